/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

std::string format_bytes( size_t bytes );

/* tv_nsec is always normalized into [0, 1e9), also before the epoch */
template<typename Duration>
inline void to_timespec( const Duration& d, timespec& ts )
{
  auto sec = std::chrono::duration_cast<std::chrono::seconds>( d );
  if ( sec > d ) {
    sec -= std::chrono::seconds { 1 };
  }

  ts.tv_sec = sec.count();
  ts.tv_nsec
    = std::chrono::duration_cast<std::chrono::nanoseconds>( d - sec ).count();
}

/* "0640", "640", "4755"; anything beyond 07777 is rejected */
mode_t parse_octal_mode( const std::string_view str );

/* decimal, non-negative, fits in 64 bits */
uint64_t parse_unsigned( const std::string_view str );

/* "user.tag=value" -> { "user.tag", "value" }; the value may be empty */
std::pair<std::string, std::string> parse_key_value( const std::string_view str );

/* RFC 3339 date-time, e.g. 2021-03-04T05:06:07.123456789+01:00 */
std::chrono::system_clock::time_point parse_rfc3339( const std::string_view str );
