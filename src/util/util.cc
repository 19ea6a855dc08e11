/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "util.hh"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace std;
using namespace std::chrono;

string format_bytes( size_t bytes )
{
  const char* sizes[] = { "B", "KiB", "MiB", "GiB", "TiB" };
  double val = bytes;

  size_t i;
  for ( i = 0; i < 4 and bytes >= 1024; i++, bytes /= 1024 ) {
    val = bytes / 1024.0;
  }

  ostringstream oss;
  oss << fixed << setprecision( 1 ) << val << " " << sizes[i];
  return oss.str();
}

mode_t parse_octal_mode( const string_view str )
{
  if ( str.empty() or str.size() > 5 ) {
    throw invalid_argument( "invalid permissions: \"" + string( str ) + "\"" );
  }

  mode_t mode = 0;
  for ( const char c : str ) {
    if ( c < '0' or c > '7' ) {
      throw invalid_argument( "invalid permissions: \"" + string( str )
                              + "\"" );
    }
    mode = mode * 8 + ( c - '0' );
  }

  if ( mode > 07777 ) {
    throw invalid_argument( "permissions out of range: \"" + string( str )
                            + "\"" );
  }

  return mode;
}

uint64_t parse_unsigned( const string_view str )
{
  if ( str.empty() ) {
    throw invalid_argument( "expected a number" );
  }

  uint64_t value = 0;
  for ( const char c : str ) {
    if ( c < '0' or c > '9' ) {
      throw invalid_argument( "not a number: \"" + string( str ) + "\"" );
    }

    const uint64_t digit = c - '0';
    if ( value > ( numeric_limits<uint64_t>::max() - digit ) / 10 ) {
      throw out_of_range( "number too large: \"" + string( str ) + "\"" );
    }

    value = value * 10 + digit;
  }

  return value;
}

pair<string, string> parse_key_value( const string_view str )
{
  const auto equals = str.find( '=' );
  if ( equals == string_view::npos or equals == 0 ) {
    throw invalid_argument( "expected KEY=VALUE, got \"" + string( str )
                            + "\"" );
  }

  return { string( str.substr( 0, equals ) ),
           string( str.substr( equals + 1 ) ) };
}

namespace {

/* consumes exactly `count` decimal digits from the front of `str` */
unsigned take_digits( string_view& str, const size_t count )
{
  if ( str.size() < count ) {
    throw invalid_argument( "truncated timestamp" );
  }

  unsigned value = 0;
  for ( size_t i = 0; i < count; i++ ) {
    if ( str[i] < '0' or str[i] > '9' ) {
      throw invalid_argument( "malformed timestamp" );
    }
    value = value * 10 + ( str[i] - '0' );
  }

  str.remove_prefix( count );
  return value;
}

void take_char( string_view& str, const string_view accepted )
{
  if ( str.empty() or accepted.find( str.front() ) == string_view::npos ) {
    throw invalid_argument( "malformed timestamp" );
  }

  str.remove_prefix( 1 );
}

bool is_leap_year( const int year )
{
  return ( year % 4 == 0 and year % 100 != 0 ) or year % 400 == 0;
}

unsigned days_in_month( const int year, const unsigned month )
{
  static constexpr unsigned days[]
    = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
  return ( month == 2 and is_leap_year( year ) ) ? 29 : days[month - 1];
}

/* days since 1970-01-01 in the proleptic Gregorian calendar */
int64_t days_from_civil( int year, const unsigned month, const unsigned day )
{
  year -= month <= 2;
  const int64_t era = ( year >= 0 ? year : year - 399 ) / 400;
  const unsigned yoe = static_cast<unsigned>( year - era * 400 );
  const unsigned doy = ( 153 * ( month + ( month > 2 ? -3 : 9 ) ) + 2 ) / 5
                       + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>( doe ) - 719468;
}

}

system_clock::time_point parse_rfc3339( const string_view input )
{
  string_view str = input;

  try {
    const int year = take_digits( str, 4 );
    take_char( str, "-" );
    const unsigned month = take_digits( str, 2 );
    take_char( str, "-" );
    const unsigned day = take_digits( str, 2 );
    take_char( str, "Tt " );
    const unsigned hour = take_digits( str, 2 );
    take_char( str, ":" );
    const unsigned minute = take_digits( str, 2 );
    take_char( str, ":" );
    const unsigned second = take_digits( str, 2 );

    if ( month < 1 or month > 12 or day < 1
         or day > days_in_month( year, month ) or hour > 23 or minute > 59
         or second > 60 ) {
      throw invalid_argument( "timestamp field out of range" );
    }

    int64_t nanos = 0;
    if ( not str.empty() and str.front() == '.' ) {
      str.remove_prefix( 1 );

      size_t digits = 0;
      while ( not str.empty() and str.front() >= '0' and str.front() <= '9' ) {
        if ( digits < 9 ) {
          nanos = nanos * 10 + ( str.front() - '0' );
        }
        digits++;
        str.remove_prefix( 1 );
      }

      if ( digits == 0 ) {
        throw invalid_argument( "empty fractional seconds" );
      }

      for ( ; digits < 9; digits++ ) {
        nanos *= 10;
      }
    }

    int64_t offset_seconds = 0;
    if ( not str.empty() and ( str.front() == 'Z' or str.front() == 'z' ) ) {
      str.remove_prefix( 1 );
    } else {
      const bool negative = not str.empty() and str.front() == '-';
      take_char( str, "+-" );
      const unsigned offset_hour = take_digits( str, 2 );
      take_char( str, ":" );
      const unsigned offset_minute = take_digits( str, 2 );

      if ( offset_hour > 23 or offset_minute > 59 ) {
        throw invalid_argument( "timezone offset out of range" );
      }

      offset_seconds = offset_hour * 3600 + offset_minute * 60;
      if ( negative ) {
        offset_seconds = -offset_seconds;
      }
    }

    if ( not str.empty() ) {
      throw invalid_argument( "trailing characters" );
    }

    const int64_t epoch_seconds = days_from_civil( year, month, day ) * 86400
                                  + hour * 3600 + minute * 60 + second
                                  - offset_seconds;

    return system_clock::time_point { duration_cast<system_clock::duration>(
      seconds { epoch_seconds } + nanoseconds { nanos } ) };
  } catch ( const invalid_argument& e ) {
    throw invalid_argument( "invalid RFC 3339 timestamp \"" + string( input )
                            + "\": " + e.what() );
  }
}
