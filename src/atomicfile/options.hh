/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "atomicfile/content_source.hh"
#include "util/file_descriptor.hh"

namespace atomicfile {

using TimePoint = std::chrono::system_clock::time_point;

struct Configuration;

//! One change to a Configuration; throws creation_error on conflict
using Option = std::function<void( Configuration& )>;

//! Everything a new file is created with
struct Configuration
{
  std::shared_ptr<ContentSource> contents {};
  bool durable { false };
  std::optional<uint64_t> preallocate_bytes {};
  std::vector<std::pair<std::string, std::string>> extended_attributes {};
  std::optional<mode_t> permissions {};
  std::optional<uid_t> owner_uid {};
  std::optional<gid_t> owner_gid {};
  std::optional<TimePoint> modification_time {};
  std::optional<TimePoint> access_time {};

  //! Applies `options` in order to an empty configuration, stopping at the
  //! first one that fails.
  static Configuration from_options( const std::vector<Option>& options );
};

//! \name Option constructors
//!@{
Option contents( ContentSource source );
Option contents( std::string data );
Option contents( std::istream& in );
Option contents( FileDescriptor fd );

//! fsync the file before it is linked and the directory after
Option durable();

//! Reserve at least `bytes` without changing the file size; failure is fatal
Option preallocate( const int64_t bytes );

//! May be repeated, also with the same name; applied in order
Option extended_attribute( const std::string& name, const std::string& value );

Option permissions( const mode_t mode );

//! std::nullopt leaves that id alone
Option owner( const std::optional<uid_t> uid, const std::optional<gid_t> gid );

Option modification_time( const TimePoint time );
Option access_time( const TimePoint time );
//!@}

} // namespace atomicfile
