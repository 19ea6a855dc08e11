/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <filesystem>
#include <type_traits>
#include <utility>
#include <vector>

#include "atomicfile/errors.hh"
#include "atomicfile/filesystem.hh"
#include "atomicfile/options.hh"

namespace atomicfile {

/* Creates a new regular file at `path`, fully formed before it gets its name:
   contents, permissions, ownership, extended attributes and timestamps are
   applied to an unnamed file in the same directory, which is then linked in
   place. An existing `path` is never replaced. Throws creation_error. */
void create( const std::filesystem::path& path,
             const Configuration& config,
             FileSystem& fs );

void create( const std::filesystem::path& path,
             const std::vector<Option>& options,
             FileSystem& fs );

void create( const std::filesystem::path& path,
             const std::vector<Option>& options = {} );

/* create( path, contents( "x" ), durable() ) */
template<typename... Options,
         typename = std::enable_if_t<( std::is_convertible_v<Options, Option> and ... )>>
void create( const std::filesystem::path& path, Option first, Options... rest )
{
  create( path, std::vector<Option> { std::move( first ), std::move( rest )... } );
}

} // namespace atomicfile
