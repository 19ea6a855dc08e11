/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "create.hh"

#include <glog/logging.h>
#include <optional>
#include <system_error>

#include "atomicfile/staged_file.hh"
#include "util/util.hh"

using namespace std;

namespace atomicfile {

namespace {

/* the directory the file is staged in, and where it gets linked */
filesystem::path target_directory( const filesystem::path& path )
{
  const auto leaf = path.filename();
  if ( path.empty() or leaf.empty() or leaf == "." or leaf == ".." ) {
    throw creation_error { ErrorKind::InvalidArgument,
                           "options",
                           "invalid file name: \"" + path.string() + "\"" };
  }

  return path.has_parent_path() ? path.parent_path() : filesystem::path { "." };
}

void apply_ownership( FileSystem& fs,
                      const FileDescriptor& file,
                      const Configuration& config )
{
  if ( not config.owner_uid and not config.owner_gid ) {
    return;
  }

  try {
    fs.change_owner( file, config.owner_uid, config.owner_gid );
  } catch ( const exception& ) {
    fail( ErrorKind::AttributeApplicationFailed,
          "changing owner",
          AttributeStep::Ownership );
  }
}

void apply_permissions( FileSystem& fs,
                        const FileDescriptor& file,
                        const Configuration& config )
{
  if ( not config.permissions ) {
    return;
  }

  try {
    fs.change_mode( file, *config.permissions );
  } catch ( const exception& ) {
    fail( ErrorKind::AttributeApplicationFailed,
          "changing permissions",
          AttributeStep::Permissions );
  }
}

/* \returns the explicitly requested size, or 0 */
uint64_t apply_preallocation( FileSystem& fs,
                              const FileDescriptor& file,
                              const Configuration& config )
{
  if ( config.preallocate_bytes ) {
    const uint64_t requested = *config.preallocate_bytes;
    try {
      fs.preallocate( file, requested );
    } catch ( const exception& ) {
      fail( ErrorKind::PreallocationFailed, "preallocating file" );
    }
    VLOG( 1 ) << "preallocated " << format_bytes( requested );
    return requested;
  }

  if ( not config.contents ) {
    return 0;
  }

  const uint64_t guess = config.contents->size_hint().value_or( 0 );
  if ( guess > 0 ) {
    try {
      fs.preallocate( file, guess );
      VLOG( 1 ) << "preallocated " << format_bytes( guess ) << " (guessed)";
    } catch ( const exception& e ) {
      VLOG( 1 ) << "ignoring failed preallocation: " << e.what();
    }
  }

  return 0;
}

uint64_t apply_contents( FileSystem& fs,
                         FileDescriptor& file,
                         const Configuration& config )
{
  if ( not config.contents ) {
    return 0;
  }

  uint64_t written;
  try {
    written = fs.copy_contents( *config.contents, file );
  } catch ( const exception& ) {
    fail( ErrorKind::AttributeApplicationFailed,
          "populating file",
          AttributeStep::Contents );
  }

  VLOG( 1 ) << "wrote " << format_bytes( written );
  return written;
}

void release_unused_preallocation( FileSystem& fs,
                                   const FileDescriptor& file,
                                   const uint64_t requested,
                                   const uint64_t written )
{
  if ( written >= requested ) {
    return;
  }

  try {
    fs.punch_hole( file, written, requested - written );
  } catch ( const exception& e ) {
    LOG( WARNING ) << "could not release "
                   << format_bytes( requested - written )
                   << " of unused preallocation: " << e.what();
  }
}

void apply_extended_attributes( FileSystem& fs,
                                const FileDescriptor& file,
                                const Configuration& config )
{
  for ( const auto& [name, value] : config.extended_attributes ) {
    try {
      fs.set_extended_attribute( file, name, value );
    } catch ( const exception& ) {
      fail( ErrorKind::AttributeApplicationFailed,
            "setting extended attribute " + name,
            AttributeStep::ExtendedAttribute );
    }
  }
}

void apply_times( FileSystem& fs,
                  const FileDescriptor& file,
                  const Configuration& config )
{
  if ( not config.modification_time and not config.access_time ) {
    return;
  }

  try {
    fs.set_times( file, config.modification_time, config.access_time );
  } catch ( const exception& ) {
    fail( ErrorKind::AttributeApplicationFailed,
          "setting file times",
          AttributeStep::Timestamps );
  }
}

void flush( FileSystem& fs, const FileDescriptor& fd, const char* stage )
{
  try {
    fs.sync( fd );
  } catch ( const exception& ) {
    fail( ErrorKind::DurabilityFailed, stage );
  }
}

}

void create( const filesystem::path& path,
             const Configuration& config,
             FileSystem& fs )
{
  const auto directory = target_directory( path );

  StagedFile staged { fs, directory };

  optional<FileDescriptor> directory_fd;
  if ( config.durable ) {
    try {
      directory_fd.emplace( fs.open_directory( directory ) );
    } catch ( const exception& ) {
      fail( ErrorKind::StagingFailed, "opening directory" );
    }
  }

  FileDescriptor& file = staged.fd();

  /* each step may be observable through /proc/self/fd, so the order matters:
     nothing is written before ownership and mode are final */
  apply_ownership( fs, file, config );
  apply_permissions( fs, file, config );
  const uint64_t requested = apply_preallocation( fs, file, config );
  const uint64_t written = apply_contents( fs, file, config );
  if ( requested > 0 ) {
    release_unused_preallocation( fs, file, requested, written );
  }
  apply_extended_attributes( fs, file, config );
  apply_times( fs, file, config );

  if ( config.durable ) {
    flush( fs, file, "fsync file" );
  }

  move( staged ).publish( path );

  if ( directory_fd ) {
    flush( fs, *directory_fd, "fsync directory" );
  }
}

void create( const filesystem::path& path,
             const vector<Option>& options,
             FileSystem& fs )
{
  create( path, Configuration::from_options( options ), fs );
}

void create( const filesystem::path& path, const vector<Option>& options )
{
  PosixFileSystem fs;
  create( path, options, fs );
}

} // namespace atomicfile
