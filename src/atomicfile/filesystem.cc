/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "filesystem.hh"

#include <fcntl.h>
#include <linux/falloc.h>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>

#include "util/exception.hh"
#include "util/util.hh"

using namespace std;

namespace atomicfile {

namespace {

/* same default as creat(2), before umask */
constexpr mode_t STAGED_FILE_MODE = 0666;

timespec to_utimens( const optional<TimePoint>& time )
{
  timespec ts {};
  if ( time ) {
    to_timespec( time->time_since_epoch(), ts );
  } else {
    ts.tv_nsec = UTIME_OMIT;
  }
  return ts;
}

}

FileDescriptor PosixFileSystem::open_anonymous( const filesystem::path& directory )
{
  return FileDescriptor { CheckSystemCall(
    "open O_TMPFILE (" + directory.string() + ")",
    open( directory.c_str(),
          O_TMPFILE | O_WRONLY | O_CLOEXEC,
          STAGED_FILE_MODE ) ) };
}

FileDescriptor PosixFileSystem::open_directory( const filesystem::path& directory )
{
  return FileDescriptor { CheckSystemCall(
    "open (" + directory.string() + ")",
    open( directory.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC ) ) };
}

void PosixFileSystem::change_owner( const FileDescriptor& file,
                                    const optional<uid_t> uid,
                                    const optional<gid_t> gid )
{
  CheckSystemCall( "fchown",
                   fchown( file.fd_num(),
                           uid.value_or( static_cast<uid_t>( -1 ) ),
                           gid.value_or( static_cast<gid_t>( -1 ) ) ) );
}

void PosixFileSystem::change_mode( const FileDescriptor& file, const mode_t mode )
{
  CheckSystemCall( "fchmod", fchmod( file.fd_num(), mode ) );
}

void PosixFileSystem::preallocate( const FileDescriptor& file,
                                   const uint64_t length )
{
  CheckSystemCall( "fallocate",
                   fallocate( file.fd_num(), FALLOC_FL_KEEP_SIZE, 0, length ) );
}

uint64_t PosixFileSystem::copy_contents( ContentSource& source,
                                         FileDescriptor& file )
{
  return source.copy_to( file );
}

void PosixFileSystem::punch_hole( const FileDescriptor& file,
                                  const uint64_t offset,
                                  const uint64_t length )
{
  CheckSystemCall( "fallocate FALLOC_FL_PUNCH_HOLE",
                   fallocate( file.fd_num(),
                              FALLOC_FL_PUNCH_HOLE | FALLOC_FL_KEEP_SIZE,
                              offset,
                              length ) );
}

void PosixFileSystem::set_extended_attribute( const FileDescriptor& file,
                                              const string& name,
                                              const string& value )
{
  CheckSystemCall(
    "fsetxattr (" + name + ")",
    fsetxattr( file.fd_num(), name.c_str(), value.data(), value.size(), 0 ) );
}

void PosixFileSystem::set_times( const FileDescriptor& file,
                                 const optional<TimePoint> modification_time,
                                 const optional<TimePoint> access_time )
{
  const timespec times[2] = { to_utimens( access_time ),
                              to_utimens( modification_time ) };
  CheckSystemCall( "futimens", futimens( file.fd_num(), times ) );
}

void PosixFileSystem::sync( const FileDescriptor& file )
{
  CheckSystemCall( "fsync", fsync( file.fd_num() ) );
}

void PosixFileSystem::link_descriptor( const FileDescriptor& file,
                                       const filesystem::path& target )
{
  CheckSystemCall(
    "linkat AT_EMPTY_PATH (" + target.string() + ")",
    linkat( file.fd_num(), "", AT_FDCWD, target.c_str(), AT_EMPTY_PATH ) );
}

void PosixFileSystem::link_proc_path( const FileDescriptor& file,
                                      const filesystem::path& target )
{
  const string proc_path = "/proc/self/fd/" + std::to_string( file.fd_num() );
  CheckSystemCall( "linkat " + proc_path + " (" + target.string() + ")",
                   linkat( AT_FDCWD,
                           proc_path.c_str(),
                           AT_FDCWD,
                           target.c_str(),
                           AT_SYMLINK_FOLLOW ) );
}

} // namespace atomicfile
