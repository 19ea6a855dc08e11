/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "staged_file.hh"

#include <cerrno>
#include <glog/logging.h>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

#include "atomicfile/errors.hh"

using namespace std;

namespace atomicfile {

namespace {

constexpr char LINK_STAGE[] = "linking file";

struct LinkStrategy
{
  const char* name;
  void ( FileSystem::*link )( const FileDescriptor&, const filesystem::path& );
};

/* tried in order; the last failure is the one reported */
constexpr LinkStrategy LINK_STRATEGIES[] = {
  { "descriptor", &FileSystem::link_descriptor },
  { "/proc/self/fd", &FileSystem::link_proc_path },
};

}

StagedFile::StagedFile( FileSystem& fs, const filesystem::path& directory )
  : fs_( fs )
  , fd_()
{
  try {
    fd_.emplace( fs_.open_anonymous( directory ) );
  } catch ( const exception& ) {
    fail( ErrorKind::StagingFailed, "opening file" );
  }

  VLOG( 1 ) << "staged fd " << fd_->fd_num() << " in " << directory;
}

FileDescriptor& StagedFile::fd()
{
  if ( not fd_ ) {
    throw logic_error( "staged file already published" );
  }

  return *fd_;
}

void StagedFile::publish( const filesystem::path& target ) &&
{
  /* closed when this returns or throws, exactly once */
  FileDescriptor file { move( fd() ) };
  fd_.reset();

  string earlier_failures;

  for ( const auto& strategy : LINK_STRATEGIES ) {
    try {
      ( fs_.*strategy.link )( file, target );

      VLOG( 1 ) << "linked " << target << " via " << strategy.name
                << ( earlier_failures.empty() ? "" : " after: " )
                << earlier_failures;
      return;
    } catch ( const system_error& e ) {
      if ( e.code() == errc::file_exists ) {
        fail( ErrorKind::AlreadyExists, LINK_STAGE );
      }

      const bool last = &strategy == &LINK_STRATEGIES[size( LINK_STRATEGIES ) - 1];
      if ( last ) {
        throw_with_nested( creation_error {
          ErrorKind::PublicationFailed,
          earlier_failures.empty()
            ? string( LINK_STAGE )
            : string( LINK_STAGE ) + " (after " + earlier_failures + ")",
          e.what(),
          e.code() } );
      }

      earlier_failures += ( earlier_failures.empty() ? "" : "; " );
      earlier_failures += e.what();
    } catch ( const exception& ) {
      fail( ErrorKind::PublicationFailed, LINK_STAGE );
    }
  }
}

} // namespace atomicfile
