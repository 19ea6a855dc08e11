/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "file_descriptor.hh"

#include <cerrno>
#include <fcntl.h>
#include <glog/logging.h>
#include <stdexcept>
#include <unistd.h>

#include "exception.hh"

using namespace std;

//! \param[in] fd is the file descriptor number returned by [open(2)](\ref man2::open) or similar
FileDescriptor::FDWrapper::FDWrapper( const int fd )
  : _fd( fd )
{
  if ( fd < 0 ) {
    throw runtime_error( "invalid fd number:" + to_string( fd ) );
  }

  CheckSystemCall( "fcntl", fcntl( fd, F_GETFD ) );
}

void FileDescriptor::FDWrapper::close()
{
  if ( _closed ) {
    return;
  }

  /* the descriptor is gone even if close(2) reports an error */
  _eof = _closed = true;
  CheckSystemCall( "close", ::close( _fd ) );
}

FileDescriptor::FDWrapper::~FDWrapper()
{
  try {
    close();
  } catch ( const exception& e ) {
    // don't throw an exception from the destructor
    LOG( ERROR ) << "Exception destructing FDWrapper: " << e.what();
  }
}

//! \param[in] fd is the file descriptor number returned by [open(2)](\ref man2::open) or similar
FileDescriptor::FileDescriptor( const int fd )
  : _internal_fd( make_shared<FDWrapper>( fd ) )
{}

//! Private constructor used by duplicate()
FileDescriptor::FileDescriptor( shared_ptr<FDWrapper> other_shared_ptr )
  : _internal_fd( move( other_shared_ptr ) )
{}

//! \returns a copy of this FileDescriptor
FileDescriptor FileDescriptor::duplicate() const
{
  return FileDescriptor( _internal_fd );
}

size_t FileDescriptor::read( char* buffer, const size_t length )
{
  if ( length == 0 ) {
    throw runtime_error( "FileDescriptor::read: no space to read" );
  }

  ssize_t bytes_read;
  do {
    bytes_read = ::read( fd_num(), buffer, length );
  } while ( bytes_read < 0 and errno == EINTR );

  CheckSystemCall( "read", bytes_read );

  if ( bytes_read == 0 ) {
    _internal_fd->_eof = true;
  }

  if ( bytes_read > static_cast<ssize_t>( length ) ) {
    throw runtime_error( "read() read more than requested" );
  }

  return bytes_read;
}

size_t FileDescriptor::write( const string_view buffer )
{
  ssize_t bytes_written;
  do {
    bytes_written = ::write( fd_num(), buffer.data(), buffer.size() );
  } while ( bytes_written < 0 and errno == EINTR );

  CheckSystemCall( "write", bytes_written );

  if ( bytes_written == 0 and buffer.size() != 0 ) {
    throw runtime_error( "write returned 0 given non-empty input buffer" );
  }

  if ( bytes_written > ssize_t( buffer.size() ) ) {
    throw runtime_error( "write wrote more than length of input buffer" );
  }

  return bytes_written;
}

void FileDescriptor::write_all( string_view buffer )
{
  while ( not buffer.empty() ) {
    buffer.remove_prefix( write( buffer ) );
  }
}

struct stat FileDescriptor::stat() const
{
  struct stat info;
  CheckSystemCall( "fstat", ::fstat( fd_num(), &info ) );
  return info;
}

off_t FileDescriptor::offset() const
{
  return CheckSystemCall( "lseek", ::lseek( fd_num(), 0, SEEK_CUR ) );
}
