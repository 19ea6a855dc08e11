/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "content_source.hh"

#include <algorithm>
#include <cerrno>
#include <glog/logging.h>
#include <limits>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

#include "util/exception.hh"

using namespace std;

namespace atomicfile {

namespace {

constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

/* upper bound for a single copy_file_range(2) call */
constexpr size_t COPY_RANGE_CHUNK = 1 << 30;

size_t next_chunk( const optional<uint64_t> limit,
                   const uint64_t copied,
                   const size_t chunk )
{
  if ( not limit ) {
    return chunk;
  }

  return static_cast<size_t>( min<uint64_t>( *limit - copied, chunk ) );
}

bool copy_range_unsupported( const int error )
{
  return error == EXDEV or error == ENOSYS or error == EOPNOTSUPP
         or error == EINVAL or error == EBADF;
}

uint64_t copy_buffer( const string& data,
                      FileDescriptor& dst,
                      const optional<uint64_t> limit )
{
  const size_t length = limit ? min<uint64_t>( *limit, data.size() )
                              : data.size();
  dst.write_all( { data.data(), length } );
  return length;
}

uint64_t copy_stream( istream& in,
                      FileDescriptor& dst,
                      const optional<uint64_t> limit )
{
  string buffer( COPY_BUFFER_SIZE, '\0' );
  uint64_t copied = 0;

  while ( not limit or copied < *limit ) {
    const size_t wanted = next_chunk( limit, copied, buffer.size() );
    in.read( buffer.data(), wanted );
    const size_t got = in.gcount();

    if ( in.bad() ) {
      throw runtime_error( "error reading content stream" );
    }

    dst.write_all( { buffer.data(), got } );
    copied += got;

    if ( got < wanted ) {
      break;
    }
  }

  return copied;
}

uint64_t copy_file( FileDescriptor& src,
                    FileDescriptor& dst,
                    const optional<uint64_t> limit )
{
  uint64_t copied = 0;
  bool use_copy_range = true;
  string buffer;

  while ( not limit or copied < *limit ) {
    if ( use_copy_range ) {
      const ssize_t n = copy_file_range( src.fd_num(),
                                         nullptr,
                                         dst.fd_num(),
                                         nullptr,
                                         next_chunk( limit, copied, COPY_RANGE_CHUNK ),
                                         0 );
      if ( n < 0 ) {
        const unix_error error { "copy_file_range" };

        if ( error.error_number() == EINTR ) {
          continue;
        }

        if ( copied == 0 and copy_range_unsupported( error.error_number() ) ) {
          VLOG( 1 ) << error.what() << ", copying through a buffer";
          use_copy_range = false;
          continue;
        }

        throw error;
      }

      if ( n == 0 ) {
        break;
      }

      copied += n;
      continue;
    }

    buffer.resize( COPY_BUFFER_SIZE );
    const size_t got
      = src.read( buffer.data(), next_chunk( limit, copied, buffer.size() ) );
    if ( got == 0 ) {
      break;
    }

    dst.write_all( { buffer.data(), got } );
    copied += got;
  }

  return copied;
}

optional<uint64_t> stream_remaining( istream& in )
{
  streambuf* const buf = in.rdbuf();
  if ( buf == nullptr ) {
    return nullopt;
  }

  const streampos failed { streamoff { -1 } };

  const streampos current = buf->pubseekoff( 0, ios::cur, ios::in );
  if ( current == failed ) {
    return nullopt;
  }

  const streampos end = buf->pubseekoff( 0, ios::end, ios::in );
  if ( buf->pubseekpos( current, ios::in ) != current ) {
    /* surfaces as a read error once the copy starts */
    in.setstate( ios::badbit );
    return nullopt;
  }

  if ( end == failed ) {
    return nullopt;
  }

  const streamoff remaining = end - current;
  return remaining > 0 ? static_cast<uint64_t>( remaining ) : 0;
}

optional<uint64_t> file_remaining( const FileDescriptor& fd )
{
  try {
    const struct stat info = fd.stat();
    if ( not S_ISREG( info.st_mode ) ) {
      return nullopt;
    }

    const off_t offset = fd.offset();
    return info.st_size > offset ? static_cast<uint64_t>( info.st_size - offset )
                                 : 0;
  } catch ( const unix_error& e ) {
    VLOG( 1 ) << "no size hint for content file: " << e.what();
    return nullopt;
  }
}

}

ContentSource::ContentSource( Kind source )
  : source_( move( source ) )
{}

ContentSource ContentSource::buffer( string data )
{
  return ContentSource { Buffer { move( data ) } };
}

ContentSource ContentSource::stream( istream& in )
{
  return ContentSource { Stream { &in } };
}

ContentSource ContentSource::file( FileDescriptor fd )
{
  return ContentSource { File { move( fd ) } };
}

ContentSource ContentSource::limited( ContentSource inner, const uint64_t limit )
{
  return ContentSource { Limited {
    make_shared<ContentSource>( move( inner ) ), limit } };
}

optional<uint64_t> ContentSource::size_hint() const
{
  if ( const auto* buf = get_if<Buffer>( &source_ ) ) {
    return buf->data.size();
  } else if ( const auto* stream = get_if<Stream>( &source_ ) ) {
    return stream_remaining( *stream->in );
  } else if ( const auto* file = get_if<File>( &source_ ) ) {
    return file_remaining( file->fd );
  } else if ( const auto* limited = get_if<Limited>( &source_ ) ) {
    /* the limit alone is only an upper bound */
    const auto inner = limited->inner->size_hint();
    return inner ? optional<uint64_t> { min( *inner, limited->limit ) } : nullopt;
  }

  return nullopt;
}

uint64_t ContentSource::copy_to( FileDescriptor& dst,
                                 const optional<uint64_t> limit )
{
  if ( auto* buf = get_if<Buffer>( &source_ ) ) {
    return copy_buffer( buf->data, dst, limit );
  } else if ( auto* stream = get_if<Stream>( &source_ ) ) {
    return copy_stream( *stream->in, dst, limit );
  } else if ( auto* file = get_if<File>( &source_ ) ) {
    return copy_file( file->fd, dst, limit );
  } else if ( auto* limited = get_if<Limited>( &source_ ) ) {
    return limited->inner->copy_to(
      dst, limit ? min( *limit, limited->limit ) : limited->limit );
  }

  throw logic_error( "unknown content source" );
}

} // namespace atomicfile
