#include <getopt.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "atomicfile/create.hh"
#include "util/util.hh"

using namespace std;
using namespace atomicfile;

void usage( const char* argv0, int exit_code )
{
  cerr << "Usage: " << argv0 << " [OPTION]... FILENAME" << endl
       << endl
       << "Creates FILENAME from standard input. The file appears complete, or"
       << endl
       << "not at all; an existing FILENAME is never replaced." << endl
       << endl
       << "Options:" << endl
       << "  -f --fsync               fsync the file and its directory" << endl
       << "  -p --prealloc BYTES      preallocate file space" << endl
       << "  -x --xattr KEY=VALUE     add an extended attribute" << endl
       << "                           (can be repeated)" << endl
       << "  -m --perm OCTAL          file permissions" << endl
       << "  -u --uid UID             file owner user" << endl
       << "  -g --gid GID             file owner group" << endl
       << "  -M --mtime TIME          modification time (RFC 3339)" << endl
       << "  -A --atime TIME          access time (RFC 3339)" << endl
       << "  -h --help                show help information" << endl;

  exit( exit_code );
}

template<typename Id>
Id parse_id( const char* str )
{
  const uint64_t value = parse_unsigned( str );
  if ( value >= numeric_limits<Id>::max() ) {
    throw out_of_range( "id out of range: " + string( str ) );
  }
  return static_cast<Id>( value );
}

int main( int argc, char* argv[] )
{
  if ( argc <= 0 ) {
    abort();
  }

  FLAGS_logtostderr = true;
  google::InitGoogleLogging( argv[0] );

  vector<Option> options { contents( cin ) };

  struct option long_options[] = {
    { "fsync", no_argument, nullptr, 'f' },
    { "prealloc", required_argument, nullptr, 'p' },
    { "xattr", required_argument, nullptr, 'x' },
    { "perm", required_argument, nullptr, 'm' },
    { "uid", required_argument, nullptr, 'u' },
    { "gid", required_argument, nullptr, 'g' },
    { "mtime", required_argument, nullptr, 'M' },
    { "atime", required_argument, nullptr, 'A' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
  };

  optional<uid_t> uid;
  optional<gid_t> gid;

  try {
    while ( true ) {
      const int opt
        = getopt_long( argc, argv, "fp:x:m:u:g:M:A:h", long_options, nullptr );

      if ( opt == -1 ) {
        break;
      }

      switch ( opt ) {
        // clang-format off
        case 'f': options.push_back( durable() ); break;
        case 'p': options.push_back( preallocate( static_cast<int64_t>( parse_unsigned( optarg ) ) ) ); break;
        case 'm': options.push_back( permissions( parse_octal_mode( optarg ) ) ); break;
        case 'u': uid = parse_id<uid_t>( optarg ); break;
        case 'g': gid = parse_id<gid_t>( optarg ); break;
        case 'M': options.push_back( modification_time( parse_rfc3339( optarg ) ) ); break;
        case 'A': options.push_back( access_time( parse_rfc3339( optarg ) ) ); break;
        case 'h': usage( argv[0], EXIT_SUCCESS ); break;
        // clang-format on

        case 'x': {
          const auto [key, value] = parse_key_value( optarg );
          options.push_back( extended_attribute( key, value ) );
          break;
        }

        default: usage( argv[0], EXIT_FAILURE );
      }
    }
  } catch ( const logic_error& e ) {
    /* invalid_argument and out_of_range from the parsers */
    cerr << argv[0] << ": " << e.what() << endl;
    usage( argv[0], EXIT_FAILURE );
  }

  if ( optind != argc - 1 ) {
    usage( argv[0], EXIT_FAILURE );
  }

  if ( uid or gid ) {
    options.push_back( owner( uid, gid ) );
  }

  const string filename { argv[optind] };

  try {
    create( filename, options );
  } catch ( const exception& e ) {
    LOG( ERROR ) << "could not create " << filename;
    cerr << describe( e ) << endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
