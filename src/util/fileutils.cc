/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "fileutils.hh"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/xattr.h>
#include <unistd.h>

#include "exception.hh"
#include "file_descriptor.hh"

using namespace std;

string read_file( const filesystem::path& pathn )
{
  /* read input file into memory */
  FileDescriptor in_file { CheckSystemCall(
    "open (" + pathn.string() + ")",
    open( pathn.string().c_str(), O_RDONLY | O_CLOEXEC ) ) };
  const struct stat pathn_info = in_file.stat();

  if ( not S_ISREG( pathn_info.st_mode ) ) {
    throw runtime_error( pathn.string() + " is not a regular file" );
  }

  string contents;
  contents.resize( pathn_info.st_size );

  for ( size_t index = 0; not in_file.eof() and index < contents.length(); ) {
    index += in_file.read( contents.data() + index, contents.length() - index );
  }

  return contents;
}

optional<string> read_xattr( const filesystem::path& pathn, const string& name )
{
  while ( true ) {
    const ssize_t length = getxattr( pathn.c_str(), name.c_str(), nullptr, 0 );
    if ( length < 0 and errno == ENODATA ) {
      return nullopt;
    }
    CheckSystemCall( "getxattr (" + name + ")", length );

    string value( length, '\0' );
    const ssize_t got
      = getxattr( pathn.c_str(), name.c_str(), value.data(), value.size() );
    if ( got < 0 and errno == ERANGE ) {
      continue; /* grew in between */
    }
    CheckSystemCall( "getxattr (" + name + ")", got );

    value.resize( got );
    return value;
  }
}

vector<string> list_directory( const filesystem::path& dirn )
{
  vector<string> names;
  for ( const auto& entry : filesystem::directory_iterator( dirn ) ) {
    names.push_back( entry.path().filename().string() );
  }

  sort( names.begin(), names.end() );
  return names;
}
