/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "temp_dir.hh"

#include <cstdlib>
#include <glog/logging.h>
#include <system_error>

#include "exception.hh"

using namespace std;

UniqueDirectory::UniqueDirectory( const string& dirname_template )
  : mutable_temp_dirname_()
  , moved_away_( false )
{
  const string full_template = dirname_template + "XXXXXX";
  mutable_temp_dirname_.assign( full_template.begin(), full_template.end() );
  mutable_temp_dirname_.push_back( 0 );

  if ( mkdtemp( mutable_temp_dirname_.data() ) == nullptr ) {
    throw unix_error( "mkdtemp " + full_template );
  }
}

UniqueDirectory::UniqueDirectory( UniqueDirectory&& other )
  : mutable_temp_dirname_( other.mutable_temp_dirname_ )
  , moved_away_( false )
{
  other.moved_away_ = true;
}

string UniqueDirectory::name( void ) const
{
  return string( mutable_temp_dirname_.data() );
}

TempDirectory TempDirectory::in_tmpdir( const string& prefix )
{
  const char* const tmpdir = getenv( "TMPDIR" );
  const filesystem::path base { ( tmpdir and *tmpdir ) ? tmpdir : "/tmp" };
  return TempDirectory { ( base / prefix ).string() };
}

TempDirectory::~TempDirectory()
{
  if ( moved_away_ ) {
    return;
  }

  error_code ec;
  filesystem::remove_all( name(), ec );
  if ( ec ) {
    LOG( ERROR ) << "could not remove " << name() << ": " << ec.message();
  }
}
