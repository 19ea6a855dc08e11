/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "options.hh"

#include <sys/stat.h>

#include "atomicfile/errors.hh"

using namespace std;

namespace atomicfile {

namespace {

constexpr char STAGE[] = "options";

[[noreturn]] void invalid( const string& why )
{
  throw creation_error { ErrorKind::InvalidArgument, STAGE, why };
}

template<typename T>
void set_once( optional<T>& field, const T& value, const char* name )
{
  if ( field ) {
    throw creation_error { ErrorKind::DuplicateOption,
                           STAGE,
                           string( "multiple " ) + name };
  }

  field = value;
}

Option contents_option( shared_ptr<ContentSource> source )
{
  return [source]( Configuration& c ) {
    if ( c.contents ) {
      throw creation_error { ErrorKind::DuplicateOption,
                             STAGE,
                             "multiple contents" };
    }
    c.contents = source;
  };
}

}

Configuration Configuration::from_options( const vector<Option>& options )
{
  Configuration config;
  for ( const auto& option : options ) {
    option( config );
  }
  return config;
}

Option contents( ContentSource source )
{
  return contents_option( make_shared<ContentSource>( move( source ) ) );
}

Option contents( string data )
{
  return contents( ContentSource::buffer( move( data ) ) );
}

Option contents( istream& in )
{
  return contents( ContentSource::stream( in ) );
}

Option contents( FileDescriptor fd )
{
  return contents( ContentSource::file( move( fd ) ) );
}

Option durable()
{
  return []( Configuration& c ) { c.durable = true; };
}

Option preallocate( const int64_t bytes )
{
  return [bytes]( Configuration& c ) {
    if ( bytes < 0 ) {
      invalid( "invalid preallocation size: " + std::to_string( bytes ) );
    }
    if ( bytes == 0 ) {
      /* same as not asking; the size is still guessed from the contents */
      return;
    }
    set_once( c.preallocate_bytes,
              static_cast<uint64_t>( bytes ),
              "preallocations" );
  };
}

Option extended_attribute( const string& name, const string& value )
{
  return [name, value]( Configuration& c ) {
    if ( name.empty() ) {
      invalid( "empty extended attribute name" );
    }
    c.extended_attributes.emplace_back( name, value );
  };
}

Option permissions( const mode_t mode )
{
  return [mode]( Configuration& c ) {
    if ( mode & ~static_cast<mode_t>( 07777 ) ) {
      invalid( "invalid permissions: " + std::to_string( mode ) );
    }
    set_once( c.permissions, mode, "permissions" );
  };
}

Option owner( const optional<uid_t> uid, const optional<gid_t> gid )
{
  return [uid, gid]( Configuration& c ) {
    /* -1 means "unchanged" to fchown(2) and cannot be requested */
    if ( uid and *uid == static_cast<uid_t>( -1 ) ) {
      invalid( "invalid uid" );
    }
    if ( gid and *gid == static_cast<gid_t>( -1 ) ) {
      invalid( "invalid gid" );
    }

    if ( uid ) {
      set_once( c.owner_uid, *uid, "owner uids" );
    }
    if ( gid ) {
      set_once( c.owner_gid, *gid, "owner gids" );
    }
  };
}

Option modification_time( const TimePoint time )
{
  return [time]( Configuration& c ) {
    set_once( c.modification_time, time, "modification times" );
  };
}

Option access_time( const TimePoint time )
{
  return [time]( Configuration& c ) {
    set_once( c.access_time, time, "access times" );
  };
}

} // namespace atomicfile
