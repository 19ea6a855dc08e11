#include <atomic>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

#include "atomicfile/create.hh"
#include "util/exception.hh"
#include "util/fileutils.hh"
#include "util/temp_dir.hh"

using namespace std;
using namespace std::chrono;
using namespace atomicfile;

namespace {

string pattern( const size_t size )
{
  string data( size, '\0' );
  for ( size_t i = 0; i < size; i++ ) {
    data[i] = static_cast<char>( ( i * 131 + i / 4096 ) & 0xff );
  }
  return data;
}

bool unsupported( const creation_error& e )
{
  return e.os_error() == errc::operation_not_supported;
}

}

class CreateTest : public ::testing::Test
{
protected:
  TempDirectory dir { TempDirectory::in_tmpdir( "atomicfile-create-" ) };

  filesystem::path target() const { return dir.path() / "out.bin"; }
};

TEST_F( CreateTest, ContentsAreWrittenExactly )
{
  for ( const size_t size : { 0ul, 1ul, 4096ul, 10'000'000ul } ) {
    const auto path = dir.path() / ( "file-" + to_string( size ) );
    const string data = pattern( size );

    create( path, contents( data ) );

    EXPECT_EQ( size, filesystem::file_size( path ) ) << size;
    EXPECT_TRUE( data == read_file( path ) ) << size;
  }
}

TEST_F( CreateTest, TaggedFileWithPermissions )
{
  try {
    create( target(),
            contents( "hello" ),
            permissions( 0640 ),
            extended_attribute( "user.tag", "v" ) );
  } catch ( const creation_error& e ) {
    if ( unsupported( e ) ) {
      GTEST_SKIP() << "no user xattrs here: " << e.what();
    }
    throw;
  }

  struct stat info;
  ASSERT_EQ( 0, stat( target().c_str(), &info ) );
  EXPECT_TRUE( S_ISREG( info.st_mode ) );
  EXPECT_EQ( 5, info.st_size );
  EXPECT_EQ( 0640u, info.st_mode & 07777 );
  EXPECT_EQ( "v", read_xattr( target(), "user.tag" ).value_or( "<unset>" ) );
  EXPECT_EQ( vector<string> { "out.bin" }, list_directory( dir.path() ) );
}

TEST_F( CreateTest, RepeatedAttributeNamesApplyInOrder )
{
  try {
    create( target(),
            extended_attribute( "user.k", "first" ),
            extended_attribute( "user.empty", "" ),
            extended_attribute( "user.k", "second" ) );
  } catch ( const creation_error& e ) {
    if ( unsupported( e ) ) {
      GTEST_SKIP() << "no user xattrs here: " << e.what();
    }
    throw;
  }

  EXPECT_EQ( "second", read_xattr( target(), "user.k" ).value_or( "<unset>" ) );
  EXPECT_EQ( "", read_xattr( target(), "user.empty" ).value_or( "<unset>" ) );
  EXPECT_EQ( 0, filesystem::file_size( target() ) );
}

TEST_F( CreateTest, NeverReplacesAnExistingFile )
{
  create( target(), contents( "original" ), permissions( 0600 ) );
  const auto before = filesystem::last_write_time( target() );

  try {
    create( target(), contents( "replacement" ), permissions( 0644 ) );
    FAIL() << "existing file was replaced";
  } catch ( const creation_error& e ) {
    EXPECT_EQ( ErrorKind::AlreadyExists, e.kind() );
    EXPECT_EQ( e.os_error(), errc::file_exists );
  }

  EXPECT_EQ( "original", read_file( target() ) );
  EXPECT_EQ( filesystem::perms::owner_read | filesystem::perms::owner_write,
             filesystem::status( target() ).permissions() );
  EXPECT_EQ( before, filesystem::last_write_time( target() ) );
  EXPECT_EQ( vector<string> { "out.bin" }, list_directory( dir.path() ) );
}

TEST_F( CreateTest, MissingDirectory )
{
  try {
    create( dir.path() / "missing" / "out.bin", contents( "hello" ) );
    FAIL() << "created a file in a missing directory";
  } catch ( const creation_error& e ) {
    EXPECT_EQ( ErrorKind::StagingFailed, e.kind() );
    EXPECT_EQ( e.os_error(), errc::no_such_file_or_directory );
  }

  EXPECT_TRUE( list_directory( dir.path() ).empty() );
}

TEST_F( CreateTest, Timestamps )
{
  const TimePoint mtime { duration_cast<system_clock::duration>(
    seconds { 1'600'000'000 } + nanoseconds { 123'456'789 } ) };
  const TimePoint atime { duration_cast<system_clock::duration>(
    seconds { 1'500'000'000 } ) };

  create( target(),
          contents( "hello" ),
          modification_time( mtime ),
          access_time( atime ) );

  struct stat info;
  ASSERT_EQ( 0, stat( target().c_str(), &info ) );
  EXPECT_EQ( 1'600'000'000, info.st_mtim.tv_sec );
  EXPECT_EQ( 1'500'000'000, info.st_atim.tv_sec );
  EXPECT_EQ( 0, info.st_atim.tv_nsec );
}

TEST_F( CreateTest, UnsetTimestampIsLeftAlone )
{
  const auto start = system_clock::to_time_t( system_clock::now() );

  create( target(), contents( "hello" ), access_time( TimePoint {} ) );

  struct stat info;
  ASSERT_EQ( 0, stat( target().c_str(), &info ) );
  EXPECT_EQ( 0, info.st_atim.tv_sec );
  EXPECT_GE( info.st_mtim.tv_sec, start - 1 );
}

TEST_F( CreateTest, OwnershipToSelf )
{
  create( target(), contents( "hello" ), owner( getuid(), getgid() ) );

  struct stat info;
  ASSERT_EQ( 0, stat( target().c_str(), &info ) );
  EXPECT_EQ( getuid(), info.st_uid );
  EXPECT_EQ( getgid(), info.st_gid );
}

TEST_F( CreateTest, DurableCreation )
{
  create( target(), contents( "hello" ), durable(), permissions( 0600 ) );

  EXPECT_EQ( "hello", read_file( target() ) );
  EXPECT_EQ( vector<string> { "out.bin" }, list_directory( dir.path() ) );
}

TEST_F( CreateTest, ExplicitPreallocationKeepsSize )
{
  try {
    create( target(), contents( "hello" ), preallocate( 1 << 20 ) );
  } catch ( const creation_error& e ) {
    if ( e.kind() == ErrorKind::PreallocationFailed and unsupported( e ) ) {
      GTEST_SKIP() << "no fallocate here: " << e.what();
    }
    throw;
  }

  EXPECT_EQ( 5, filesystem::file_size( target() ) );
  EXPECT_EQ( "hello", read_file( target() ) );
}

TEST_F( CreateTest, RelativePath )
{
  const auto cwd = filesystem::current_path();
  filesystem::current_path( dir.path() );

  try {
    create( "relative.txt", contents( "hello" ) );
  } catch ( ... ) {
    filesystem::current_path( cwd );
    throw;
  }
  filesystem::current_path( cwd );

  EXPECT_EQ( "hello", read_file( dir.path() / "relative.txt" ) );
}

TEST_F( CreateTest, ContentsFromAFile )
{
  const string data = pattern( 300'000 );
  create( dir.path() / "source", contents( data ) );

  FileDescriptor source { CheckSystemCall(
    "open", open( ( dir.path() / "source" ).c_str(), O_RDONLY ) ) };
  create( target(), contents( move( source ) ) );

  EXPECT_TRUE( data == read_file( target() ) );
}

TEST_F( CreateTest, ContentsFromAStream )
{
  istringstream in { "streamed bytes" };
  create( target(), contents( in ) );

  EXPECT_EQ( "streamed bytes", read_file( target() ) );
}

TEST_F( CreateTest, ConcurrentCreatorsOfOneName )
{
  constexpr size_t CREATORS = 8;

  atomic<size_t> created { 0 };
  atomic<size_t> existed { 0 };
  vector<thread> creators;

  for ( size_t i = 0; i < CREATORS; i++ ) {
    creators.emplace_back( [&, i] {
      try {
        create( target(), contents( string( 100'000, 'a' + i ) ) );
        created++;
      } catch ( const creation_error& e ) {
        if ( e.kind() == ErrorKind::AlreadyExists ) {
          existed++;
        }
      }
    } );
  }

  for ( auto& creator : creators ) {
    creator.join();
  }

  EXPECT_EQ( 1, created.load() );
  EXPECT_EQ( CREATORS - 1, existed.load() );

  const string result = read_file( target() );
  ASSERT_EQ( 100'000, result.size() );
  EXPECT_EQ( string( 100'000, result.front() ), result );
}

TEST_F( CreateTest, ObserverNeverSeesPartialFile )
{
  constexpr size_t SIZE = 8 << 20;
  constexpr size_t FILES = 4;

  atomic<bool> done { false };
  atomic<size_t> partial { 0 };

  thread observer { [&] {
    while ( not done ) {
      for ( size_t i = 0; i < FILES; i++ ) {
        struct stat info;
        const auto path = dir.path() / ( "file-" + to_string( i ) );
        if ( stat( path.c_str(), &info ) == 0 ) {
          if ( static_cast<size_t>( info.st_size ) != SIZE
               or ( info.st_mode & 07777 ) != 0604 ) {
            partial++;
          }
        }
      }
    }
  } };

  for ( size_t i = 0; i < FILES; i++ ) {
    create( dir.path() / ( "file-" + to_string( i ) ),
            contents( string( SIZE, 'z' ) ),
            permissions( 0604 ) );
  }

  done = true;
  observer.join();

  EXPECT_EQ( 0, partial.load() );
  EXPECT_EQ( FILES, list_directory( dir.path() ).size() );
}
