#include <fcntl.h>
#include <sstream>
#include <string>
#include <unistd.h>

#include <gtest/gtest.h>

#include "atomicfile/content_source.hh"
#include "util/exception.hh"
#include "util/fileutils.hh"
#include "util/temp_dir.hh"

using namespace std;
using namespace atomicfile;

class ContentSourceTest : public ::testing::Test
{
protected:
  TempDirectory dir { TempDirectory::in_tmpdir( "atomicfile-source-" ) };

  FileDescriptor open_file( const string& name, const int flags )
  {
    return FileDescriptor { CheckSystemCall(
      "open", open( ( dir.path() / name ).c_str(), flags | O_CLOEXEC, 0600 ) ) };
  }

  FileDescriptor file_with( const string& name, const string& data )
  {
    {
      FileDescriptor out = open_file( name, O_WRONLY | O_CREAT | O_TRUNC );
      out.write_all( data );
    }
    return open_file( name, O_RDONLY );
  }

  /* copies `source` into a new file and returns what was written */
  string copy( ContentSource& source )
  {
    FileDescriptor out = open_file( "copy", O_WRONLY | O_CREAT | O_TRUNC );
    const uint64_t written = source.copy_to( out );
    const string result = read_file( dir.path() / "copy" );
    EXPECT_EQ( result.size(), written );
    return result;
  }
};

TEST_F( ContentSourceTest, BufferHint )
{
  auto source = ContentSource::buffer( "hello" );

  EXPECT_EQ( 5u, source.size_hint().value_or( 0 ) );
  EXPECT_EQ( "hello", copy( source ) );
}

TEST_F( ContentSourceTest, SeekableStreamHintDoesNotConsume )
{
  istringstream in { "0123456789" };
  in.ignore( 3 );

  auto source = ContentSource::stream( in );

  EXPECT_EQ( 7u, source.size_hint().value_or( 0 ) );
  EXPECT_EQ( 7u, source.size_hint().value_or( 0 ) );
  EXPECT_EQ( "3456789", copy( source ) );
}

TEST_F( ContentSourceTest, UnseekableStreamHasNoHint )
{
  /* a streambuf that only supports reading forward */
  struct forward_only : streambuf
  {
    string data;
    explicit forward_only( string d )
      : data( move( d ) )
    {
      setg( data.data(), data.data(), data.data() + data.size() );
    }
  };

  forward_only buf { "no seeking" };
  istream in { &buf };
  auto source = ContentSource::stream( in );

  EXPECT_FALSE( source.size_hint().has_value() );
  EXPECT_EQ( "no seeking", copy( source ) );
}

TEST_F( ContentSourceTest, FileHintStartsAtOffset )
{
  FileDescriptor in = file_with( "in", "abcdefgh" );
  char skipped[2];
  ASSERT_EQ( 2u, in.read( skipped, sizeof( skipped ) ) );

  auto source = ContentSource::file( move( in ) );

  EXPECT_EQ( 6u, source.size_hint().value_or( 0 ) );
  EXPECT_EQ( "cdefgh", copy( source ) );
}

TEST_F( ContentSourceTest, PipeHasNoHint )
{
  int fds[2];
  CheckSystemCall( "pipe", pipe2( fds, O_CLOEXEC ) );
  FileDescriptor read_end { fds[0] };
  FileDescriptor write_end { fds[1] };

  write_end.write_all( "through a pipe" );
  write_end.close();

  auto source = ContentSource::file( move( read_end ) );

  EXPECT_FALSE( source.size_hint().has_value() );
  EXPECT_EQ( "through a pipe", copy( source ) );
}

TEST_F( ContentSourceTest, LimitedSource )
{
  auto shorter = ContentSource::limited( ContentSource::buffer( "abcdef" ), 4 );
  EXPECT_EQ( 4u, shorter.size_hint().value_or( 0 ) );
  EXPECT_EQ( "abcd", copy( shorter ) );

  auto longer = ContentSource::limited( ContentSource::buffer( "ab" ), 10 );
  EXPECT_EQ( 2u, longer.size_hint().value_or( 0 ) );
  EXPECT_EQ( "ab", copy( longer ) );
}

TEST_F( ContentSourceTest, LimitedFileAndStream )
{
  FileDescriptor in = file_with( "in", string( 100'000, 'q' ) );
  auto file = ContentSource::limited( ContentSource::file( move( in ) ), 70'000 );
  EXPECT_EQ( 70'000u, file.size_hint().value_or( 0 ) );
  EXPECT_EQ( string( 70'000, 'q' ), copy( file ) );

  istringstream stream_in { "limited stream" };
  auto stream = ContentSource::limited( ContentSource::stream( stream_in ), 7 );
  EXPECT_EQ( "limited", copy( stream ) );
  EXPECT_EQ( ' ', stream_in.peek() );
}

TEST_F( ContentSourceTest, LimitWithoutInnerHint )
{
  FileDescriptor duplicate = [&] {
    int fds[2];
    CheckSystemCall( "pipe", pipe2( fds, O_CLOEXEC ) );
    FileDescriptor read_end { fds[0] };
    FileDescriptor write_end { fds[1] };
    write_end.write_all( "0123456789" );
    return read_end.duplicate();
  }();

  auto source = ContentSource::limited( ContentSource::file( move( duplicate ) ), 4 );

  EXPECT_FALSE( source.size_hint().has_value() );
  EXPECT_EQ( "0123", copy( source ) );
}
