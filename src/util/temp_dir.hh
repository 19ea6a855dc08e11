/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

/* a freshly created directory with a unique name, made by mkdtemp(3) */
class UniqueDirectory
{
private:
  std::vector<char> mutable_temp_dirname_;

protected:
  bool moved_away_;

public:
  /* dirname_template is a prefix; "XXXXXX" is appended */
  UniqueDirectory( const std::string& dirname_template );
  virtual ~UniqueDirectory() {}

  std::string name( void ) const;
  std::filesystem::path path( void ) const { return name(); }

  /* ban copying */
  UniqueDirectory( const UniqueDirectory& other ) = delete;
  UniqueDirectory& operator=( const UniqueDirectory& other ) = delete;

  /* allow move constructor */
  UniqueDirectory( UniqueDirectory&& other );

  /* ... but not move assignment operator */
  UniqueDirectory& operator=( UniqueDirectory&& other ) = delete;
};

/* TempDirectory and everything in it is deleted when object destroyed */
class TempDirectory : public UniqueDirectory
{
public:
  using UniqueDirectory::UniqueDirectory;

  /* a directory under $TMPDIR (or /tmp) named after `prefix` */
  static TempDirectory in_tmpdir( const std::string& prefix );

  /* allow move constructor */
  TempDirectory( TempDirectory&& other )
    : UniqueDirectory( std::move( other ) )
  {}

  ~TempDirectory();
};
