/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <filesystem>
#include <optional>

#include "atomicfile/filesystem.hh"
#include "util/file_descriptor.hh"

namespace atomicfile {

//! An unnamed file in the target directory. Invisible to everyone else until
//! publish(); discarded by the kernel if it is never published.
class StagedFile
{
private:
  FileSystem& fs_;
  std::optional<FileDescriptor> fd_;

public:
  //! Throws creation_error (StagingFailed)
  StagedFile( FileSystem& fs, const std::filesystem::path& directory );

  FileDescriptor& fd();

  //! Link the file as `target`, never replacing an existing name. Consumes
  //! the descriptor whether or not it succeeds.
  //! Throws creation_error (AlreadyExists or PublicationFailed)
  void publish( const std::filesystem::path& target ) &&;

  StagedFile( const StagedFile& other ) = delete;
  StagedFile& operator=( const StagedFile& other ) = delete;
};

} // namespace atomicfile
