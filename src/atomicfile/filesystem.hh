/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "atomicfile/content_source.hh"
#include "atomicfile/options.hh"
#include "util/file_descriptor.hh"

namespace atomicfile {

//! The system calls a creation is made of. Every method throws
//! std::system_error (normally unix_error) on failure.
class FileSystem
{
public:
  //! An unnamed regular file inside `directory`
  virtual FileDescriptor open_anonymous( const std::filesystem::path& directory )
    = 0;

  //! A read-only handle on `directory`, for fsync
  virtual FileDescriptor open_directory( const std::filesystem::path& directory )
    = 0;

  virtual void change_owner( const FileDescriptor& file,
                             const std::optional<uid_t> uid,
                             const std::optional<gid_t> gid )
    = 0;

  virtual void change_mode( const FileDescriptor& file, const mode_t mode ) = 0;

  //! Allocate [0, length) without changing the file size
  virtual void preallocate( const FileDescriptor& file, const uint64_t length )
    = 0;

  //! \returns number of bytes written to `file`
  virtual uint64_t copy_contents( ContentSource& source, FileDescriptor& file )
    = 0;

  //! Deallocate [offset, offset + length) without changing the file size
  virtual void punch_hole( const FileDescriptor& file,
                           const uint64_t offset,
                           const uint64_t length )
    = 0;

  virtual void set_extended_attribute( const FileDescriptor& file,
                                       const std::string& name,
                                       const std::string& value )
    = 0;

  //! Unset times are left alone
  virtual void set_times( const FileDescriptor& file,
                          const std::optional<TimePoint> modification_time,
                          const std::optional<TimePoint> access_time )
    = 0;

  virtual void sync( const FileDescriptor& file ) = 0;

  //! Give the inode behind `file` the name `target`, by descriptor
  virtual void link_descriptor( const FileDescriptor& file,
                                const std::filesystem::path& target )
    = 0;

  //! Same as link_descriptor(), through /proc/self/fd
  virtual void link_proc_path( const FileDescriptor& file,
                               const std::filesystem::path& target )
    = 0;

  virtual ~FileSystem() {}
};

class PosixFileSystem : public FileSystem
{
public:
  FileDescriptor open_anonymous(
    const std::filesystem::path& directory ) override;
  FileDescriptor open_directory(
    const std::filesystem::path& directory ) override;
  void change_owner( const FileDescriptor& file,
                     const std::optional<uid_t> uid,
                     const std::optional<gid_t> gid ) override;
  void change_mode( const FileDescriptor& file, const mode_t mode ) override;
  void preallocate( const FileDescriptor& file, const uint64_t length ) override;
  uint64_t copy_contents( ContentSource& source, FileDescriptor& file ) override;
  void punch_hole( const FileDescriptor& file,
                   const uint64_t offset,
                   const uint64_t length ) override;
  void set_extended_attribute( const FileDescriptor& file,
                               const std::string& name,
                               const std::string& value ) override;
  void set_times( const FileDescriptor& file,
                  const std::optional<TimePoint> modification_time,
                  const std::optional<TimePoint> access_time ) override;
  void sync( const FileDescriptor& file ) override;
  void link_descriptor( const FileDescriptor& file,
                        const std::filesystem::path& target ) override;
  void link_proc_path( const FileDescriptor& file,
                       const std::filesystem::path& target ) override;
};

} // namespace atomicfile
