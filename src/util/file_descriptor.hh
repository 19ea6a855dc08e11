/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <sys/types.h>

//! A reference-counted handle to a file descriptor
class FileDescriptor
{
  //! \brief A handle on a kernel file descriptor.
  //! \details FileDescriptor objects contain a std::shared_ptr to a FDWrapper.
  class FDWrapper
  {
  public:
    int _fd;              //!< The file descriptor number returned by the kernel
    bool _eof = false;    //!< Flag indicating whether FDWrapper::_fd is at EOF
    bool _closed = false; //!< Flag indicating whether FDWrapper::_fd has been closed

    //! Construct from a file descriptor number returned by the kernel
    explicit FDWrapper( const int fd );
    //! Closes the file descriptor upon destruction
    ~FDWrapper();
    //! Calls [close(2)](\ref man2::close) on FDWrapper::_fd, at most once
    void close();

    //! \name
    //! An FDWrapper cannot be copied or moved

    //!@{
    FDWrapper( const FDWrapper& other ) = delete;
    FDWrapper& operator=( const FDWrapper& other ) = delete;
    FDWrapper( FDWrapper&& other ) = delete;
    FDWrapper& operator=( FDWrapper&& other ) = delete;
    //!@}
  };

  //! A reference-counted handle to a shared FDWrapper
  std::shared_ptr<FDWrapper> _internal_fd;

  // private constructor used to duplicate the FileDescriptor (increase the reference count)
  explicit FileDescriptor( std::shared_ptr<FDWrapper> other_shared_ptr );

public:
  //! Construct from a file descriptor number returned by the kernel
  explicit FileDescriptor( const int fd );

  //! Free the std::shared_ptr; the FDWrapper destructor calls close() when the refcount goes to zero.
  ~FileDescriptor() = default;

  //! Read up to `length` bytes into `buffer`
  //! \returns number of bytes read (0 at end of file)
  size_t read( char* buffer, const size_t length );

  //! Attempt to write a buffer
  //! \returns number of bytes written
  size_t write( const std::string_view buffer );

  //! Write the whole buffer, retrying after short writes
  void write_all( std::string_view buffer );

  //! [fstat(2)](\ref man2::fstat) on the descriptor
  struct stat stat() const;

  //! Current file offset, from [lseek(2)](\ref man2::lseek)
  off_t offset() const;

  //! Close the underlying file descriptor
  void close() { _internal_fd->close(); }

  //! Copy a FileDescriptor explicitly, increasing the FDWrapper refcount
  FileDescriptor duplicate() const;

  //! \name FDWrapper accessors
  //!@{
  int fd_num() const { return _internal_fd->_fd; }      //!< \brief underlying descriptor number
  bool eof() const { return _internal_fd->_eof; }       //!< \brief EOF flag state
  bool closed() const { return _internal_fd->_closed; } //!< \brief closed flag state
  //!@}

  //! \name Copy/move constructor/assignment operators
  //! FileDescriptor can be moved, but cannot be copied (but see duplicate())
  //!@{
  FileDescriptor( const FileDescriptor& other ) = delete;            //!< \brief copy construction is forbidden
  FileDescriptor& operator=( const FileDescriptor& other ) = delete; //!< \brief copy assignment is forbidden
  FileDescriptor( FileDescriptor&& other ) = default;                //!< \brief move construction is allowed
  FileDescriptor& operator=( FileDescriptor&& other ) = default;     //!< \brief move assignment is allowed
                                                                     //!@}
};

//! \class FileDescriptor
//! Every system call made through a FileDescriptor goes through
//! CheckSystemCall, so failures surface as unix_error carrying errno.
