/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "util/file_descriptor.hh"

namespace atomicfile {

//! Where the bytes of a new file come from
class ContentSource
{
public:
  //! Bytes held in memory
  struct Buffer
  {
    std::string data;
  };

  //! A borrowed stream; must outlive the creation
  struct Stream
  {
    std::istream* in;
  };

  //! An open file, read from its current offset
  struct File
  {
    FileDescriptor fd;
  };

  //! At most `limit` bytes of another source
  struct Limited
  {
    std::shared_ptr<ContentSource> inner;
    uint64_t limit;
  };

  using Kind = std::variant<Buffer, Stream, File, Limited>;

private:
  Kind source_;

  explicit ContentSource( Kind source );

public:
  static ContentSource buffer( std::string data );
  static ContentSource stream( std::istream& in );
  static ContentSource file( FileDescriptor fd );
  static ContentSource limited( ContentSource inner, const uint64_t limit );

  //! \returns the number of bytes left to copy, if it can be known without
  //! consuming anything
  std::optional<uint64_t> size_hint() const;

  //! Copy everything that is left, or at most `limit` bytes, to `dst`.
  //! File sources go through copy_file_range(2) when the kernel allows it.
  //! \returns number of bytes written to `dst`
  uint64_t copy_to( FileDescriptor& dst,
                    const std::optional<uint64_t> limit = std::nullopt );

  ContentSource( ContentSource&& other ) = default;
  ContentSource& operator=( ContentSource&& other ) = default;
};

} // namespace atomicfile
