/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

namespace atomicfile {

enum class ErrorKind
{
  InvalidArgument,
  DuplicateOption,
  StagingFailed,
  AttributeApplicationFailed,
  PreallocationFailed,
  DurabilityFailed,
  AlreadyExists,
  PublicationFailed,
};

/* which attribute step failed, for ErrorKind::AttributeApplicationFailed */
enum class AttributeStep
{
  None,
  Ownership,
  Permissions,
  Contents,
  ExtendedAttribute,
  Timestamps,
};

const char* to_string( const ErrorKind kind );
const char* to_string( const AttributeStep step );

class creation_error : public std::runtime_error
{
private:
  ErrorKind kind_;
  AttributeStep step_;
  std::string stage_;
  std::error_code os_error_;

public:
  creation_error( const ErrorKind kind,
                  const std::string& stage,
                  const std::string& cause,
                  const std::error_code os_error = {},
                  const AttributeStep step = AttributeStep::None );

  ErrorKind kind() const { return kind_; }
  AttributeStep step() const { return step_; }
  const std::string& stage() const { return stage_; }

  /* empty unless the failure came from a system call */
  const std::error_code& os_error() const { return os_error_; }
};

/* Must be called from inside a catch block. Throws a creation_error for
   `stage` with the exception being handled nested inside it. */
[[noreturn]] void fail( const ErrorKind kind,
                        const std::string& stage,
                        const AttributeStep step = AttributeStep::None );

/* one line per level of a std::throw_with_nested chain */
std::string describe( const std::exception& e );

} // namespace atomicfile
