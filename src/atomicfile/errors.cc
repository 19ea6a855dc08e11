/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "errors.hh"

#include <sstream>

using namespace std;

namespace atomicfile {

const char* to_string( const ErrorKind kind )
{
  switch ( kind ) {
    case ErrorKind::InvalidArgument: return "invalid argument";
    case ErrorKind::DuplicateOption: return "duplicate option";
    case ErrorKind::StagingFailed: return "staging failed";
    case ErrorKind::AttributeApplicationFailed:
      return "attribute application failed";
    case ErrorKind::PreallocationFailed: return "preallocation failed";
    case ErrorKind::DurabilityFailed: return "durability failed";
    case ErrorKind::AlreadyExists: return "already exists";
    case ErrorKind::PublicationFailed: return "publication failed";
  }

  return "unknown error";
}

const char* to_string( const AttributeStep step )
{
  switch ( step ) {
    case AttributeStep::None: return "none";
    case AttributeStep::Ownership: return "ownership";
    case AttributeStep::Permissions: return "permissions";
    case AttributeStep::Contents: return "contents";
    case AttributeStep::ExtendedAttribute: return "extended attribute";
    case AttributeStep::Timestamps: return "timestamps";
  }

  return "unknown step";
}

creation_error::creation_error( const ErrorKind kind,
                                const string& stage,
                                const string& cause,
                                const error_code os_error,
                                const AttributeStep step )
  : runtime_error( cause.empty() ? stage : stage + ": " + cause )
  , kind_( kind )
  , step_( step )
  , stage_( stage )
  , os_error_( os_error )
{}

void fail( const ErrorKind kind, const string& stage, const AttributeStep step )
{
  try {
    throw;
  } catch ( const system_error& e ) {
    throw_with_nested( creation_error { kind, stage, e.what(), e.code(), step } );
  } catch ( const exception& e ) {
    throw_with_nested( creation_error { kind, stage, e.what(), {}, step } );
  }
}

namespace {

void describe_level( const exception& e, ostringstream& out, const size_t depth )
{
  if ( depth > 0 ) {
    out << "\n" << string( 2 * depth, ' ' ) << "caused by: ";
  }

  const auto* creation = dynamic_cast<const creation_error*>( &e );
  const auto* nested = dynamic_cast<const nested_exception*>( &e );

  /* a wrapped cause already repeats its own text one level down */
  out << ( ( creation and nested and nested->nested_ptr() ) ? creation->stage()
                                                            : e.what() );

  try {
    rethrow_if_nested( e );
  } catch ( const exception& inner ) {
    describe_level( inner, out, depth + 1 );
  }
}

}

string describe( const exception& e )
{
  ostringstream out;
  describe_level( e, out, 0 );
  return out.str();
}

} // namespace atomicfile
