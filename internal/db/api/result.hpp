#pragma once

#include <string>

namespace tablebook::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  ConnectionLost,
  Timeout,
  IOError,
  Corruption,

  // schema / statement defects
  UndefinedTable,
  UndefinedColumn,
  SyntaxError,

  Unsupported,
  InternalError
};

// True for failures that may succeed when the same work is repeated
// against fresh state.
constexpr bool IsTransient(ErrorCode code) {
  switch (code) {
    case ErrorCode::Busy:
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
    case ErrorCode::SerializationFailure:
    case ErrorCode::ConnectionLost:
    case ErrorCode::Timeout:
      return true;
    default:
      return false;
  }
}

constexpr const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::ConnectionLost: return "connection_lost";
    case ErrorCode::Timeout: return "timeout";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::UndefinedTable: return "undefined_table";
    case ErrorCode::UndefinedColumn: return "undefined_column";
    case ErrorCode::SyntaxError: return "syntax_error";
    case ErrorCode::Unsupported: return "unsupported";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace tablebook::db
