#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace apparatus::db {

/*
  Backend-neutral outcome of one repository call.

  Backends translate sqlite3 / pqxx failures into these codes; the store
  maps them onto util::NotFound, ConflictError and IntegrityError.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  // stale unit version, or a concurrent writer won the row
  Conflict,
  // the backend could not take its write lock
  Busy,

  // UNIQUE, CHECK or FOREIGN KEY rejected the write
  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
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

} // namespace apparatus::db
