#pragma once

#include <string>
#include <utility>

namespace tierbridge::db {

/*
  Outcome of one repository write.

  Backends translate sqlite result codes and pqxx exception types into
  these; ThrowIfDbError (db_errors.hpp) turns a failure into the
  util::errors taxonomy at the engine boundary.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,            // update or delete of a missing row
  AlreadyExists,       // primary key taken
  ConstraintViolation, // any other constraint
  Busy,                // lock wait or serialization failure
  Unavailable,         // connection or disk I/O failure
  Corrupt,             // database file damaged
  Internal
};

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

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Corrupt:
      return "corrupt";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

} // namespace tierbridge::db
