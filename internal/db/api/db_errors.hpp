#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace tierbridge::db {

/*
  Missing and duplicate rows keep their meaning for callers; every other
  failure is a std::runtime_error, which the TransferEngine treats as
  transient.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) message += ": " + result.message;

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::ConstraintViolation:
      throw std::invalid_argument(message);
    case ErrorCode::Corrupt:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace tierbridge::db
