#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace freight::db {

// Raises the util:: exception matching a failed repository result.
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw freight::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw freight::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw freight::util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace freight::db
