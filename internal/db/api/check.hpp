#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::db {

// Translates a repository result into the core error taxonomy.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.ToString();
  switch (result.code) {
    case ErrorCode::NotFound:
      throw vkyc::util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw vkyc::util::InvalidArgument(message);
    case ErrorCode::Conflict:
      throw vkyc::util::TransitionError(message);
    case ErrorCode::Busy:
      throw vkyc::util::ResourceExhausted(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace vkyc::db
