#pragma once

#include <string>
#include <string_view>

namespace vkyc::db {

/*
  Outcome of a repository call.

  Backends map their native failures onto ErrorCode; the session core turns
  a failed Result into an exception with ThrowIfDbError (check.hpp).
*/

enum class ErrorCode {
  OK = 0,

  // lookups and inserts
  NotFound,
  AlreadyExists,

  // UpdateSession lost the version compare-and-set
  Conflict,

  // writer lock held elsewhere past the busy timeout
  Busy,
  ConstraintViolation,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
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

  std::string ToString() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) {
      out += ": " + message;
    }
    return out;
  }
};

} // namespace vkyc::db
