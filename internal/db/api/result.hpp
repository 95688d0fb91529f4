#pragma once

#include <string>

namespace causal::db {

// Backend failure classes. Repositories map sqlite3 return codes onto these.
enum class ErrorCode {
  OK = 0,

  NotFound,
  Conflict,
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
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
      return "internal";
  }
  return "unknown";
}

/*
  Outcome of a repository write (insert, reset).

  Reads return std::optional / vectors instead; absence there is not an
  error.
*/
struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace causal::db
