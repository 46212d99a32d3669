#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace strata::util {

/*
  Outcome of a ledger call or a migration body.

  Ledger backends translate their native errors into these codes, and
  migrations report their own outcome with the same type, so nothing above
  the db layer sees pqxx or sqlite errors.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  Cancelled,
  Unsupported,
  InternalError
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

  // Same code, message prefixed with "<context>: ". No-op on success.
  Result WithContext(std::string_view context) const {
    if (code == ErrorCode::OK) return *this;
    return {code, std::string(context) + ": " + message};
  }
};

const char* ErrorCodeName(ErrorCode code);

// "<code>: <message>" or just "<code>" when there is no message.
std::string Describe(const Result& result);

} // namespace strata::util
