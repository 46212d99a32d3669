#include "internal/util/result.hpp"

namespace strata::util {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

std::string Describe(const Result& result) {
  std::string out = ErrorCodeName(result.code);
  if (!result.message.empty()) {
    out += ": ";
    out += result.message;
  }
  return out;
}

} // namespace strata::util
