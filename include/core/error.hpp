#ifndef CFS_CORE_ERROR_HPP
#define CFS_CORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cfs {

enum class ErrorCode {
  NOT_FOUND,
  CONFLICT,
  BAD_REQUEST,
  RANGE_NOT_SATISFIABLE,
  INTERNAL
};

inline const char* error_code_to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::NOT_FOUND: return "Not found";
    case ErrorCode::CONFLICT: return "Conflict";
    case ErrorCode::BAD_REQUEST: return "Bad request";
    case ErrorCode::RANGE_NOT_SATISFIABLE: return "Range not satisfiable";
    case ErrorCode::INTERNAL: return "Internal error";
    default: return "Undefined error";
  }
}

// Base of every failure that maps onto a client-visible status
class ServiceError : public std::runtime_error {
public:
  ServiceError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

class NotFoundError : public ServiceError {
public:
  explicit NotFoundError(const std::string& message)
    : ServiceError(ErrorCode::NOT_FOUND, message) {}
};

class ConflictError : public ServiceError {
public:
  explicit ConflictError(const std::string& message)
    : ServiceError(ErrorCode::CONFLICT, message) {}
};

class BadRequestError : public ServiceError {
public:
  explicit BadRequestError(const std::string& message)
    : ServiceError(ErrorCode::BAD_REQUEST, message) {}
};

class RangeNotSatisfiableError : public ServiceError {
public:
  explicit RangeNotSatisfiableError(const std::string& message)
    : ServiceError(ErrorCode::RANGE_NOT_SATISFIABLE, message) {}
};

} // namespace cfs

#endif // CFS_CORE_ERROR_HPP
