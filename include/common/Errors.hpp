#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace restauth::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: caller passed invalid input.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 401 Unauthorized: token or session rejected.
struct AuthenticationError : AppError {
  explicit AuthenticationError(std::string sCode, std::string sMsg)
      : AppError(401, std::move(sCode), std::move(sMsg)) {}
};

/// 403 Forbidden: request refused by security policy (e.g., plain HTTP).
struct AuthorizationError : AppError {
  explicit AuthorizationError(std::string sCode, std::string sMsg)
      : AppError(403, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: requested entity does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: concurrent modification lost a compare-and-swap.
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: persistence layer failed.
struct StoreError : AppError {
  explicit StoreError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: cookie or header could not be written.
struct TransportError : AppError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace restauth::common
