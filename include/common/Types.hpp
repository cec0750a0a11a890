#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace restauth::common {

/// Uniform outcome envelope returned by every public protocol operation.
/// Failures of every category share this shape; only sCode/sMessage differ.
/// Class abbreviation: res
template <typename T>
struct Result {
  bool bOk = false;
  int iStatus = 500;
  std::string sCode;
  std::string sMessage;
  std::optional<T> oData;

  static Result success(int iStatus, std::string sMessage, T data) {
    Result res;
    res.bOk = true;
    res.iStatus = iStatus;
    res.sMessage = std::move(sMessage);
    res.oData = std::move(data);
    return res;
  }

  static Result failure(int iStatus, std::string sCode, std::string sMessage) {
    Result res;
    res.iStatus = iStatus;
    res.sCode = std::move(sCode);
    res.sMessage = std::move(sMessage);
    return res;
  }
};

/// Result with no payload.
using Status = Result<std::monostate>;

/// Identity context injected by AuthMiddleware.
/// Class abbreviation: rc
struct RequestContext {
  int64_t iUserId = 0;
  std::string sTokenName;
  int64_t iIssuedAt = 0;
  int64_t iExpiresAt = 0;
};

}  // namespace restauth::common
