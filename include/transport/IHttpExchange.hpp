#pragma once

#include <optional>
#include <string>

namespace restauth::transport {

/// The slice of one HTTP request/response pair that the token protocol
/// needs. Implemented over the HTTP server in use and by test fakes.
class IHttpExchange {
 public:
  virtual ~IHttpExchange() = default;

  /// Case-insensitive request header lookup.
  virtual std::optional<std::string> requestHeader(const std::string& sName) const = 0;

  /// Whether the request arrived over TLS.
  virtual bool isSecure() const = 0;

  /// Whether response headers can no longer be changed.
  virtual bool responseCommitted() const = 0;

  /// Append a response header (repeated names are kept, not replaced).
  virtual void addResponseHeader(const std::string& sName, const std::string& sValue) = 0;
};

}  // namespace restauth::transport
