#pragma once

#include <string>

#include "common/Types.hpp"

namespace restauth::dal {
class UserRepository;
}

namespace restauth::security {
class TokenService;
}

namespace restauth::transport {
class IHttpExchange;
}

namespace restauth::api {

/// Cookie token validation for protected routes; yields the RequestContext.
/// Class abbreviation: am
class AuthMiddleware {
 public:
  static constexpr const char* kSessionToken = "session";

  AuthMiddleware(security::TokenService& tksService, dal::UserRepository& urRepo);
  ~AuthMiddleware();

  /// Validate the token named sTokenName (rotating its secrets) and check
  /// that its user still exists and is active.
  /// Throws AppError carrying the status and code of the rejection.
  common::RequestContext authenticate(transport::IHttpExchange& heExchange,
                                      const std::string& sTokenName = kSessionToken) const;

 private:
  security::TokenService& _tksService;
  dal::UserRepository& _urRepo;
};

}  // namespace restauth::api
