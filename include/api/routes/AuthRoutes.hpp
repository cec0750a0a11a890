#pragma once

#include <crow.h>

namespace restauth::dal {
class UserRepository;
}

namespace restauth::security {
class PasswordHasher;
class TokenService;
}  // namespace restauth::security

namespace restauth::api {
class AuthMiddleware;
}

namespace restauth::api::routes {

/// Handlers for /api/v1/auth
/// Class abbreviation: ar
class AuthRoutes {
 public:
  AuthRoutes(security::TokenService& tksService, const api::AuthMiddleware& amMiddleware,
             dal::UserRepository& urRepo, const security::PasswordHasher& phHasher,
             bool bTrustForwardedProto);
  ~AuthRoutes();

  /// Register auth routes on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

 private:
  security::TokenService& _tksService;
  const api::AuthMiddleware& _amMiddleware;
  dal::UserRepository& _urRepo;
  const security::PasswordHasher& _phHasher;
  bool _bTrustForwardedProto;
};

}  // namespace restauth::api::routes
