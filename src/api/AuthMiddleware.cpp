#include "api/AuthMiddleware.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/UserRepository.hpp"
#include "security/TokenService.hpp"

namespace restauth::api {

AuthMiddleware::AuthMiddleware(security::TokenService& tksService,
                               dal::UserRepository& urRepo)
    : _tksService(tksService), _urRepo(urRepo) {}

AuthMiddleware::~AuthMiddleware() = default;

common::RequestContext AuthMiddleware::authenticate(transport::IHttpExchange& heExchange,
                                                    const std::string& sTokenName) const {
  auto resToken = _tksService.validate(heExchange, sTokenName);
  if (!resToken.bOk) {
    throw common::AppError(resToken.iStatus, resToken.sCode, resToken.sMessage);
  }

  const auto& apPrincipal = *resToken.oData;
  auto oUser = _urRepo.findById(apPrincipal.iUserId);
  if (!oUser.has_value() || !oUser->bIsActive) {
    auto stRemoved = _tksService.remove(heExchange, sTokenName, apPrincipal.iUserId);
    if (!stRemoved.bOk) {
      common::Logger::get()->warn("Token '{}' of inactive user {} not fully removed: {}",
                                  sTokenName, apPrincipal.iUserId, stRemoved.sCode);
    }
    throw common::AuthenticationError("user_not_found", "User not found or inactive");
  }

  common::RequestContext rcCtx;
  rcCtx.iUserId = apPrincipal.iUserId;
  rcCtx.sTokenName = sTokenName;
  rcCtx.iIssuedAt = apPrincipal.iIssuedAt;
  rcCtx.iExpiresAt = apPrincipal.iExpiresAt;
  return rcCtx;
}

}  // namespace restauth::api
