#include "api/routes/AuthRoutes.hpp"

#include "api/AuthMiddleware.hpp"
#include "api/CrowExchange.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/UserRepository.hpp"
#include "security/PasswordHasher.hpp"
#include "security/TokenService.hpp"

#include <nlohmann/json.hpp>

namespace restauth::api::routes {

namespace {
void sendJson(crow::response& res, int iStatus, const nlohmann::json& jBody) {
  res.code = iStatus;
  res.set_header("Content-Type", "application/json");
  res.body = jBody.dump(2);
  res.end();
}

void sendError(crow::response& res, int iStatus, const std::string& sCode,
               const std::string& sMessage) {
  sendJson(res, iStatus, {{"error", sCode}, {"message", sMessage}});
}

nlohmann::json sessionJson(const dal::SessionRow& srRow) {
  nlohmann::json jSession = {
      {"name", srRow.sName},
      {"user_id", srRow.iUser},
      {"created_at", srRow.iCreatedAt},
      {"expiration_at", srRow.iExpirationAt},
      {"updated_tally", srRow.iUpdatedTally},
      {"additionals", srRow.jAdditionals},
  };
  jSession["updated_at"] = srRow.oUpdatedAt ? nlohmann::json(*srRow.oUpdatedAt) : nullptr;
  return jSession;
}

/// Run a handler body, mapping thrown errors onto JSON error responses.
template <typename Fn>
void handle(crow::response& res, Fn&& fn) {
  try {
    fn();
  } catch (const common::AppError& e) {
    sendError(res, e._iHttpStatus, e._sErrorCode, e.what());
  } catch (const nlohmann::json::exception&) {
    sendError(res, 400, "invalid_json", "Invalid JSON body");
  } catch (const std::exception& e) {
    common::Logger::get()->error("Unhandled error in auth route: {}", e.what());
    sendError(res, 500, "internal_error", "Internal server error");
  }
}
}  // namespace

AuthRoutes::AuthRoutes(security::TokenService& tksService,
                       const api::AuthMiddleware& amMiddleware, dal::UserRepository& urRepo,
                       const security::PasswordHasher& phHasher, bool bTrustForwardedProto)
    : _tksService(tksService),
      _amMiddleware(amMiddleware),
      _urRepo(urRepo),
      _phHasher(phHasher),
      _bTrustForwardedProto(bTrustForwardedProto) {}

AuthRoutes::~AuthRoutes() = default;

void AuthRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /api/v1/auth/login
  CROW_ROUTE(app, "/api/v1/auth/login").methods("POST"_method)(
      [this](const crow::request& req, crow::response& res) {
        handle(res, [&] {
          auto jBody = nlohmann::json::parse(req.body);
          std::string sUsername = jBody.value("username", "");
          std::string sPassword = jBody.value("password", "");

          if (sUsername.empty() || sPassword.empty()) {
            sendError(res, 400, "validation_error", "username and password are required");
            return;
          }

          // Same error for unknown user and wrong password
          auto oUser = _urRepo.findByUsername(sUsername);
          if (!oUser.has_value() || !_phHasher.verify(sPassword, oUser->sPasswordHash)) {
            sendError(res, 401, "invalid_credentials", "Invalid username or password");
            return;
          }
          if (!oUser->bIsActive) {
            sendError(res, 401, "account_disabled", "User account is disabled");
            return;
          }

          CrowExchange cxExchange(req, res, _bTrustForwardedProto);
          auto resToken = _tksService.generate(cxExchange, AuthMiddleware::kSessionToken,
                                               oUser->iId);
          if (!resToken.bOk) {
            sendError(res, resToken.iStatus, resToken.sCode, resToken.sMessage);
            return;
          }

          sendJson(res, 200,
                   {{"user_id", resToken.oData->iUserId},
                    {"issued_at", resToken.oData->iIssuedAt},
                    {"expires_at", resToken.oData->iExpiresAt}});
        });
      });

  // POST /api/v1/auth/logout
  CROW_ROUTE(app, "/api/v1/auth/logout").methods("POST"_method)(
      [this](const crow::request& req, crow::response& res) {
        handle(res, [&] {
          CrowExchange cxExchange(req, res, _bTrustForwardedProto);
          auto rcCtx = _amMiddleware.authenticate(cxExchange);

          auto stRemoved = _tksService.remove(cxExchange, rcCtx.sTokenName, rcCtx.iUserId);
          if (!stRemoved.bOk) {
            sendError(res, stRemoved.iStatus, stRemoved.sCode, stRemoved.sMessage);
            return;
          }
          sendJson(res, 200, {{"message", "Logged out successfully"}});
        });
      });

  // GET /api/v1/auth/me
  CROW_ROUTE(app, "/api/v1/auth/me").methods("GET"_method)(
      [this](const crow::request& req, crow::response& res) {
        handle(res, [&] {
          CrowExchange cxExchange(req, res, _bTrustForwardedProto);
          auto rcCtx = _amMiddleware.authenticate(cxExchange);

          auto oUser = _urRepo.findById(rcCtx.iUserId);
          sendJson(res, 200,
                   {{"user_id", rcCtx.iUserId},
                    {"username", oUser ? oUser->sUsername : std::string()},
                    {"issued_at", rcCtx.iIssuedAt},
                    {"expires_at", rcCtx.iExpiresAt}});
        });
      });

  // GET /api/v1/auth/session
  CROW_ROUTE(app, "/api/v1/auth/session").methods("GET"_method)(
      [this](const crow::request& req, crow::response& res) {
        handle(res, [&] {
          CrowExchange cxExchange(req, res, _bTrustForwardedProto);
          auto rcCtx = _amMiddleware.authenticate(cxExchange);

          auto resSession = _tksService.sessionData(rcCtx.sTokenName, rcCtx.iUserId);
          if (!resSession.bOk) {
            sendError(res, resSession.iStatus, resSession.sCode, resSession.sMessage);
            return;
          }
          sendJson(res, 200, sessionJson(*resSession.oData));
        });
      });

  // PUT /api/v1/auth/session
  CROW_ROUTE(app, "/api/v1/auth/session").methods("PUT"_method)(
      [this](const crow::request& req, crow::response& res) {
        handle(res, [&] {
          auto jAdditionals = nlohmann::json::parse(req.body);

          CrowExchange cxExchange(req, res, _bTrustForwardedProto);
          auto rcCtx = _amMiddleware.authenticate(cxExchange);

          auto resSession =
              _tksService.updateSessionData(rcCtx.sTokenName, rcCtx.iUserId, jAdditionals);
          if (!resSession.bOk) {
            sendError(res, resSession.iStatus, resSession.sCode, resSession.sMessage);
            return;
          }
          sendJson(res, 200, sessionJson(*resSession.oData));
        });
      });
}

}  // namespace restauth::api::routes
