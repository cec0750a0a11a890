#include "security/TokenService.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/SessionStore.hpp"
#include "security/CryptoService.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace restauth::security {

using common::AppError;
using common::AuthenticationError;
using common::Result;
using common::Status;

namespace {
constexpr const char* kRefreshSuffix = "_refresh";

/// Scoped copy of a secret that is wiped when it goes out of scope.
class SecretBytes {
 public:
  explicit SecretBytes(std::vector<unsigned char> vData) : _vData(std::move(vData)) {}
  ~SecretBytes() { OPENSSL_cleanse(_vData.data(), _vData.size()); }

  SecretBytes(const SecretBytes&) = delete;
  SecretBytes& operator=(const SecretBytes&) = delete;

  const std::vector<unsigned char>& get() const { return _vData; }

 private:
  std::vector<unsigned char> _vData;
};

std::string userLabel(const std::optional<int64_t>& oUser) {
  return oUser ? std::to_string(*oUser) : std::string("unknown");
}
}  // namespace

TokenService::TokenService(const CryptoService& csCrypto, core::SessionStore& ssStore,
                           const common::IClock& clkClock, TokenSettings tsSettings)
    : _csCrypto(csCrypto),
      _ssStore(ssStore),
      _clkClock(clkClock),
      _tsSettings(std::move(tsSettings)),
      _atcCodec(csCrypto) {}

TokenService::~TokenService() = default;

bool TokenService::isValidName(const std::string& sName) {
  return !sName.empty() && std::all_of(sName.begin(), sName.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_';
  });
}

std::string TokenService::cookieName(const std::string& sName) const {
  return _tsSettings.sPrefix + sName;
}

std::string TokenService::refreshCookieName(const std::string& sName) const {
  return _tsSettings.sPrefix + sName + kRefreshSuffix;
}

transport::CookieTransport TokenService::cookies(transport::IHttpExchange& heExchange) const {
  return transport::CookieTransport(heExchange, _tsSettings.cpolCookies, _clkClock);
}

void TokenService::sweep() {
  try {
    _ssStore.sweepExpired();
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Expired session sweep failed: {}", ex.what());
  }
}

// ── generate ───────────────────────────────────────────────────────────────

Result<AuthenticatedPrincipal> TokenService::generate(transport::IHttpExchange& heExchange,
                                                      const std::string& sName,
                                                      int64_t iUserId,
                                                      std::optional<int64_t> oTtlSeconds,
                                                      const nlohmann::json& jAdditionals) {
  using ResultT = Result<AuthenticatedPrincipal>;
  auto spLog = common::Logger::get();

  if (!isValidName(sName)) {
    return ResultT::failure(400, "invalid_token_name",
                            "Token name must be non-empty [A-Za-z0-9_].");
  }
  if (iUserId <= 0) {
    return ResultT::failure(400, "invalid_user", "User id must be positive.");
  }

  const int64_t iIssuedAt = _clkClock.nowSeconds();
  const int64_t iTtl = oTtlSeconds.value_or(_tsSettings.iDefaultTtlSeconds);
  // Expiry must land in [epoch, kLatestExpiry]; bounds checked without overflow
  if (iIssuedAt < 0 || iTtl < -iIssuedAt ||
      iTtl > transport::CookieTransport::kLatestExpiry - iIssuedAt) {
    return ResultT::failure(400, "invalid_ttl", "Token lifetime is out of range.");
  }
  const int64_t iExpiresAt = iIssuedAt + iTtl;

  sweep();

  std::string sToken;
  std::vector<unsigned char> vRefreshRaw;
  std::vector<unsigned char> vHeaderRaw;
  try {
    SecretBytes sbNonce(CryptoService::randomBytes(CryptoService::kNonceLen));
    {
      TokenClaims tcClaims{iUserId, iExpiresAt, iIssuedAt, sbNonce.get()};
      sToken = _atcCodec.seal(tcClaims);
      OPENSSL_cleanse(tcClaims.vNonce.data(), tcClaims.vNonce.size());
    }
    vRefreshRaw = CryptoService::randomBytes(CryptoService::kNonceLen);
    vHeaderRaw = CryptoService::randomBytes(CryptoService::kNonceLen);

    if (_tsSettings.bHttpsOnly && !heExchange.isSecure()) {
      spLog->warn("Token '{}' for user {} refused over an insecure channel", sName, iUserId);
      return ResultT::failure(403, "insecure_transport",
                              "Tokens can only be issued over HTTPS.");
    }

    try {
      _ssStore.generate(sName, iUserId, _csCrypto.hashNonce(sbNonce.get()), iExpiresAt,
                        jAdditionals, _csCrypto.hashNonce(vRefreshRaw),
                        _csCrypto.hashNonce(vHeaderRaw));
    } catch (const common::ValidationError&) {
      throw;
    } catch (const AppError& ex) {
      spLog->error("Token '{}' for user {}: session store failed: {}", sName, iUserId,
                   ex.what());
      return ResultT::failure(500, "session_store_failed", "Could not store the session.");
    }
  } catch (const AppError& ex) {
    return ResultT::failure(ex._iHttpStatus, ex._sErrorCode, ex.what());
  } catch (const std::exception& ex) {
    spLog->error("Token '{}' for user {}: encryption failed: {}", sName, iUserId, ex.what());
    return ResultT::failure(500, "token_encryption_failed", "Could not create the token.");
  }

  SecretBytes sbRefresh(std::move(vRefreshRaw));
  SecretBytes sbHeader(std::move(vHeaderRaw));

  auto ctCookies = cookies(heExchange);
  if (!ctCookies.set(cookieName(sName), sToken, iExpiresAt)) {
    return ResultT::failure(500, "cookie_set_failed", "Could not set the token cookies.");
  }
  if (!ctCookies.set(refreshCookieName(sName), CryptoService::base64Encode(sbRefresh.get()),
                     iExpiresAt)) {
    // A token cookie without its refresh cookie is unusable; take it back
    if (!ctCookies.remove(cookieName(sName))) {
      spLog->warn("Token '{}' for user {}: could not retract the token cookie", sName,
                  iUserId);
    }
    return ResultT::failure(500, "cookie_set_failed", "Could not set the token cookies.");
  }

  if (heExchange.responseCommitted()) {
    spLog->error("Token '{}' for user {}: header nonce not sent, response committed", sName,
                 iUserId);
    return ResultT::failure(500, "header_set_failed", "Could not send the header nonce.");
  }
  heExchange.addResponseHeader(_tsSettings.sHeaderNonceName,
                               CryptoService::hexEncode(sbHeader.get()));

  spLog->debug("Token '{}' issued for user {} until {}", sName, iUserId, iExpiresAt);
  return ResultT::success(200, "Token generated.",
                          AuthenticatedPrincipal{iUserId, iIssuedAt, iExpiresAt});
}

// ── validate ───────────────────────────────────────────────────────────────

Result<AuthenticatedPrincipal> TokenService::validate(
    transport::IHttpExchange& heExchange, const std::string& sName,
    std::optional<int64_t> oLogoutTime, std::optional<HeaderNoncePolicy> oPolicy) {
  using ResultT = Result<AuthenticatedPrincipal>;
  auto spLog = common::Logger::get();

  if (!isValidName(sName)) {
    return ResultT::failure(400, "invalid_token_name",
                            "Token name must be non-empty [A-Za-z0-9_].");
  }

  sweep();

  std::optional<int64_t> oKnownUser;
  try {
    auto apPrincipal = checkAndRotate(heExchange, sName, oLogoutTime,
                                      oPolicy.value_or(_tsSettings.hnpDefault), oKnownUser);
    return ResultT::success(200, "Token is valid.", apPrincipal);
  } catch (const TokenRejection& ex) {
    if (!oKnownUser) oKnownUser = ex.oUserId;
    spLog->warn("Token '{}' rejected for user {}: {}", sName, userLabel(oKnownUser),
                ex._sErrorCode);
    revoke(heExchange, sName, oKnownUser);
    return ResultT::failure(ex._iHttpStatus, ex._sErrorCode, ex.what());
  } catch (const AppError& ex) {
    spLog->error("Token '{}' validation failed for user {}: {} ({})", sName,
                 userLabel(oKnownUser), ex._sErrorCode, ex.what());
    revoke(heExchange, sName, oKnownUser);
    return ResultT::failure(ex._iHttpStatus, ex._sErrorCode, ex.what());
  } catch (const std::exception& ex) {
    spLog->error("Token '{}' validation failed for user {}: {}", sName,
                 userLabel(oKnownUser), ex.what());
    revoke(heExchange, sName, oKnownUser);
    return ResultT::failure(500, "internal_error", "Token validation failed.");
  }
}

AuthenticatedPrincipal TokenService::checkAndRotate(transport::IHttpExchange& heExchange,
                                                    const std::string& sName,
                                                    std::optional<int64_t> oLogoutTime,
                                                    HeaderNoncePolicy hnpPolicy,
                                                    std::optional<int64_t>& oKnownUser) {
  auto ctCookies = cookies(heExchange);
  auto oToken = ctCookies.get(cookieName(sName));
  auto oRefresh = ctCookies.get(refreshCookieName(sName));
  if (!oToken || oToken->empty() || !oRefresh || oRefresh->empty()) {
    throw TokenRejection("missing_token", "Authentication token is missing.");
  }

  TokenClaims tcClaims = _atcCodec.open(*oToken);
  SecretBytes sbNonce(std::move(tcClaims.vNonce));
  oKnownUser = tcClaims.iUserId;

  const int64_t iNow = _clkClock.nowSeconds();
  if (tcClaims.iExpiresAt <= iNow) {
    throw TokenRejection("token_expired", "Authentication token has expired.");
  }
  if (oLogoutTime && tcClaims.iIssuedAt <= *oLogoutTime) {
    throw TokenRejection("stale_after_logout", "Token was issued before the last logout.");
  }

  dal::SessionRow srRow;
  try {
    srRow = _ssStore.get(sName, tcClaims.iUserId);
  } catch (const common::NotFoundError&) {
    throw TokenRejection("no_session", "No active session for this token.");
  } catch (const AuthenticationError&) {
    throw TokenRejection("no_session", "No active session for this token.");
  }

  if (!CryptoService::constantTimeEquals(_csCrypto.hashNonce(sbNonce.get()),
                                         srRow.sNonceHash)) {
    throw TokenRejection("replay_detected", "Token does not match the active session.");
  }

  if (hnpPolicy == HeaderNoncePolicy::Required) {
    auto oHeader = heExchange.requestHeader(_tsSettings.sHeaderNonceName);
    auto oHeaderRaw = oHeader ? CryptoService::hexDecode(*oHeader) : std::nullopt;
    if (!oHeaderRaw || oHeaderRaw->size() != CryptoService::kNonceLen) {
      throw TokenRejection("header_nonce_mismatch", "Header nonce is missing or malformed.");
    }
    SecretBytes sbHeaderIn(std::move(*oHeaderRaw));
    if (!CryptoService::constantTimeEquals(_csCrypto.hashNonce(sbHeaderIn.get()),
                                           srRow.sHeaderNonceHash)) {
      throw TokenRejection("header_nonce_mismatch", "Header nonce does not match.");
    }
  }

  auto oRefreshRaw = CryptoService::base64Decode(*oRefresh);
  if (!oRefreshRaw || oRefreshRaw->size() != CryptoService::kNonceLen) {
    throw TokenRejection("refresh_mismatch", "Refresh cookie is malformed.");
  }
  SecretBytes sbRefreshIn(std::move(*oRefreshRaw));
  if (!CryptoService::constantTimeEquals(_csCrypto.hashNonce(sbRefreshIn.get()),
                                         srRow.sRefreshNonceHash)) {
    throw TokenRejection("refresh_mismatch", "Refresh cookie does not match.");
  }

  SecretBytes sbNewRefresh(CryptoService::randomBytes(CryptoService::kNonceLen));
  SecretBytes sbNewHeader(CryptoService::randomBytes(CryptoService::kNonceLen));
  try {
    _ssStore.update(sName, tcClaims.iUserId, srRow.jAdditionals,
                    _csCrypto.hashNonce(sbNewRefresh.get()),
                    _csCrypto.hashNonce(sbNewHeader.get()), srRow.iUpdatedTally);
  } catch (const common::ConflictError&) {
    throw TokenRejection("replay_detected", "Token was used by a concurrent request.");
  } catch (const common::NotFoundError&) {
    throw TokenRejection("no_session", "No active session for this token.");
  } catch (const AuthenticationError&) {
    throw TokenRejection("no_session", "No active session for this token.");
  }

  if (!ctCookies.set(refreshCookieName(sName), CryptoService::base64Encode(sbNewRefresh.get()),
                     tcClaims.iExpiresAt)) {
    throw common::TransportError("cookie_set_failed", "Could not rotate the refresh cookie.");
  }
  if (heExchange.responseCommitted()) {
    throw common::TransportError("header_set_failed", "Could not send the header nonce.");
  }
  heExchange.addResponseHeader(_tsSettings.sHeaderNonceName,
                               CryptoService::hexEncode(sbNewHeader.get()));

  return AuthenticatedPrincipal{tcClaims.iUserId, tcClaims.iIssuedAt, tcClaims.iExpiresAt};
}

void TokenService::revoke(transport::IHttpExchange& heExchange, const std::string& sName,
                          std::optional<int64_t> oUserId) {
  auto spLog = common::Logger::get();
  auto ctCookies = cookies(heExchange);
  ctCookies.remove(cookieName(sName));
  ctCookies.remove(refreshCookieName(sName));

  if (!oUserId) return;
  try {
    _ssStore.remove(sName, *oUserId);
  } catch (const common::NotFoundError&) {
    // Already gone (expired on access or never created).
  } catch (const std::exception& ex) {
    spLog->error("Could not revoke session '{}' for user {}: {}", sName, *oUserId, ex.what());
  }
}

// ── remove ─────────────────────────────────────────────────────────────────

Status TokenService::remove(transport::IHttpExchange& heExchange, const std::string& sName,
                            std::optional<int64_t> oUserId) {
  if (!isValidName(sName)) {
    return Status::failure(400, "invalid_token_name",
                           "Token name must be non-empty [A-Za-z0-9_].");
  }

  std::optional<Status> oFirstFailure;
  auto ctCookies = cookies(heExchange);
  const bool bTokenRemoved = ctCookies.remove(cookieName(sName));
  const bool bRefreshRemoved = ctCookies.remove(refreshCookieName(sName));
  if (!bTokenRemoved || !bRefreshRemoved) {
    oFirstFailure = Status::failure(500, "cookie_remove_failed",
                                    "Could not remove the token cookies.");
  }

  if (oUserId) {
    try {
      _ssStore.remove(sName, *oUserId);
    } catch (const AppError& ex) {
      if (!oFirstFailure) {
        oFirstFailure = Status::failure(ex._iHttpStatus, ex._sErrorCode, ex.what());
      }
    } catch (const std::exception& ex) {
      common::Logger::get()->error("Removing session '{}' for user {} failed: {}", sName,
                                   *oUserId, ex.what());
      if (!oFirstFailure) {
        oFirstFailure = Status::failure(500, "internal_error", "Could not remove the session.");
      }
    }
  }

  if (oFirstFailure) return *oFirstFailure;
  return Status::success(200, "Token removed.", std::monostate{});
}

// ── session data ───────────────────────────────────────────────────────────

Result<dal::SessionRow> TokenService::parse(transport::IHttpExchange& heExchange,
                                            const std::string& sName,
                                            std::optional<int64_t> oLogoutTime,
                                            std::optional<HeaderNoncePolicy> oPolicy) {
  auto resValid = validate(heExchange, sName, oLogoutTime, oPolicy);
  if (!resValid.bOk) {
    return Result<dal::SessionRow>::failure(resValid.iStatus, resValid.sCode,
                                            resValid.sMessage);
  }
  return sessionData(sName, resValid.oData->iUserId);
}

Result<dal::SessionRow> TokenService::sessionData(const std::string& sName, int64_t iUserId) {
  using ResultT = Result<dal::SessionRow>;
  try {
    return ResultT::success(200, "Session found.", _ssStore.get(sName, iUserId));
  } catch (const AppError& ex) {
    return ResultT::failure(ex._iHttpStatus, ex._sErrorCode, ex.what());
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Reading session '{}' for user {} failed: {}", sName, iUserId,
                                 ex.what());
    return ResultT::failure(500, "internal_error", "Could not read the session.");
  }
}

Result<dal::SessionRow> TokenService::updateSessionData(const std::string& sName,
                                                        int64_t iUserId,
                                                        const nlohmann::json& jAdditionals) {
  using ResultT = Result<dal::SessionRow>;
  try {
    return ResultT::success(200, "Session updated.",
                            _ssStore.updateAdditionals(sName, iUserId, jAdditionals));
  } catch (const AppError& ex) {
    return ResultT::failure(ex._iHttpStatus, ex._sErrorCode, ex.what());
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Updating session '{}' for user {} failed: {}", sName,
                                 iUserId, ex.what());
    return ResultT::failure(500, "internal_error", "Could not update the session.");
  }
}

}  // namespace restauth::security
