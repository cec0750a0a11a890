#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Clock.hpp"
#include "common/Types.hpp"
#include "dal/ISessionRepository.hpp"
#include "security/AuthTokenCodec.hpp"
#include "transport/CookieTransport.hpp"

namespace restauth::core {
class SessionStore;
}

namespace restauth::security {

class CryptoService;

/// Whether validation demands the header nonce echoed by the client.
/// Skip drops the binding to a value only script code can read back, so a
/// stolen cookie jar is enough to authenticate once.
enum class HeaderNoncePolicy { Required, Skip };

/// Class abbreviation: ts
struct TokenSettings {
  std::string sPrefix = "restauth_auth_token_";
  int64_t iDefaultTtlSeconds = 604800;
  bool bHttpsOnly = true;
  transport::CookiePolicy cpolCookies;
  std::string sHeaderNonceName = "X-Auth-Nonce";
  HeaderNoncePolicy hnpDefault = HeaderNoncePolicy::Required;
};

/// Identity carried by a token that passed validation.
/// Class abbreviation: ap
struct AuthenticatedPrincipal {
  int64_t iUserId = 0;
  int64_t iIssuedAt = 0;
  int64_t iExpiresAt = 0;
};

/// Issues and checks cookie-borne authentication tokens.
///
/// A token lives in cookie {prefix}{name}; a refresh secret in
/// {prefix}{name}_refresh; a header secret is sent in the configured
/// response header and must be echoed back. Each successful validation
/// rotates the refresh and header secrets. Any failed check removes both
/// cookies and, when the user is known, the session.
///
/// No method throws; outcomes are reported through common::Result.
/// Class abbreviation: tks
class TokenService {
 public:
  TokenService(const CryptoService& csCrypto, core::SessionStore& ssStore,
               const common::IClock& clkClock, TokenSettings tsSettings);
  ~TokenService();

  /// Issue a token for iUserId. oTtlSeconds defaults to the configured TTL
  /// and may be negative (the token is born expired).
  common::Result<AuthenticatedPrincipal> generate(
      transport::IHttpExchange& heExchange, const std::string& sName, int64_t iUserId,
      std::optional<int64_t> oTtlSeconds = std::nullopt,
      const nlohmann::json& jAdditionals = nullptr);

  /// Run every check on the token named sName. Tokens issued at or before
  /// oLogoutTime are refused.
  common::Result<AuthenticatedPrincipal> validate(
      transport::IHttpExchange& heExchange, const std::string& sName,
      std::optional<int64_t> oLogoutTime = std::nullopt,
      std::optional<HeaderNoncePolicy> oPolicy = std::nullopt);

  /// Remove both cookies and, if oUserId is given, the session. Every step
  /// runs; the first failure is reported.
  common::Status remove(transport::IHttpExchange& heExchange, const std::string& sName,
                        std::optional<int64_t> oUserId = std::nullopt);

  /// validate() followed by the (rotated) session record.
  common::Result<dal::SessionRow> parse(
      transport::IHttpExchange& heExchange, const std::string& sName,
      std::optional<int64_t> oLogoutTime = std::nullopt,
      std::optional<HeaderNoncePolicy> oPolicy = std::nullopt);

  common::Result<dal::SessionRow> sessionData(const std::string& sName, int64_t iUserId);

  common::Result<dal::SessionRow> updateSessionData(const std::string& sName,
                                                    int64_t iUserId,
                                                    const nlohmann::json& jAdditionals);

  std::string cookieName(const std::string& sName) const;
  std::string refreshCookieName(const std::string& sName) const;
  const std::string& headerNonceName() const { return _tsSettings.sHeaderNonceName; }

  /// Token names are non-empty [A-Za-z0-9_].
  static bool isValidName(const std::string& sName);

 private:
  AuthenticatedPrincipal checkAndRotate(transport::IHttpExchange& heExchange,
                                        const std::string& sName,
                                        std::optional<int64_t> oLogoutTime,
                                        HeaderNoncePolicy hnpPolicy,
                                        std::optional<int64_t>& oKnownUser);

  void revoke(transport::IHttpExchange& heExchange, const std::string& sName,
              std::optional<int64_t> oUserId);

  void sweep();

  transport::CookieTransport cookies(transport::IHttpExchange& heExchange) const;

  const CryptoService& _csCrypto;
  core::SessionStore& _ssStore;
  const common::IClock& _clkClock;
  TokenSettings _tsSettings;
  AuthTokenCodec _atcCodec;
};

}  // namespace restauth::security
