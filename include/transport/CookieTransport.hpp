#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "common/Clock.hpp"
#include "transport/IHttpExchange.hpp"

namespace restauth::transport {

enum class SameSite { Strict, Lax, None };

/// Attributes applied to every cookie written. HttpOnly is always set.
/// Class abbreviation: cpol
struct CookiePolicy {
  bool bSecure = true;
  SameSite ssSameSite = SameSite::Strict;
  std::string sPath = "/";
  std::string sDomain;
};

/// Named client-side values carried in cookies.
/// set() and remove() report false instead of throwing when the response
/// is already committed or the value cannot be represented in a cookie.
/// Class abbreviation: ct
class CookieTransport {
 public:
  /// 9999-12-31T23:59:59Z, the last instant an IMF-fixdate can express.
  static constexpr int64_t kLatestExpiry = 253402300799;

  CookieTransport(IHttpExchange& heExchange, CookiePolicy cpolPolicy,
                  const common::IClock& clkClock);

  bool set(const std::string& sName, const std::string& sValue, int64_t iExpiresAt);
  std::optional<std::string> get(const std::string& sName) const;
  bool remove(const std::string& sName);

  /// Full Set-Cookie value (without the header name).
  static std::string formatSetCookie(const std::string& sName, const std::string& sValue,
                                     int64_t iExpiresAt, int64_t iMaxAge,
                                     const CookiePolicy& cpolPolicy);

  /// Parse a request Cookie header. The first occurrence of a name wins.
  static std::map<std::string, std::string> parseCookieHeader(const std::string& sHeader);

  /// RFC 7231 IMF-fixdate, e.g. "Thu, 01 Jan 1970 00:00:00 GMT". Input is
  /// clamped to [0, kLatestExpiry].
  static std::string httpDate(int64_t iEpochSeconds);

  static bool isValidName(const std::string& sName);
  static bool isValidValue(const std::string& sValue);

  static std::string toString(SameSite ssSameSite);
  static std::optional<SameSite> parseSameSite(const std::string& sValue);

 private:
  bool write(const std::string& sName, const std::string& sValue, int64_t iExpiresAt,
             int64_t iMaxAge);

  IHttpExchange& _heExchange;
  CookiePolicy _cpolPolicy;
  const common::IClock& _clkClock;
};

}  // namespace restauth::transport
