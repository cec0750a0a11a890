#include "transport/CookieTransport.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <ctime>
#include <string_view>
#include <utility>

namespace restauth::transport {

namespace {
bool isTokenChar(unsigned char c) {
  // RFC 7230 tchar
  static constexpr std::string_view kSeparators = "()<>@,;:\\\"/[]?={} \t";
  return c > 0x20 && c < 0x7f && kSeparators.find(static_cast<char>(c)) == std::string_view::npos;
}

bool isCookieOctet(unsigned char c) {
  // RFC 6265 cookie-octet
  return c == 0x21 || (c >= 0x23 && c <= 0x2b) || (c >= 0x2d && c <= 0x3a) ||
         (c >= 0x3c && c <= 0x5b) || (c >= 0x5d && c <= 0x7e);
}

std::string trim(const std::string& s) {
  const auto nBegin = s.find_first_not_of(" \t");
  if (nBegin == std::string::npos) return "";
  const auto nEnd = s.find_last_not_of(" \t");
  return s.substr(nBegin, nEnd - nBegin + 1);
}
}  // namespace

CookieTransport::CookieTransport(IHttpExchange& heExchange, CookiePolicy cpolPolicy,
                                 const common::IClock& clkClock)
    : _heExchange(heExchange), _cpolPolicy(std::move(cpolPolicy)), _clkClock(clkClock) {}

bool CookieTransport::set(const std::string& sName, const std::string& sValue,
                          int64_t iExpiresAt) {
  const int64_t iNow = _clkClock.nowSeconds();
  const int64_t iMaxAge = (iNow < 0 || iExpiresAt <= iNow) ? 0 : iExpiresAt - iNow;
  return write(sName, sValue, iExpiresAt, iMaxAge);
}

bool CookieTransport::remove(const std::string& sName) {
  return write(sName, "", 0, 0);
}

bool CookieTransport::write(const std::string& sName, const std::string& sValue,
                            int64_t iExpiresAt, int64_t iMaxAge) {
  if (_heExchange.responseCommitted()) {
    common::Logger::get()->error("Cookie '{}' not written: response already committed", sName);
    return false;
  }
  if (!isValidName(sName) || !isValidValue(sValue)) {
    common::Logger::get()->error("Cookie '{}' not written: invalid name or value", sName);
    return false;
  }

  _heExchange.addResponseHeader(
      "Set-Cookie", formatSetCookie(sName, sValue, iExpiresAt, iMaxAge, _cpolPolicy));
  return true;
}

std::optional<std::string> CookieTransport::get(const std::string& sName) const {
  auto oHeader = _heExchange.requestHeader("Cookie");
  if (!oHeader) return std::nullopt;

  auto mCookies = parseCookieHeader(*oHeader);
  auto it = mCookies.find(sName);
  if (it == mCookies.end()) return std::nullopt;
  return it->second;
}

std::string CookieTransport::formatSetCookie(const std::string& sName,
                                             const std::string& sValue, int64_t iExpiresAt,
                                             int64_t iMaxAge,
                                             const CookiePolicy& cpolPolicy) {
  std::string sOut = sName + "=" + sValue;
  sOut += "; Expires=" + httpDate(iExpiresAt);
  sOut += "; Max-Age=" + std::to_string(iMaxAge);
  sOut += "; Path=" + (cpolPolicy.sPath.empty() ? std::string("/") : cpolPolicy.sPath);
  if (!cpolPolicy.sDomain.empty()) {
    sOut += "; Domain=" + cpolPolicy.sDomain;
  }
  if (cpolPolicy.bSecure) {
    sOut += "; Secure";
  }
  sOut += "; HttpOnly";
  sOut += "; SameSite=" + toString(cpolPolicy.ssSameSite);
  return sOut;
}

std::map<std::string, std::string> CookieTransport::parseCookieHeader(
    const std::string& sHeader) {
  std::map<std::string, std::string> mCookies;
  size_t nPos = 0;
  while (nPos <= sHeader.size()) {
    auto nEnd = sHeader.find(';', nPos);
    if (nEnd == std::string::npos) nEnd = sHeader.size();

    const std::string sPair = trim(sHeader.substr(nPos, nEnd - nPos));
    const auto nEq = sPair.find('=');
    if (nEq != std::string::npos && nEq > 0) {
      const std::string sName = trim(sPair.substr(0, nEq));
      std::string sValue = trim(sPair.substr(nEq + 1));
      if (sValue.size() >= 2 && sValue.front() == '"' && sValue.back() == '"') {
        sValue = sValue.substr(1, sValue.size() - 2);
      }
      mCookies.emplace(sName, sValue);
    }
    nPos = nEnd + 1;
  }
  return mCookies;
}

std::string CookieTransport::httpDate(int64_t iEpochSeconds) {
  static constexpr std::array<const char*, 7> kDays = {"Sun", "Mon", "Tue", "Wed",
                                                       "Thu", "Fri", "Sat"};
  static constexpr std::array<const char*, 12> kMonths = {
      "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  std::time_t tTime =
      static_cast<std::time_t>(std::clamp<int64_t>(iEpochSeconds, 0, kLatestExpiry));
  std::tm tmUtc{};
  gmtime_r(&tTime, &tmUtc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                kDays[static_cast<size_t>(tmUtc.tm_wday)], tmUtc.tm_mday,
                kMonths[static_cast<size_t>(tmUtc.tm_mon)], tmUtc.tm_year + 1900,
                tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec);
  return buf;
}

bool CookieTransport::isValidName(const std::string& sName) {
  return !sName.empty() &&
         std::all_of(sName.begin(), sName.end(),
                     [](char c) { return isTokenChar(static_cast<unsigned char>(c)); });
}

bool CookieTransport::isValidValue(const std::string& sValue) {
  return std::all_of(sValue.begin(), sValue.end(),
                     [](char c) { return isCookieOctet(static_cast<unsigned char>(c)); });
}

std::string CookieTransport::toString(SameSite ssSameSite) {
  switch (ssSameSite) {
    case SameSite::Strict: return "Strict";
    case SameSite::Lax: return "Lax";
    case SameSite::None: return "None";
  }
  return "Strict";
}

std::optional<SameSite> CookieTransport::parseSameSite(const std::string& sValue) {
  if (sValue == "Strict") return SameSite::Strict;
  if (sValue == "Lax") return SameSite::Lax;
  if (sValue == "None") return SameSite::None;
  return std::nullopt;
}

}  // namespace restauth::transport
