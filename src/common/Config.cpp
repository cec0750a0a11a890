#include "common/Config.hpp"

#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace restauth::common {

namespace {
constexpr size_t kMinSecretLen = 32;

bool isCookieNameSafe(const std::string& sValue) {
  for (char c : sValue) {
    const bool bAlnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (!bAlnum && c != '_') return false;
  }
  return true;
}
}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = getEnv("RESTAUTH_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable RESTAUTH_DB_URL is not set");
  }

  cfg.sMasterSecret = loadSecret("RESTAUTH_MASTER_SECRET");
  cfg.sNonceSecret = loadSecret("RESTAUTH_NONCE_SECRET");

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("RESTAUTH_DB_POOL_SIZE", 10);

  cfg.iTokenTtlSeconds = getEnvInt("RESTAUTH_TOKEN_TTL_SECONDS", 604800);
  if (const char* pPrefix = std::getenv("RESTAUTH_TOKEN_PREFIX")) {
    cfg.sTokenPrefix = pPrefix;  // may be deliberately empty
  }
  cfg.bTokenHttpsOnly = getEnvBool("RESTAUTH_TOKEN_HTTPS_ONLY", true);
  const std::string sHeaderName = getEnv("RESTAUTH_HEADER_NONCE_NAME");
  if (!sHeaderName.empty()) {
    cfg.sHeaderNonceName = sHeaderName;
  }
  cfg.bRequireHeaderNonce = getEnvBool("RESTAUTH_REQUIRE_HEADER_NONCE", true);

  // Cookie
  cfg.bCookieSecure = getEnvBool("RESTAUTH_COOKIE_SECURE", true);
  const std::string sSameSite = getEnv("RESTAUTH_COOKIE_SAME_SITE");
  if (!sSameSite.empty()) {
    cfg.sCookieSameSite = sSameSite;
  }
  const std::string sPath = getEnv("RESTAUTH_COOKIE_PATH");
  if (!sPath.empty()) {
    cfg.sCookiePath = sPath;
  }
  cfg.sCookieDomain = getEnv("RESTAUTH_COOKIE_DOMAIN");

  // Session
  cfg.iSweepIntervalSeconds = getEnvInt("RESTAUTH_SWEEP_INTERVAL_SECONDS", 86400);

  // Password hashing
  cfg.iArgon2MemoryKib = getEnvInt("RESTAUTH_ARGON2_MEMORY_KIB", 65536);
  cfg.iArgon2TimeCost = getEnvInt("RESTAUTH_ARGON2_TIME_COST", 3);
  cfg.iArgon2Parallelism = getEnvInt("RESTAUTH_ARGON2_PARALLELISM", 1);

  // HTTP
  cfg.iHttpPort = getEnvInt("RESTAUTH_HTTP_PORT", 8080);
  cfg.iHttpThreads = getEnvInt("RESTAUTH_HTTP_THREADS", 4);
  cfg.bTrustForwardedProto = getEnvBool("RESTAUTH_TRUST_FORWARDED_PROTO", false);

  // Bootstrap user
  const std::string sBootUser = getEnv("RESTAUTH_BOOTSTRAP_USERNAME");
  if (!sBootUser.empty()) {
    cfg.oBootstrapUsername = sBootUser;
  }
  const std::string sBootPassword = getEnv("RESTAUTH_BOOTSTRAP_PASSWORD");
  if (!sBootPassword.empty()) {
    cfg.oBootstrapPassword = sBootPassword;
  }

  // Logging
  const std::string sLogLevel = getEnv("RESTAUTH_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.sMasterSecret.size() < kMinSecretLen) {
    throw std::runtime_error("RESTAUTH_MASTER_SECRET must be at least 32 bytes");
  }
  if (cfg.sNonceSecret.size() < kMinSecretLen) {
    throw std::runtime_error("RESTAUTH_NONCE_SECRET must be at least 32 bytes");
  }
  if (cfg.sMasterSecret.size() == cfg.sNonceSecret.size() &&
      CRYPTO_memcmp(cfg.sMasterSecret.data(), cfg.sNonceSecret.data(),
                    cfg.sMasterSecret.size()) == 0) {
    throw std::runtime_error("RESTAUTH_NONCE_SECRET must differ from RESTAUTH_MASTER_SECRET");
  }

  if (cfg.iDbPoolSize < 1) {
    throw std::runtime_error(
        "RESTAUTH_DB_POOL_SIZE must be >= 1 (got " + std::to_string(cfg.iDbPoolSize) + ")");
  }
  if (cfg.iTokenTtlSeconds < 1) {
    throw std::runtime_error(
        "RESTAUTH_TOKEN_TTL_SECONDS must be >= 1 (got " +
        std::to_string(cfg.iTokenTtlSeconds) + ")");
  }
  if (!isCookieNameSafe(cfg.sTokenPrefix)) {
    throw std::runtime_error(
        "RESTAUTH_TOKEN_PREFIX may only contain letters, digits and underscores");
  }
  if (cfg.sCookieSameSite != "Strict" && cfg.sCookieSameSite != "Lax" &&
      cfg.sCookieSameSite != "None") {
    throw std::runtime_error(
        "RESTAUTH_COOKIE_SAME_SITE must be Strict, Lax or None (got " +
        cfg.sCookieSameSite + ")");
  }
  // Browsers drop SameSite=None cookies that are not also Secure
  if (cfg.sCookieSameSite == "None" && !cfg.bCookieSecure) {
    throw std::runtime_error(
        "RESTAUTH_COOKIE_SAME_SITE=None requires RESTAUTH_COOKIE_SECURE=true");
  }
  if (cfg.iSweepIntervalSeconds < 1) {
    throw std::runtime_error(
        "RESTAUTH_SWEEP_INTERVAL_SECONDS must be >= 1 (got " +
        std::to_string(cfg.iSweepIntervalSeconds) + ")");
  }
  if (cfg.iArgon2TimeCost < 1 || cfg.iArgon2Parallelism < 1) {
    throw std::runtime_error(
        "RESTAUTH_ARGON2_TIME_COST and RESTAUTH_ARGON2_PARALLELISM must be >= 1");
  }
  if (cfg.iArgon2MemoryKib < 8 * cfg.iArgon2Parallelism) {
    throw std::runtime_error(
        "RESTAUTH_ARGON2_MEMORY_KIB must be >= 8 x RESTAUTH_ARGON2_PARALLELISM (got " +
        std::to_string(cfg.iArgon2MemoryKib) + ")");
  }
  if (!Logger::isValidLevel(cfg.sLogLevel)) {
    throw std::runtime_error("RESTAUTH_LOG_LEVEL must be one of trace, debug, info, warn, "
                             "error, critical, off (got " + cfg.sLogLevel + ")");
  }
  if (cfg.oBootstrapUsername.has_value() != cfg.oBootstrapPassword.has_value()) {
    throw std::runtime_error(
        "RESTAUTH_BOOTSTRAP_USERNAME and RESTAUTH_BOOTSTRAP_PASSWORD must be set together");
  }

  return cfg;
}

}  // namespace restauth::common
