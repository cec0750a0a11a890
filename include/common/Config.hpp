#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace restauth::common {

/// Environment variable loader.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;
  std::string sMasterSecret;  // HKDF input (zeroed after handoff to CryptoService)
  std::string sNonceSecret;   // nonce-hash key (zeroed after handoff to CryptoService)

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 10;

  // ── Token ─────────────────────────────────────────────────────────────
  int iTokenTtlSeconds = 604800;  // 7 days
  std::string sTokenPrefix = "restauth_auth_token_";
  bool bTokenHttpsOnly = true;
  std::string sHeaderNonceName = "X-Auth-Nonce";
  bool bRequireHeaderNonce = true;

  // ── Cookie ────────────────────────────────────────────────────────────
  bool bCookieSecure = true;
  std::string sCookieSameSite = "Strict";
  std::string sCookiePath = "/";
  std::string sCookieDomain;

  // ── Session ───────────────────────────────────────────────────────────
  int iSweepIntervalSeconds = 86400;

  // ── Password hashing ──────────────────────────────────────────────────
  int iArgon2MemoryKib = 65536;
  int iArgon2TimeCost = 3;
  int iArgon2Parallelism = 1;

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpPort = 8080;
  int iHttpThreads = 4;
  bool bTrustForwardedProto = false;

  // ── Bootstrap user ────────────────────────────────────────────────────
  std::optional<std::string> oBootstrapUsername;
  std::optional<std::string> oBootstrapPassword;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for RESTAUTH_MASTER_SECRET and RESTAUTH_NONCE_SECRET.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0), default false.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace restauth::common
