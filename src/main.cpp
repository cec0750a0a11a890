#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "api/AuthMiddleware.hpp"
#include "api/RouteRegistry.hpp"
#include "api/routes/AuthRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "common/Clock.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/SessionStore.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/FlagRepository.hpp"
#include "dal/SessionRepository.hpp"
#include "dal/UserRepository.hpp"
#include "security/CryptoService.hpp"
#include "security/PasswordHasher.hpp"
#include "security/TokenService.hpp"

#include <openssl/crypto.h>

namespace {

restauth::security::TokenSettings buildTokenSettings(const restauth::common::Config& cfgApp) {
  using restauth::transport::CookieTransport;

  auto oSameSite = CookieTransport::parseSameSite(cfgApp.sCookieSameSite);
  if (!oSameSite) {
    throw std::runtime_error("Invalid cookie SameSite value: " + cfgApp.sCookieSameSite);
  }

  restauth::security::TokenSettings tsSettings;
  tsSettings.sPrefix = cfgApp.sTokenPrefix;
  tsSettings.iDefaultTtlSeconds = cfgApp.iTokenTtlSeconds;
  tsSettings.bHttpsOnly = cfgApp.bTokenHttpsOnly;
  tsSettings.cpolCookies.bSecure = cfgApp.bCookieSecure;
  tsSettings.cpolCookies.ssSameSite = *oSameSite;
  tsSettings.cpolCookies.sPath = cfgApp.sCookiePath;
  tsSettings.cpolCookies.sDomain = cfgApp.sCookieDomain;
  tsSettings.sHeaderNonceName = cfgApp.sHeaderNonceName;
  tsSettings.hnpDefault = cfgApp.bRequireHeaderNonce
                              ? restauth::security::HeaderNoncePolicy::Required
                              : restauth::security::HeaderNoncePolicy::Skip;
  return tsSettings;
}

void bootstrapUser(restauth::common::Config& cfgApp, restauth::dal::UserRepository& urRepo,
                   const restauth::security::PasswordHasher& phHasher) {
  auto spLog = restauth::common::Logger::get();
  if (!cfgApp.oBootstrapUsername) return;

  const std::string& sUsername = *cfgApp.oBootstrapUsername;
  if (urRepo.findByUsername(sUsername)) {
    spLog->info("Bootstrap user '{}' already exists", sUsername);
  } else {
    auto resHash = phHasher.hash(*cfgApp.oBootstrapPassword);
    if (!resHash.bOk) {
      throw std::runtime_error("Cannot hash bootstrap password: " + resHash.sMessage);
    }
    const int64_t iUserId = urRepo.create(sUsername, *resHash.oData);
    spLog->info("Bootstrap user '{}' created (id={})", sUsername, iUserId);
  }

  OPENSSL_cleanse(cfgApp.oBootstrapPassword->data(), cfgApp.oBootstrapPassword->size());
  cfgApp.oBootstrapPassword.reset();
}

}  // namespace

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = restauth::common::Config::load();

    restauth::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = restauth::common::Logger::get();
    spLog->info("Step 1: Configuration loaded");

    // ── Step 2: Crypto (secrets are wiped by the constructor) ────────────
    auto csCrypto = std::make_unique<restauth::security::CryptoService>(
        std::move(cfgApp.sMasterSecret), std::move(cfgApp.sNonceSecret));
    OPENSSL_cleanse(cfgApp.sMasterSecret.data(), cfgApp.sMasterSecret.size());
    OPENSSL_cleanse(cfgApp.sNonceSecret.data(), cfgApp.sNonceSecret.size());
    cfgApp.sMasterSecret.clear();
    cfgApp.sNonceSecret.clear();

    if (!restauth::security::PasswordHasher::isAvailable()) {
      throw std::runtime_error("Linked OpenSSL does not provide ARGON2ID (need >= 3.2)");
    }
    restauth::security::PasswordHasher phHasher(restauth::security::Argon2Params{
        static_cast<uint32_t>(cfgApp.iArgon2MemoryKib),
        static_cast<uint32_t>(cfgApp.iArgon2TimeCost),
        static_cast<uint32_t>(cfgApp.iArgon2Parallelism)});
    spLog->info("Step 2: CryptoService and PasswordHasher initialized");

    // ── Step 3: Database ─────────────────────────────────────────────────
    auto cpPool = std::make_unique<restauth::dal::ConnectionPool>(cfgApp.sDbUrl,
                                                                  cfgApp.iDbPoolSize);
    restauth::dal::SessionRepository srRepo(*cpPool);
    restauth::dal::FlagRepository frFlags(*cpPool);
    restauth::dal::UserRepository urRepo(*cpPool);
    srRepo.ensureSchema();
    frFlags.ensureSchema();
    urRepo.ensureSchema();
    spLog->info("Step 3: Database ready (pool size={})", cfgApp.iDbPoolSize);

    // ── Step 4: Session store and token service ──────────────────────────
    restauth::common::SystemClock clkClock;
    restauth::core::SessionStore ssStore(srRepo, frFlags, clkClock,
                                         cfgApp.iSweepIntervalSeconds);
    restauth::security::TokenService tksService(*csCrypto, ssStore, clkClock,
                                                buildTokenSettings(cfgApp));
    if (!cfgApp.bRequireHeaderNonce) {
      spLog->warn("Header nonce checks are disabled; a stolen cookie pair is sufficient "
                  "to authenticate");
    }
    spLog->info("Step 4: TokenService ready (cookie prefix '{}')", cfgApp.sTokenPrefix);

    // ── Step 5: Bootstrap user ───────────────────────────────────────────
    bootstrapUser(cfgApp, urRepo, phHasher);

    // ── Step 6: Routes ───────────────────────────────────────────────────
    restauth::api::AuthMiddleware amMiddleware(tksService, urRepo);
    restauth::api::routes::AuthRoutes arRoutes(tksService, amMiddleware, urRepo, phHasher,
                                               cfgApp.bTrustForwardedProto);
    restauth::api::routes::HealthRoutes hrRoutes(*cpPool);

    restauth::api::RouteRegistry rrRegistry;
    rrRegistry.add("health", [&hrRoutes](crow::SimpleApp& app) { hrRoutes.registerRoutes(app); });
    rrRegistry.add("auth", [&arRoutes](crow::SimpleApp& app) { arRoutes.registerRoutes(app); });

    // ── Step 7: HTTP server ──────────────────────────────────────────────
    restauth::api::ApiServer apiServer(rrRegistry);
    apiServer.registerRoutes();
    spLog->info("Step 7: restauth ready");
    apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    spLog->info("HTTP server stopped");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
