#include "api/AuthMiddleware.hpp"

#include "common/Clock.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/SessionStore.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/FlagRepository.hpp"
#include "dal/SessionRepository.hpp"
#include "dal/UserRepository.hpp"
#include "security/CryptoService.hpp"
#include "security/TokenService.hpp"
#include "support/FakeExchange.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>

using restauth::api::AuthMiddleware;
using restauth::common::AppError;
using restauth::common::SystemClock;
using restauth::core::SessionStore;
using restauth::dal::ConnectionPool;
using restauth::dal::FlagRepository;
using restauth::dal::SessionRepository;
using restauth::dal::UserRepository;
using restauth::security::CryptoService;
using restauth::security::TokenService;
using restauth::security::TokenSettings;
using restauth::test::FakeBrowser;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("RESTAUTH_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class AuthMiddlewareTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "RESTAUTH_DB_URL not set, skipping integration test";
    }
    restauth::common::Logger::init("warn");
    _cpPool = std::make_unique<ConnectionPool>(_sDbUrl, 2);
    _urRepo = std::make_unique<UserRepository>(*_cpPool);
    _srRepo = std::make_unique<SessionRepository>(*_cpPool);
    _frRepo = std::make_unique<FlagRepository>(*_cpPool);
    _urRepo->ensureSchema();
    _srRepo->ensureSchema();
    _frRepo->ensureSchema();

    {
      auto cg = _cpPool->checkout();
      pqxx::work txn(*cg);
      txn.exec("DELETE FROM restauth_sessions");
      txn.exec("DELETE FROM restauth_flags");
      txn.exec("DELETE FROM restauth_users");
      txn.commit();
    }
    _iUserId = _urRepo->create("alice", "unused-hash");

    _csCrypto = std::make_unique<CryptoService>(
        "integration-master-secret-0123456789abcdef",
        "integration-nonce-secret-fedcba9876543210");
    _ssStore = std::make_unique<SessionStore>(*_srRepo, *_frRepo, _clk, 86400);
    _tksService = std::make_unique<TokenService>(*_csCrypto, *_ssStore, _clk, TokenSettings{});
    _amMiddleware = std::make_unique<AuthMiddleware>(*_tksService, *_urRepo);
  }

  void login(int64_t iUserId) {
    auto fx = _fb.request();
    auto res = _tksService->generate(fx, AuthMiddleware::kSessionToken, iUserId);
    ASSERT_TRUE(res.bOk) << res.sCode;
    _fb.absorb(fx);
  }

  std::string _sDbUrl;
  SystemClock _clk;
  FakeBrowser _fb;
  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<UserRepository> _urRepo;
  std::unique_ptr<SessionRepository> _srRepo;
  std::unique_ptr<FlagRepository> _frRepo;
  std::unique_ptr<CryptoService> _csCrypto;
  std::unique_ptr<SessionStore> _ssStore;
  std::unique_ptr<TokenService> _tksService;
  std::unique_ptr<AuthMiddleware> _amMiddleware;
  int64_t _iUserId = 0;
};

TEST_F(AuthMiddlewareTest, ValidSessionYieldsRequestContext) {
  login(_iUserId);
  auto fx = _fb.request();
  auto rcCtx = _amMiddleware->authenticate(fx);
  _fb.absorb(fx);

  EXPECT_EQ(rcCtx.iUserId, _iUserId);
  EXPECT_EQ(rcCtx.sTokenName, "session");
  EXPECT_LT(rcCtx.iIssuedAt, rcCtx.iExpiresAt);

  // Rotated credentials work for the next request
  auto fxNext = _fb.request();
  EXPECT_EQ(_amMiddleware->authenticate(fxNext).iUserId, _iUserId);
}

TEST_F(AuthMiddlewareTest, MissingCookieThrows401) {
  auto fx = _fb.request();
  try {
    _amMiddleware->authenticate(fx);
    FAIL() << "expected AppError";
  } catch (const AppError& ae) {
    EXPECT_EQ(ae._iHttpStatus, 401);
    EXPECT_EQ(ae._sErrorCode, "missing_token");
  }
}

TEST_F(AuthMiddlewareTest, ReplayedCredentialsAreRejected) {
  login(_iUserId);
  FakeBrowser fbCaptured = _fb;

  auto fx = _fb.request();
  _amMiddleware->authenticate(fx);

  auto fxReplay = fbCaptured.request();
  EXPECT_THROW(_amMiddleware->authenticate(fxReplay), AppError);
  EXPECT_FALSE(_srRepo->findByNameAndUser("session", _iUserId).has_value());
}

TEST_F(AuthMiddlewareTest, DeletedUserIsRejectedAndSessionRemoved) {
  const int64_t iGhost = _iUserId + 100000;
  login(iGhost);

  auto fx = _fb.request();
  try {
    _amMiddleware->authenticate(fx);
    FAIL() << "expected AppError";
  } catch (const AppError& ae) {
    EXPECT_EQ(ae._iHttpStatus, 401);
    EXPECT_EQ(ae._sErrorCode, "user_not_found");
  }
  EXPECT_FALSE(_srRepo->findByNameAndUser("session", iGhost).has_value());
}

TEST_F(AuthMiddlewareTest, InactiveUserIsRejected) {
  login(_iUserId);
  {
    auto cg = _cpPool->checkout();
    pqxx::work txn(*cg);
    txn.exec("UPDATE restauth_users SET is_active = FALSE WHERE id = $1",
             pqxx::params{_iUserId});
    txn.commit();
  }

  auto fx = _fb.request();
  EXPECT_THROW(_amMiddleware->authenticate(fx), AppError);
  _fb.absorb(fx);
  EXPECT_FALSE(_fb.cookie("restauth_auth_token_session").has_value());
}
