#include "core/SessionStore.hpp"

#include "common/Errors.hpp"
#include "support/InMemorySessionRepository.hpp"
#include "support/ManualClock.hpp"

#include <gtest/gtest.h>

#include <string>

using restauth::common::AuthenticationError;
using restauth::common::ConflictError;
using restauth::common::NotFoundError;
using restauth::common::StoreError;
using restauth::common::ValidationError;
using restauth::core::SessionStore;
using restauth::test::InMemoryFlagStore;
using restauth::test::InMemorySessionRepository;
using restauth::test::ManualClock;

class SessionStoreTest : public ::testing::Test {
 protected:
  InMemorySessionRepository _srRepo;
  InMemoryFlagStore _fsFlags;
  ManualClock _clk{1000};
  SessionStore _ss{_srRepo, _fsFlags, _clk, 86400};

  void generateDefault(int64_t iExpiration = 4600) {
    _ss.generate("session", 42, "nonce-h", iExpiration, {{"theme", "dark"}}, "refresh-h",
                 "header-h");
  }
};

TEST_F(SessionStoreTest, GenerateReturnsStoredRecord) {
  auto srRow = _ss.generate("session", 42, "nonce-h", 4600, nullptr, "refresh-h", "header-h");
  EXPECT_GT(srRow.iId, 0);
  EXPECT_EQ(srRow.iUser, 42);
  EXPECT_EQ(srRow.iCreatedAt, 1000);
  EXPECT_EQ(srRow.iExpirationAt, 4600);
  EXPECT_EQ(srRow.iUpdatedTally, 0);
  EXPECT_FALSE(srRow.oUpdatedAt.has_value());
  EXPECT_TRUE(srRow.jAdditionals.is_object());
  EXPECT_TRUE(srRow.jAdditionals.empty());
}

TEST_F(SessionStoreTest, GenerateEvictsPriorSession) {
  generateDefault();
  auto srFirst = _ss.get("session", 42);
  _ss.generate("session", 42, "nonce-2", 5000, nullptr, "refresh-2", "header-2");

  EXPECT_EQ(_srRepo.countFor("session", 42), 1u);
  auto srSecond = _ss.get("session", 42);
  EXPECT_NE(srSecond.iId, srFirst.iId);
  EXPECT_EQ(srSecond.sNonceHash, "nonce-2");
}

TEST_F(SessionStoreTest, NamesAndUsersAreIndependent) {
  generateDefault();
  _ss.generate("api", 42, "n", 4600, nullptr, "r", "h");
  _ss.generate("session", 7, "n", 4600, nullptr, "r", "h");
  EXPECT_EQ(_srRepo.rows().size(), 3u);
}

TEST_F(SessionStoreTest, InvalidAdditionalsNeverEvictLiveSession) {
  generateDefault();
  EXPECT_THROW(_ss.generate("session", 42, "n2", 4600, nlohmann::json::array({1, 2}), "r2",
                            "h2"),
               ValidationError);
  EXPECT_THROW(_ss.generate("session", 42, "n2", 4600,
                            {{"blob", std::string(SessionStore::kMaxAdditionalsBytes, 'x')}},
                            "r2", "h2"),
               ValidationError);
  EXPECT_EQ(_ss.get("session", 42).sNonceHash, "nonce-h");
}

TEST_F(SessionStoreTest, GetMissingIsNotFound) {
  EXPECT_THROW(_ss.get("session", 42), NotFoundError);
}

TEST_F(SessionStoreTest, GetExpiredDeletesRow) {
  generateDefault(4600);
  _clk.set(4600);
  EXPECT_THROW(_ss.get("session", 42), AuthenticationError);
  EXPECT_EQ(_srRepo.countFor("session", 42), 0u);
  EXPECT_THROW(_ss.get("session", 42), NotFoundError);
}

TEST_F(SessionStoreTest, UpdateRotatesAndCounts) {
  generateDefault();
  _clk.set(1500);
  auto srRow = _ss.update("session", 42, {{"theme", "light"}}, "refresh-2", "header-2", 0);
  EXPECT_EQ(srRow.iUpdatedTally, 1);
  ASSERT_TRUE(srRow.oUpdatedAt.has_value());
  EXPECT_EQ(*srRow.oUpdatedAt, 1500);

  auto srStored = _ss.get("session", 42);
  EXPECT_EQ(srStored.sRefreshNonceHash, "refresh-2");
  EXPECT_EQ(srStored.sHeaderNonceHash, "header-2");
  EXPECT_EQ(srStored.jAdditionals["theme"], "light");
  // Write-once columns
  EXPECT_EQ(srStored.sNonceHash, "nonce-h");
  EXPECT_EQ(srStored.iCreatedAt, 1000);
  EXPECT_EQ(srStored.iExpirationAt, 4600);

  _ss.update("session", 42, srStored.jAdditionals, "refresh-3", "header-3",
             srStored.iUpdatedTally);
  EXPECT_EQ(_ss.get("session", 42).iUpdatedTally, 2);
}

TEST_F(SessionStoreTest, UpdateWithoutSessionFails) {
  EXPECT_THROW(_ss.update("session", 42, nullptr, "r", "h", 0), NotFoundError);
}

TEST_F(SessionStoreTest, UpdateLosingRaceIsConflict) {
  generateDefault();
  _srRepo.bInterleaveNextRotate = true;
  EXPECT_THROW(_ss.update("session", 42, nullptr, "r", "h", 0), ConflictError);
  EXPECT_EQ(_ss.get("session", 42).sRefreshNonceHash, "refresh-h");
}

TEST_F(SessionStoreTest, UpdateFromStaleReadIsConflict) {
  generateDefault();
  auto srRead = _ss.get("session", 42);
  _ss.update("session", 42, nullptr, "refresh-a", "header-a", srRead.iUpdatedTally);

  EXPECT_THROW(
      _ss.update("session", 42, nullptr, "refresh-b", "header-b", srRead.iUpdatedTally),
      ConflictError);
  auto srStored = _ss.get("session", 42);
  EXPECT_EQ(srStored.sRefreshNonceHash, "refresh-a");
  EXPECT_EQ(srStored.iUpdatedTally, 1);
}

TEST_F(SessionStoreTest, UpdateAdditionalsKeepsRotationHashes) {
  generateDefault();
  auto srRow = _ss.updateAdditionals("session", 42, {{"cart", 3}});
  EXPECT_EQ(srRow.jAdditionals["cart"], 3);
  EXPECT_EQ(srRow.sRefreshNonceHash, "refresh-h");
  EXPECT_EQ(srRow.sHeaderNonceHash, "header-h");
  EXPECT_EQ(srRow.iUpdatedTally, 1);
  EXPECT_THROW(_ss.updateAdditionals("session", 42, "text"), ValidationError);
}

TEST_F(SessionStoreTest, RemoveDeletesOrReportsMissing) {
  generateDefault();
  EXPECT_NO_THROW(_ss.remove("session", 42));
  EXPECT_EQ(_srRepo.countFor("session", 42), 0u);
  EXPECT_THROW(_ss.remove("session", 42), NotFoundError);
}

TEST_F(SessionStoreTest, SweepRunsOncePerInterval) {
  _ss.generate("session", 1, "n", 1500, nullptr, "r", "h");
  _ss.generate("session", 2, "n", 9000, nullptr, "r", "h");
  _clk.set(2000);

  EXPECT_EQ(_ss.sweepExpired(), 1);
  EXPECT_EQ(_srRepo.rows().size(), 1u);

  _clk.set(2500);
  EXPECT_EQ(_ss.sweepExpired(), -1);
  EXPECT_EQ(_srRepo.iDeleteExpiredCalls, 1);

  _clk.set(2000 + 86400);
  EXPECT_EQ(_ss.sweepExpired(), 1);
  EXPECT_EQ(_srRepo.iDeleteExpiredCalls, 2);
}

TEST_F(SessionStoreTest, SweepKeepsRowExpiringExactlyNow) {
  _ss.generate("session", 1, "n", 2000, nullptr, "r", "h");
  _clk.set(2000);
  EXPECT_EQ(_ss.sweepExpired(), 0);
  EXPECT_EQ(_srRepo.rows().size(), 1u);
}

TEST_F(SessionStoreTest, RepositoryFailuresBecomeStoreErrors) {
  _srRepo.bFailAll = true;
  EXPECT_THROW(_ss.get("session", 42), StoreError);
  EXPECT_THROW(generateDefault(), StoreError);
  EXPECT_THROW(_ss.remove("session", 42), StoreError);

  _srRepo.bFailAll = false;
  _fsFlags.bFailAll = true;
  EXPECT_THROW(_ss.sweepExpired(), StoreError);
}
