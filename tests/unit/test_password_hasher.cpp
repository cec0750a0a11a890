#include "security/PasswordHasher.hpp"

#include <gtest/gtest.h>

#include <string>

using restauth::security::Argon2Params;
using restauth::security::PasswordHasher;

class PasswordHasherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!PasswordHasher::isAvailable()) {
      GTEST_SKIP() << "Linked OpenSSL has no ARGON2ID KDF";
    }
  }

  // Low costs keep the suite fast
  PasswordHasher _phHasher{Argon2Params{8192, 1, 1}};
};

TEST_F(PasswordHasherTest, HashProducesPhcString) {
  auto res = _phHasher.hash("correct horse battery staple");
  ASSERT_TRUE(res.bOk) << res.sMessage;
  EXPECT_EQ(res.oData->rfind("$argon2id$v=19$m=8192,t=1,p=1$", 0), 0u);
  EXPECT_NE(res.oData->back(), '=');  // unpadded base64
}

TEST_F(PasswordHasherTest, VerifyAcceptsCorrectSecret) {
  auto res = _phHasher.hash("s3cret");
  ASSERT_TRUE(res.bOk);
  EXPECT_TRUE(_phHasher.verify("s3cret", *res.oData));
  EXPECT_FALSE(_phHasher.verify("s3cret!", *res.oData));
}

TEST_F(PasswordHasherTest, SaltMakesDigestsDiffer) {
  auto res1 = _phHasher.hash("same");
  auto res2 = _phHasher.hash("same");
  ASSERT_TRUE(res1.bOk && res2.bOk);
  EXPECT_NE(*res1.oData, *res2.oData);
}

TEST_F(PasswordHasherTest, DigestCarriesItsOwnParameters) {
  PasswordHasher phOther(Argon2Params{16384, 2, 2});
  auto res = phOther.hash("portable");
  ASSERT_TRUE(res.bOk);
  EXPECT_TRUE(_phHasher.verify("portable", *res.oData));
}

TEST_F(PasswordHasherTest, RejectsEmptyAndOversizedSecrets) {
  auto resEmpty = _phHasher.hash("");
  EXPECT_FALSE(resEmpty.bOk);
  EXPECT_EQ(resEmpty.iStatus, 400);

  auto resLong = _phHasher.hash(std::string(PasswordHasher::kMaxSecretBytes + 1, 'a'));
  EXPECT_FALSE(resLong.bOk);
  EXPECT_EQ(resLong.iStatus, 400);

  EXPECT_TRUE(_phHasher.hash(std::string(PasswordHasher::kMaxSecretBytes, 'a')).bOk);
}

TEST_F(PasswordHasherTest, MalformedDigestsVerifyFalse) {
  EXPECT_FALSE(_phHasher.verify("x", ""));
  EXPECT_FALSE(_phHasher.verify("x", "not-a-digest"));
  EXPECT_FALSE(_phHasher.verify("x", "$argon2i$v=19$m=8192,t=1,p=1$c2FsdHNhbHQ$aGFzaA"));
  EXPECT_FALSE(_phHasher.verify("x", "$argon2id$v=19$m=8192,t=1,p=1$!!!$aGFzaA"));
  EXPECT_FALSE(_phHasher.verify("x", "$argon2id$v=19$m=8192,t=1,p=1x$c2FsdHNhbHQ$aGFzaA"));
  // Cost far above the accepted bound
  EXPECT_FALSE(_phHasher.verify(
      "x", "$argon2id$v=19$m=99999999,t=1,p=1$c2FsdHNhbHRzYWx0$aGFzaGhhc2hoYXNoaGFzaA"));
}

TEST_F(PasswordHasherTest, TamperedHashVerifiesFalse) {
  auto res = _phHasher.hash("s3cret");
  ASSERT_TRUE(res.bOk);
  std::string sDigest = *res.oData;
  sDigest[sDigest.size() - 2] = sDigest[sDigest.size() - 2] == 'A' ? 'B' : 'A';
  EXPECT_FALSE(_phHasher.verify("s3cret", sDigest));
}
