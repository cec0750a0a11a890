#pragma once

#include <cstdint>
#include <string>

#include "common/Types.hpp"

namespace restauth::security {

/// Argon2id cost parameters.
/// Class abbreviation: ap
struct Argon2Params {
  uint32_t uMemoryKib = 65536;  // 64 MiB
  uint32_t uTimeCost = 3;
  uint32_t uParallelism = 1;
};

/// Argon2id password hashing via OpenSSL EVP_KDF (requires OpenSSL >= 3.2).
/// Fails closed: hash() reports errors through its Result and verify()
/// collapses every failure to false.
/// Class abbreviation: ph
class PasswordHasher {
 public:
  static constexpr size_t kMaxSecretBytes = 1024;

  explicit PasswordHasher(Argon2Params apParams);
  ~PasswordHasher();

  /// Hash a secret into a PHC string:
  /// $argon2id$v=19$m=<kib>,t=<iter>,p=<lanes>$<b64 salt>$<b64 hash>
  /// 400 for an empty or oversized secret, 500 if the KDF fails.
  common::Result<std::string> hash(const std::string& sSecret) const;

  /// Verify a secret against a PHC string. Malformed digests, unsupported
  /// parameters and wrong secrets are indistinguishable (all false).
  bool verify(const std::string& sSecret, const std::string& sDigest) const;

  /// Whether the linked OpenSSL provides the ARGON2ID KDF.
  static bool isAvailable();

 private:
  Argon2Params _apParams;
};

}  // namespace restauth::security
