#include "security/PasswordHasher.hpp"

#include "common/Logger.hpp"
#include "security/CryptoService.hpp"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <cstdio>
#include <exception>
#include <optional>
#include <sstream>
#include <vector>

namespace restauth::security {

namespace {
constexpr size_t kSaltLen = 16;
constexpr size_t kHashLen = 32;

// Upper bounds accepted from a stored digest
constexpr uint32_t kMaxMemoryKib = 1u << 22;  // 4 GiB
constexpr uint32_t kMaxTimeCost = 64;
constexpr uint32_t kMaxParallelism = 64;

std::string phcEncode(const std::vector<unsigned char>& vData) {
  std::string sB64 = CryptoService::base64Encode(vData);
  while (!sB64.empty() && sB64.back() == '=') {
    sB64.pop_back();
  }
  return sB64;
}

std::optional<std::vector<unsigned char>> phcDecode(std::string sB64) {
  while (sB64.size() % 4 != 0) {
    sB64 += '=';
  }
  return CryptoService::base64Decode(sB64);
}

bool deriveArgon2id(const std::string& sSecret,
                    const std::vector<unsigned char>& vSalt,
                    uint32_t uMemoryKib, uint32_t uTimeCost, uint32_t uLanes,
                    std::vector<unsigned char>& vOut) {
  EVP_KDF* pKdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
  if (!pKdf) {
    return false;
  }

  EVP_KDF_CTX* pCtx = EVP_KDF_CTX_new(pKdf);
  EVP_KDF_free(pKdf);
  if (!pCtx) {
    return false;
  }

  // One thread: OpenSSL refuses more unless OSSL_set_max_threads() was called
  uint32_t uThreads = 1;

  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_octet_string(
          OSSL_KDF_PARAM_PASSWORD,
          const_cast<char*>(sSecret.data()),
          sSecret.size()),
      OSSL_PARAM_construct_octet_string(
          OSSL_KDF_PARAM_SALT,
          const_cast<unsigned char*>(vSalt.data()),
          vSalt.size()),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &uTimeCost),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ARGON2_MEMCOST, &uMemoryKib),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_THREADS, &uThreads),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ARGON2_LANES, &uLanes),
      OSSL_PARAM_construct_end(),
  };

  const bool bOk = EVP_KDF_derive(pCtx, vOut.data(), vOut.size(), params) == 1;
  EVP_KDF_CTX_free(pCtx);
  return bOk;
}
}  // namespace

PasswordHasher::PasswordHasher(Argon2Params apParams) : _apParams(apParams) {}
PasswordHasher::~PasswordHasher() = default;

bool PasswordHasher::isAvailable() {
  EVP_KDF* pKdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
  if (!pKdf) {
    return false;
  }
  EVP_KDF_free(pKdf);
  return true;
}

common::Result<std::string> PasswordHasher::hash(const std::string& sSecret) const {
  using ResultT = common::Result<std::string>;

  if (sSecret.empty()) {
    return ResultT::failure(400, "empty_secret", "A secret must be provided to hash.");
  }
  if (sSecret.size() > kMaxSecretBytes) {
    return ResultT::failure(400, "secret_too_long",
                            "Secret exceeds the maximum of 1024 bytes.");
  }

  std::vector<unsigned char> vSalt;
  try {
    vSalt = CryptoService::randomBytes(kSaltLen);
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Password hash: {}", ex.what());
    return ResultT::failure(500, "hash_failed", "Failed to hash the secret.");
  }

  std::vector<unsigned char> vHash(kHashLen);
  if (!deriveArgon2id(sSecret, vSalt, _apParams.uMemoryKib, _apParams.uTimeCost,
                      _apParams.uParallelism, vHash)) {
    common::Logger::get()->error(
        "Password hash: Argon2id derivation failed (m={}, t={}, p={})",
        _apParams.uMemoryKib, _apParams.uTimeCost, _apParams.uParallelism);
    return ResultT::failure(500, "hash_failed", "Failed to hash the secret.");
  }

  std::string sDigest = "$argon2id$v=19$m=" + std::to_string(_apParams.uMemoryKib) +
                        ",t=" + std::to_string(_apParams.uTimeCost) +
                        ",p=" + std::to_string(_apParams.uParallelism) +
                        "$" + phcEncode(vSalt) + "$" + phcEncode(vHash);
  OPENSSL_cleanse(vHash.data(), vHash.size());

  return ResultT::success(200, "Password hash successful.", std::move(sDigest));
}

bool PasswordHasher::verify(const std::string& sSecret, const std::string& sDigest) const {
  if (sSecret.empty() || sSecret.size() > kMaxSecretBytes || sDigest.empty()) {
    return false;
  }

  // Fields: [0]="" [1]="argon2id" [2]="v=19" [3]="m=..,t=..,p=.." [4]=salt [5]=hash
  std::vector<std::string> vParts;
  std::istringstream iss(sDigest);
  std::string sPart;
  while (std::getline(iss, sPart, '$')) {
    vParts.push_back(sPart);
  }

  if (vParts.size() != 6 || !vParts[0].empty() || vParts[1] != "argon2id" ||
      vParts[2] != "v=19") {
    return false;
  }

  uint32_t uMemory = 0, uTime = 0, uParallelism = 0;
  char cTrailing = 0;
  if (std::sscanf(vParts[3].c_str(), "m=%u,t=%u,p=%u%c",
                  &uMemory, &uTime, &uParallelism, &cTrailing) != 3) {
    return false;
  }
  if (uTime < 1 || uTime > kMaxTimeCost || uParallelism < 1 ||
      uParallelism > kMaxParallelism || uMemory < 8 * uParallelism ||
      uMemory > kMaxMemoryKib) {
    return false;
  }

  auto oSalt = phcDecode(vParts[4]);
  auto oStored = phcDecode(vParts[5]);
  if (!oSalt || !oStored || oSalt->size() < 8 || oStored->size() < 16 ||
      oStored->size() > 64) {
    return false;
  }

  std::vector<unsigned char> vDerived(oStored->size());
  if (!deriveArgon2id(sSecret, *oSalt, uMemory, uTime, uParallelism, vDerived)) {
    return false;
  }

  const bool bMatch = CryptoService::constantTimeEquals(vDerived, *oStored);
  OPENSSL_cleanse(vDerived.data(), vDerived.size());
  return bMatch;
}

}  // namespace restauth::security
