#include "security/CryptoService.hpp"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace restauth::security {

namespace {
constexpr const char* kEncryptionLabel = "encryption";
constexpr const char* kAuthenticationLabel = "authentication";

bool isBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '+' || c == '/';
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void cleanse(std::vector<unsigned char>& vData) {
  if (!vData.empty()) {
    OPENSSL_cleanse(vData.data(), vData.size());
  }
}
}  // namespace

// ── Constructor / Destructor ───────────────────────────────────────────────

CryptoService::CryptoService(std::string sMasterSecret, std::string sNonceSecret) {
  if (sMasterSecret.empty() || sNonceSecret.empty()) {
    throw std::runtime_error("CryptoService requires a non-empty master and nonce secret");
  }

  _dkKeys = deriveKeys(sMasterSecret);
  _vNonceKey.assign(sNonceSecret.begin(), sNonceSecret.end());

  OPENSSL_cleanse(sMasterSecret.data(), sMasterSecret.size());
  OPENSSL_cleanse(sNonceSecret.data(), sNonceSecret.size());
}

CryptoService::~CryptoService() {
  cleanse(_dkKeys.vEncryptionKey);
  cleanse(_dkKeys.vMacKey);
  cleanse(_vNonceKey);
}

// ── Key derivation ─────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::hkdfSha256(const std::vector<unsigned char>& vIkm,
                                                     const std::vector<unsigned char>& vSalt,
                                                     const std::string& sInfo,
                                                     size_t nLength) {
  EVP_KDF* pKdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
  if (!pKdf) {
    throw std::runtime_error("Failed to fetch HKDF KDF");
  }

  EVP_KDF_CTX* pCtx = EVP_KDF_CTX_new(pKdf);
  EVP_KDF_free(pKdf);
  if (!pCtx) {
    throw std::runtime_error("Failed to create KDF context");
  }

  char vDigest[] = "SHA256";
  OSSL_PARAM params[5];
  size_t nParam = 0;
  params[nParam++] = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, vDigest, 0);
  params[nParam++] = OSSL_PARAM_construct_octet_string(
      OSSL_KDF_PARAM_KEY, const_cast<unsigned char*>(vIkm.data()), vIkm.size());
  if (!vSalt.empty()) {
    params[nParam++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_SALT, const_cast<unsigned char*>(vSalt.data()), vSalt.size());
  }
  if (!sInfo.empty()) {
    params[nParam++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_INFO, const_cast<char*>(sInfo.data()), sInfo.size());
  }
  params[nParam] = OSSL_PARAM_construct_end();

  std::vector<unsigned char> vOut(nLength);
  if (EVP_KDF_derive(pCtx, vOut.data(), vOut.size(), params) != 1) {
    EVP_KDF_CTX_free(pCtx);
    throw std::runtime_error("HKDF-SHA256 derivation failed");
  }

  EVP_KDF_CTX_free(pCtx);
  return vOut;
}

DerivedKeys CryptoService::deriveKeys(const std::string& sMasterSecret) {
  std::vector<unsigned char> vIkm(sMasterSecret.begin(), sMasterSecret.end());

  DerivedKeys dk;
  dk.vEncryptionKey = hkdfSha256(vIkm, {}, kEncryptionLabel, kKeyLen);
  dk.vMacKey = hkdfSha256(vIkm, {}, kAuthenticationLabel, kKeyLen);

  cleanse(vIkm);
  return dk;
}

// ── AES-256-CBC ────────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::encrypt(const std::string& sPlaintext,
                                                  const std::vector<unsigned char>& vIv) const {
  if (vIv.size() != kIvLen) {
    throw std::runtime_error("AES-256-CBC requires a 16-byte IV");
  }

  EVP_CIPHER_CTX* pCtx = EVP_CIPHER_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create cipher context");
  }

  if (EVP_EncryptInit_ex(pCtx, EVP_aes_256_cbc(), nullptr,
                         _dkKeys.vEncryptionKey.data(), vIv.data()) != 1) {
    EVP_CIPHER_CTX_free(pCtx);
    throw std::runtime_error("Failed to initialize AES-256-CBC encryption");
  }

  // Output grows by at most one block of padding
  std::vector<unsigned char> vCiphertext(sPlaintext.size() + kIvLen);
  int iOutLen = 0;
  if (EVP_EncryptUpdate(pCtx, vCiphertext.data(), &iOutLen,
                        reinterpret_cast<const unsigned char*>(sPlaintext.data()),
                        static_cast<int>(sPlaintext.size())) != 1) {
    EVP_CIPHER_CTX_free(pCtx);
    throw std::runtime_error("Encryption failed");
  }
  int iCiphertextLen = iOutLen;

  if (EVP_EncryptFinal_ex(pCtx, vCiphertext.data() + iCiphertextLen, &iOutLen) != 1) {
    EVP_CIPHER_CTX_free(pCtx);
    throw std::runtime_error("Encryption finalization failed");
  }
  iCiphertextLen += iOutLen;

  EVP_CIPHER_CTX_free(pCtx);

  vCiphertext.resize(static_cast<size_t>(iCiphertextLen));
  return vCiphertext;
}

std::optional<std::string> CryptoService::decrypt(const std::vector<unsigned char>& vCiphertext,
                                                  const std::vector<unsigned char>& vIv) const {
  if (vIv.size() != kIvLen || vCiphertext.empty() || vCiphertext.size() % kIvLen != 0) {
    return std::nullopt;
  }

  EVP_CIPHER_CTX* pCtx = EVP_CIPHER_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create cipher context");
  }

  if (EVP_DecryptInit_ex(pCtx, EVP_aes_256_cbc(), nullptr,
                         _dkKeys.vEncryptionKey.data(), vIv.data()) != 1) {
    EVP_CIPHER_CTX_free(pCtx);
    throw std::runtime_error("Failed to initialize AES-256-CBC decryption");
  }

  std::vector<unsigned char> vPlaintext(vCiphertext.size() + kIvLen);
  int iOutLen = 0;
  if (EVP_DecryptUpdate(pCtx, vPlaintext.data(), &iOutLen,
                        vCiphertext.data(), static_cast<int>(vCiphertext.size())) != 1) {
    EVP_CIPHER_CTX_free(pCtx);
    cleanse(vPlaintext);
    return std::nullopt;
  }
  int iPlaintextLen = iOutLen;

  // Finalize: checks PKCS#7 padding
  if (EVP_DecryptFinal_ex(pCtx, vPlaintext.data() + iPlaintextLen, &iOutLen) != 1) {
    EVP_CIPHER_CTX_free(pCtx);
    cleanse(vPlaintext);
    return std::nullopt;
  }
  iPlaintextLen += iOutLen;

  EVP_CIPHER_CTX_free(pCtx);

  std::string sPlaintext(reinterpret_cast<char*>(vPlaintext.data()),
                         static_cast<size_t>(iPlaintextLen));
  cleanse(vPlaintext);
  return sPlaintext;
}

// ── HMAC ───────────────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::hmacSha256(const std::vector<unsigned char>& vKey,
                                                     const std::vector<unsigned char>& vData) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  // HMAC() rejects a null key pointer even for zero length
  static const unsigned char kEmpty = 0;
  const unsigned char* pKey = vKey.empty() ? &kEmpty : vKey.data();
  const unsigned char* pData = vData.empty() ? &kEmpty : vData.data();

  unsigned char* pResult = HMAC(EVP_sha256(),
                                pKey, static_cast<int>(vKey.size()),
                                pData, vData.size(),
                                vHash, &uHashLen);
  if (!pResult) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  return std::vector<unsigned char>(vHash, vHash + uHashLen);
}

std::vector<unsigned char> CryptoService::mac(const std::vector<unsigned char>& vData) const {
  return hmacSha256(_dkKeys.vMacKey, vData);
}

std::string CryptoService::hashNonce(const std::vector<unsigned char>& vRaw) const {
  return hexEncode(hmacSha256(_vNonceKey, vRaw));
}

// ── Comparison / randomness ────────────────────────────────────────────────

bool CryptoService::constantTimeEquals(const std::string& sA, const std::string& sB) {
  if (sA.size() != sB.size()) {
    return false;
  }
  return CRYPTO_memcmp(sA.data(), sB.data(), sA.size()) == 0;
}

bool CryptoService::constantTimeEquals(const std::vector<unsigned char>& vA,
                                       const std::vector<unsigned char>& vB) {
  if (vA.size() != vB.size()) {
    return false;
  }
  return CRYPTO_memcmp(vA.data(), vB.data(), vA.size()) == 0;
}

std::vector<unsigned char> CryptoService::randomBytes(size_t nLen) {
  std::vector<unsigned char> vBytes(nLen);
  if (nLen > 0 && RAND_bytes(vBytes.data(), static_cast<int>(nLen)) != 1) {
    throw std::runtime_error("Failed to generate random bytes");
  }
  return vBytes;
}

// ── Base64 ─────────────────────────────────────────────────────────────────

std::string CryptoService::base64Encode(const std::vector<unsigned char>& vData) {
  if (vData.empty()) {
    return {};
  }
  // EVP_EncodeBlock writes 4 chars per 3 input bytes plus a NUL, no newlines
  std::vector<unsigned char> vOut(((vData.size() + 2) / 3) * 4 + 1);
  const int iLen = EVP_EncodeBlock(vOut.data(), vData.data(), static_cast<int>(vData.size()));
  return std::string(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iLen));
}

std::optional<std::vector<unsigned char>> CryptoService::base64Decode(const std::string& sEncoded) {
  if (sEncoded.empty()) {
    return std::vector<unsigned char>{};
  }
  if (sEncoded.size() % 4 != 0) {
    return std::nullopt;
  }

  size_t nPadding = 0;
  for (size_t i = 0; i < sEncoded.size(); ++i) {
    const char c = sEncoded[i];
    if (c == '=') {
      // Padding only in the final two positions
      if (i < sEncoded.size() - 2) return std::nullopt;
      ++nPadding;
    } else if (nPadding > 0 || !isBase64Char(c)) {
      return std::nullopt;
    }
  }

  std::vector<unsigned char> vOut((sEncoded.size() / 4) * 3);
  const int iLen = EVP_DecodeBlock(vOut.data(),
                                   reinterpret_cast<const unsigned char*>(sEncoded.data()),
                                   static_cast<int>(sEncoded.size()));
  if (iLen < 0 || static_cast<size_t>(iLen) < nPadding) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts padding as zero bytes
  vOut.resize(static_cast<size_t>(iLen) - nPadding);

  // Only the canonical encoding is accepted; stray low bits in the last
  // quantum would otherwise let two strings decode to the same bytes
  if (base64Encode(vOut) != sEncoded) {
    return std::nullopt;
  }
  return vOut;
}

// ── Hex ────────────────────────────────────────────────────────────────────

std::string CryptoService::hexEncode(const std::vector<unsigned char>& vData) {
  static const char kDigits[] = "0123456789abcdef";
  std::string sOut;
  sOut.reserve(vData.size() * 2);
  for (unsigned char uByte : vData) {
    sOut.push_back(kDigits[uByte >> 4]);
    sOut.push_back(kDigits[uByte & 0x0F]);
  }
  return sOut;
}

std::optional<std::vector<unsigned char>> CryptoService::hexDecode(const std::string& sHex) {
  if (sHex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<unsigned char> vOut;
  vOut.reserve(sHex.size() / 2);
  for (size_t i = 0; i < sHex.size(); i += 2) {
    const int iHigh = hexValue(sHex[i]);
    const int iLow = hexValue(sHex[i + 1]);
    if (iHigh < 0 || iLow < 0) {
      return std::nullopt;
    }
    vOut.push_back(static_cast<unsigned char>((iHigh << 4) | iLow));
  }
  return vOut;
}

}  // namespace restauth::security
