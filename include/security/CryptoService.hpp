#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace restauth::security {

/// Keys derived from the master secret; one per primitive.
/// Class abbreviation: dk
struct DerivedKeys {
  std::vector<unsigned char> vEncryptionKey;
  std::vector<unsigned char> vMacKey;
};

/// Cryptographic primitives for the token protocol: HKDF-SHA256 key
/// derivation, AES-256-CBC, HMAC-SHA256, constant-time comparison, CSPRNG
/// and the base64/hex codecs used on the wire.
///
/// An instance owns the two keys derived from the master secret and the
/// separate nonce-hashing secret. All three are zeroed on destruction.
/// Class abbreviation: cs
class CryptoService {
 public:
  static constexpr size_t kKeyLen = 32;    // AES-256 / HMAC-SHA256 key
  static constexpr size_t kIvLen = 16;     // AES block
  static constexpr size_t kMacLen = 32;    // HMAC-SHA256 tag
  static constexpr size_t kNonceLen = 32;  // every protocol secret

  /// Derives the encryption and MAC keys from sMasterSecret. Both input
  /// strings are zeroed via OPENSSL_cleanse once consumed.
  /// Throws std::runtime_error if either secret is empty.
  CryptoService(std::string sMasterSecret, std::string sNonceSecret);
  ~CryptoService();

  CryptoService(const CryptoService&) = delete;
  CryptoService& operator=(const CryptoService&) = delete;

  /// AES-256-CBC (PKCS#7 padding) with the derived encryption key.
  /// Throws std::runtime_error if vIv is not 16 bytes or OpenSSL fails.
  std::vector<unsigned char> encrypt(const std::string& sPlaintext,
                                     const std::vector<unsigned char>& vIv) const;

  /// Inverse of encrypt(). A padding or format failure is an expected
  /// outcome for forged input and yields std::nullopt.
  std::optional<std::string> decrypt(const std::vector<unsigned char>& vCiphertext,
                                     const std::vector<unsigned char>& vIv) const;

  /// HMAC-SHA256 with the derived MAC key.
  std::vector<unsigned char> mac(const std::vector<unsigned char>& vData) const;

  /// One-way storage form of a protocol secret:
  /// lowercase hex of HMAC-SHA256(nonce secret, vRaw).
  std::string hashNonce(const std::vector<unsigned char>& vRaw) const;

  /// HKDF-SHA256 with the labels "encryption" and "authentication".
  static DerivedKeys deriveKeys(const std::string& sMasterSecret);

  /// RFC 5869 HKDF-SHA256 (extract + expand). An empty salt is omitted.
  static std::vector<unsigned char> hkdfSha256(const std::vector<unsigned char>& vIkm,
                                               const std::vector<unsigned char>& vSalt,
                                               const std::string& sInfo,
                                               size_t nLength);

  static std::vector<unsigned char> hmacSha256(const std::vector<unsigned char>& vKey,
                                               const std::vector<unsigned char>& vData);

  /// Length check followed by CRYPTO_memcmp; never short-circuits on content.
  static bool constantTimeEquals(const std::string& sA, const std::string& sB);
  static bool constantTimeEquals(const std::vector<unsigned char>& vA,
                                 const std::vector<unsigned char>& vB);

  /// RAND_bytes. Throws std::runtime_error if the CSPRNG fails.
  static std::vector<unsigned char> randomBytes(size_t nLen);

  /// Standard alphabet, padded, no line breaks.
  static std::string base64Encode(const std::vector<unsigned char>& vData);

  /// Strict: rejects characters outside the alphabet, bad padding and
  /// lengths that are not a multiple of four.
  static std::optional<std::vector<unsigned char>> base64Decode(const std::string& sEncoded);

  /// Lowercase hex.
  static std::string hexEncode(const std::vector<unsigned char>& vData);
  static std::optional<std::vector<unsigned char>> hexDecode(const std::string& sHex);

 private:
  DerivedKeys _dkKeys;
  std::vector<unsigned char> _vNonceKey;
};

}  // namespace restauth::security
