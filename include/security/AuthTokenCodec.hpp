#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Errors.hpp"

namespace restauth::security {

class CryptoService;

/// Decrypted contents of an authentication token.
/// Class abbreviation: tc
struct TokenClaims {
  int64_t iUserId = 0;
  int64_t iExpiresAt = 0;
  int64_t iIssuedAt = 0;
  std::vector<unsigned char> vNonce;
};

/// A token check failed. oUserId is set when the token was readable far
/// enough to name its user, so the caller can revoke that user's session.
struct TokenRejection : common::AuthenticationError {
  std::optional<int64_t> oUserId;

  TokenRejection(std::string sCode, std::string sMsg,
                   std::optional<int64_t> oUser = std::nullopt)
      : common::AuthenticationError(std::move(sCode), std::move(sMsg)), oUserId(oUser) {}
};

/// Encrypt-then-MAC token format:
///   base64(IV) "." base64(AES-256-CBC(plaintext)) "." base64(HMAC(IV || ciphertext))
/// with plaintext "user_id|expires_at|issued_at|hex(nonce)".
/// Class abbreviation: atc
class AuthTokenCodec {
 public:
  explicit AuthTokenCodec(const CryptoService& csCrypto);

  /// Throws std::runtime_error if the CSPRNG or cipher fails.
  std::string seal(const TokenClaims& tcClaims) const;

  /// Verify and decrypt. Throws TokenRejection with code
  /// malformed_token, integrity_failure, corrupt_token or invalid_structure.
  TokenClaims open(const std::string& sToken) const;

 private:
  static TokenClaims parsePlaintext(const std::string& sPlaintext);

  const CryptoService& _csCrypto;
};

}  // namespace restauth::security
