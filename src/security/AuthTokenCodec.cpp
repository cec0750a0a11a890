#include "security/AuthTokenCodec.hpp"

#include "security/CryptoService.hpp"

#include <openssl/crypto.h>

#include <charconv>

namespace restauth::security {

namespace {
std::vector<std::string> split(const std::string& s, char cDelim) {
  std::vector<std::string> vParts;
  size_t nStart = 0;
  while (true) {
    const auto nPos = s.find(cDelim, nStart);
    if (nPos == std::string::npos) {
      vParts.push_back(s.substr(nStart));
      return vParts;
    }
    vParts.push_back(s.substr(nStart, nPos - nStart));
    nStart = nPos + 1;
  }
}

/// Whole-string base-10 integer, no sign prefix other than '-'.
std::optional<int64_t> parseInt(const std::string& s) {
  if (s.empty()) return std::nullopt;
  int64_t iValue = 0;
  const auto* pEnd = s.data() + s.size();
  auto [pPtr, ec] = std::from_chars(s.data(), pEnd, iValue);
  if (ec != std::errc() || pPtr != pEnd) return std::nullopt;
  return iValue;
}
}  // namespace

AuthTokenCodec::AuthTokenCodec(const CryptoService& csCrypto) : _csCrypto(csCrypto) {}

std::string AuthTokenCodec::seal(const TokenClaims& tcClaims) const {
  std::string sPlaintext = std::to_string(tcClaims.iUserId) + "|" +
                           std::to_string(tcClaims.iExpiresAt) + "|" +
                           std::to_string(tcClaims.iIssuedAt) + "|" +
                           CryptoService::hexEncode(tcClaims.vNonce);

  const auto vIv = CryptoService::randomBytes(CryptoService::kIvLen);
  const auto vCiphertext = _csCrypto.encrypt(sPlaintext, vIv);
  OPENSSL_cleanse(sPlaintext.data(), sPlaintext.size());

  std::vector<unsigned char> vSigned(vIv);
  vSigned.insert(vSigned.end(), vCiphertext.begin(), vCiphertext.end());
  const auto vMac = _csCrypto.mac(vSigned);

  return CryptoService::base64Encode(vIv) + "." + CryptoService::base64Encode(vCiphertext) +
         "." + CryptoService::base64Encode(vMac);
}

TokenClaims AuthTokenCodec::open(const std::string& sToken) const {
  const auto vParts = split(sToken, '.');
  if (vParts.size() != 3) {
    throw TokenRejection("malformed_token", "Token must have three segments");
  }

  auto oIv = CryptoService::base64Decode(vParts[0]);
  auto oCiphertext = CryptoService::base64Decode(vParts[1]);
  auto oMac = CryptoService::base64Decode(vParts[2]);
  if (!oIv || !oCiphertext || !oMac) {
    throw TokenRejection("malformed_token", "Token segment is not valid base64");
  }
  if (oIv->size() != CryptoService::kIvLen || oMac->size() != CryptoService::kMacLen ||
      oCiphertext->empty() || oCiphertext->size() % CryptoService::kIvLen != 0) {
    throw TokenRejection("malformed_token", "Token segment has the wrong length");
  }

  std::vector<unsigned char> vSigned(*oIv);
  vSigned.insert(vSigned.end(), oCiphertext->begin(), oCiphertext->end());
  if (!CryptoService::constantTimeEquals(_csCrypto.mac(vSigned), *oMac)) {
    throw TokenRejection("integrity_failure", "Token integrity check failed");
  }

  auto oPlaintext = _csCrypto.decrypt(*oCiphertext, *oIv);
  if (!oPlaintext) {
    throw TokenRejection("corrupt_token", "Token could not be decrypted");
  }

  TokenClaims tcClaims = parsePlaintext(*oPlaintext);
  OPENSSL_cleanse(oPlaintext->data(), oPlaintext->size());
  return tcClaims;
}

TokenClaims AuthTokenCodec::parsePlaintext(const std::string& sPlaintext) {
  const auto vFields = split(sPlaintext, '|');

  std::optional<int64_t> oUser;
  if (!vFields.empty()) {
    oUser = parseInt(vFields[0]);
    if (oUser && *oUser <= 0) oUser.reset();
  }

  if (vFields.size() != 4) {
    throw TokenRejection("invalid_structure", "Token payload must have four fields", oUser);
  }

  auto oExpires = parseInt(vFields[1]);
  auto oIssued = parseInt(vFields[2]);
  auto oNonce = CryptoService::hexDecode(vFields[3]);
  if (!oUser || !oExpires || !oIssued || !oNonce ||
      oNonce->size() != CryptoService::kNonceLen) {
    throw TokenRejection("invalid_structure", "Token payload field is malformed", oUser);
  }

  return TokenClaims{*oUser, *oExpires, *oIssued, std::move(*oNonce)};
}

}  // namespace restauth::security
