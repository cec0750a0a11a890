#include "support/FakeExchange.hpp"

#include <algorithm>
#include <cctype>

namespace restauth::test {

namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
}  // namespace

std::optional<std::string> FakeExchange::requestHeader(const std::string& sName) const {
  auto it = _mRequest.find(lower(sName));
  if (it == _mRequest.end()) return std::nullopt;
  return it->second;
}

bool FakeExchange::responseCommitted() const {
  ++_iCommitChecks;
  return bCommitted || _iCommitChecks == iCommittedOnCheck;
}

void FakeExchange::addResponseHeader(const std::string& sName, const std::string& sValue) {
  _vResponse.emplace_back(sName, sValue);
}

void FakeExchange::setRequestHeader(const std::string& sName, const std::string& sValue) {
  _mRequest[lower(sName)] = sValue;
}

std::vector<std::string> FakeExchange::responseHeaders(const std::string& sName) const {
  std::vector<std::string> vValues;
  for (const auto& [sKey, sValue] : _vResponse) {
    if (lower(sKey) == lower(sName)) vValues.push_back(sValue);
  }
  return vValues;
}

FakeExchange FakeBrowser::request(bool bSecure) const {
  FakeExchange fx;
  fx.bSecure = bSecure;
  if (!_mJar.empty()) {
    std::string sCookie;
    for (const auto& [sName, sValue] : _mJar) {
      if (!sCookie.empty()) sCookie += "; ";
      sCookie += sName + "=" + sValue;
    }
    fx.setRequestHeader("Cookie", sCookie);
  }
  if (oHeaderNonce) {
    fx.setRequestHeader(_sHeaderNonceName, *oHeaderNonce);
  }
  return fx;
}

void FakeBrowser::absorb(const FakeExchange& fxResponse) {
  for (const auto& sSetCookie : fxResponse.responseHeaders("Set-Cookie")) {
    const auto nEq = sSetCookie.find('=');
    const auto nSemi = sSetCookie.find(';');
    if (nEq == std::string::npos) continue;
    const std::string sName = sSetCookie.substr(0, nEq);
    const std::string sValue = sSetCookie.substr(nEq + 1, nSemi - nEq - 1);
    if (sValue.empty()) {
      _mJar.erase(sName);
    } else {
      _mJar[sName] = sValue;
    }
  }
  auto vNonces = fxResponse.responseHeaders(_sHeaderNonceName);
  if (!vNonces.empty()) {
    oHeaderNonce = vNonces.back();
  }
}

std::optional<std::string> FakeBrowser::cookie(const std::string& sName) const {
  auto it = _mJar.find(sName);
  if (it == _mJar.end()) return std::nullopt;
  return it->second;
}

void FakeBrowser::setCookie(const std::string& sName, const std::string& sValue) {
  _mJar[sName] = sValue;
}

}  // namespace restauth::test
