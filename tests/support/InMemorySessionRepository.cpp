#include "support/InMemorySessionRepository.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace restauth::test {

void InMemorySessionRepository::maybeFail() const {
  if (bFailAll) {
    throw std::runtime_error("connection refused");
  }
}

int64_t InMemorySessionRepository::replace(const dal::SessionRow& srRow) {
  maybeFail();
  for (auto it = _mRows.begin(); it != _mRows.end();) {
    if (it->second.sName == srRow.sName && it->second.iUser == srRow.iUser) {
      it = _mRows.erase(it);
    } else {
      ++it;
    }
  }
  dal::SessionRow srStored = srRow;
  srStored.iId = _iNextId++;
  srStored.iUpdatedTally = 0;
  srStored.oUpdatedAt.reset();
  _mRows[srStored.iId] = srStored;
  return srStored.iId;
}

std::optional<dal::SessionRow> InMemorySessionRepository::findByNameAndUser(
    const std::string& sName, int64_t iUser) {
  maybeFail();
  if (fnInterleave && --iInterleaveAtFind <= 0) {
    auto fnRun = std::move(fnInterleave);
    fnInterleave = nullptr;
    fnRun();
  }
  for (const auto& [iId, srRow] : _mRows) {
    if (srRow.sName == sName && srRow.iUser == iUser) return srRow;
  }
  return std::nullopt;
}

bool InMemorySessionRepository::rotate(const dal::SessionRow& srRow, int64_t iExpectedTally) {
  maybeFail();
  auto it = _mRows.find(srRow.iId);
  if (it == _mRows.end()) return false;
  if (bInterleaveNextRotate) {
    bInterleaveNextRotate = false;
    ++it->second.iUpdatedTally;
  }
  if (it->second.iUpdatedTally != iExpectedTally) return false;

  it->second.sRefreshNonceHash = srRow.sRefreshNonceHash;
  it->second.sHeaderNonceHash = srRow.sHeaderNonceHash;
  it->second.iUpdatedTally = srRow.iUpdatedTally;
  it->second.oUpdatedAt = srRow.oUpdatedAt;
  it->second.jAdditionals = srRow.jAdditionals;
  return true;
}

bool InMemorySessionRepository::deleteById(int64_t iId) {
  maybeFail();
  return _mRows.erase(iId) > 0;
}

int InMemorySessionRepository::deleteExpired(int64_t iNow) {
  maybeFail();
  ++iDeleteExpiredCalls;
  int iDeleted = 0;
  for (auto it = _mRows.begin(); it != _mRows.end();) {
    if (it->second.iExpirationAt < iNow) {
      it = _mRows.erase(it);
      ++iDeleted;
    } else {
      ++it;
    }
  }
  return iDeleted;
}

std::vector<dal::SessionRow> InMemorySessionRepository::rows() const {
  std::vector<dal::SessionRow> vRows;
  for (const auto& [iId, srRow] : _mRows) vRows.push_back(srRow);
  return vRows;
}

size_t InMemorySessionRepository::countFor(const std::string& sName, int64_t iUser) const {
  return static_cast<size_t>(std::count_if(_mRows.begin(), _mRows.end(), [&](const auto& kv) {
    return kv.second.sName == sName && kv.second.iUser == iUser;
  }));
}

bool InMemoryFlagStore::isSet(const std::string& sName, int64_t iNow) {
  if (bFailAll) throw std::runtime_error("flag store offline");
  auto it = _mFlags.find(sName);
  return it != _mFlags.end() && it->second > iNow;
}

void InMemoryFlagStore::set(const std::string& sName, int64_t iExpiresAt) {
  if (bFailAll) throw std::runtime_error("flag store offline");
  _mFlags[sName] = iExpiresAt;
}

}  // namespace restauth::test
