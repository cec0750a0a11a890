#include "core/SessionStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <exception>
#include <utility>

namespace restauth::core {

using common::AppError;
using common::StoreError;

namespace {
/// Run a repository call, translating anything that is not already an
/// AppError into StoreError.
template <typename Fn>
auto guarded(const char* pOperation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const AppError&) {
    throw;
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Session store {} failed: {}", pOperation, ex.what());
    throw StoreError("store_failure", std::string("Session store ") + pOperation + " failed");
  }
}
}  // namespace

SessionStore::SessionStore(dal::ISessionRepository& srRepo, dal::IFlagStore& fsFlags,
                           const common::IClock& clkClock, int iSweepIntervalSeconds)
    : _srRepo(srRepo),
      _fsFlags(fsFlags),
      _clkClock(clkClock),
      _iSweepIntervalSeconds(iSweepIntervalSeconds) {}

nlohmann::json SessionStore::normalizeAdditionals(const nlohmann::json& jAdditionals) {
  if (jAdditionals.is_null()) {
    return nlohmann::json::object();
  }
  if (!jAdditionals.is_object()) {
    throw common::ValidationError("invalid_additionals",
                                  "Session additionals must be a JSON object");
  }
  size_t nSize = 0;
  try {
    nSize = jAdditionals.dump().size();
  } catch (const nlohmann::json::type_error&) {
    throw common::ValidationError("invalid_additionals",
                                  "Session additionals contain invalid UTF-8");
  }
  if (nSize > kMaxAdditionalsBytes) {
    throw common::ValidationError("invalid_additionals",
                                  "Session additionals exceed 65536 bytes");
  }
  return jAdditionals;
}

dal::SessionRow SessionStore::generate(const std::string& sName, int64_t iUser,
                                       const std::string& sNonceHash,
                                       int64_t iExpirationAt,
                                       const nlohmann::json& jAdditionals,
                                       const std::string& sRefreshNonceHash,
                                       const std::string& sHeaderNonceHash) {
  dal::SessionRow srRow;
  srRow.jAdditionals = normalizeAdditionals(jAdditionals);
  srRow.sName = sName;
  srRow.iUser = iUser;
  srRow.sNonceHash = sNonceHash;
  srRow.sRefreshNonceHash = sRefreshNonceHash;
  srRow.sHeaderNonceHash = sHeaderNonceHash;
  srRow.iCreatedAt = _clkClock.nowSeconds();
  srRow.iExpirationAt = iExpirationAt;

  srRow.iId = guarded("generate", [&] { return _srRepo.replace(srRow); });
  return srRow;
}

dal::SessionRow SessionStore::get(const std::string& sName, int64_t iUser) {
  auto oRow = guarded("get", [&] { return _srRepo.findByNameAndUser(sName, iUser); });
  if (!oRow) {
    throw common::NotFoundError("session_not_found", "No session for this token");
  }

  if (oRow->iExpirationAt <= _clkClock.nowSeconds()) {
    guarded("delete", [&] { return _srRepo.deleteById(oRow->iId); });
    throw common::AuthenticationError("session_expired", "Session has expired");
  }
  return std::move(*oRow);
}

dal::SessionRow SessionStore::update(const std::string& sName, int64_t iUser,
                                     const nlohmann::json& jAdditionals,
                                     const std::string& sRefreshNonceHash,
                                     const std::string& sHeaderNonceHash,
                                     int64_t iExpectedTally) {
  auto jNormalized = normalizeAdditionals(jAdditionals);
  auto srRow = get(sName, iUser);
  if (srRow.iUpdatedTally != iExpectedTally) {
    throw common::ConflictError("session_conflict",
                                "Session was modified by a concurrent request");
  }
  srRow.jAdditionals = std::move(jNormalized);
  srRow.sRefreshNonceHash = sRefreshNonceHash;
  srRow.sHeaderNonceHash = sHeaderNonceHash;
  return persistRotation(std::move(srRow));
}

dal::SessionRow SessionStore::updateAdditionals(const std::string& sName, int64_t iUser,
                                                const nlohmann::json& jAdditionals) {
  auto jNormalized = normalizeAdditionals(jAdditionals);
  auto srRow = get(sName, iUser);
  srRow.jAdditionals = std::move(jNormalized);
  return persistRotation(std::move(srRow));
}

dal::SessionRow SessionStore::persistRotation(dal::SessionRow srRow) {
  const int64_t iExpectedTally = srRow.iUpdatedTally;
  srRow.iUpdatedTally = iExpectedTally + 1;
  srRow.oUpdatedAt = _clkClock.nowSeconds();

  const bool bWritten =
      guarded("update", [&] { return _srRepo.rotate(srRow, iExpectedTally); });
  if (!bWritten) {
    throw common::ConflictError("session_conflict",
                                "Session was modified by a concurrent request");
  }
  return srRow;
}

void SessionStore::remove(const std::string& sName, int64_t iUser) {
  auto oRow = guarded("get", [&] { return _srRepo.findByNameAndUser(sName, iUser); });
  if (!oRow) {
    throw common::NotFoundError("session_not_found", "No session to delete");
  }
  if (!guarded("delete", [&] { return _srRepo.deleteById(oRow->iId); })) {
    throw common::NotFoundError("session_not_found", "No session to delete");
  }
}

int SessionStore::sweepExpired() {
  const int64_t iNow = _clkClock.nowSeconds();
  if (guarded("sweep", [&] { return _fsFlags.isSet(kSweepFlag, iNow); })) {
    return -1;
  }

  guarded("sweep", [&] { _fsFlags.set(kSweepFlag, iNow + _iSweepIntervalSeconds); });
  const int iDeleted = guarded("sweep", [&] { return _srRepo.deleteExpired(iNow); });
  if (iDeleted > 0) {
    common::Logger::get()->info("Session sweep removed {} expired sessions", iDeleted);
  }
  return iDeleted;
}

}  // namespace restauth::core
