#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Clock.hpp"
#include "dal/IFlagStore.hpp"
#include "dal/ISessionRepository.hpp"

namespace restauth::core {

/// Session record semantics on top of a session table and a flag store:
/// one row per (name, user), self-cleaning on expired access, rotation
/// bookkeeping with a compare-and-swap on updated_tally, and a sweep of
/// expired rows that runs at most once per interval.
///
/// Every failure is thrown as a common::AppError subclass. Storage
/// exceptions are logged and rethrown as common::StoreError.
/// Class abbreviation: ss
class SessionStore {
 public:
  static constexpr size_t kMaxAdditionalsBytes = 65536;
  static constexpr const char* kSweepFlag = "session_sweep";

  SessionStore(dal::ISessionRepository& srRepo, dal::IFlagStore& fsFlags,
               const common::IClock& clkClock, int iSweepIntervalSeconds);

  /// Evict any session for (sName, iUser) and insert a fresh one.
  /// jAdditionals is checked first (ValidationError) so a bad payload never
  /// destroys a live session.
  dal::SessionRow generate(const std::string& sName, int64_t iUser,
                           const std::string& sNonceHash, int64_t iExpirationAt,
                           const nlohmann::json& jAdditionals,
                           const std::string& sRefreshNonceHash,
                           const std::string& sHeaderNonceHash);

  /// NotFoundError when absent. An expired row is deleted and reported as
  /// AuthenticationError("session_expired").
  dal::SessionRow get(const std::string& sName, int64_t iUser);

  /// Rotate the refresh and header hashes and replace the additionals.
  /// iExpectedTally is the updated_tally of the row the caller verified;
  /// ConflictError("session_conflict") when the session moved past it.
  dal::SessionRow update(const std::string& sName, int64_t iUser,
                         const nlohmann::json& jAdditionals,
                         const std::string& sRefreshNonceHash,
                         const std::string& sHeaderNonceHash, int64_t iExpectedTally);

  /// Replace only the additionals; the rotation hashes are kept.
  dal::SessionRow updateAdditionals(const std::string& sName, int64_t iUser,
                                    const nlohmann::json& jAdditionals);

  /// NotFoundError when no row exists for (sName, iUser).
  void remove(const std::string& sName, int64_t iUser);

  /// Delete every row past its expiration. Returns the number of rows
  /// deleted, or -1 when the sweep already ran within the interval.
  int sweepExpired();

  /// Throws ValidationError unless jAdditionals is an object or null and
  /// serializes to at most kMaxAdditionalsBytes.
  static nlohmann::json normalizeAdditionals(const nlohmann::json& jAdditionals);

 private:
  dal::SessionRow persistRotation(dal::SessionRow srRow);

  dal::ISessionRepository& _srRepo;
  dal::IFlagStore& _fsFlags;
  const common::IClock& _clkClock;
  int _iSweepIntervalSeconds;
};

}  // namespace restauth::core
