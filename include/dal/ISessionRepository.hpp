#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace restauth::dal {

/// One session per (name, user). Timestamps are seconds since the epoch.
/// Only the three nonce columns hold secrets, and only as keyed hashes.
struct SessionRow {
  int64_t iId = 0;
  std::string sName;
  int64_t iUser = 0;
  std::string sNonceHash;
  std::string sRefreshNonceHash;
  std::string sHeaderNonceHash;
  int64_t iCreatedAt = 0;
  int64_t iExpirationAt = 0;
  int64_t iUpdatedTally = 0;
  std::optional<int64_t> oUpdatedAt;
  nlohmann::json jAdditionals = nlohmann::json::object();
};

/// Storage for session rows. Implementations let storage exceptions
/// propagate; callers decide how to report them.
class ISessionRepository {
 public:
  virtual ~ISessionRepository() = default;

  virtual void ensureSchema() = 0;

  /// Delete any row for (sName, iUser) and insert srRow in one transaction.
  /// iId and iUpdatedTally of srRow are ignored. Returns the new id.
  virtual int64_t replace(const SessionRow& srRow) = 0;

  virtual std::optional<SessionRow> findByNameAndUser(const std::string& sName,
                                                      int64_t iUser) = 0;

  /// Write the mutable columns of srRow (refresh/header hashes, tally,
  /// updated_at, additionals) only if the stored tally still equals
  /// iExpectedTally. Returns false when the row changed or disappeared.
  virtual bool rotate(const SessionRow& srRow, int64_t iExpectedTally) = 0;

  virtual bool deleteById(int64_t iId) = 0;

  /// Delete rows with expiration_at < iNow. Returns rows deleted.
  virtual int deleteExpired(int64_t iNow) = 0;
};

}  // namespace restauth::dal
