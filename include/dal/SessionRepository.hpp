#pragma once

#include "dal/ISessionRepository.hpp"

namespace restauth::dal {

class ConnectionPool;

/// libpqxx implementation of ISessionRepository over the restauth_sessions table.
/// Class abbreviation: sr
class SessionRepository : public ISessionRepository {
 public:
  explicit SessionRepository(ConnectionPool& cpPool);
  ~SessionRepository() override;

  void ensureSchema() override;
  int64_t replace(const SessionRow& srRow) override;
  std::optional<SessionRow> findByNameAndUser(const std::string& sName,
                                              int64_t iUser) override;
  bool rotate(const SessionRow& srRow, int64_t iExpectedTally) override;
  bool deleteById(int64_t iId) override;
  int deleteExpired(int64_t iNow) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace restauth::dal
