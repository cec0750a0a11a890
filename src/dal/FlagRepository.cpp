#include "dal/FlagRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace restauth::dal {

FlagRepository::FlagRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
FlagRepository::~FlagRepository() = default;

void FlagRepository::ensureSchema() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "CREATE TABLE IF NOT EXISTS restauth_flags ("
      "  name TEXT PRIMARY KEY,"
      "  expires_at BIGINT NOT NULL)");
  txn.commit();
}

bool FlagRepository::isSet(const std::string& sName, int64_t iNow) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT 1 FROM restauth_flags WHERE name = $1 AND expires_at > $2",
      pqxx::params{sName, iNow});
  txn.commit();
  return !result.empty();
}

void FlagRepository::set(const std::string& sName, int64_t iExpiresAt) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO restauth_flags (name, expires_at) VALUES ($1, $2) "
      "ON CONFLICT (name) DO UPDATE SET expires_at = EXCLUDED.expires_at",
      pqxx::params{sName, iExpiresAt});
  txn.commit();
}

}  // namespace restauth::dal
