#include "dal/SessionRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace restauth::dal {

namespace {
constexpr const char* kSelectColumns =
    "SELECT id, name, user_id, nonce_hash, refresh_nonce_hash, header_nonce_hash, "
    "created_at, expiration_at, updated_tally, updated_at, additionals::text "
    "FROM restauth_sessions ";

SessionRow mapRow(const pqxx::row& row) {
  SessionRow srRow;
  srRow.iId = row[0].as<int64_t>();
  srRow.sName = row[1].as<std::string>();
  srRow.iUser = row[2].as<int64_t>();
  srRow.sNonceHash = row[3].as<std::string>();
  srRow.sRefreshNonceHash = row[4].as<std::string>();
  srRow.sHeaderNonceHash = row[5].as<std::string>();
  srRow.iCreatedAt = row[6].as<int64_t>();
  srRow.iExpirationAt = row[7].as<int64_t>();
  srRow.iUpdatedTally = row[8].as<int64_t>();
  if (!row[9].is_null()) {
    srRow.oUpdatedAt = row[9].as<int64_t>();
  }
  srRow.jAdditionals = nlohmann::json::parse(row[10].as<std::string>());
  return srRow;
}
}  // namespace

SessionRepository::SessionRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
SessionRepository::~SessionRepository() = default;

void SessionRepository::ensureSchema() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "CREATE TABLE IF NOT EXISTS restauth_sessions ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  name TEXT NOT NULL,"
      "  user_id BIGINT NOT NULL,"
      "  nonce_hash TEXT NOT NULL,"
      "  refresh_nonce_hash TEXT NOT NULL,"
      "  header_nonce_hash TEXT NOT NULL,"
      "  created_at BIGINT NOT NULL,"
      "  expiration_at BIGINT NOT NULL,"
      "  updated_tally BIGINT NOT NULL DEFAULT 0,"
      "  updated_at BIGINT,"
      "  additionals JSONB NOT NULL DEFAULT '{}'::jsonb,"
      "  UNIQUE (name, user_id))");
  txn.exec(
      "CREATE INDEX IF NOT EXISTS restauth_sessions_expiration_idx "
      "ON restauth_sessions (expiration_at)");
  txn.commit();
}

int64_t SessionRepository::replace(const SessionRow& srRow) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("DELETE FROM restauth_sessions WHERE name = $1 AND user_id = $2",
           pqxx::params{srRow.sName, srRow.iUser});
  auto result = txn.exec(
      "INSERT INTO restauth_sessions (name, user_id, nonce_hash, refresh_nonce_hash, "
      "header_nonce_hash, created_at, expiration_at, updated_tally, updated_at, additionals) "
      "VALUES ($1, $2, $3, $4, $5, $6, $7, 0, NULL, $8::jsonb) RETURNING id",
      pqxx::params{srRow.sName, srRow.iUser, srRow.sNonceHash, srRow.sRefreshNonceHash,
                   srRow.sHeaderNonceHash, srRow.iCreatedAt, srRow.iExpirationAt,
                   srRow.jAdditionals.dump()});
  txn.commit();
  return result.one_row()[0].as<int64_t>();
}

std::optional<SessionRow> SessionRepository::findByNameAndUser(const std::string& sName,
                                                               int64_t iUser) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(std::string(kSelectColumns) + "WHERE name = $1 AND user_id = $2",
                         pqxx::params{sName, iUser});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return mapRow(result[0]);
}

bool SessionRepository::rotate(const SessionRow& srRow, int64_t iExpectedTally) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  std::optional<int64_t> oUpdatedAt = srRow.oUpdatedAt;
  auto result = txn.exec(
      "UPDATE restauth_sessions SET "
      "refresh_nonce_hash = $2, header_nonce_hash = $3, updated_tally = $4, "
      "updated_at = $5, additionals = $6::jsonb "
      "WHERE id = $1 AND updated_tally = $7",
      pqxx::params{srRow.iId, srRow.sRefreshNonceHash, srRow.sHeaderNonceHash,
                   srRow.iUpdatedTally, oUpdatedAt, srRow.jAdditionals.dump(),
                   iExpectedTally});
  txn.commit();
  return result.affected_rows() == 1;
}

bool SessionRepository::deleteById(int64_t iId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("DELETE FROM restauth_sessions WHERE id = $1", pqxx::params{iId});
  txn.commit();
  return result.affected_rows() > 0;
}

int SessionRepository::deleteExpired(int64_t iNow) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("DELETE FROM restauth_sessions WHERE expiration_at < $1",
                         pqxx::params{iNow});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

}  // namespace restauth::dal
