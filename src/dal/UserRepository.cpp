#include "dal/UserRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace restauth::dal {

namespace {
constexpr const char* kSelectUser =
    "SELECT id, username, password_hash, is_active FROM restauth_users ";

UserRow mapRow(const pqxx::row& row) {
  return UserRow{
      row[0].as<int64_t>(),
      row[1].as<std::string>(),
      row[2].as<std::string>(),
      row[3].as<bool>(),
  };
}
}  // namespace

UserRepository::UserRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
UserRepository::~UserRepository() = default;

void UserRepository::ensureSchema() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "CREATE TABLE IF NOT EXISTS restauth_users ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  username TEXT NOT NULL UNIQUE,"
      "  password_hash TEXT NOT NULL,"
      "  is_active BOOLEAN NOT NULL DEFAULT TRUE)");
  txn.commit();
}

std::optional<UserRow> UserRepository::findByUsername(const std::string& sUsername) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(std::string(kSelectUser) + "WHERE username = $1",
                         pqxx::params{sUsername});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return mapRow(result[0]);
}

std::optional<UserRow> UserRepository::findById(int64_t iUserId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(std::string(kSelectUser) + "WHERE id = $1",
                         pqxx::params{iUserId});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return mapRow(result[0]);
}

int64_t UserRepository::create(const std::string& sUsername,
                               const std::string& sPasswordHash) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "INSERT INTO restauth_users (username, password_hash) VALUES ($1, $2) RETURNING id",
      pqxx::params{sUsername, sPasswordHash});
  txn.commit();
  return result.one_row()[0].as<int64_t>();
}

}  // namespace restauth::dal
