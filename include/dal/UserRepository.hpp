#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace restauth::dal {

class ConnectionPool;

/// Row type returned from user queries.
struct UserRow {
  int64_t iId = 0;
  std::string sUsername;
  std::string sPasswordHash;
  bool bIsActive = true;
};

/// Local accounts for the login endpoint.
/// Class abbreviation: ur
class UserRepository {
 public:
  explicit UserRepository(ConnectionPool& cpPool);
  ~UserRepository();

  void ensureSchema();

  std::optional<UserRow> findByUsername(const std::string& sUsername);
  std::optional<UserRow> findById(int64_t iUserId);

  /// Returns the new user ID. Throws pqxx::unique_violation on a taken name.
  int64_t create(const std::string& sUsername, const std::string& sPasswordHash);

 private:
  ConnectionPool& _cpPool;
};

}  // namespace restauth::dal
