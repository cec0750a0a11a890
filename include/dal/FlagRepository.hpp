#pragma once

#include "dal/IFlagStore.hpp"

namespace restauth::dal {

class ConnectionPool;

/// libpqxx implementation of IFlagStore over the restauth_flags table.
/// Class abbreviation: fr
class FlagRepository : public IFlagStore {
 public:
  explicit FlagRepository(ConnectionPool& cpPool);
  ~FlagRepository() override;

  void ensureSchema() override;
  bool isSet(const std::string& sName, int64_t iNow) override;
  void set(const std::string& sName, int64_t iExpiresAt) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace restauth::dal
