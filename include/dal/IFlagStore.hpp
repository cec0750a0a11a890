#pragma once

#include <cstdint>
#include <string>

namespace restauth::dal {

/// Named boolean flags that lapse at a given time. Used to rate-limit
/// periodic jobs across processes sharing one database.
class IFlagStore {
 public:
  virtual ~IFlagStore() = default;

  virtual void ensureSchema() = 0;

  /// True when the flag exists and has not expired at iNow.
  virtual bool isSet(const std::string& sName, int64_t iNow) = 0;

  /// Create or overwrite the flag so it lapses at iExpiresAt.
  virtual void set(const std::string& sName, int64_t iExpiresAt) = 0;
};

}  // namespace restauth::dal
