#pragma once

#include <chrono>
#include <cstdint>

namespace restauth::common {

/// Wall clock in whole seconds since the Unix epoch.
class IClock {
 public:
  virtual ~IClock() = default;

  virtual int64_t nowSeconds() const = 0;
};

/// IClock backed by std::chrono::system_clock.
class SystemClock : public IClock {
 public:
  int64_t nowSeconds() const override {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace restauth::common
