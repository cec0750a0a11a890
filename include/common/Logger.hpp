#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace restauth::common {

/// Process-wide "restauth" logger on top of spdlog's default logger.
/// Safe to call get() from any thread before init(); the logger is then
/// created at "info" and init() later only changes its level.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Server starting on port {}", iPort);
class Logger {
 public:
  static constexpr const char* kLoggerName = "restauth";

  /// Set the level. Throws std::invalid_argument for a name isValidLevel()
  /// rejects.
  static void init(const std::string& sLevel);

  static std::shared_ptr<spdlog::logger> get();

  /// One of "trace", "debug", "info", "warn", "error", "critical", "off".
  static bool isValidLevel(const std::string& sLevel);

 private:
  static void ensureCreated();
};

}  // namespace restauth::common
