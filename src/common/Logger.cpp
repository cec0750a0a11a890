#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

namespace restauth::common {

namespace {
std::once_flag gCreateOnce;
}  // namespace

void Logger::ensureCreated() {
  std::call_once(gCreateOnce, [] {
    // Reuse a logger someone else registered under our name
    auto spLogger = spdlog::get(kLoggerName);
    if (!spLogger) {
      spLogger = spdlog::stdout_color_mt(kLoggerName);
      spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
      spLogger->set_level(spdlog::level::info);
    }
    spdlog::set_default_logger(spLogger);
  });
}

bool Logger::isValidLevel(const std::string& sLevel) {
  return sLevel == "trace" || sLevel == "debug" || sLevel == "info" || sLevel == "warn" ||
         sLevel == "error" || sLevel == "critical" || sLevel == "off";
}

void Logger::init(const std::string& sLevel) {
  if (!isValidLevel(sLevel)) {
    throw std::invalid_argument("Unknown log level '" + sLevel + "'");
  }
  ensureCreated();
  auto spLogger = spdlog::default_logger();
  spLogger->set_level(spdlog::level::from_str(sLevel));
  spLogger->debug("Logger level set to '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  ensureCreated();
  return spdlog::default_logger();
}

}  // namespace restauth::common
