#include "api/RouteRegistry.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace restauth::api {

void RouteRegistry::add(std::string sName, Registrar fnRegister) {
  if (sName.empty() || !fnRegister) {
    throw std::invalid_argument("Route module needs a name and a registrar");
  }
  const bool bDuplicate = std::any_of(_vEntries.begin(), _vEntries.end(),
                                      [&](const Entry& e) { return e.sName == sName; });
  if (bDuplicate) {
    throw std::invalid_argument("Route module already registered: " + sName);
  }
  _vEntries.push_back(Entry{std::move(sName), std::move(fnRegister)});
}

void RouteRegistry::applyTo(crow::SimpleApp& app) const {
  for (const auto& entry : _vEntries) {
    entry.fnRegister(app);
    common::Logger::get()->info("Registered route module '{}'", entry.sName);
  }
}

std::vector<std::string> RouteRegistry::names() const {
  std::vector<std::string> vNames;
  vNames.reserve(_vEntries.size());
  for (const auto& entry : _vEntries) {
    vNames.push_back(entry.sName);
  }
  return vNames;
}

}  // namespace restauth::api
