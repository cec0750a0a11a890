#pragma once

#include <functional>
#include <string>
#include <vector>

#include <crow.h>

namespace restauth::api {

/// Route modules known to the server, built once at startup and then
/// applied to the Crow app in insertion order.
/// Class abbreviation: rr
class RouteRegistry {
 public:
  using Registrar = std::function<void(crow::SimpleApp&)>;

  /// Throws std::invalid_argument on an empty or duplicate module name.
  void add(std::string sName, Registrar fnRegister);

  void applyTo(crow::SimpleApp& app) const;

  std::vector<std::string> names() const;

 private:
  struct Entry {
    std::string sName;
    Registrar fnRegister;
  };

  std::vector<Entry> _vEntries;
};

}  // namespace restauth::api
