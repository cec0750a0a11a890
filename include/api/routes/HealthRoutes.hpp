#pragma once

#include <crow.h>

namespace restauth::dal {
class ConnectionPool;
}

namespace restauth::api::routes {

/// Handler for /api/v1/health
class HealthRoutes {
 public:
  explicit HealthRoutes(dal::ConnectionPool& cpPool);
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  dal::ConnectionPool& _cpPool;
};

}  // namespace restauth::api::routes
