#include "api/routes/HealthRoutes.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <nlohmann/json.hpp>

namespace restauth::api::routes {

HealthRoutes::HealthRoutes(dal::ConnectionPool& cpPool) : _cpPool(cpPool) {}
HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/health
  CROW_ROUTE(app, "/api/v1/health").methods("GET"_method)([this]() -> crow::response {
    nlohmann::json jResp = {{"status", "ok"}, {"db_pool_idle", _cpPool.available()}};
    try {
      auto cg = _cpPool.checkout();
      pqxx::nontransaction ntx(*cg);
      ntx.exec("SELECT 1").one_row();
    } catch (const std::exception& ex) {
      common::Logger::get()->warn("Health check: database unreachable: {}", ex.what());
      jResp["status"] = "degraded";
      crow::response resp(503, jResp.dump(2));
      resp.set_header("Content-Type", "application/json");
      return resp;
    }

    crow::response resp(200, jResp.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  });
}

}  // namespace restauth::api::routes
