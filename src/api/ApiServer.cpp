#include "api/ApiServer.hpp"

#include "api/RouteRegistry.hpp"
#include "common/Logger.hpp"

namespace restauth::api {

ApiServer::ApiServer(const RouteRegistry& rrRegistry) : _rrRegistry(rrRegistry) {
  _app.loglevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() { _rrRegistry.applyTo(_app); }

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} ({} threads)", iPort, iThreads);
  _app.port(static_cast<uint16_t>(iPort))
      .concurrency(static_cast<uint16_t>(iThreads))
      .run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace restauth::api
