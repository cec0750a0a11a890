#pragma once

#include <crow.h>

namespace restauth::api {

class RouteRegistry;

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  explicit ApiServer(const RouteRegistry& rrRegistry);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or the process receives SIGINT/SIGTERM.
  void start(int iPort, int iThreads);
  void stop();

 private:
  const RouteRegistry& _rrRegistry;
  crow::SimpleApp _app;
};

}  // namespace restauth::api
