#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace restauth::dal {

class ConnectionPool;

/// Checked-out connection; hands it back to the pool when it goes out of scope.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::shared_ptr<pqxx::connection> spConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  void release();

  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed set of libpqxx connections shared by every repository.
/// checkout() blocks until a connection is free or the wait times out.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  ConnectionPool(std::string sDbUrl, int iPoolSize,
                 std::chrono::seconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /// Throws std::runtime_error on timeout or when a stale connection
  /// cannot be reopened.
  ConnectionGuard checkout();

  /// Called by ConnectionGuard.
  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  int size() const { return _iPoolSize; }

  /// Connections currently idle.
  int available();

 private:
  std::shared_ptr<pqxx::connection> open();
  static bool isAlive(pqxx::connection& conn);

  std::vector<std::shared_ptr<pqxx::connection>> _vIdle;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::seconds _durCheckoutTimeout;
};

}  // namespace restauth::dal
