#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>

namespace restauth::dal {

namespace {
/// Strip credentials before the URL reaches a log line.
std::string redactUrl(const std::string& sDbUrl) {
  const auto nAt = sDbUrl.rfind('@');
  if (nAt == std::string::npos) return sDbUrl;
  const auto nScheme = sDbUrl.find("://");
  const std::string sScheme =
      nScheme == std::string::npos ? "" : sDbUrl.substr(0, nScheme + 3);
  return sScheme + "***" + sDbUrl.substr(nAt);
}
}  // namespace

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() { release(); }

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

void ConnectionGuard::release() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
  _spConn.reset();
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

ConnectionPool::ConnectionPool(std::string sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(std::move(sDbUrl)),
      _iPoolSize(iPoolSize),
      _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool size must be at least 1");
  }

  auto spLog = common::Logger::get();
  spLog->info("Opening {} database connections to {}", _iPoolSize, redactUrl(_sDbUrl));

  _vIdle.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vIdle.push_back(open());
  }

  spLog->info("Connection pool ready");
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vIdle.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::open() {
  auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  if (!spConn->is_open()) {
    throw std::runtime_error("Failed to open database connection");
  }
  return spConn;
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  if (!_cv.wait_for(lock, _durCheckoutTimeout, [this] { return !_vIdle.empty(); })) {
    throw std::runtime_error("Connection pool exhausted: timed out waiting for a connection");
  }

  auto spConn = std::move(_vIdle.back());
  _vIdle.pop_back();
  lock.unlock();

  if (!isAlive(*spConn)) {
    common::Logger::get()->warn("Stale database connection, reconnecting");
    try {
      spConn = open();
    } catch (...) {
      // Keep the slot so the pool does not shrink after a transient outage.
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _vIdle.push_back(std::move(spConn));
  }
  _cv.notify_one();
}

int ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vIdle.size());
}

bool ConnectionPool::isAlive(pqxx::connection& conn) {
  if (!conn.is_open()) return false;
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->debug("Connection health check failed: {}", ex.what());
    return false;
  }
}

}  // namespace restauth::dal
