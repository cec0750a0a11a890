#include "api/CrowExchange.hpp"

#include <algorithm>
#include <cctype>

namespace restauth::api {

CrowExchange::CrowExchange(const crow::request& req, crow::response& res,
                           bool bTrustForwardedProto)
    : _req(req), _res(res), _bTrustForwardedProto(bTrustForwardedProto) {}

std::optional<std::string> CrowExchange::requestHeader(const std::string& sName) const {
  // crow::ci_map compares names case-insensitively
  auto it = _req.headers.find(sName);
  if (it == _req.headers.end()) return std::nullopt;
  return it->second;
}

bool CrowExchange::isSecure() const {
  if (!_bTrustForwardedProto) return false;
  auto oProto = requestHeader("X-Forwarded-Proto");
  if (!oProto) return false;
  std::string sProto = *oProto;
  std::transform(sProto.begin(), sProto.end(), sProto.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sProto == "https";
}

bool CrowExchange::responseCommitted() const { return _res.is_completed(); }

void CrowExchange::addResponseHeader(const std::string& sName, const std::string& sValue) {
  _res.add_header(sName, sValue);
}

}  // namespace restauth::api
