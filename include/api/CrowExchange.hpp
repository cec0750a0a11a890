#pragma once

#include <crow.h>

#include "transport/IHttpExchange.hpp"

namespace restauth::api {

/// IHttpExchange over one Crow request/response pair. The server speaks
/// plain HTTP, so a request only counts as secure when a trusted proxy
/// reports X-Forwarded-Proto: https.
/// Class abbreviation: cx
class CrowExchange : public transport::IHttpExchange {
 public:
  CrowExchange(const crow::request& req, crow::response& res, bool bTrustForwardedProto);

  std::optional<std::string> requestHeader(const std::string& sName) const override;
  bool isSecure() const override;
  bool responseCommitted() const override;
  void addResponseHeader(const std::string& sName, const std::string& sValue) override;

 private:
  const crow::request& _req;
  crow::response& _res;
  bool _bTrustForwardedProto;
};

}  // namespace restauth::api
