#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/Context.hpp"

namespace zonesync::http {

/// One outbound HTTP request.
/// Class abbreviation: req
struct HttpRequest {
  std::string sMethod;
  std::string sUrl;
  std::vector<std::pair<std::string, std::string>> vHeaders;
  std::string sBody;
};

/// Raw HTTP response; status classification is the caller's job.
/// Class abbreviation: resp
struct HttpResponse {
  int iStatus = 0;
  std::string sBody;
};

/// Pure abstract interface for executing a single HTTP exchange.
/// Implementations throw TransportError when no response was obtained and
/// CancelledError when the context is done before or during the exchange.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  virtual HttpResponse send(const HttpRequest& req, const common::Context& ctx) = 0;
};

}  // namespace zonesync::http
