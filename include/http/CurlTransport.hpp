#pragma once

#include "http/IHttpTransport.hpp"

namespace zonesync::http {

/// libcurl-backed transport. One easy handle per request, so a single
/// instance may be shared by concurrent callers.
/// Class abbreviation: ct
class CurlTransport : public IHttpTransport {
 public:
  explicit CurlTransport(bool bTlsInsecureSkipVerify = false);
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  HttpResponse send(const HttpRequest& req, const common::Context& ctx) override;

 private:
  bool _bTlsInsecureSkipVerify;
};

}  // namespace zonesync::http
