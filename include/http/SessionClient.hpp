#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "common/Context.hpp"
#include "http/IHttpTransport.hpp"

namespace zonesync::http {

/// Executes backend calls with transparent session-token lifecycle and
/// uniform response classification.
///
/// The token is acquired at construction when a password is configured and
/// renewed lazily after a 401. Renewal is single-flight: concurrent callers
/// that hit a 401 with a token somebody else already replaced just retry.
/// Class abbreviation: sc
class SessionClient {
 public:
  static constexpr int kMaxTokenRenewals = 3;
  static constexpr const char* kAuthPath = "/api/auth";
  static constexpr const char* kSessionHeader = "X-FTL-SID";

  /// Throws ConfigurationError when sServer is empty.
  /// A non-zero durCallTimeout bounds every single HTTP exchange, on top of
  /// whatever deadline the caller's context carries.
  SessionClient(std::unique_ptr<IHttpTransport> upTransport, std::string sServer,
                std::string sPassword, const common::Context& ctx = common::Context(),
                std::chrono::milliseconds durCallTimeout = std::chrono::milliseconds::zero());
  ~SessionClient();

  SessionClient(const SessionClient&) = delete;
  SessionClient& operator=(const SessionClient&) = delete;

  /// Perform one call and return the response body.
  /// 200/201/204, "already present" errors and 404 on DELETE are successes.
  /// Throws BackendError, TokenRenewalError, ProviderError, TransportError
  /// or CancelledError.
  std::string execute(const std::string& sMethod, const std::string& sUrl,
                      const common::Context& ctx, const std::string& sBody = {});

  const std::string& server() const { return _sServer; }
  std::string token() const;

 private:
  struct SentRequest {
    HttpResponse resp;
    std::string sToken;  // token attached to the request, "" if none
  };

  SentRequest send(const HttpRequest& req, const common::Context& ctx);
  common::Context callContext(const common::Context& ctx) const;
  void renewToken(const std::string& sStaleToken, int iAttempt, const common::Context& ctx);
  bool checkTokenValidity(const std::string& sToken, const common::Context& ctx);
  void retrieveNewToken(const common::Context& ctx);

  std::unique_ptr<IHttpTransport> _upTransport;
  std::string _sServer;
  std::string _sPassword;
  std::chrono::milliseconds _durCallTimeout;

  mutable std::mutex _mtxToken;  // guards _sToken
  std::string _sToken;
  std::mutex _mtxRenew;          // serializes renewal rounds
};

}  // namespace zonesync::http
