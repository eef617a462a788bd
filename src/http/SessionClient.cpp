#include "http/SessionClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <nlohmann/json.hpp>

namespace zonesync::http {

namespace {

constexpr const char* kContentTypeJson = "application/json";
constexpr const char* kAlreadyPresent = "Item already present";

/// Backend error envelope: {"error":{"key","message","hint"},"took"}
struct ErrorEnvelope {
  bool bParsed = false;
  std::string sKey;
  std::string sMessage;
  std::string sHint;
  double dTook = 0.0;
  std::string sParseError;
};

bool isSuccess(int iStatus) { return iStatus == 200 || iStatus == 201 || iStatus == 204; }

/// String member of jObj, "" when absent or null.
std::string optionalString(const nlohmann::json& jObj, const char* pKey) {
  const auto it = jObj.find(pKey);
  if (it == jObj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

ErrorEnvelope parseErrorEnvelope(const std::string& sBody) {
  ErrorEnvelope ee;
  try {
    const auto jBody = nlohmann::json::parse(sBody);
    if (!jBody.is_object()) {
      ee.sParseError = "error response is not a JSON object";
      return ee;
    }
    if (jBody.contains("error") && jBody["error"].is_object()) {
      const auto& jErr = jBody["error"];
      ee.sKey = optionalString(jErr, "key");
      ee.sMessage = optionalString(jErr, "message");
      ee.sHint = optionalString(jErr, "hint");
    }
    if (jBody.contains("took") && jBody["took"].is_number()) {
      ee.dTook = jBody["took"].get<double>();
    }
    ee.bParsed = true;
  } catch (const nlohmann::json::exception& ex) {
    ee.sParseError = ex.what();
  }
  return ee;
}

[[noreturn]] void throwForEnvelope(int iStatus, const ErrorEnvelope& ee) {
  if (!ee.bParsed) {
    throw common::ProviderError(
        "invalid_error_response",
        "failed to unmarshal error response (status " + std::to_string(iStatus) +
            "): " + ee.sParseError);
  }
  throw common::BackendError(iStatus, ee.sKey, ee.sMessage, ee.sHint, ee.dTook);
}

}  // anonymous namespace

SessionClient::SessionClient(std::unique_ptr<IHttpTransport> upTransport, std::string sServer,
                             std::string sPassword, const common::Context& ctx,
                             std::chrono::milliseconds durCallTimeout)
    : _upTransport(std::move(upTransport)),
      _sServer(std::move(sServer)),
      _sPassword(std::move(sPassword)),
      _durCallTimeout(durCallTimeout) {
  if (_sServer.empty()) {
    throw common::ConfigurationError("missing_server",
                                     "no backend server configured in the environment or flags");
  }
  if (!_upTransport) {
    throw common::ConfigurationError("invalid_config", "SessionClient requires a transport");
  }
  while (_sServer.back() == '/') {
    _sServer.pop_back();
  }

  if (!_sPassword.empty()) {
    retrieveNewToken(ctx);
  }
}

SessionClient::~SessionClient() {
  // Zero secrets from memory
  if (!_sPassword.empty()) {
    OPENSSL_cleanse(_sPassword.data(), _sPassword.size());
  }
  if (!_sToken.empty()) {
    OPENSSL_cleanse(_sToken.data(), _sToken.size());
  }
}

std::string SessionClient::token() const {
  std::lock_guard<std::mutex> lock(_mtxToken);
  return _sToken;
}

common::Context SessionClient::callContext(const common::Context& ctx) const {
  if (_durCallTimeout <= std::chrono::milliseconds::zero()) {
    return ctx;
  }
  return ctx.childWithTimeout(_durCallTimeout);
}

SessionClient::SentRequest SessionClient::send(const HttpRequest& req,
                                               const common::Context& ctx) {
  SentRequest sr;
  sr.sToken = token();

  HttpRequest reqOut = req;
  reqOut.vHeaders.emplace_back("content-type", kContentTypeJson);
  if (!sr.sToken.empty()) {
    reqOut.vHeaders.emplace_back(kSessionHeader, sr.sToken);
  }
  sr.resp = _upTransport->send(reqOut, callContext(ctx));
  return sr;
}

std::string SessionClient::execute(const std::string& sMethod, const std::string& sUrl,
                                   const common::Context& ctx, const std::string& sBody) {
  auto spLog = common::Logger::get();
  const HttpRequest req{sMethod, sUrl, {}, sBody};

  auto sr = send(req, ctx);
  int iRenewals = 0;
  while (!isSuccess(sr.resp.iStatus)) {
    const ErrorEnvelope ee = parseErrorEnvelope(sr.resp.sBody);

    // Idempotent outcomes: the entry is already in the desired state
    if (ee.sMessage.find(kAlreadyPresent) != std::string::npos) {
      spLog->debug("{} {}: entry already present, treating as success", sMethod, sUrl);
      return sr.resp.sBody;
    }
    if (sr.resp.iStatus == 404 && sMethod == "DELETE") {
      spLog->debug("{} {}: entry not found, treating as success", sMethod, sUrl);
      return sr.resp.sBody;
    }

    if (sr.resp.iStatus == 401 && !sr.sToken.empty()) {
      if (iRenewals >= kMaxTokenRenewals) {
        throw common::TokenRenewalError("token_renewal_exhausted",
                                        "max tries reached for token renewal");
      }
      ++iRenewals;
      renewToken(sr.sToken, iRenewals, ctx);
      sr = send(req, ctx);
      continue;
    }

    spLog->debug("Error on request {} {}", sMethod, sUrl);
    if (!sBody.empty()) {
      spLog->debug("Body of the request {}", sBody);
    }
    throwForEnvelope(sr.resp.iStatus, ee);
  }
  return sr.resp.sBody;
}

void SessionClient::renewToken(const std::string& sStaleToken, int iAttempt,
                               const common::Context& ctx) {
  ctx.throwIfDone();
  std::lock_guard<std::mutex> lock(_mtxRenew);

  if (token() != sStaleToken) {
    common::Logger::get()->debug("Session token already renewed by a concurrent call");
    return;
  }

  if (checkTokenValidity(sStaleToken, ctx)) {
    // Inconsistent backend state; retry within the bound anyway
    common::Logger::get()->warn(
        "Backend rejected a session it reports as valid, retrying ({}/{})", iAttempt,
        kMaxTokenRenewals);
    return;
  }

  common::Logger::get()->debug("Session token has expired, fetching a new one. Try ({}/{})",
                               iAttempt, kMaxTokenRenewals);
  retrieveNewToken(ctx);
}

bool SessionClient::checkTokenValidity(const std::string& sToken, const common::Context& ctx) {
  if (sToken.empty()) {
    return false;
  }

  HttpRequest req{"GET", _sServer + kAuthPath, {}, {}};
  req.vHeaders.emplace_back("content-type", kContentTypeJson);
  req.vHeaders.emplace_back(kSessionHeader, sToken);
  const auto resp = _upTransport->send(req, callContext(ctx));

  try {
    const auto jBody = nlohmann::json::parse(resp.sBody);
    return jBody.at("session").value("valid", false);
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_auth_response",
                                std::string("failed to parse session check response: ") +
                                    ex.what());
  }
}

void SessionClient::retrieveNewToken(const common::Context& ctx) {
  if (_sPassword.empty()) {
    return;
  }

  const std::string sUrl = _sServer + kAuthPath;
  common::Logger::get()->debug("Fetching new token from {}", sUrl);

  HttpRequest req{"POST", sUrl, {}, nlohmann::json{{"password", _sPassword}}.dump()};
  req.vHeaders.emplace_back("content-type", kContentTypeJson);
  const auto resp = _upTransport->send(req, callContext(ctx));
  OPENSSL_cleanse(req.sBody.data(), req.sBody.size());

  if (!isSuccess(resp.iStatus)) {
    throwForEnvelope(resp.iStatus, parseErrorEnvelope(resp.sBody));
  }

  std::string sSid;
  try {
    const auto jBody = nlohmann::json::parse(resp.sBody);
    const auto& jSid = jBody.at("session").at("sid");
    if (jSid.is_string()) {
      sSid = jSid.get<std::string>();
    }
  } catch (const nlohmann::json::exception& ex) {
    throw common::ProviderError("invalid_auth_response",
                                std::string("failed to parse auth response: ") + ex.what());
  }

  if (sSid.empty()) {
    common::Logger::get()->warn("Auth response carried no session id; keeping current token");
    return;
  }

  std::lock_guard<std::mutex> lock(_mtxToken);
  _sToken = std::move(sSid);
}

}  // namespace zonesync::http
