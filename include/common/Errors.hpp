#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace zonesync::common {

/// Base error for all application-level exceptions.
/// Carries an HTTP-style status and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400: missing endpoint, malformed filter, mixed filter modes. Never retried.
struct ConfigurationError : AppError {
  explicit ConfigurationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 422: record shape the backend cannot represent.
/// Reported per record; the surrounding batch continues.
struct SoftError : AppError {
  explicit SoftError(std::string sCode, std::string sMsg)
      : AppError(422, std::move(sCode), std::move(sMsg)) {}
};

/// 502: upstream DNS backend returned something unusable.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// Non-success HTTP status from the backend, with its error envelope.
struct BackendError : AppError {
  std::string _sKey;
  std::string _sBackendMessage;
  std::string _sHint;
  double _dTook = 0.0;

  BackendError(int iStatus, std::string sKey, std::string sBackendMessage, std::string sHint,
               double dTook)
      : AppError(iStatus, sKey.empty() ? "backend_error" : sKey,
                 "received " + std::to_string(iStatus) + " status code from request: [" + sKey +
                     "] " + sBackendMessage + " (" + sHint + ")"),
        _sKey(std::move(sKey)),
        _sBackendMessage(std::move(sBackendMessage)),
        _sHint(std::move(sHint)),
        _dTook(dTook) {}
};

/// 401: the session could not be renewed within the attempt bound.
struct TokenRenewalError : AppError {
  explicit TokenRenewalError(std::string sCode, std::string sMsg)
      : AppError(401, std::move(sCode), std::move(sMsg)) {}
};

/// 503: the request never produced an HTTP response.
struct TransportError : AppError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : AppError(503, std::move(sCode), std::move(sMsg)) {}
};

/// 408: the caller's context was cancelled or its deadline passed.
struct CancelledError : AppError {
  explicit CancelledError(std::string sCode, std::string sMsg)
      : AppError(408, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace zonesync::common
