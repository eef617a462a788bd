#include "http/CurlTransport.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace zonesync::http {

namespace {

std::once_flag g_onceCurlInit;

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t writeBody(char* pData, size_t nSize, size_t nCount, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  pBody->append(pData, nSize * nCount);
  return nSize * nCount;
}

/// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int onProgress(void* pUser, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* pCtx = static_cast<const common::Context*>(pUser);
  return pCtx->isDone() ? 1 : 0;
}

}  // anonymous namespace

CurlTransport::CurlTransport(bool bTlsInsecureSkipVerify)
    : _bTlsInsecureSkipVerify(bTlsInsecureSkipVerify) {
  std::call_once(g_onceCurlInit, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw common::TransportError("transport_failure", "curl_global_init failed");
    }
  });
  if (_bTlsInsecureSkipVerify) {
    common::Logger::get()->warn("TLS certificate verification is disabled");
  }
}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::send(const HttpRequest& req, const common::Context& ctx) {
  ctx.throwIfDone();

  EasyHandle upCurl(curl_easy_init(), &curl_easy_cleanup);
  if (!upCurl) {
    throw common::TransportError("transport_failure", "curl_easy_init failed");
  }
  CURL* pCurl = upCurl.get();

  HeaderList upHeaders(nullptr, &curl_slist_free_all);
  for (const auto& [sName, sValue] : req.vHeaders) {
    const std::string sLine = sName + ": " + sValue;
    curl_slist* pNext = curl_slist_append(upHeaders.get(), sLine.c_str());
    if (!pNext) {
      throw common::TransportError("transport_failure", "curl_slist_append failed");
    }
    upHeaders.release();
    upHeaders.reset(pNext);
  }

  HttpResponse resp;
  curl_easy_setopt(pCurl, CURLOPT_URL, req.sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_CUSTOMREQUEST, req.sMethod.c_str());
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, &writeBody);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &resp.sBody);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(pCurl, CURLOPT_XFERINFOFUNCTION, &onProgress);
  curl_easy_setopt(pCurl, CURLOPT_XFERINFODATA, &ctx);

  if (!req.sBody.empty()) {
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, req.sBody.c_str());
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(req.sBody.size()));
  }

  if (const auto oRemaining = ctx.remaining()) {
    // 0 would mean "no timeout" to curl
    curl_easy_setopt(pCurl, CURLOPT_TIMEOUT_MS, std::max<long>(1L, oRemaining->count()));
  }

  if (_bTlsInsecureSkipVerify) {
    curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  const CURLcode rc = curl_easy_perform(pCurl);
  if (rc == CURLE_ABORTED_BY_CALLBACK || rc == CURLE_OPERATION_TIMEDOUT) {
    ctx.throwIfDone();
  }
  if (rc != CURLE_OK) {
    throw common::TransportError("transport_failure", std::string(req.sMethod) + " " + req.sUrl +
                                                          ": " + curl_easy_strerror(rc));
  }

  long lStatus = 0;
  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &lStatus);
  resp.iStatus = static_cast<int>(lStatus);
  return resp;
}

}  // namespace zonesync::http
