#pragma once

#include <chrono>
#include <string>

namespace vkyc::verification {

enum class HttpTransport {
  kOk,
  kTimeout,
  kError,
};

struct HttpResponse {
  HttpTransport transport   = HttpTransport::kError;
  long          status_code = 0;
  std::string   body;
  std::string   error;

  bool Success() const {
    return transport == HttpTransport::kOk && status_code >= 200 && status_code < 300;
  }
};

/*
  Blocking JSON POST over libcurl.

  One easy handle per call, so calls are safe from any worker thread once
  CurlGlobal is alive.
*/
class HttpClient {
 public:
  static HttpResponse PostJson(const std::string& url, const std::string& body, const std::string& bearer_token,
                               std::chrono::milliseconds timeout);
};

// Owns curl_global_init/curl_global_cleanup; create one before any worker starts.
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&)            = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace vkyc::verification
