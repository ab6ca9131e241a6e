#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace vkyc::verification {

namespace {

size_t WriteBody(char* contents, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(contents, size * nmemb);
  return size * nmemb;
}

struct EasyDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

HttpResponse HttpClient::PostJson(const std::string& url, const std::string& body, const std::string& bearer_token,
                                  std::chrono::milliseconds timeout) {
  HttpResponse response;

  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "curl_easy_init failed";
    return response;
  }

  curl_slist* raw_headers = nullptr;
  raw_headers             = curl_slist_append(raw_headers, "Content-Type: application/json");
  raw_headers             = curl_slist_append(raw_headers, "Accept: application/json");
  if (!bearer_token.empty()) {
    const auto auth = "Authorization: Bearer " + bearer_token;
    raw_headers     = curl_slist_append(raw_headers, auth.c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  // Worker threads must not receive SIGALRM from the resolver.
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    response.transport = HttpTransport::kTimeout;
    response.error     = curl_easy_strerror(res);
    return response;
  }
  if (res != CURLE_OK) {
    response.transport = HttpTransport::kError;
    response.error     = curl_easy_strerror(res);
    return response;
  }

  response.transport = HttpTransport::kOk;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlGlobal::~CurlGlobal() {
  curl_global_cleanup();
}

} // namespace vkyc::verification
