#pragma once

#include "http_ocr_client.hpp"
#include "registry_service.hpp"

namespace vkyc::verification {

/*
  DigiLocker-style registry over HTTP/JSON.

  Request:  {"doc_type": "pan"|"aadhaar", "doc_info": {...}} with a bearer token
  Reply:    {"verified": bool, "message": "...", "data": {...}}

  HTTP 408, 429 and 5xx are reported as kUnavailable.
*/
class HttpRegistryClient final : public RegistryService {
 public:
  explicit HttpRegistryClient(HttpEndpoint endpoint);

  RegistryResponse Verify(const std::map<std::string, std::string>& fields, vkyc::v1::DocumentType document_type,
                          std::chrono::milliseconds timeout) override;

  static RegistryResponse ParseReply(long status_code, const std::string& body);

 private:
  HttpEndpoint endpoint_;
};

} // namespace vkyc::verification
