#pragma once

#include <map>
#include <string>

#include "ocr_service.hpp"

namespace vkyc::verification {

struct HttpEndpoint {
  std::string url;
  std::string bearer_token;
};

/*
  OCR over HTTP/JSON, one endpoint per document type.

  Request:  {"image": "<base64>"}
  Reply:    {"success": bool, "error": "...", "confidence": 0..1 (or 0..100),
             "data": {"name": "...", ...}}
  Fields are read from "data" when present, else from the top level.
  A reply without a confidence counts as fully confident.
*/
class HttpOcrClient final : public OcrService {
 public:
  explicit HttpOcrClient(std::map<vkyc::v1::DocumentType, HttpEndpoint> endpoints);

  OcrResult Extract(const std::string& image, vkyc::v1::DocumentType document_type, std::chrono::milliseconds timeout) override;

  static OcrResult ParseReply(const std::string& body);

 private:
  std::map<vkyc::v1::DocumentType, HttpEndpoint> endpoints_;
};

} // namespace vkyc::verification
