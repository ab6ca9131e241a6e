#pragma once

#include <chrono>
#include <string>

#include "types.hpp"

namespace vkyc::verification {

/*
  OCR capability.

  Extract never throws for service failures; it reports them through
  OcrResult::ok and OcrResult::error.
*/
class OcrService {
 public:
  virtual ~OcrService() = default;

  virtual OcrResult Extract(const std::string& image, vkyc::v1::DocumentType document_type, std::chrono::milliseconds timeout) = 0;
};

} // namespace vkyc::verification
