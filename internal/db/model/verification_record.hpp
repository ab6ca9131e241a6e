#pragma once

#include <cstdint>
#include <string>

#include "vkyc/v1/types.pb.h"

namespace vkyc::db::model {

// One row per (session, document type); overwritten as attempts progress.
struct VerificationRecord {
  std::string            session_id;
  vkyc::v1::DocumentType document_type = vkyc::v1::DOCUMENT_TYPE_UNSPECIFIED;

  // Extracted fields as a JSON object.
  std::string fields_json;
  double      ocr_confidence = 0.0;

  vkyc::v1::RegistryStatus registry_status = vkyc::v1::REGISTRY_STATUS_UNSPECIFIED;

  uint32_t ocr_attempts      = 0;
  uint32_t registry_attempts = 0;

  int64_t     updated_at_ms = 0;
  std::string detail;
};

} // namespace vkyc::db::model
