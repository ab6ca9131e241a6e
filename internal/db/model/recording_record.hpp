#pragma once

#include <cstdint>
#include <string>

#include "vkyc/v1/types.pb.h"

namespace vkyc::db::model {

struct RecordingRecord {
  std::string              session_id;
  vkyc::v1::RecordingState state = vkyc::v1::RECORDING_STATE_UNSPECIFIED;

  uint64_t buffered_ms = 0;
  bool     cap_reached = false;

  // Artifact URI once done.
  std::string location;

  uint64_t raw_bytes        = 0;
  uint64_t compressed_bytes = 0;

  std::string error;
  int64_t     updated_at_ms = 0;
};

} // namespace vkyc::db::model
