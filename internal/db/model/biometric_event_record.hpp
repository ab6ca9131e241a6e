#pragma once

#include <cstdint>
#include <string>

#include "vkyc/v1/types.pb.h"

namespace vkyc::db::model {

/*
  Append-only biometric event.

  (session_id, sequence) is unique; recorded_at_us strictly increases with
  sequence within a session.
*/
struct BiometricEventRecord {
  std::string             session_id;
  uint64_t                sequence = 0;
  vkyc::v1::BiometricKind kind     = vkyc::v1::BIOMETRIC_KIND_UNSPECIFIED;
  std::string             payload_json;
  int64_t                 recorded_at_us = 0;
  int64_t                 client_time_ms = 0;
};

} // namespace vkyc::db::model
