#pragma once

#include <cstdint>
#include <string>

#include "vkyc/v1/types.pb.h"

namespace vkyc::db::model {

/*
  Persistent session row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - version increments by one on every committed mutation.
  - ended_at_ms is non-zero iff state is terminal.
*/
struct SessionRecord {
  std::string id;
  std::string link_token;
  std::string customer_id;

  vkyc::v1::SessionMode  mode  = vkyc::v1::SESSION_MODE_UNSPECIFIED;
  vkyc::v1::SessionState state = vkyc::v1::SESSION_STATE_UNSPECIFIED;

  // 0 = not set
  int64_t scheduled_at_ms = 0;
  int64_t created_at_ms   = 0;
  int64_t started_at_ms   = 0;
  int64_t ended_at_ms     = 0;

  vkyc::v1::TerminationReason termination_reason = vkyc::v1::TERMINATION_REASON_UNSPECIFIED;
  std::string                 termination_detail;

  bool manual_review = false;

  // Empty until an agent accepts the session.
  std::string agent_id;
  int64_t     agent_assigned_at_ms = 0;

  uint64_t version = 0;
};

} // namespace vkyc::db::model
