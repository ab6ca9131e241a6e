#pragma once

#include <cstdint>

#include "vkyc/v1/signaling.pb.h"

namespace vkyc::signaling {

struct ValidationLimits {
  uint64_t max_frame_bytes   = 8 * 1024 * 1024;
  uint64_t max_payload_bytes = 64 * 1024;
};

/*
  Boundary checks for a message received from a peer.

  Throws util::InvalidMessage when the variant is malformed or not allowed
  from the sender's role. Session state is checked by the caller.
*/
void ValidateInbound(const vkyc::v1::SignalEnvelope& envelope, vkyc::v1::PeerRole sender, const ValidationLimits& limits);

} // namespace vkyc::signaling
