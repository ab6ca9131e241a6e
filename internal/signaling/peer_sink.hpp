#pragma once

#include "vkyc/v1/signaling.pb.h"

namespace vkyc::signaling {

// Outbound side of one connected peer.
class PeerSink {
 public:
  virtual ~PeerSink() = default;

  // False when the peer is gone; the message is then kept for redelivery.
  virtual bool Send(const vkyc::v1::SignalEnvelope& envelope) = 0;

  // Ends the peer's stream after the final notice.
  virtual void Close() {
  }
};

} // namespace vkyc::signaling
