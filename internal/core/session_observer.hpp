#pragma once

#include "internal/verification/types.hpp"
#include "vkyc/v1/types.pb.h"

namespace vkyc::core {

/*
  Receives session lifecycle notifications from the SessionManager.

  Called after the session's lock is released, in commit order for any one
  session. Implementations should not throw.
*/
class SessionObserver {
 public:
  virtual ~SessionObserver() = default;

  virtual void OnSessionStarted(const vkyc::v1::Session& session) = 0;
  virtual void OnSessionEnded(const vkyc::v1::Session& session)   = 0;

  virtual void OnVerificationUpdate(const vkyc::v1::Session&, const verification::VerificationReport&) {
  }

  virtual void OnAgentAssigned(const vkyc::v1::Session&) {
  }
};

} // namespace vkyc::core
