#pragma once

#include <string>

#include "vkyc/v1/types.pb.h"

namespace vkyc::recording {

/*
  Events the recording path reports back to the session state machine.

  Delivered from recording threads, never from inside a call the state
  machine made into the RecordingManager.
*/
class RecordingEvents {
 public:
  virtual ~RecordingEvents() = default;

  virtual void OnCapReached(const std::string& session_id) = 0;

  // during_buffering is false for finalize-time (compression/storage) failures.
  virtual void OnRecordingFailed(const std::string& session_id, const std::string& error, bool during_buffering) = 0;

  virtual void OnRecordingFinalized(const std::string&, const vkyc::v1::Recording&) {
  }
};

} // namespace vkyc::recording
