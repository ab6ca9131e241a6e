#pragma once

#include "vkyc/v1/types.pb.h"

namespace vkyc::model {

using vkyc::v1::SessionState;

constexpr bool IsTerminal(SessionState state) {
  return state == vkyc::v1::SESSION_STATE_COMPLETED || state == vkyc::v1::SESSION_STATE_FAILED || state == vkyc::v1::SESSION_STATE_EXPIRED;
}

// Live call: channel open, recording running.
constexpr bool IsActive(SessionState state) {
  return state == vkyc::v1::SESSION_STATE_IN_PROGRESS || state == vkyc::v1::SESSION_STATE_VERIFYING;
}

// States in which the verification link may still expire.
constexpr bool IsAwaitingStart(SessionState state) {
  return state == vkyc::v1::SESSION_STATE_CREATED || state == vkyc::v1::SESSION_STATE_SCHEDULED ||
         state == vkyc::v1::SESSION_STATE_READY_TO_START;
}

/*
  Transition table.

    created        -> scheduled | ready-to-start | expired | failed
    scheduled      -> ready-to-start | expired | failed
    ready-to-start -> in-progress | expired | failed
    in-progress    -> verifying | failed
    verifying      -> completed | failed

  A transition to the current state is always allowed (idempotent no-op).
*/
constexpr bool CanTransition(SessionState from, SessionState to) {
  using namespace vkyc::v1;

  if (from == to) {
    return true;
  }
  if (IsTerminal(from) || to == SESSION_STATE_UNSPECIFIED) {
    return false;
  }
  if (to == SESSION_STATE_FAILED) {
    return true;
  }

  switch (from) {
    case SESSION_STATE_CREATED:
      return to == SESSION_STATE_SCHEDULED || to == SESSION_STATE_READY_TO_START || to == SESSION_STATE_EXPIRED;
    case SESSION_STATE_SCHEDULED:
      return to == SESSION_STATE_READY_TO_START || to == SESSION_STATE_EXPIRED;
    case SESSION_STATE_READY_TO_START:
      return to == SESSION_STATE_IN_PROGRESS || to == SESSION_STATE_EXPIRED;
    case SESSION_STATE_IN_PROGRESS:
      return to == SESSION_STATE_VERIFYING;
    case SESSION_STATE_VERIFYING:
      return to == SESSION_STATE_COMPLETED;
    default:
      return false;
  }
}

} // namespace vkyc::model
