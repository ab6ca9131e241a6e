#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "peer_sink.hpp"

namespace vkyc::signaling {

/*
  Control channel of one live session: a user and an agent.

  Each direction is FIFO: every message goes through the peer's bounded
  mailbox. At most one thread drains a mailbox at a time, and it writes to
  the sink without holding the channel lock, so a peer that stops reading
  only holds up its own direction. While a peer is away its mailbox is kept
  and flushed, in order, on reattach.

  A capture command counts as delivered once it reached the user's sink;
  from then on the matching submission is accepted exactly once.
*/
class SignalingChannel {
 public:
  SignalingChannel(std::string session_id, std::chrono::milliseconds disconnect_grace, std::size_t mailbox_capacity);

  const std::string& SessionId() const {
    return session_id_;
  }

  // Returns true if the role was in its disconnect grace period. Throws
  // SessionNotActive once the channel is closed.
  bool Attach(vkyc::v1::PeerRole role, std::shared_ptr<PeerSink> sink, util::TimePoint now);

  // Ignored unless sink is the role's current sink. An unexpected detach
  // starts the grace period.
  void Detach(vkyc::v1::PeerRole role, const PeerSink* sink, bool expected, util::TimePoint now);

  void Send(vkyc::v1::PeerRole to, const vkyc::v1::SignalEnvelope& envelope, util::TimePoint now);

  // Removes an undelivered or delivered command for the document.
  void CancelCapture(vkyc::v1::DocumentType document_type);

  // True exactly once per delivered capture command.
  bool ConsumeCapture(vkyc::v1::DocumentType document_type);

  // Puts back a consumed capture, used when the submission was not accepted.
  void RestoreCapture(vkyc::v1::DocumentType document_type);

  // Role whose grace period elapsed, if any.
  std::optional<vkyc::v1::PeerRole> GraceExpired(util::TimePoint now) const;

  // Sends the final notice to connected peers and closes them. Later sends
  // are dropped.
  void Close(const vkyc::v1::SignalEnvelope& final_notice);

  bool Closed() const;

  bool IsConnected(vkyc::v1::PeerRole role) const;
  std::size_t MailboxDepth(vkyc::v1::PeerRole role) const;

 private:
  struct Peer {
    std::shared_ptr<PeerSink>              sink;
    std::deque<vkyc::v1::SignalEnvelope>   mailbox;
    std::optional<util::TimePoint>         grace_deadline;
    bool                                   draining    = false;
    bool                                   close_after = false;
    // Capture command being written right now, unless cancelled meanwhile.
    std::optional<vkyc::v1::DocumentType>  inflight_capture;
  };

  using Roles = std::vector<vkyc::v1::PeerRole>;

  // Caller holds mutex_.
  void EnqueueLocked(vkyc::v1::PeerRole to, Peer& peer, const vkyc::v1::SignalEnvelope& envelope, Roles& drain);
  void ClaimDrainLocked(vkyc::v1::PeerRole role, Peer& peer, Roles& drain);
  void DisconnectLocked(Peer& peer, util::TimePoint now);
  void NotifyOtherLocked(vkyc::v1::PeerRole about, vkyc::v1::NoticeKind kind, Roles& drain);

  // Writes the role's mailbox to its sink; the caller must have claimed it.
  void Drain(vkyc::v1::PeerRole role, util::TimePoint now);
  void DrainAll(const Roles& roles, util::TimePoint now);

  const std::string               session_id_;
  const std::chrono::milliseconds disconnect_grace_;
  const std::size_t               mailbox_capacity_;

  mutable std::mutex                    mutex_;
  std::map<vkyc::v1::PeerRole, Peer>    peers_;
  std::set<vkyc::v1::DocumentType>      armed_;
  bool                                  closed_ = false;
};

// Server notice helper.
vkyc::v1::SignalEnvelope MakeNotice(vkyc::v1::NoticeKind kind, const std::string& message);

} // namespace vkyc::signaling
