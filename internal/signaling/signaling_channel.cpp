#include "signaling_channel.hpp"

#include <utility>

#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::signaling {

using namespace vkyc::v1;
using observability::IntField;
using observability::SessionField;
using observability::StringField;

namespace {

PeerRole Other(PeerRole role) {
  return role == PEER_ROLE_USER ? PEER_ROLE_AGENT : PEER_ROLE_USER;
}

} // namespace

SignalEnvelope MakeNotice(NoticeKind kind, const std::string& message) {
  SignalEnvelope envelope;
  auto*          notice = envelope.mutable_notice();
  notice->set_kind(kind);
  notice->set_message(message);
  return envelope;
}

SignalingChannel::SignalingChannel(std::string session_id, std::chrono::milliseconds disconnect_grace, std::size_t mailbox_capacity)
    : session_id_(std::move(session_id)), disconnect_grace_(disconnect_grace), mailbox_capacity_(mailbox_capacity == 0 ? 1 : mailbox_capacity) {
  peers_[PEER_ROLE_USER];
  peers_[PEER_ROLE_AGENT];
}

bool SignalingChannel::Attach(PeerRole role, std::shared_ptr<PeerSink> sink, util::TimePoint now) {
  std::shared_ptr<PeerSink> replaced;
  Roles                     drain;
  bool                      reconnect = false;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      throw util::SessionNotActive("session channel is closed");
    }
    auto& peer = peers_.at(role);

    reconnect = peer.grace_deadline.has_value();
    if (peer.sink && peer.sink != sink) {
      // A newer connection for the same role replaces the old one.
      replaced = std::move(peer.sink);
    }
    peer.sink = std::move(sink);
    peer.grace_deadline.reset();
    ClaimDrainLocked(role, peer, drain);
    if (reconnect) {
      NotifyOtherLocked(role, NOTICE_KIND_PEER_RECONNECTED, drain);
    }
  }
  if (replaced) {
    replaced->Close();
  }

  VKYC_LOG_INFO("peer attached", {SessionField(session_id_), StringField("role", model::RoleName(role)),
                                  observability::BoolField("reconnect", reconnect)});
  DrainAll(drain, now);
  return reconnect;
}

void SignalingChannel::Detach(PeerRole role, const PeerSink* sink, bool expected, util::TimePoint now) {
  Roles drain;
  {
    std::lock_guard lock(mutex_);
    auto&           peer = peers_.at(role);
    if (!peer.sink || peer.sink.get() != sink) {
      return;
    }

    peer.sink.reset();
    if (expected || closed_) {
      peer.grace_deadline.reset();
      VKYC_LOG_INFO("peer left", {SessionField(session_id_), StringField("role", model::RoleName(role))});
      return;
    }

    peer.grace_deadline = now + disconnect_grace_;
    VKYC_LOG_WARN("peer disconnected, grace period started", {SessionField(session_id_), StringField("role", model::RoleName(role)),
                                                              IntField("grace_ms", disconnect_grace_.count())});
    NotifyOtherLocked(role, NOTICE_KIND_PEER_DISCONNECTED, drain);
  }
  DrainAll(drain, now);
}

void SignalingChannel::Send(PeerRole to, const SignalEnvelope& envelope, util::TimePoint now) {
  Roles drain;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return;
    }
    EnqueueLocked(to, peers_.at(to), envelope, drain);
  }
  DrainAll(drain, now);
}

void SignalingChannel::EnqueueLocked(PeerRole to, Peer& peer, const SignalEnvelope& envelope, Roles& drain) {
  if (peer.mailbox.size() >= mailbox_capacity_) {
    peer.mailbox.pop_front();
    VKYC_LOG_WARN("signaling mailbox full, dropped oldest message",
                  {SessionField(session_id_), StringField("role", model::RoleName(to))});
  }
  peer.mailbox.push_back(envelope);
  ClaimDrainLocked(to, peer, drain);
}

void SignalingChannel::ClaimDrainLocked(PeerRole role, Peer& peer, Roles& drain) {
  if (peer.sink && !peer.draining && (!peer.mailbox.empty() || peer.close_after)) {
    peer.draining = true;
    drain.push_back(role);
  }
}

void SignalingChannel::DisconnectLocked(Peer& peer, util::TimePoint now) {
  peer.sink.reset();
  if (!peer.grace_deadline && !closed_) {
    peer.grace_deadline = now + disconnect_grace_;
  }
}

void SignalingChannel::NotifyOtherLocked(PeerRole about, NoticeKind kind, Roles& drain) {
  const auto other = Other(about);
  EnqueueLocked(other, peers_.at(other), MakeNotice(kind, std::string(model::RoleName(about))), drain);
}

void SignalingChannel::DrainAll(const Roles& roles, util::TimePoint now) {
  for (const auto role : roles) {
    Drain(role, now);
  }
}

void SignalingChannel::Drain(PeerRole role, util::TimePoint now) {
  for (;;) {
    std::shared_ptr<PeerSink> sink;
    SignalEnvelope            next;
    bool                      finished = false;
    {
      std::lock_guard lock(mutex_);
      auto&           peer = peers_.at(role);
      if (!peer.sink || peer.mailbox.empty()) {
        peer.draining = false;
        if (!peer.sink || !peer.close_after) {
          return;
        }
        peer.close_after = false;
        sink             = std::move(peer.sink);
        finished         = true;
      } else {
        sink = peer.sink;
        next = std::move(peer.mailbox.front());
        peer.mailbox.pop_front();
        if (role == PEER_ROLE_USER && next.has_capture_command() && !next.capture_command().cancel()) {
          peer.inflight_capture = next.capture_command().document_type();
        }
      }
    }

    if (finished) {
      sink->Close();
      return;
    }

    const bool delivered = sink->Send(next);

    std::lock_guard lock(mutex_);
    auto&           peer     = peers_.at(role);
    const auto      captured = std::exchange(peer.inflight_capture, std::nullopt);
    if (delivered) {
      if (captured && !closed_) {
        armed_.insert(*captured);
      }
      continue;
    }
    if (closed_) {
      // Nobody will reattach: give up on this peer.
      peer.mailbox.clear();
      peer.close_after = false;
      if (peer.sink == sink) peer.sink.reset();
      peer.draining = false;
      return;
    }
    peer.mailbox.push_front(std::move(next));
    if (peer.sink == sink) {
      DisconnectLocked(peer, now);
      peer.draining = false;
      return;
    }
    // Replaced by a newer sink meanwhile: keep draining into it.
  }
}

void SignalingChannel::CancelCapture(DocumentType document_type) {
  std::lock_guard lock(mutex_);
  armed_.erase(document_type);

  auto& user = peers_.at(PEER_ROLE_USER);
  if (user.inflight_capture == document_type) {
    user.inflight_capture.reset();
  }

  // A command still waiting in the user's mailbox is dropped with it.
  auto& mailbox = user.mailbox;
  for (auto it = mailbox.begin(); it != mailbox.end();) {
    if (it->has_capture_command() && !it->capture_command().cancel() && it->capture_command().document_type() == document_type) {
      it = mailbox.erase(it);
    } else {
      ++it;
    }
  }
}

bool SignalingChannel::ConsumeCapture(DocumentType document_type) {
  std::lock_guard lock(mutex_);
  return armed_.erase(document_type) > 0;
}

void SignalingChannel::RestoreCapture(DocumentType document_type) {
  std::lock_guard lock(mutex_);
  if (!closed_) {
    armed_.insert(document_type);
  }
}

std::optional<PeerRole> SignalingChannel::GraceExpired(util::TimePoint now) const {
  std::lock_guard lock(mutex_);
  if (closed_) {
    return std::nullopt;
  }
  for (const auto& [role, peer] : peers_) {
    if (peer.grace_deadline && now >= *peer.grace_deadline) {
      return role;
    }
  }
  return std::nullopt;
}

void SignalingChannel::Close(const SignalEnvelope& final_notice) {
  Roles drain;
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    armed_.clear();

    // Connected peers get what is queued, then the notice, then the close.
    // A peer whose sink is still busy is closed by its current drainer.
    for (auto& [role, peer] : peers_) {
      peer.grace_deadline.reset();
      if (!peer.sink) {
        peer.mailbox.clear();
        continue;
      }
      peer.mailbox.push_back(final_notice);
      peer.close_after = true;
      ClaimDrainLocked(role, peer, drain);
    }
  }
  DrainAll(drain, util::TimePoint{});
}

bool SignalingChannel::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

bool SignalingChannel::IsConnected(PeerRole role) const {
  std::lock_guard lock(mutex_);
  return peers_.at(role).sink != nullptr;
}

std::size_t SignalingChannel::MailboxDepth(PeerRole role) const {
  std::lock_guard lock(mutex_);
  return peers_.at(role).mailbox.size();
}

} // namespace vkyc::signaling
