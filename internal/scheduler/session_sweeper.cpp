#include "session_sweeper.hpp"

#include <stdexcept>

#include "internal/core/session_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recording/recording_manager.hpp"
#include "internal/signaling/signaling_hub.hpp"

namespace vkyc::scheduler {

using observability::IntField;
using observability::StringField;

SessionSweeper::SessionSweeper(std::shared_ptr<core::SessionManager> sessions, std::shared_ptr<signaling::SignalingHub> hub,
                               std::shared_ptr<recording::RecordingManager> recordings, std::chrono::milliseconds interval)
    : sessions_(std::move(sessions)), hub_(std::move(hub)), recordings_(std::move(recordings)), interval_(interval) {
  if (!sessions_ || !hub_ || !recordings_) {
    throw std::invalid_argument("SessionSweeper: sessions, hub and recordings are required");
  }
  if (interval_ <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("SessionSweeper: interval must be positive");
  }
}

SessionSweeper::~SessionSweeper() {
  Stop();
}

void SessionSweeper::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SessionSweeper::Loop, this);
}

void SessionSweeper::Stop() {
  if (running_.exchange(false)) {
    cv_.notify_all();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::size_t SessionSweeper::Tick() {
  std::size_t changed = sessions_->SweepExpired();
  changed += hub_->SweepDisconnected();
  recordings_->SweepWallClock();
  return changed;
}

void SessionSweeper::Loop() {
  while (running_) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval_, [&] { return !running_; });
    }
    if (!running_) break;

    try {
      if (const auto changed = Tick(); changed > 0) {
        VKYC_LOG_DEBUG("sweep changed sessions", {IntField("count", static_cast<int64_t>(changed))});
      }
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("session sweep failed", {StringField("error", e.what())});
    }
  }
}

} // namespace vkyc::scheduler
