#include "biometric_logger.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace vkyc::biometrics {

using observability::IntField;
using observability::SessionField;
using observability::StringField;

BiometricLogger::BiometricLogger(std::shared_ptr<BiometricSink> sink, std::shared_ptr<util::TimeSource> clock, BiometricPolicy policy)
    : sink_(std::move(sink)), clock_(std::move(clock)), policy_(policy) {
  if (!sink_ || !clock_) {
    throw std::invalid_argument("BiometricLogger: sink and clock are required");
  }
  if (policy_.queue_capacity == 0) {
    policy_.queue_capacity = 1;
  }
}

BiometricLogger::~BiometricLogger() {
  Stop();
}

void BiometricLogger::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&BiometricLogger::Run, this);
}

void BiometricLogger::Stop() {
  if (running_.exchange(false)) {
    run_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }
  if (!Flush()) {
    VKYC_LOG_WARN("biometric events left unflushed at shutdown", {IntField("queued", static_cast<std::int64_t>(QueueDepth()))});
  }
}

void BiometricLogger::Run() {
  while (running_) {
    {
      std::unique_lock lock(run_mutex_);
      run_cv_.wait_for(lock, policy_.flush_interval, [&] { return !running_; });
    }
    if (!running_) break;
    Flush();
  }
}

bool BiometricLogger::Append(const std::string& session_id, vkyc::v1::BiometricKind kind, std::string payload_json, int64_t client_time_ms) {
  const auto now_us = util::ToUnixMicros(clock_->Now());

  std::lock_guard lock(mutex_);
  auto&           track = tracks_[session_id];
  if (track.ended) {
    VKYC_LOG_DEBUG("biometric event after session end ignored", {SessionField(session_id)});
    return false;
  }

  db::model::BiometricEventRecord event;
  event.session_id     = session_id;
  event.sequence       = track.next_sequence++;
  event.kind           = kind;
  event.recorded_at_us = std::max(now_us, track.last_stamp_us + 1);
  event.client_time_ms = client_time_ms;
  track.last_stamp_us  = event.recorded_at_us;

  if (kind == vkyc::v1::BIOMETRIC_KIND_BLINK) {
    ++track.summary.blink_count;
  } else if (kind == vkyc::v1::BIOMETRIC_KIND_HEAD_POSE) {
    ++track.summary.head_pose_count;
  }

  event.payload_json = std::move(payload_json);
  if (queue_.size() >= policy_.queue_capacity) {
    DropOldestLocked(queue_.size() - policy_.queue_capacity + 1);
  }
  queue_.push_back(std::move(event));
  return true;
}

void BiometricLogger::DropOldestLocked(std::size_t count) {
  count = std::min(count, queue_.size());
  if (count == 0) return;

  queue_.erase(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(count));
  dropped_ += count;
  observability::Metrics::Instance().RecordBiometricDropped(count);
  VKYC_LOG_WARN("biometric queue full, dropped oldest events",
                {IntField("dropped", static_cast<std::int64_t>(count)), IntField("dropped_total", static_cast<std::int64_t>(dropped_))});
}

bool BiometricLogger::Flush() {
  std::lock_guard flush_lock(flush_mutex_);

  std::vector<db::model::BiometricEventRecord> batch;
  {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) return true;
    batch.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
  }

  const auto result = sink_->Write(batch);
  if (result) {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  VKYC_LOG_WARN("biometric flush failed, retrying per session",
                {IntField("batch", static_cast<std::int64_t>(batch.size())), StringField("error", result.ToString())});

  // One session's bad events must not hold back the others.
  std::map<std::string, std::vector<db::model::BiometricEventRecord>> by_session;
  for (auto& event : batch) {
    by_session[event.session_id].push_back(std::move(event));
  }

  std::vector<db::model::BiometricEventRecord> retained;
  uint64_t                                     rejected = 0;
  for (auto& [session_id, events] : by_session) {
    const auto session_result = sink_->Write(events);
    if (session_result) continue;
    if (session_result.code == db::ErrorCode::ConstraintViolation) {
      rejected += events.size();
      VKYC_LOG_ERROR("biometric events rejected by store, discarding",
                     {SessionField(session_id), IntField("events", static_cast<std::int64_t>(events.size())),
                      StringField("error", session_result.ToString())});
      continue;
    }
    retained.insert(retained.end(), std::make_move_iterator(events.begin()), std::make_move_iterator(events.end()));
  }
  std::stable_sort(retained.begin(), retained.end(), [](const auto& a, const auto& b) { return a.recorded_at_us < b.recorded_at_us; });

  std::lock_guard lock(mutex_);
  if (rejected > 0) {
    dropped_ += rejected;
    observability::Metrics::Instance().RecordBiometricDropped(rejected);
  }
  // Older events go back in front of anything appended meanwhile.
  queue_.insert(queue_.begin(), std::make_move_iterator(retained.begin()), std::make_move_iterator(retained.end()));
  if (queue_.size() > policy_.queue_capacity) {
    DropOldestLocked(queue_.size() - policy_.queue_capacity);
  }
  return retained.empty() && queue_.empty();
}

LivenessSummary BiometricLogger::Summary(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  const auto      it = tracks_.find(session_id);
  return it == tracks_.end() ? LivenessSummary{} : it->second.summary;
}

uint64_t BiometricLogger::DroppedCount() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

std::size_t BiometricLogger::QueueDepth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

// The track stays behind as a tombstone so a late event cannot restart the
// sequence. Only the most recent ended_retention tombstones are kept.
void BiometricLogger::OnSessionEnded(const vkyc::v1::Session& session) {
  std::lock_guard lock(mutex_);
  auto&           track = tracks_[session.session_id()];
  if (track.ended) return;
  track.ended   = true;
  track.summary = LivenessSummary{};
  ended_order_.push_back(session.session_id());
  while (ended_order_.size() > policy_.ended_retention) {
    tracks_.erase(ended_order_.front());
    ended_order_.pop_front();
  }
}

} // namespace vkyc::biometrics
