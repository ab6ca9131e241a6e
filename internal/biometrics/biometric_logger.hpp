#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "biometric_sink.hpp"
#include "internal/core/session_observer.hpp"
#include "internal/util/time.hpp"

namespace vkyc::biometrics {

struct BiometricPolicy {
  std::size_t               queue_capacity{1024};
  std::chrono::milliseconds flush_interval{500};
  // Ended sessions remembered so late events are refused.
  std::size_t ended_retention{4096};
};

struct LivenessSummary {
  uint32_t blink_count     = 0;
  uint32_t head_pose_count = 0;
};

/*
  Best-effort biometric audit trail.

  Append never touches the sink: events land in a bounded queue that a
  background flusher drains. When the queue is full the oldest event is
  dropped and counted. A failed flush is retried per session: events the
  store rejects outright are discarded and counted, the rest stay queued for
  the next attempt. Events for an ended session are refused.

  Stored timestamps are stamped here, strictly increasing per session.
*/
class BiometricLogger final : public core::SessionObserver {
 public:
  BiometricLogger(std::shared_ptr<BiometricSink> sink, std::shared_ptr<util::TimeSource> clock, BiometricPolicy policy);
  ~BiometricLogger() override;

  void Start();
  // Stops the flusher after one last flush.
  void Stop();

  // Returns false when the session has already ended.
  bool Append(const std::string& session_id, vkyc::v1::BiometricKind kind, std::string payload_json, int64_t client_time_ms);

  // Returns true when the queue was fully drained.
  bool Flush();

  LivenessSummary Summary(const std::string& session_id) const;

  uint64_t    DroppedCount() const;
  std::size_t QueueDepth() const;

  void OnSessionStarted(const vkyc::v1::Session&) override {
  }
  void OnSessionEnded(const vkyc::v1::Session& session) override;

 private:
  struct SessionTrack {
    uint64_t        next_sequence  = 1;
    int64_t         last_stamp_us  = 0;
    LivenessSummary summary;
    bool            ended = false;
  };

  void Run();
  void DropOldestLocked(std::size_t count);

  std::shared_ptr<BiometricSink>    sink_;
  std::shared_ptr<util::TimeSource> clock_;
  BiometricPolicy                   policy_;

  mutable std::mutex                            mutex_;
  std::deque<db::model::BiometricEventRecord>   queue_;
  std::unordered_map<std::string, SessionTrack> tracks_;
  std::deque<std::string>                       ended_order_;
  uint64_t                                      dropped_ = 0;

  std::mutex flush_mutex_;

  std::mutex              run_mutex_;
  std::condition_variable run_cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace vkyc::biometrics
