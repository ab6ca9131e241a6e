#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace vkyc::core {
class SessionManager;
}
namespace vkyc::signaling {
class SignalingHub;
}
namespace vkyc::recording {
class RecordingManager;
}

namespace vkyc::scheduler {

/*
  Periodically drives the time-based transitions: link expiry, scheduled
  activation, disconnect grace and the recording wall-clock cap.
*/
class SessionSweeper {
 public:
  SessionSweeper(std::shared_ptr<core::SessionManager> sessions, std::shared_ptr<signaling::SignalingHub> hub,
                 std::shared_ptr<recording::RecordingManager> recordings, std::chrono::milliseconds interval);
  ~SessionSweeper();

  void Start();
  void Stop();

  // One pass; returns the number of sessions changed.
  std::size_t Tick();

 private:
  void Loop();

  std::shared_ptr<core::SessionManager>        sessions_;
  std::shared_ptr<signaling::SignalingHub>     hub_;
  std::shared_ptr<recording::RecordingManager> recordings_;
  std::chrono::milliseconds                    interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace vkyc::scheduler
