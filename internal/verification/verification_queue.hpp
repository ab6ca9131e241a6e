#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

#include "types.hpp"

namespace vkyc::verification {

using ReportCallback = std::function<void(const VerificationReport&)>;

struct VerificationJob {
  CaptureFrame                       frame;
  ReportCallback                     callback;
  std::shared_ptr<std::atomic<bool>> cancelled;
};

/*
  Thread-safe blocking queue feeding the pipeline workers.
*/
class VerificationQueue {
 public:
  void Enqueue(VerificationJob job);

  // blocking wait; nullopt once shut down and drained
  std::optional<VerificationJob> Dequeue();

  void Shutdown();

 private:
  std::mutex                  mutex_;
  std::condition_variable     cv_;
  std::queue<VerificationJob> queue_;
  bool                        shutdown_ = false;
};

} // namespace vkyc::verification
