#include "verification_queue.hpp"

namespace vkyc::verification {

void VerificationQueue::Enqueue(VerificationJob job) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

std::optional<VerificationJob> VerificationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  VerificationJob job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void VerificationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace vkyc::verification
