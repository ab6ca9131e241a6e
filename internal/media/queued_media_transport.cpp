#include "queued_media_transport.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::media {

using observability::SessionField;
using observability::StringField;

namespace {

constexpr std::size_t kMaxPendingControls = 64;

} // namespace

class QueuedMediaTransport::Stream final : public ChunkStream {
 public:
  explicit Stream(std::size_t capacity) : capacity_(capacity) {
  }

  std::optional<vkyc::v1::MediaChunk> Next() override {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || failed_ || !chunks_.empty(); });
    if (!chunks_.empty()) {
      auto chunk = std::move(chunks_.front());
      chunks_.pop_front();
      return chunk;
    }
    if (failed_) {
      throw util::RecordingError("media transport failed: " + error_);
    }
    return std::nullopt;
  }

  void Close() override {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      chunks_.clear();
    }
    cv_.notify_all();
  }

  bool Push(const vkyc::v1::MediaChunk& chunk) {
    {
      std::lock_guard lock(mutex_);
      if (closed_ || failed_ || chunks_.size() >= capacity_) {
        return false;
      }
      chunks_.push_back(chunk);
    }
    cv_.notify_one();
    return true;
  }

  void Fail(const std::string& error) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return;
      failed_ = true;
      error_  = error;
    }
    cv_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  const std::size_t                    capacity_;
  mutable std::mutex                   mutex_;
  std::condition_variable              cv_;
  std::deque<vkyc::v1::MediaChunk>     chunks_;
  bool                                 closed_ = false;
  bool                                 failed_ = false;
  std::string                          error_;
};

QueuedMediaTransport::QueuedMediaTransport(std::size_t max_buffered_chunks)
    : max_buffered_chunks_(max_buffered_chunks == 0 ? 1 : max_buffered_chunks) {
}

std::shared_ptr<ChunkStream> QueuedMediaTransport::OpenChannel(const std::string& session_id) {
  std::lock_guard lock(streams_mutex_);
  if (auto existing = streams_[session_id].lock(); existing && !existing->Closed()) {
    return existing;
  }
  auto stream          = std::make_shared<Stream>(max_buffered_chunks_);
  streams_[session_id] = stream;
  return stream;
}

std::shared_ptr<QueuedMediaTransport::Stream> QueuedMediaTransport::FindStream(const std::string& session_id) {
  std::lock_guard lock(streams_mutex_);
  const auto      it = streams_.find(session_id);
  if (it == streams_.end()) {
    return nullptr;
  }
  auto stream = it->second.lock();
  if (!stream || stream->Closed()) {
    streams_.erase(it);
    return nullptr;
  }
  return stream;
}

bool QueuedMediaTransport::Push(const vkyc::v1::MediaChunk& chunk) {
  auto stream = FindStream(chunk.session_id());
  return stream && stream->Push(chunk);
}

void QueuedMediaTransport::Fail(const std::string& session_id, const std::string& error) {
  if (auto stream = FindStream(session_id)) {
    stream->Fail(error);
  }
}

void QueuedMediaTransport::SendControl(const std::string& session_id, const vkyc::v1::MediaControl& control) {
  {
    std::lock_guard lock(controls_mutex_);
    auto&           queue = controls_[session_id];
    if (control.kind() == vkyc::v1::MEDIA_CONTROL_KIND_STOP_RECORDING && queue.waiters == 0) {
      // Nobody is listening; a later subscriber has nothing to stop.
      controls_.erase(session_id);
      return;
    }
    if (queue.pending.size() >= kMaxPendingControls) {
      queue.pending.pop_front();
      VKYC_LOG_WARN("media control queue full, dropped oldest", {SessionField(session_id)});
    }
    queue.pending.push_back(control);
  }
  controls_cv_.notify_all();
}

std::optional<vkyc::v1::MediaControl> QueuedMediaTransport::NextControl(const std::string& session_id, std::chrono::milliseconds wait) {
  std::unique_lock lock(controls_mutex_);
  ++controls_[session_id].waiters;
  controls_cv_.wait_for(lock, wait, [&] { return !controls_[session_id].pending.empty(); });

  auto& queue = controls_[session_id];
  --queue.waiters;
  if (queue.pending.empty()) {
    if (queue.waiters == 0) controls_.erase(session_id);
    return std::nullopt;
  }

  auto control = std::move(queue.pending.front());
  queue.pending.pop_front();
  if (queue.pending.empty() && queue.waiters == 0 && control.kind() == vkyc::v1::MEDIA_CONTROL_KIND_STOP_RECORDING) {
    controls_.erase(session_id);
  }
  return control;
}

} // namespace vkyc::media
