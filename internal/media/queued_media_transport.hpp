#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

#include "media_transport.hpp"

namespace vkyc::media {

/*
  MediaTransport fed by the MediaIngest RPC.

  Push() hands chunks to the session's open stream; controls queue per
  session until the media engine picks them up with NextControl().
*/
class QueuedMediaTransport final : public MediaTransport {
 public:
  explicit QueuedMediaTransport(std::size_t max_buffered_chunks = 1024);

  std::shared_ptr<ChunkStream> OpenChannel(const std::string& session_id) override;
  void                         SendControl(const std::string& session_id, const vkyc::v1::MediaControl& control) override;

  // False when no stream is open for the session or its buffer is full.
  bool Push(const vkyc::v1::MediaChunk& chunk);

  // Ends the session's stream with a transport error.
  void Fail(const std::string& session_id, const std::string& error);

  std::optional<vkyc::v1::MediaControl> NextControl(const std::string& session_id, std::chrono::milliseconds wait);

 private:
  class Stream;

  struct ControlQueue {
    std::deque<vkyc::v1::MediaControl> pending;
    std::size_t                        waiters = 0;
  };

  std::shared_ptr<Stream> FindStream(const std::string& session_id);

  std::size_t max_buffered_chunks_;

  std::mutex                                            streams_mutex_;
  std::unordered_map<std::string, std::weak_ptr<Stream>> streams_;

  std::mutex                                    controls_mutex_;
  std::condition_variable                       controls_cv_;
  std::unordered_map<std::string, ControlQueue> controls_;
};

} // namespace vkyc::media
