#pragma once

#include <memory>
#include <optional>
#include <string>

#include "vkyc/v1/media.pb.h"

namespace vkyc::media {

// Chunks of one session's recorded media, in arrival order.
class ChunkStream {
 public:
  virtual ~ChunkStream() = default;

  // Blocks for the next chunk; nullopt at end of stream or after Close().
  // Throws util::RecordingError when the transport failed.
  virtual std::optional<vkyc::v1::MediaChunk> Next() = 0;

  virtual void Close() = 0;
};

/*
  Media transport capability.

  The media engine (codec negotiation, NAT traversal) lives outside the
  service; the recording path only consumes chunks and sends controls.
*/
class MediaTransport {
 public:
  virtual ~MediaTransport() = default;

  virtual std::shared_ptr<ChunkStream> OpenChannel(const std::string& session_id) = 0;

  virtual void SendControl(const std::string& session_id, const vkyc::v1::MediaControl& control) = 0;
};

} // namespace vkyc::media
