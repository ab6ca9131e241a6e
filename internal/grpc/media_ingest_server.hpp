#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/media/queued_media_transport.hpp"
#include "vkyc/v1_grpc.hpp"

namespace vkyc::grpc {

class MediaIngestServer final : public vkyc::v1::MediaIngestService::Service {
 public:
  explicit MediaIngestServer(std::shared_ptr<vkyc::media::QueuedMediaTransport> transport);

  ::grpc::Status Push(::grpc::ServerContext*, ::grpc::ServerReader<vkyc::v1::MediaChunk>*, vkyc::v1::MediaAck*) override;

  ::grpc::Status Controls(::grpc::ServerContext*, const vkyc::v1::ControlsRequest*, ::grpc::ServerWriter<vkyc::v1::MediaControl>*) override;

 private:
  std::shared_ptr<vkyc::media::QueuedMediaTransport> transport_;
};

} // namespace vkyc::grpc
