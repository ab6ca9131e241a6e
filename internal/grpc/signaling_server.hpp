#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/signaling/signaling_hub.hpp"
#include "vkyc/v1_grpc.hpp"

namespace vkyc::grpc {

/*
  One Connect stream per peer. The first inbound envelope must be Hello;
  every later one is handed to the hub. A rejected message is answered with
  an ERROR notice and the stream stays open.
*/
class SignalingServer final : public vkyc::v1::SignalingService::Service {
 public:
  explicit SignalingServer(std::shared_ptr<vkyc::signaling::SignalingHub> hub);

  ::grpc::Status Connect(::grpc::ServerContext*,
                         ::grpc::ServerReaderWriter<vkyc::v1::SignalEnvelope, vkyc::v1::SignalEnvelope>*) override;

 private:
  std::shared_ptr<vkyc::signaling::SignalingHub> hub_;
};

} // namespace vkyc::grpc
