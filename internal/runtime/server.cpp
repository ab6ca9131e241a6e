#include "server.hpp"

#include <limits>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vkyc::runtime {

using observability::IntField;
using observability::StringField;

namespace {

// Room for the SignalEnvelope fields around a capture frame.
constexpr std::uint64_t kEnvelopeSlack = 64 * 1024;

int ClampToInt(std::uint64_t value) {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
  return static_cast<int>(value > kMax ? kMax : value);
}

} // namespace

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port_);
  builder.SetMaxReceiveMessageSize(ClampToInt(options_.max_receive_bytes + kEnvelopeSlack));
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, static_cast<int>(options_.keepalive_interval.count()));
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, static_cast<int>(options_.keepalive_timeout.count()));
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  VKYC_LOG_INFO("gRPC server listening", {StringField("bind_address", options_.bind_address), IntField("port", selected_port_),
                                          IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) {
    grpc_server_->Wait();
  }
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
  VKYC_LOG_INFO("gRPC server stopped", {StringField("bind_address", options_.bind_address)});
}

} // namespace vkyc::runtime
