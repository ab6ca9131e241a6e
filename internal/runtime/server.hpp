#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vkyc::runtime {

struct ServerOptions {
  std::string bind_address{"0.0.0.0:50061"};

  // Must admit the largest capture frame plus its envelope.
  std::uint64_t max_receive_bytes{8 * 1024 * 1024};

  // Signaling streams stay open for the whole call; keepalive pings detect
  // peers that vanished without closing the stream.
  std::chrono::milliseconds keepalive_interval{std::chrono::seconds(20)};
  std::chrono::milliseconds keepalive_timeout{std::chrono::seconds(10)};

  // Streaming handlers get this long to notice shutdown before cancellation.
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(5)};
};

/*
  Hosts the session, signaling and media-ingest services on one port.
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one for ":0".
  int SelectedPort() const {
    return selected_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace vkyc::runtime
