#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/verification/http_client.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Args {
  std::string config_path;
  bool        check_only = false;
};

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      args.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (args.config_path.empty() && arg.rfind("--", 0) != 0) {
      args.config_path = arg;
    } else {
      return false;
    }
  }
  return !args.config_path.empty();
}

void ShutdownObservability() {
  vkyc::observability::ShutdownMetrics();
  vkyc::observability::ShutdownTracing();
  vkyc::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    std::cerr << "usage: vkyc-orchestrator [--check-config] [--config] <config.yaml>\n";
    return 1;
  }

  try {
    auto config = vkyc::config::ConfigLoader::LoadFromYaml(args.config_path);
    if (args.check_only) {
      std::cout << args.config_path << ": ok\n";
      return 0;
    }

    vkyc::observability::InitializeLogging(config);
    vkyc::observability::InitializeTracing(config);
    vkyc::observability::InitializeMetrics(config);

    vkyc::verification::CurlGlobal curl;

    // Recovers sessions and recordings left over from the previous process
    // before any client can reach the services.
    auto app = vkyc::factory::Build(config);
    app.Start();

    vkyc::runtime::ServerOptions options;
    options.bind_address      = config.server().bind_address();
    options.max_receive_bytes = config.signaling().max_frame_bytes();
    vkyc::runtime::Server server(std::move(options), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    VKYC_LOG_INFO("vkyc orchestrator started", {vkyc::observability::IntField("port", server.SelectedPort())});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    VKYC_LOG_INFO("vkyc orchestrator stopping");
    server.Stop();
    app.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("fatal error", {vkyc::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
