#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace vkyc::core {
class SessionManager;
}
namespace vkyc::biometrics {
class BiometricLogger;
}
namespace vkyc::recording {
class RecordingManager;
}
namespace vkyc::verification {
class VerificationPipeline;
}
namespace vkyc::signaling {
class SignalingHub;
}
namespace vkyc::scheduler {
class SessionSweeper;
}
namespace vkyc::db {
class Repository;
}

namespace vkyc::factory {

/*
  Application

  Owns every long-lived component of the orchestrator. Background workers
  start in Start() and stop, in dependency order, in Stop().
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<db::Repository>                     repository;
  std::shared_ptr<core::SessionManager>               sessions;
  std::shared_ptr<signaling::SignalingHub>            hub;
  std::shared_ptr<biometrics::BiometricLogger>        biometrics;
  std::shared_ptr<recording::RecordingManager>        recordings;
  std::shared_ptr<verification::VerificationPipeline> pipeline;
  std::shared_ptr<scheduler::SessionSweeper>          sweeper;

  void Start();
  void Stop();
};

/*
  Build

  Composition root: the only place that knows concrete repository,
  transport, codec and HTTP capability types. Sessions and recordings left
  live by a previous process are failed before Build returns.
*/
Application Build(const vkyc::config::RuntimeConfig& config);

} // namespace vkyc::factory
