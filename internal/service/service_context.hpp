#pragma once

#include <memory>

namespace vkyc::core {
class SessionManager;
}
namespace vkyc::link {
class LinkIssuer;
}
namespace vkyc::biometrics {
class BiometricLogger;
}
namespace vkyc::recording {
class RecordingManager;
}

namespace vkyc::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vkyc::core::SessionManager>        sessions;
  std::shared_ptr<vkyc::link::LinkIssuer>            links;
  std::shared_ptr<vkyc::biometrics::BiometricLogger> biometrics;
  std::shared_ptr<vkyc::recording::RecordingManager> recordings;
};

} // namespace vkyc::service
