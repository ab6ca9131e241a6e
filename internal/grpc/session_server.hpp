#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/session_service.hpp"
#include "vkyc/v1_grpc.hpp"

namespace vkyc::grpc {

class SessionServer final : public vkyc::v1::SessionService::Service {
 public:
  explicit SessionServer(std::shared_ptr<vkyc::service::SessionService> svc);

  ::grpc::Status IssueLink(::grpc::ServerContext*, const vkyc::v1::IssueLinkRequest*, vkyc::v1::IssueLinkResponse*) override;
  ::grpc::Status ResolveLink(::grpc::ServerContext*, const vkyc::v1::ResolveLinkRequest*, vkyc::v1::ResolveLinkResponse*) override;

  ::grpc::Status CreateSession(::grpc::ServerContext*, const vkyc::v1::CreateSessionRequest*, vkyc::v1::SessionResponse*) override;
  ::grpc::Status ChooseMode(::grpc::ServerContext*, const vkyc::v1::ChooseModeRequest*, vkyc::v1::ChooseModeResponse*) override;
  ::grpc::Status BeginSession(::grpc::ServerContext*, const vkyc::v1::SessionRequest*, vkyc::v1::SessionResponse*) override;
  ::grpc::Status RequestVerification(::grpc::ServerContext*, const vkyc::v1::RequestVerificationRequest*,
                                     vkyc::v1::SessionResponse*) override;
  ::grpc::Status CompleteSession(::grpc::ServerContext*, const vkyc::v1::SessionRequest*, vkyc::v1::SessionResponse*) override;
  ::grpc::Status FailSession(::grpc::ServerContext*, const vkyc::v1::FailSessionRequest*, vkyc::v1::SessionResponse*) override;
  ::grpc::Status ExpireSession(::grpc::ServerContext*, const vkyc::v1::SessionRequest*, vkyc::v1::SessionResponse*) override;

  ::grpc::Status ListWaitingSessions(::grpc::ServerContext*, const vkyc::v1::ListWaitingSessionsRequest*,
                                     vkyc::v1::ListWaitingSessionsResponse*) override;
  ::grpc::Status AcceptSession(::grpc::ServerContext*, const vkyc::v1::AgentSessionRequest*, vkyc::v1::SessionResponse*) override;
  ::grpc::Status DeclineSession(::grpc::ServerContext*, const vkyc::v1::AgentSessionRequest*, vkyc::v1::SessionResponse*) override;

  ::grpc::Status GetSession(::grpc::ServerContext*, const vkyc::v1::SessionRequest*, vkyc::v1::GetSessionResponse*) override;
  ::grpc::Status ListBiometricEvents(::grpc::ServerContext*, const vkyc::v1::SessionRequest*,
                                     vkyc::v1::ListBiometricEventsResponse*) override;

 private:
  std::shared_ptr<vkyc::service::SessionService> service_;
};

} // namespace vkyc::grpc
