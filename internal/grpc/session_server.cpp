#include "session_server.hpp"

#include "grpc_error.hpp"

namespace vkyc::grpc {

using namespace vkyc::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

SessionServer::SessionServer(std::shared_ptr<vkyc::service::SessionService> svc) : service_(std::move(svc)) {
}

::grpc::Status SessionServer::IssueLink(::grpc::ServerContext*, const IssueLinkRequest* req, IssueLinkResponse* resp) {
  return Handle([&] { *resp = service_->IssueLink(*req); });
}

::grpc::Status SessionServer::ResolveLink(::grpc::ServerContext*, const ResolveLinkRequest* req, ResolveLinkResponse* resp) {
  return Handle([&] { *resp = service_->ResolveLink(*req); });
}

::grpc::Status SessionServer::CreateSession(::grpc::ServerContext*, const CreateSessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->CreateSession(*req); });
}

::grpc::Status SessionServer::ChooseMode(::grpc::ServerContext*, const ChooseModeRequest* req, ChooseModeResponse* resp) {
  return Handle([&] { *resp = service_->ChooseMode(*req); });
}

::grpc::Status SessionServer::BeginSession(::grpc::ServerContext*, const SessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->BeginSession(*req); });
}

::grpc::Status SessionServer::RequestVerification(::grpc::ServerContext*, const RequestVerificationRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->RequestVerification(*req); });
}

::grpc::Status SessionServer::CompleteSession(::grpc::ServerContext*, const SessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->CompleteSession(*req); });
}

::grpc::Status SessionServer::FailSession(::grpc::ServerContext*, const FailSessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->FailSession(*req); });
}

::grpc::Status SessionServer::ExpireSession(::grpc::ServerContext*, const SessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->ExpireSession(*req); });
}

::grpc::Status SessionServer::ListWaitingSessions(::grpc::ServerContext*, const ListWaitingSessionsRequest* req,
                                                  ListWaitingSessionsResponse* resp) {
  return Handle([&] { *resp = service_->ListWaitingSessions(*req); });
}

::grpc::Status SessionServer::AcceptSession(::grpc::ServerContext*, const AgentSessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->AcceptSession(*req); });
}

::grpc::Status SessionServer::DeclineSession(::grpc::ServerContext*, const AgentSessionRequest* req, SessionResponse* resp) {
  return Handle([&] { *resp = service_->DeclineSession(*req); });
}

::grpc::Status SessionServer::GetSession(::grpc::ServerContext*, const SessionRequest* req, GetSessionResponse* resp) {
  return Handle([&] { *resp = service_->GetSession(*req); });
}

::grpc::Status SessionServer::ListBiometricEvents(::grpc::ServerContext*, const SessionRequest* req, ListBiometricEventsResponse* resp) {
  return Handle([&] { *resp = service_->ListBiometricEvents(*req); });
}

} // namespace vkyc::grpc
