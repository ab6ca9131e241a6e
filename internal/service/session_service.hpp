#pragma once

#include "service_context.hpp"
#include "vkyc/v1.hpp"

namespace vkyc::service {

class SessionService {
 public:
  explicit SessionService(ServiceContext ctx);

  vkyc::v1::IssueLinkResponse   IssueLink(const vkyc::v1::IssueLinkRequest& req);
  vkyc::v1::ResolveLinkResponse ResolveLink(const vkyc::v1::ResolveLinkRequest& req);

  vkyc::v1::SessionResponse    CreateSession(const vkyc::v1::CreateSessionRequest& req);
  vkyc::v1::ChooseModeResponse ChooseMode(const vkyc::v1::ChooseModeRequest& req);
  vkyc::v1::SessionResponse    BeginSession(const vkyc::v1::SessionRequest& req);
  vkyc::v1::SessionResponse    RequestVerification(const vkyc::v1::RequestVerificationRequest& req);
  vkyc::v1::SessionResponse    CompleteSession(const vkyc::v1::SessionRequest& req);
  vkyc::v1::SessionResponse    FailSession(const vkyc::v1::FailSessionRequest& req);
  vkyc::v1::SessionResponse    ExpireSession(const vkyc::v1::SessionRequest& req);

  vkyc::v1::ListWaitingSessionsResponse ListWaitingSessions(const vkyc::v1::ListWaitingSessionsRequest& req);
  vkyc::v1::SessionResponse             AcceptSession(const vkyc::v1::AgentSessionRequest& req);
  vkyc::v1::SessionResponse             DeclineSession(const vkyc::v1::AgentSessionRequest& req);

  vkyc::v1::GetSessionResponse          GetSession(const vkyc::v1::SessionRequest& req);
  vkyc::v1::ListBiometricEventsResponse ListBiometricEvents(const vkyc::v1::SessionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace vkyc::service
