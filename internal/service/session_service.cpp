#include "session_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/biometrics/biometric_logger.hpp"
#include "internal/core/session_manager.hpp"
#include "internal/link/link_issuer.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recording/recording_manager.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::service {

using namespace vkyc::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& session_id, Fn&& fn) {
  vkyc::observability::SpanScope span(route, session_id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    auto& metrics = vkyc::observability::Metrics::Instance();
    metrics.RecordRequest(route, success);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    VKYC_LOG_ERROR("RPC failed", {vkyc::observability::StringField("route", route), vkyc::observability::StringField("error", ex.what()),
                                  vkyc::observability::SessionField(session_id)});
    record(false);
    throw;
  }
}

SessionResponse Wrap(Session session) {
  SessionResponse resp;
  *resp.mutable_session() = std::move(session);
  return resp;
}

} // namespace

SessionService::SessionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.sessions || !ctx_.links || !ctx_.biometrics || !ctx_.recordings) {
    throw std::invalid_argument("SessionService: incomplete service context");
  }
}

IssueLinkResponse SessionService::IssueLink(const IssueLinkRequest& req) {
  return ObserveRpc("SessionService.IssueLink", "", [&] {
    std::optional<std::chrono::milliseconds> ttl;
    if (req.ttl_seconds() > 0) {
      ttl = std::chrono::seconds(req.ttl_seconds());
    }
    IssueLinkResponse resp;
    *resp.mutable_link() = ctx_.links->Issue(req.customer_id(), ttl);
    return resp;
  });
}

ResolveLinkResponse SessionService::ResolveLink(const ResolveLinkRequest& req) {
  return ObserveRpc("SessionService.ResolveLink", "", [&] { return ctx_.links->Resolve(req.token()); });
}

SessionResponse SessionService::CreateSession(const CreateSessionRequest& req) {
  return ObserveRpc("SessionService.CreateSession", "", [&] { return Wrap(ctx_.sessions->CreateSession(req.token())); });
}

ChooseModeResponse SessionService::ChooseMode(const ChooseModeRequest& req) {
  return ObserveRpc("SessionService.ChooseMode", req.session_id(), [&] {
    std::optional<util::TimePoint> scheduled_at;
    if (req.has_scheduled_at()) {
      scheduled_at = util::FromProto(req.scheduled_at());
    }

    auto               result = ctx_.sessions->ChooseMode(req.session_id(), req.mode(), scheduled_at);
    ChooseModeResponse resp;
    *resp.mutable_session() = std::move(result.session);
    if (result.scheduled_link) {
      *resp.mutable_scheduled_link() = std::move(*result.scheduled_link);
    }
    return resp;
  });
}

SessionResponse SessionService::BeginSession(const SessionRequest& req) {
  return ObserveRpc("SessionService.BeginSession", req.session_id(), [&] { return Wrap(ctx_.sessions->BeginSession(req.session_id())); });
}

SessionResponse SessionService::RequestVerification(const RequestVerificationRequest& req) {
  return ObserveRpc("SessionService.RequestVerification", req.session_id(), [&] {
    verification::CaptureFrame frame;
    frame.session_id    = req.session_id();
    frame.document_type = req.document_type();
    frame.image         = req.image();
    frame.captured_at   = util::Now();
    return Wrap(ctx_.sessions->RequestVerification(std::move(frame)));
  });
}

SessionResponse SessionService::CompleteSession(const SessionRequest& req) {
  return ObserveRpc("SessionService.CompleteSession", req.session_id(),
                    [&] { return Wrap(ctx_.sessions->CompleteSession(req.session_id())); });
}

SessionResponse SessionService::FailSession(const FailSessionRequest& req) {
  return ObserveRpc("SessionService.FailSession", req.session_id(), [&] {
    const auto reason = req.reason() == TERMINATION_REASON_UNSPECIFIED ? TERMINATION_REASON_AGENT_REPORTED_ERROR : req.reason();
    return Wrap(ctx_.sessions->FailSession(req.session_id(), reason, req.detail()));
  });
}

SessionResponse SessionService::ExpireSession(const SessionRequest& req) {
  return ObserveRpc("SessionService.ExpireSession", req.session_id(), [&] { return Wrap(ctx_.sessions->ExpireSession(req.session_id())); });
}

ListWaitingSessionsResponse SessionService::ListWaitingSessions(const ListWaitingSessionsRequest&) {
  return ObserveRpc("SessionService.ListWaitingSessions", "", [&] {
    ListWaitingSessionsResponse resp;
    for (auto& session : ctx_.sessions->ListWaitingSessions()) {
      *resp.add_sessions() = std::move(session);
    }
    return resp;
  });
}

SessionResponse SessionService::AcceptSession(const AgentSessionRequest& req) {
  return ObserveRpc("SessionService.AcceptSession", req.session_id(),
                    [&] { return Wrap(ctx_.sessions->AcceptSession(req.session_id(), req.agent_id())); });
}

SessionResponse SessionService::DeclineSession(const AgentSessionRequest& req) {
  return ObserveRpc("SessionService.DeclineSession", req.session_id(),
                    [&] { return Wrap(ctx_.sessions->DeclineSession(req.session_id(), req.agent_id())); });
}

GetSessionResponse SessionService::GetSession(const SessionRequest& req) {
  return ObserveRpc("SessionService.GetSession", req.session_id(), [&] {
    GetSessionResponse resp;
    *resp.mutable_session() = ctx_.sessions->GetSession(req.session_id());
    for (auto& result : ctx_.sessions->ListVerificationResults(req.session_id())) {
      *resp.add_verifications() = std::move(result);
    }
    if (auto recording = ctx_.recordings->Get(req.session_id())) {
      *resp.mutable_recording() = std::move(*recording);
    }
    resp.set_end_category(model::EndCategoryFor(resp.session().state(), resp.session().termination_reason()));
    return resp;
  });
}

ListBiometricEventsResponse SessionService::ListBiometricEvents(const SessionRequest& req) {
  return ObserveRpc("SessionService.ListBiometricEvents", req.session_id(), [&] {
    ListBiometricEventsResponse resp;
    for (auto& event : ctx_.sessions->ListBiometricEvents(req.session_id())) {
      *resp.add_events() = std::move(event);
    }
    resp.set_dropped_total(ctx_.biometrics->DroppedCount());
    return resp;
  });
}

} // namespace vkyc::service
