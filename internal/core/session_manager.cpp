#include "session_manager.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/biometrics/biometric_logger.hpp"
#include "internal/db/api/check.hpp"
#include "internal/link/link_issuer.hpp"
#include "internal/model/names.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/verification/verification_pipeline.hpp"

namespace vkyc::core {

using namespace vkyc::v1;
using observability::BoolField;
using observability::SessionField;
using observability::StringField;

namespace {

std::string FieldsToJson(const google::protobuf::Map<std::string, std::string>& fields) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : fields) {
    (*object.mutable_fields())[key].set_string_value(value);
  }
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode verification fields: " + std::string(status.message()));
  }
  return json;
}

void FieldsFromJson(const std::string& json, google::protobuf::Map<std::string, std::string>* fields) {
  if (json.empty()) {
    return;
  }
  google::protobuf::Struct object;
  const auto               status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw std::runtime_error("decode verification fields: " + std::string(status.message()));
  }
  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      (*fields)[key] = value.string_value();
    }
  }
}

std::string Join(const std::vector<std::string>& parts) {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) {
      out += "; ";
    }
    out += part;
  }
  return out;
}

void ApplyState(db::model::SessionRecord& record, SessionState to, int64_t now_ms) {
  record.state = to;
  if (model::IsTerminal(to) && record.ended_at_ms == 0) {
    record.ended_at_ms = now_ms;
  }
}

[[noreturn]] void ThrowInvalidTransition(const db::model::SessionRecord& record, SessionState to, const std::string& why = {}) {
  auto message = "session " + record.id + ": cannot move from " + std::string(model::StateName(record.state)) + " to " +
                 std::string(model::StateName(to));
  if (!why.empty()) {
    message += " (" + why + ")";
  }
  VKYC_LOG_WARN("invalid session transition", {SessionField(record.id), StringField("from", model::StateName(record.state)),
                                                StringField("to", model::StateName(to)), StringField("detail", why)});
  throw util::InvalidTransition(message);
}

void RequireTransition(const db::model::SessionRecord& record, SessionState to) {
  if (!model::CanTransition(record.state, to)) {
    ThrowInvalidTransition(record, to);
  }
}

} // namespace

VerificationResult ToProto(const db::model::VerificationRecord& record) {
  VerificationResult result;
  result.set_session_id(record.session_id);
  result.set_document_type(record.document_type);
  FieldsFromJson(record.fields_json, result.mutable_fields());
  result.set_ocr_confidence(record.ocr_confidence);
  result.set_registry_status(record.registry_status);
  result.set_ocr_attempts(record.ocr_attempts);
  result.set_registry_attempts(record.registry_attempts);
  if (record.updated_at_ms > 0) {
    *result.mutable_updated_at() = util::ToProto(util::FromUnixMillis(record.updated_at_ms));
  }
  result.set_detail(record.detail);
  return result;
}

db::model::VerificationRecord ToRecord(const VerificationResult& result) {
  db::model::VerificationRecord record;
  record.session_id        = result.session_id();
  record.document_type     = result.document_type();
  record.fields_json       = FieldsToJson(result.fields());
  record.ocr_confidence    = result.ocr_confidence();
  record.registry_status   = result.registry_status();
  record.ocr_attempts      = result.ocr_attempts();
  record.registry_attempts = result.registry_attempts();
  if (result.has_updated_at()) {
    record.updated_at_ms = util::ToUnixMillis(util::FromProto(result.updated_at()));
  }
  record.detail = result.detail();
  return record;
}

Session ToProto(const db::model::SessionRecord& record) {
  Session session;
  session.set_session_id(record.id);
  session.set_link_token(record.link_token);
  session.set_customer_id(record.customer_id);
  session.set_mode(record.mode);
  session.set_state(record.state);
  if (record.scheduled_at_ms > 0) {
    *session.mutable_scheduled_at() = util::ToProto(util::FromUnixMillis(record.scheduled_at_ms));
  }
  if (record.created_at_ms > 0) {
    *session.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  }
  if (record.started_at_ms > 0) {
    *session.mutable_started_at() = util::ToProto(util::FromUnixMillis(record.started_at_ms));
  }
  if (record.ended_at_ms > 0) {
    *session.mutable_ended_at() = util::ToProto(util::FromUnixMillis(record.ended_at_ms));
  }
  session.set_termination_reason(record.termination_reason);
  session.set_termination_detail(record.termination_detail);
  session.set_manual_review(record.manual_review);
  session.set_version(record.version);
  session.set_agent_id(record.agent_id);
  if (record.agent_assigned_at_ms > 0) {
    *session.mutable_agent_assigned_at() = util::ToProto(util::FromUnixMillis(record.agent_assigned_at_ms));
  }
  return session;
}

SessionManager::SessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<link::LinkIssuer> links,
                               std::shared_ptr<biometrics::BiometricLogger> biometrics,
                               std::shared_ptr<verification::VerificationPipeline> pipeline, std::shared_ptr<util::TimeSource> clock,
                               SessionPolicy policy)
    : repository_(std::move(repository)),
      links_(std::move(links)),
      biometrics_(std::move(biometrics)),
      pipeline_(std::move(pipeline)),
      clock_(std::move(clock)),
      policy_(std::move(policy)) {
  if (!repository_ || !links_ || !biometrics_ || !pipeline_ || !clock_) {
    throw std::invalid_argument("SessionManager: all collaborators are required");
  }
  if (policy_.required_documents.empty()) {
    throw std::invalid_argument("SessionManager: at least one required document");
  }
}

void SessionManager::AddObserver(std::weak_ptr<SessionObserver> observer) {
  std::lock_guard lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

std::shared_ptr<SessionManager::SessionSlot> SessionManager::AcquireSlot(const std::string& session_id) {
  std::lock_guard lock(slots_guard_);
  auto&           slot = slots_[session_id];
  if (!slot) {
    slot = std::make_shared<SessionSlot>();
  }
  return slot;
}

void SessionManager::ReleaseSlot(const std::string& session_id, const std::shared_ptr<SessionSlot>& slot) {
  std::lock_guard lock(slots_guard_);
  const auto      it = slots_.find(session_id);
  // Only the map and the caller may still hold it.
  if (it != slots_.end() && it->second == slot && slot.use_count() == 2) {
    slots_.erase(it);
  }
}

std::size_t SessionManager::TrackedSessions() {
  std::size_t tracked = 0;
  {
    std::lock_guard lock(slots_guard_);
    tracked += slots_.size();
  }
  std::shared_lock lock(snapshot_cache_mutex_);
  return tracked + snapshot_cache_.size();
}

SessionManager::SessionLock::SessionLock(SessionManager& manager, const std::string& session_id)
    : manager_(manager), session_id_(session_id), slot_(manager.AcquireSlot(session_id)), lock_(slot_->mutex) {
}

SessionManager::SessionLock::~SessionLock() {
  lock_.unlock();
  manager_.Dispatch(*slot_);
  manager_.ReleaseSlot(session_id_, slot_);
}

db::model::SessionRecord SessionManager::Load(db::Transaction& tx, const std::string& session_id) const {
  if (session_id.empty()) {
    throw util::InvalidArgument("session_id is required");
  }
  auto record = repository_->GetSession(tx, session_id);
  if (!record) {
    throw util::NotFound("session not found: " + session_id);
  }
  return *record;
}

Session SessionManager::CommitLocked(db::Transaction& tx, db::model::SessionRecord& record, SessionState from) {
  const auto expected = record.version;
  record.version      = expected + 1;
  db::ThrowIfDbError(repository_->UpdateSession(tx, record, expected), "update session " + record.id);
  tx.Commit();

  auto session = ToProto(record);
  CacheSnapshot(session);

  if (from != record.state) {
    observability::Metrics::Instance().RecordSessionTransition(model::StateName(record.state), model::ReasonName(record.termination_reason));
    VKYC_LOG_INFO("session transition", {SessionField(record.id), StringField("from", model::StateName(from)),
                                         StringField("to", model::StateName(record.state)),
                                         StringField("reason", model::ReasonName(record.termination_reason))});
  }
  return session;
}

void SessionManager::CacheSnapshot(const Session& session) {
  std::unique_lock lock(snapshot_cache_mutex_);
  if (model::IsTerminal(session.state())) {
    snapshot_cache_.erase(session.session_id());
  } else {
    snapshot_cache_[session.session_id()] = session;
  }
}

// ------------------------------------------------------------------
// Creation and scheduling
// ------------------------------------------------------------------

Session SessionManager::CreateSession(const std::string& token) {
  observability::SpanScope span("SessionManager::CreateSession");
  if (!util::IsValidToken(token)) {
    throw util::NotFound("link not found");
  }

  const auto now = clock_->Now();
  auto       tx  = repository_->Begin();
  auto       link = repository_->GetLink(*tx, token);
  if (!link) {
    throw util::NotFound("link not found");
  }
  link::LinkIssuer::CheckUsable(*link, now);

  if (!link->session_id.empty()) {
    const auto existing = repository_->GetSession(*tx, link->session_id);
    if (existing && !model::IsTerminal(existing->state)) {
      tx->Commit();
      if (existing->state == SESSION_STATE_SCHEDULED && util::ToUnixMillis(now) >= existing->scheduled_at_ms) {
        return ActivateScheduled(existing->id);
      }
      auto session = ToProto(*existing);
      CacheSnapshot(session);
      return session;
    }
  }

  db::model::SessionRecord record;
  record.id            = util::GenerateSessionId();
  record.link_token    = link->token;
  record.customer_id   = link->customer_id;
  record.state         = SESSION_STATE_CREATED;
  record.created_at_ms = util::ToUnixMillis(now);
  record.version       = 1;
  db::ThrowIfDbError(repository_->InsertSession(*tx, record), "insert session");

  link->session_id = record.id;
  db::ThrowIfDbError(repository_->UpdateLink(*tx, *link), "bind link");
  tx->Commit();

  auto session = ToProto(record);
  CacheSnapshot(session);
  observability::Metrics::Instance().RecordSessionTransition(model::StateName(record.state), model::ReasonName(record.termination_reason));
  VKYC_LOG_INFO("session created", {SessionField(record.id), StringField("customer_id", record.customer_id)});
  return session;
}

ChooseModeResult SessionManager::ChooseMode(const std::string& session_id, SessionMode mode, std::optional<util::TimePoint> scheduled_at) {
  if (mode != SESSION_MODE_IMMEDIATE && mode != SESSION_MODE_SCHEDULED) {
    throw util::InvalidArgument("mode must be immediate or scheduled");
  }
  const auto target = mode == SESSION_MODE_IMMEDIATE ? SESSION_STATE_READY_TO_START : SESSION_STATE_SCHEDULED;

  SessionLock lock(*this, session_id);

  const auto now    = clock_->Now();
  auto       tx     = repository_->Begin();
  auto       record = Load(*tx, session_id);

  if (record.state == target && record.mode == mode) {
    ChooseModeResult result;
    if (mode == SESSION_MODE_SCHEDULED) {
      if (const auto link = repository_->GetLink(*tx, record.link_token)) {
        result.scheduled_link = links_->ToProto(*link);
      }
    }
    tx->Commit();
    result.session = ToProto(record);
    return result;
  }
  if (record.state != SESSION_STATE_CREATED) {
    ThrowInvalidTransition(record, target, "mode can only be chosen once");
  }

  auto link = repository_->GetLink(*tx, record.link_token);
  if (!link) {
    throw util::NotFound("link not found for session " + session_id);
  }
  if (util::ToUnixMillis(now) >= link->expires_at_ms) {
    ExpireLocked(*tx, record);
    throw util::LinkExpired("link expired");
  }

  ChooseModeResult result;
  const auto       from = record.state;
  if (mode == SESSION_MODE_SCHEDULED) {
    if (!scheduled_at || *scheduled_at <= now) {
      throw util::InvalidArgument("scheduled_at must be in the future");
    }
    auto fresh = links_->IssueInTransaction(*tx, record.customer_id, *scheduled_at + links_->Policy().scheduled_link_ttl, record.id);

    link->superseded_by = fresh.token();
    db::ThrowIfDbError(repository_->UpdateLink(*tx, *link), "supersede link");

    record.link_token      = fresh.token();
    record.scheduled_at_ms = util::ToUnixMillis(*scheduled_at);
    result.scheduled_link  = std::move(fresh);
  }
  record.mode = mode;
  ApplyState(record, target, util::ToUnixMillis(now));
  result.session = CommitLocked(*tx, record, from);
  return result;
}

Session SessionManager::ActivateScheduled(const std::string& session_id) {
  SessionLock lock(*this, session_id);

  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  return ActivateLocked(*tx, record);
}

Session SessionManager::ActivateLocked(db::Transaction& tx, db::model::SessionRecord& record) {
  if (record.state == SESSION_STATE_READY_TO_START) {
    tx.Commit();
    return ToProto(record);
  }
  if (record.state != SESSION_STATE_SCHEDULED) {
    ThrowInvalidTransition(record, SESSION_STATE_READY_TO_START);
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());
  if (now_ms < record.scheduled_at_ms) {
    ThrowInvalidTransition(record, SESSION_STATE_READY_TO_START, "scheduled time not reached");
  }

  const auto from = record.state;
  ApplyState(record, SESSION_STATE_READY_TO_START, now_ms);
  return CommitLocked(tx, record, from);
}

// ------------------------------------------------------------------
// Live session
// ------------------------------------------------------------------

Session SessionManager::BeginSession(const std::string& session_id) {
  observability::SpanScope span("SessionManager::BeginSession", session_id);

  SessionLock lock(*this, session_id);

  const auto now    = clock_->Now();
  auto       tx     = repository_->Begin();
  auto       record = Load(*tx, session_id);

  if (model::IsActive(record.state)) {
    tx->Commit();
    return ToProto(record);
  }
  if (record.state != SESSION_STATE_READY_TO_START) {
    ThrowInvalidTransition(record, SESSION_STATE_IN_PROGRESS);
  }

  auto link = repository_->GetLink(*tx, record.link_token);
  if (!link) {
    throw util::NotFound("link not found for session " + session_id);
  }
  if (util::ToUnixMillis(now) >= link->expires_at_ms) {
    ExpireLocked(*tx, record);
    throw util::LinkExpired("link expired");
  }
  link::LinkIssuer::CheckUsable(*link, now);

  link->consumed = true;
  db::ThrowIfDbError(repository_->UpdateLink(*tx, *link), "consume link");

  const auto from = record.state;
  if (record.started_at_ms == 0) {
    record.started_at_ms = util::ToUnixMillis(now);
  }
  ApplyState(record, SESSION_STATE_IN_PROGRESS, util::ToUnixMillis(now));
  auto session = CommitLocked(*tx, record, from);

  NotifyStarted(session);
  return session;
}

Session SessionManager::RequestVerification(verification::CaptureFrame frame) {
  const auto session_id = frame.session_id;

  SessionLock lock(*this, session_id);

  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  if (!model::IsActive(record.state)) {
    ThrowInvalidTransition(record, SESSION_STATE_VERIFYING, "verification needs a live session");
  }

  const auto document_type = frame.document_type;
  auto       previous      = repository_->GetVerification(*tx, session_id, document_type);
  if (previous && previous->registry_status == REGISTRY_STATUS_MATCHED) {
    throw util::InvalidArgument(std::string(model::DocumentName(document_type)) + " is already verified");
  }

  std::weak_ptr<SessionManager> weak = weak_from_this();
  pipeline_->Submit(std::move(frame), [weak](const verification::VerificationReport& report) {
    if (auto self = weak.lock()) {
      self->OnVerificationResult(report);
    }
  });

  auto pending = previous.value_or(db::model::VerificationRecord{});
  pending.session_id      = session_id;
  pending.document_type   = document_type;
  pending.registry_status = REGISTRY_STATUS_PENDING;
  pending.updated_at_ms   = util::ToUnixMillis(clock_->Now());
  db::ThrowIfDbError(repository_->UpsertVerification(*tx, pending), "record pending verification");

  const auto from = record.state;
  ApplyState(record, SESSION_STATE_VERIFYING, util::ToUnixMillis(clock_->Now()));
  return CommitLocked(*tx, record, from);
}

void SessionManager::OnVerificationResult(const verification::VerificationReport& report) {
  const auto& session_id = report.result.session_id();

  SessionLock lock(*this, session_id);

  try {
    auto tx     = repository_->Begin();
    auto record = Load(*tx, session_id);
    if (model::IsTerminal(record.state)) {
      VKYC_LOG_DEBUG("verification result discarded for ended session",
                     {SessionField(session_id), StringField("outcome", verification::OutcomeName(report.outcome))});
      return;
    }

    auto stored          = ToRecord(report.result);
    stored.updated_at_ms = util::ToUnixMillis(clock_->Now());
    db::ThrowIfDbError(repository_->UpsertVerification(*tx, stored), "record verification result");

    const bool unavailable = report.outcome == verification::VerificationOutcome::kUnavailable;
    if (unavailable) {
      record.manual_review = true;
    }
    auto session = CommitLocked(*tx, record, record.state);

    const auto document = model::DocumentName(report.result.document_type());
    switch (report.outcome) {
      case verification::VerificationOutcome::kMismatched:
        NotifyUpdate(session, report);
        FailLocked(session_id, TERMINATION_REASON_REGISTRY_MISMATCH, std::string(document) + " did not match the registry");
        break;
      case verification::VerificationOutcome::kLowConfidence:
        NotifyUpdate(session, report);
        FailLocked(session_id, TERMINATION_REASON_VERIFICATION_FAILED_LOW_CONFIDENCE,
                   std::string(document) + " could not be read with enough confidence");
        break;
      case verification::VerificationOutcome::kOcrError:
        NotifyUpdate(session, report);
        FailLocked(session_id, TERMINATION_REASON_VERIFICATION_FAILED_OCR_ERROR, report.result.detail());
        break;
      case verification::VerificationOutcome::kUnavailable:
        VKYC_LOG_WARN("registry unavailable, session flagged for manual review",
                      {SessionField(session_id), StringField("document_type", document), BoolField("manual_review", true)});
        NotifyUpdate(session, report);
        break;
      default:
        NotifyUpdate(session, report);
        break;
    }
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("verification result not applied", {SessionField(session_id), StringField("error", e.what())});
  }
}

SessionManager::Unmet SessionManager::EvaluateCompletion(db::Transaction& tx, const db::model::SessionRecord& record) const {
  Unmet unmet;
  bool  documents_only = true;

  for (const auto document_type : policy_.required_documents) {
    const auto result = repository_->GetVerification(tx, record.id, document_type);
    if (result && result->registry_status == REGISTRY_STATUS_MATCHED) {
      continue;
    }
    const auto name = std::string(model::DocumentName(document_type));
    if (result && result->registry_status == REGISTRY_STATUS_UNAVAILABLE) {
      unmet.conditions.push_back(name + " registry unavailable");
    } else {
      documents_only = false;
      unmet.conditions.push_back(name + " not verified");
    }
  }

  const auto liveness = biometrics_->Summary(record.id);
  if (liveness.blink_count < policy_.min_blink_count) {
    documents_only = false;
    unmet.conditions.push_back("blink count " + std::to_string(liveness.blink_count) + " below " + std::to_string(policy_.min_blink_count));
  }
  if (policy_.require_head_pose && liveness.head_pose_count == 0) {
    documents_only = false;
    unmet.conditions.push_back("no head pose event");
  }

  unmet.only_unavailable = !unmet.empty() && documents_only;
  return unmet;
}

Session SessionManager::CompleteSession(const std::string& session_id) {
  observability::SpanScope span("SessionManager::CompleteSession", session_id);
  SessionLock lock(*this, session_id);
  return CompleteLocked(session_id);
}

Session SessionManager::CompleteLocked(const std::string& session_id) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  if (record.state == SESSION_STATE_COMPLETED) {
    tx->Commit();
    return ToProto(record);
  }
  if (record.state != SESSION_STATE_VERIFYING) {
    ThrowInvalidTransition(record, SESSION_STATE_COMPLETED);
  }

  const auto unmet = EvaluateCompletion(*tx, record);
  if (!unmet.empty()) {
    ThrowInvalidTransition(record, SESSION_STATE_COMPLETED, Join(unmet.conditions));
  }

  const auto from           = record.state;
  record.termination_reason = TERMINATION_REASON_COMPLETED;
  ApplyState(record, SESSION_STATE_COMPLETED, util::ToUnixMillis(clock_->Now()));
  auto session = CommitLocked(*tx, record, from);

  pipeline_->CancelSession(session_id);
  NotifyEnded(session);
  return session;
}

// ------------------------------------------------------------------
// Termination
// ------------------------------------------------------------------

Session SessionManager::FailSession(const std::string& session_id, TerminationReason reason, const std::string& detail) {
  observability::SpanScope span("SessionManager::FailSession", session_id);
  span.SetAttribute("vkyc.termination_reason", model::ReasonName(reason));
  SessionLock lock(*this, session_id);
  return FailLocked(session_id, reason, detail);
}

Session SessionManager::FailLocked(const std::string& session_id, TerminationReason reason, const std::string& detail) {
  if (reason == TERMINATION_REASON_UNSPECIFIED || reason == TERMINATION_REASON_COMPLETED) {
    throw util::InvalidArgument("a failure reason is required");
  }

  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  if (record.state == SESSION_STATE_FAILED) {
    tx->Commit();
    return ToProto(record);
  }
  RequireTransition(record, SESSION_STATE_FAILED);

  const auto from           = record.state;
  record.termination_reason = reason;
  record.termination_detail = detail;
  ApplyState(record, SESSION_STATE_FAILED, util::ToUnixMillis(clock_->Now()));
  auto session = CommitLocked(*tx, record, from);

  pipeline_->CancelSession(session_id);
  NotifyEnded(session);
  return session;
}

Session SessionManager::ExpireSession(const std::string& session_id) {
  SessionLock lock(*this, session_id);

  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  if (record.state == SESSION_STATE_EXPIRED) {
    tx->Commit();
    return ToProto(record);
  }
  if (!model::IsAwaitingStart(record.state)) {
    ThrowInvalidTransition(record, SESSION_STATE_EXPIRED);
  }

  const auto link = repository_->GetLink(*tx, record.link_token);
  if (link && util::ToUnixMillis(clock_->Now()) < link->expires_at_ms) {
    ThrowInvalidTransition(record, SESSION_STATE_EXPIRED, "link has not expired");
  }
  return ExpireLocked(*tx, record);
}

Session SessionManager::ExpireLocked(db::Transaction& tx, db::model::SessionRecord& record) {
  const auto from           = record.state;
  record.termination_reason = TERMINATION_REASON_LINK_EXPIRED;
  ApplyState(record, SESSION_STATE_EXPIRED, util::ToUnixMillis(clock_->Now()));
  auto session = CommitLocked(tx, record, from);

  pipeline_->CancelSession(record.id);
  NotifyEnded(session);
  return session;
}

// ------------------------------------------------------------------
// Agent assignment
// ------------------------------------------------------------------

std::vector<Session> SessionManager::ListWaitingSessions() const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListSessionsInStates(*tx, {SESSION_STATE_IN_PROGRESS, SESSION_STATE_VERIFYING});
  tx->Commit();

  std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.started_at_ms < b.started_at_ms; });
  std::vector<Session> waiting;
  for (const auto& record : records) {
    if (record.agent_id.empty()) {
      waiting.push_back(ToProto(record));
    }
  }
  return waiting;
}

Session SessionManager::AcceptSession(const std::string& session_id, const std::string& agent_id) {
  observability::SpanScope span("SessionManager::AcceptSession", session_id);
  if (agent_id.empty()) {
    throw util::InvalidArgument("agent_id is required");
  }

  std::lock_guard assign(assign_mutex_);
  SessionLock     lock(*this, session_id);

  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  if (record.agent_id == agent_id && model::IsActive(record.state)) {
    tx->Commit();
    return ToProto(record);
  }
  if (!model::IsActive(record.state)) {
    throw util::InvalidTransition("session " + session_id + " is " + std::string(model::StateName(record.state)) +
                                  ": only a live session can take an agent");
  }
  if (!record.agent_id.empty()) {
    throw util::AgentUnavailable("session " + session_id + " already has an agent");
  }
  for (const auto& other : repository_->ListSessionsInStates(*tx, {SESSION_STATE_IN_PROGRESS, SESSION_STATE_VERIFYING})) {
    if (other.agent_id == agent_id) {
      throw util::AgentUnavailable("agent " + agent_id + " is serving session " + other.id);
    }
  }

  record.agent_id             = agent_id;
  record.agent_assigned_at_ms = util::ToUnixMillis(clock_->Now());
  auto session                = CommitLocked(*tx, record, record.state);

  VKYC_LOG_INFO("agent assigned", {SessionField(session_id), StringField("agent_id", agent_id)});
  NotifyAgentAssigned(session);
  return session;
}

Session SessionManager::DeclineSession(const std::string& session_id, const std::string& agent_id) {
  observability::SpanScope span("SessionManager::DeclineSession", session_id);
  if (agent_id.empty()) {
    throw util::InvalidArgument("agent_id is required");
  }

  SessionLock lock(*this, session_id);
  {
    auto tx     = repository_->Begin();
    auto record = Load(*tx, session_id);
    tx->Commit();
    if (record.state == SESSION_STATE_FAILED && record.termination_reason == TERMINATION_REASON_AGENT_DECLINED) {
      return ToProto(record);
    }
    if (!model::IsActive(record.state)) {
      throw util::InvalidTransition("session " + session_id + " is " + std::string(model::StateName(record.state)) +
                                    ": only a waiting session can be declined");
    }
    if (!record.agent_id.empty()) {
      throw util::AgentUnavailable("session " + session_id + " is already served by an agent");
    }
  }
  return FailLocked(session_id, TERMINATION_REASON_AGENT_DECLINED, "declined by agent " + agent_id);
}

// ------------------------------------------------------------------
// Recording events
// ------------------------------------------------------------------

void SessionManager::OnCapReached(const std::string& session_id) {
  SessionLock lock(*this, session_id);

  try {
    auto tx     = repository_->Begin();
    auto record = Load(*tx, session_id);
    if (model::IsTerminal(record.state)) {
      return;
    }

    const auto unmet = EvaluateCompletion(*tx, record);
    tx->Commit();

    if (unmet.empty() && record.state == SESSION_STATE_VERIFYING) {
      CompleteLocked(session_id);
      return;
    }

    const auto detail = "recording cap reached: " + Join(unmet.conditions);
    if (unmet.only_unavailable) {
      FailLocked(session_id, TERMINATION_REASON_MANUAL_REVIEW_REQUIRED, detail);
    } else {
      FailLocked(session_id, TERMINATION_REASON_VERIFICATION_INCOMPLETE, unmet.empty() ? "recording cap reached" : detail);
    }
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("cap reached not applied", {SessionField(session_id), StringField("error", e.what())});
  }
}

void SessionManager::OnRecordingFailed(const std::string& session_id, const std::string& error, bool during_buffering) {
  if (!during_buffering) {
    VKYC_LOG_ERROR("recording finalize failed, verification outcome kept",
                   {SessionField(session_id), StringField("error", error)});
    return;
  }

  SessionLock lock(*this, session_id);

  try {
    auto tx     = repository_->Begin();
    auto record = Load(*tx, session_id);
    tx->Commit();
    if (model::IsTerminal(record.state)) {
      return;
    }
    FailLocked(session_id, TERMINATION_REASON_RECORDING_FAILURE, error);
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("recording failure not applied", {SessionField(session_id), StringField("error", e.what())});
  }
}

void SessionManager::OnRecordingFinalized(const std::string& session_id, const Recording& recording) {
  VKYC_LOG_INFO("recording stored", {SessionField(session_id), StringField("location", recording.location())});
}

// ------------------------------------------------------------------
// Sweeps and recovery
// ------------------------------------------------------------------

std::size_t SessionManager::SweepExpired() {
  struct Due {
    std::string  session_id;
    SessionState state;
    int64_t      scheduled_at_ms;
    int64_t      link_expires_at_ms;
  };

  std::vector<Due> due;
  {
    auto tx = repository_->Begin();
    for (const auto& record :
         repository_->ListSessionsInStates(*tx, {SESSION_STATE_CREATED, SESSION_STATE_SCHEDULED, SESSION_STATE_READY_TO_START})) {
      const auto link = repository_->GetLink(*tx, record.link_token);
      due.push_back({record.id, record.state, record.scheduled_at_ms, link ? link->expires_at_ms : 0});
    }
    tx->Commit();
  }

  const auto  now_ms  = util::ToUnixMillis(clock_->Now());
  std::size_t changed = 0;
  for (const auto& entry : due) {
    try {
      if (now_ms >= entry.link_expires_at_ms) {
        ExpireSession(entry.session_id);
        ++changed;
      } else if (entry.state == SESSION_STATE_SCHEDULED && now_ms >= entry.scheduled_at_ms) {
        ActivateScheduled(entry.session_id);
        ++changed;
      }
    } catch (const util::TransitionError& e) {
      // The session moved on since the listing.
      VKYC_LOG_DEBUG("sweep skipped session", {SessionField(entry.session_id), StringField("error", e.what())});
    } catch (const std::exception& e) {
      VKYC_LOG_WARN("sweep failed for session", {SessionField(entry.session_id), StringField("error", e.what())});
    }
  }
  return changed;
}

std::size_t SessionManager::RecoverAfterRestart() {
  std::vector<std::string> orphaned;
  {
    auto tx = repository_->Begin();
    for (const auto& record : repository_->ListSessionsInStates(*tx, {SESSION_STATE_IN_PROGRESS, SESSION_STATE_VERIFYING})) {
      orphaned.push_back(record.id);
    }
    tx->Commit();
  }

  for (const auto& session_id : orphaned) {
    FailSession(session_id, TERMINATION_REASON_PROCESS_RESTART, "process restarted during the session");
  }
  if (!orphaned.empty()) {
    VKYC_LOG_WARN("failed sessions orphaned by restart", {observability::IntField("count", static_cast<int64_t>(orphaned.size()))});
  }
  return orphaned.size();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

Session SessionManager::GetSession(const std::string& session_id) const {
  {
    std::shared_lock lock(snapshot_cache_mutex_);
    const auto       it = snapshot_cache_.find(session_id);
    if (it != snapshot_cache_.end()) {
      return it->second;
    }
  }

  // Ended sessions, and live ones not committed since startup, are read
  // from the store.
  auto tx     = repository_->Begin();
  auto record = Load(*tx, session_id);
  tx->Commit();
  return ToProto(record);
}

std::vector<VerificationResult> SessionManager::ListVerificationResults(const std::string& session_id) const {
  auto tx = repository_->Begin();
  Load(*tx, session_id);
  auto records = repository_->ListVerifications(*tx, session_id);
  tx->Commit();

  std::vector<VerificationResult> results;
  results.reserve(records.size());
  for (const auto& record : records) {
    results.push_back(ToProto(record));
  }
  return results;
}

std::vector<BiometricEvent> SessionManager::ListBiometricEvents(const std::string& session_id) const {
  auto tx = repository_->Begin();
  Load(*tx, session_id);
  auto records = repository_->ListBiometricEvents(*tx, session_id);
  tx->Commit();

  std::vector<BiometricEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    BiometricEvent event;
    event.set_session_id(record.session_id);
    event.set_sequence(record.sequence);
    event.set_kind(record.kind);
    event.set_payload_json(record.payload_json);
    *event.mutable_recorded_at() = util::ToProto(util::FromUnixMicros(record.recorded_at_us));
    if (record.client_time_ms != 0) {
      *event.mutable_client_time() = util::ToProto(util::FromUnixMillis(record.client_time_ms));
    }
    events.push_back(std::move(event));
  }
  return events;
}

// ------------------------------------------------------------------
// Observers
// ------------------------------------------------------------------

std::vector<std::shared_ptr<SessionObserver>> SessionManager::Observers() {
  std::lock_guard                               lock(observers_mutex_);
  std::vector<std::shared_ptr<SessionObserver>> live;
  for (const auto& weak : observers_) {
    if (auto observer = weak.lock()) {
      live.push_back(std::move(observer));
    }
  }
  observers_.erase(std::remove_if(observers_.begin(), observers_.end(), [](const auto& weak) { return weak.expired(); }),
                   observers_.end());
  return live;
}

void SessionManager::NotifyStarted(const Session& session) {
  Post({Notice::Kind::kStarted, session, std::nullopt});
}

void SessionManager::NotifyEnded(const Session& session) {
  Post({Notice::Kind::kEnded, session, std::nullopt});
}

void SessionManager::NotifyUpdate(const Session& session, const verification::VerificationReport& report) {
  Post({Notice::Kind::kUpdate, session, report});
}

void SessionManager::NotifyAgentAssigned(const Session& session) {
  Post({Notice::Kind::kAgentAssigned, session, std::nullopt});
}

void SessionManager::Post(Notice notice) {
  const auto      slot = AcquireSlot(notice.session.session_id());
  std::lock_guard lock(slot->outbox_mutex);
  slot->outbox.push_back(std::move(notice));
}

void SessionManager::Dispatch(SessionSlot& slot) {
  {
    std::lock_guard lock(slot.outbox_mutex);
    if (slot.dispatching || slot.outbox.empty()) {
      return;
    }
    slot.dispatching = true;
  }
  for (;;) {
    Notice notice;
    {
      std::lock_guard lock(slot.outbox_mutex);
      if (slot.outbox.empty()) {
        slot.dispatching = false;
        return;
      }
      notice = std::move(slot.outbox.front());
      slot.outbox.pop_front();
    }
    Deliver(notice);
  }
}

void SessionManager::Deliver(const Notice& notice) {
  for (const auto& observer : Observers()) {
    try {
      switch (notice.kind) {
        case Notice::Kind::kStarted:
          observer->OnSessionStarted(notice.session);
          break;
        case Notice::Kind::kEnded:
          observer->OnSessionEnded(notice.session);
          break;
        case Notice::Kind::kUpdate:
          observer->OnVerificationUpdate(notice.session, *notice.report);
          break;
        case Notice::Kind::kAgentAssigned:
          observer->OnAgentAssigned(notice.session);
          break;
      }
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("session observer failed", {SessionField(notice.session.session_id()), StringField("error", e.what())});
    }
  }
}

} // namespace vkyc::core
