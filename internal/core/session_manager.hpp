#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/recording/recording_events.hpp"
#include "internal/util/time.hpp"
#include "internal/verification/types.hpp"
#include "session_observer.hpp"
#include "vkyc/v1.hpp"

namespace vkyc::link {
class LinkIssuer;
}
namespace vkyc::biometrics {
class BiometricLogger;
}
namespace vkyc::verification {
class VerificationPipeline;
}

namespace vkyc::core {

struct SessionPolicy {
  std::vector<vkyc::v1::DocumentType> required_documents{vkyc::v1::DOCUMENT_TYPE_PAN, vkyc::v1::DOCUMENT_TYPE_AADHAAR};
  uint32_t                            min_blink_count{1};
  bool                                require_head_pose{true};
};

struct ChooseModeResult {
  vkyc::v1::Session                         session;
  std::optional<vkyc::v1::VerificationLink> scheduled_link;
};

/*
  Session state machine.

  Every mutation of a session runs under that session's mutex and commits
  through the repository with a compare-and-set on version. Notifications
  are queued under the mutex and delivered once it is released, one session
  at a time and in commit order, so a slow observer never holds up the
  session's next operation.

  Reads of live sessions are served from a snapshot cache refreshed on every
  commit and never take a session mutex. A session leaves the cache once
  it reaches a terminal state; a session mutex lives only while in use.
*/
class SessionManager final : public recording::RecordingEvents, public std::enable_shared_from_this<SessionManager> {
 public:
  SessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<link::LinkIssuer> links,
                 std::shared_ptr<biometrics::BiometricLogger> biometrics, std::shared_ptr<verification::VerificationPipeline> pipeline,
                 std::shared_ptr<util::TimeSource> clock, SessionPolicy policy);

  SessionManager(const SessionManager&)            = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  void AddObserver(std::weak_ptr<SessionObserver> observer);

  vkyc::v1::Session CreateSession(const std::string& token);
  ChooseModeResult  ChooseMode(const std::string& session_id, vkyc::v1::SessionMode mode, std::optional<util::TimePoint> scheduled_at);
  vkyc::v1::Session ActivateScheduled(const std::string& session_id);
  vkyc::v1::Session BeginSession(const std::string& session_id);
  vkyc::v1::Session RequestVerification(verification::CaptureFrame frame);
  vkyc::v1::Session CompleteSession(const std::string& session_id);
  vkyc::v1::Session FailSession(const std::string& session_id, vkyc::v1::TerminationReason reason, const std::string& detail = {});
  vkyc::v1::Session ExpireSession(const std::string& session_id);

  // Live sessions no agent has accepted yet, oldest start first.
  std::vector<vkyc::v1::Session> ListWaitingSessions() const;

  // Binds the agent to a live session. A session takes one agent and an
  // agent serves one live session at a time; AgentUnavailable otherwise.
  vkyc::v1::Session AcceptSession(const std::string& session_id, const std::string& agent_id);

  // Ends a waiting session the agent turned down.
  vkyc::v1::Session DeclineSession(const std::string& session_id, const std::string& agent_id);

  vkyc::v1::Session                            GetSession(const std::string& session_id) const;
  std::vector<vkyc::v1::VerificationResult>    ListVerificationResults(const std::string& session_id) const;
  std::vector<vkyc::v1::BiometricEvent>        ListBiometricEvents(const std::string& session_id) const;

  // Scheduler tick: activates due scheduled sessions and expires sessions
  // whose link lapsed before they began. Returns the number changed.
  std::size_t SweepExpired();

  // Fails sessions a previous process left in-progress or verifying.
  std::size_t RecoverAfterRestart();

  // Pipeline completion callback.
  void OnVerificationResult(const verification::VerificationReport& report);

  void OnCapReached(const std::string& session_id) override;
  void OnRecordingFailed(const std::string& session_id, const std::string& error, bool during_buffering) override;
  void OnRecordingFinalized(const std::string& session_id, const vkyc::v1::Recording& recording) override;

  const SessionPolicy& Policy() const {
    return policy_;
  }

  // Cached snapshots plus session slots in use.
  std::size_t TrackedSessions();

 private:
  struct Unmet {
    std::vector<std::string> conditions;
    // Every unmet condition is a document whose registry was unavailable.
    bool only_unavailable = false;

    bool empty() const {
      return conditions.empty();
    }
  };

  struct Notice {
    enum class Kind { kStarted, kEnded, kUpdate, kAgentAssigned };

    Kind                                            kind = Kind::kStarted;
    vkyc::v1::Session                               session;
    std::optional<verification::VerificationReport> report;
  };

  struct SessionSlot {
    std::mutex         mutex;
    std::mutex         outbox_mutex;
    std::deque<Notice> outbox;
    bool               dispatching = false;
  };

  // Holds one session's mutex. On release, delivers the notices queued
  // meanwhile and drops the slot unless another caller holds it.
  class SessionLock {
   public:
    SessionLock(SessionManager& manager, const std::string& session_id);
    ~SessionLock();

    SessionLock(const SessionLock&)            = delete;
    SessionLock& operator=(const SessionLock&) = delete;

   private:
    SessionManager&              manager_;
    std::string                  session_id_;
    std::shared_ptr<SessionSlot> slot_;
    std::unique_lock<std::mutex> lock_;
  };

  std::shared_ptr<SessionSlot> AcquireSlot(const std::string& session_id);
  void                         ReleaseSlot(const std::string& session_id, const std::shared_ptr<SessionSlot>& slot);
  void                         Post(Notice notice);
  void                         Dispatch(SessionSlot& slot);
  void                         Deliver(const Notice& notice);

  db::model::SessionRecord Load(db::Transaction& tx, const std::string& session_id) const;

  // Caller holds the session mutex. Bumps the version, writes with CAS and
  // commits tx.
  vkyc::v1::Session CommitLocked(db::Transaction& tx, db::model::SessionRecord& record, vkyc::v1::SessionState from);

  // Caller holds the session mutex.
  vkyc::v1::Session FailLocked(const std::string& session_id, vkyc::v1::TerminationReason reason, const std::string& detail);
  vkyc::v1::Session CompleteLocked(const std::string& session_id);
  vkyc::v1::Session ExpireLocked(db::Transaction& tx, db::model::SessionRecord& record);
  vkyc::v1::Session ActivateLocked(db::Transaction& tx, db::model::SessionRecord& record);

  Unmet EvaluateCompletion(db::Transaction& tx, const db::model::SessionRecord& record) const;

  void CacheSnapshot(const vkyc::v1::Session& session);

  // Queue a notice; caller holds the session mutex.
  void NotifyStarted(const vkyc::v1::Session& session);
  void NotifyEnded(const vkyc::v1::Session& session);
  void NotifyUpdate(const vkyc::v1::Session& session, const verification::VerificationReport& report);
  void NotifyAgentAssigned(const vkyc::v1::Session& session);
  std::vector<std::shared_ptr<SessionObserver>> Observers();

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<link::LinkIssuer>                   links_;
  std::shared_ptr<biometrics::BiometricLogger>        biometrics_;
  std::shared_ptr<verification::VerificationPipeline> pipeline_;
  std::shared_ptr<util::TimeSource>                   clock_;
  SessionPolicy                                       policy_;

  // Serializes AcceptSession across sessions.
  std::mutex assign_mutex_;

  std::mutex                                   observers_mutex_;
  std::vector<std::weak_ptr<SessionObserver>>  observers_;

  mutable std::shared_mutex                                snapshot_cache_mutex_;
  mutable std::unordered_map<std::string, vkyc::v1::Session> snapshot_cache_;

  std::mutex                                                    slots_guard_;
  std::unordered_map<std::string, std::shared_ptr<SessionSlot>> slots_;
};

// Stored verification row <-> wire result.
vkyc::v1::VerificationResult    ToProto(const db::model::VerificationRecord& record);
db::model::VerificationRecord   ToRecord(const vkyc::v1::VerificationResult& result);
vkyc::v1::Session               ToProto(const db::model::SessionRecord& record);

} // namespace vkyc::core
