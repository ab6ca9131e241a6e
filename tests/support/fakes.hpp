#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/biometrics/biometric_logger.hpp"
#include "internal/biometrics/biometric_sink.hpp"
#include "internal/core/session_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/link/link_issuer.hpp"
#include "internal/recording/compressor.hpp"
#include "internal/signaling/peer_sink.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/verification/ocr_service.hpp"
#include "internal/verification/registry_service.hpp"
#include "internal/verification/verification_pipeline.hpp"

namespace vkyc::testing {

// Polls until pred holds or the timeout elapses.
inline bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

// Repeats fn while the previous attempt for the same document is still being
// reported.
inline bool RetryWhileBusy(const std::function<void()>& fn) {
  return WaitFor([&] {
    try {
      fn();
      return true;
    } catch (const util::VerificationBusy&) {
      return false;
    }
  });
}

// Replays scripted OCR results; repeats the last one when the script runs out.
class ScriptedOcr final : public verification::OcrService {
 public:
  void Push(verification::OcrResult result) {
    std::lock_guard lock(mutex_);
    script_.push_back(std::move(result));
  }

  verification::OcrResult Extract(const std::string&, vkyc::v1::DocumentType, std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    if (script_.empty()) {
      return Confident();
    }
    auto result = script_.front();
    if (script_.size() > 1) script_.pop_front();
    return result;
  }

  int Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  static verification::OcrResult Confident(double confidence = 0.95) {
    verification::OcrResult result;
    result.ok         = true;
    result.confidence = confidence;
    result.fields     = {{"name", "A KUMAR"}, {"number", "ABCDE1234F"}};
    return result;
  }

  static verification::OcrResult Failed(const std::string& error) {
    verification::OcrResult result;
    result.error = error;
    return result;
  }

 private:
  mutable std::mutex                  mutex_;
  std::deque<verification::OcrResult> script_;
  int                                 calls_ = 0;
};

// Replays scripted registry outcomes and tracks concurrent calls.
class ScriptedRegistry final : public verification::RegistryService {
 public:
  void Push(verification::RegistryOutcome outcome) {
    std::lock_guard lock(mutex_);
    script_.push_back(outcome);
  }

  void SetDelay(std::chrono::milliseconds delay) {
    delay_ = delay;
  }

  verification::RegistryResponse Verify(const std::map<std::string, std::string>&, vkyc::v1::DocumentType,
                                        std::chrono::milliseconds) override {
    const int now_in_flight = ++in_flight_;
    int       seen          = max_in_flight_.load();
    while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
    }
    if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

    verification::RegistryOutcome outcome = verification::RegistryOutcome::kMatched;
    {
      std::lock_guard lock(mutex_);
      ++calls_;
      if (!script_.empty()) {
        outcome = script_.front();
        if (script_.size() > 1) script_.pop_front();
      }
    }
    --in_flight_;
    return {outcome, "scripted"};
  }

  int Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  int MaxInFlight() const {
    return max_in_flight_.load();
  }

 private:
  mutable std::mutex                        mutex_;
  std::deque<verification::RegistryOutcome> script_;
  int                                       calls_ = 0;
  std::chrono::milliseconds                 delay_{0};
  std::atomic<int>                          in_flight_{0};
  std::atomic<int>                          max_in_flight_{0};
};

// Captures every envelope sent to one peer.
class CapturingSink final : public signaling::PeerSink {
 public:
  bool Send(const vkyc::v1::SignalEnvelope& envelope) override {
    std::lock_guard lock(mutex_);
    if (broken_) return false;
    received_.push_back(envelope);
    return true;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

  void Break() {
    std::lock_guard lock(mutex_);
    broken_ = true;
  }

  std::vector<vkyc::v1::SignalEnvelope> Received() const {
    std::lock_guard lock(mutex_);
    return received_;
  }

  std::size_t CountNotices(vkyc::v1::NoticeKind kind) const {
    std::lock_guard lock(mutex_);
    std::size_t     count = 0;
    for (const auto& envelope : received_) {
      if (envelope.has_notice() && envelope.notice().kind() == kind) ++count;
    }
    return count;
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex                    mutex_;
  std::vector<vkyc::v1::SignalEnvelope> received_;
  bool                                  broken_ = false;
  bool                                  closed_ = false;
};

// Biometric sink that can be switched into an outage.
// Blocks every Send until released, like a peer that stopped reading.
class StallingSink final : public signaling::PeerSink {
 public:
  bool Send(const vkyc::v1::SignalEnvelope& envelope) override {
    std::unique_lock lock(mutex_);
    ++waiting_;
    cv_.wait(lock, [&] { return released_; });
    --waiting_;
    received_.push_back(envelope);
    return true;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

  void Release() {
    {
      std::lock_guard lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

  bool Stalled() const {
    std::lock_guard lock(mutex_);
    return waiting_ > 0;
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::vector<vkyc::v1::SignalEnvelope> Received() const {
    std::lock_guard lock(mutex_);
    return received_;
  }

 private:
  mutable std::mutex                    mutex_;
  std::condition_variable               cv_;
  std::vector<vkyc::v1::SignalEnvelope> received_;
  int                                   waiting_  = 0;
  bool                                  released_ = false;
  bool                                  closed_   = false;
};

class SwitchableBiometricSink final : public biometrics::BiometricSink {
 public:
  db::Result Write(const std::vector<db::model::BiometricEventRecord>& events) override {
    std::lock_guard lock(mutex_);
    if (down_) return db::Result::Err(db::ErrorCode::IOError, "sink down");
    written_.insert(written_.end(), events.begin(), events.end());
    return db::Result::Ok();
  }

  void SetDown(bool down) {
    std::lock_guard lock(mutex_);
    down_ = down;
  }

  std::vector<db::model::BiometricEventRecord> Written() const {
    std::lock_guard lock(mutex_);
    return written_;
  }

 private:
  mutable std::mutex                           mutex_;
  std::vector<db::model::BiometricEventRecord> written_;
  bool                                         down_ = false;
};

class InMemoryArtifactStore final : public storage::ArtifactStore {
 public:
  std::string Put(const std::string& name, const std::shared_ptr<arrow::Buffer>& data) override {
    std::lock_guard lock(mutex_);
    objects_[name] = data->ToString();
    return "mem://" + name;
  }

  std::map<std::string, std::string> Objects() const {
    std::lock_guard lock(mutex_);
    return objects_;
  }

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> objects_;
};

// Identity compressor that can be told to fail.
class FakeCompressor final : public recording::Compressor {
 public:
  std::shared_ptr<arrow::Buffer> Compress(const std::shared_ptr<arrow::Buffer>& input) override {
    if (fail_) throw std::runtime_error("codec failure");
    return input;
  }

  std::string Extension() const override {
    return ".raw";
  }

  void SetFail(bool fail) {
    fail_ = fail;
  }

 private:
  std::atomic<bool> fail_{false};
};

// Records every lifecycle notification it receives.
class RecordingObserver final : public core::SessionObserver {
 public:
  void OnSessionStarted(const vkyc::v1::Session& session) override {
    std::lock_guard lock(mutex_);
    started_.push_back(session.session_id());
  }

  void OnSessionEnded(const vkyc::v1::Session& session) override {
    std::lock_guard lock(mutex_);
    ended_.push_back(session);
  }

  void OnVerificationUpdate(const vkyc::v1::Session&, const verification::VerificationReport& report) override {
    std::lock_guard lock(mutex_);
    updates_.push_back(report.outcome);
  }

  std::size_t StartedCount() const {
    std::lock_guard lock(mutex_);
    return started_.size();
  }

  std::vector<vkyc::v1::Session> Ended() const {
    std::lock_guard lock(mutex_);
    return ended_;
  }

  std::vector<verification::VerificationOutcome> Updates() const {
    std::lock_guard lock(mutex_);
    return updates_;
  }

 private:
  mutable std::mutex                             mutex_;
  std::vector<std::string>                       started_;
  std::vector<vkyc::v1::Session>                 ended_;
  std::vector<verification::VerificationOutcome> updates_;
};

inline verification::VerificationPolicy FastVerificationPolicy() {
  verification::VerificationPolicy policy;
  policy.confidence_threshold = 0.6;
  policy.max_attempts         = 3;
  policy.max_retries          = 3;
  policy.initial_backoff      = std::chrono::milliseconds(1);
  policy.max_backoff          = std::chrono::milliseconds(4);
  policy.worker_threads       = 2;
  return policy;
}

/*
  Session stack over the memory repository with a manual clock.
*/
struct SessionHarness {
  std::shared_ptr<util::ManualTimeSource>             clock;
  std::shared_ptr<db::memory::MemoryRepository>       repository;
  std::shared_ptr<link::LinkIssuer>                   links;
  std::shared_ptr<SwitchableBiometricSink>            biometric_sink;
  std::shared_ptr<biometrics::BiometricLogger>        biometrics;
  std::shared_ptr<ScriptedOcr>                        ocr;
  std::shared_ptr<ScriptedRegistry>                   registry;
  std::shared_ptr<verification::VerificationPipeline> pipeline;
  std::shared_ptr<core::SessionManager>               sessions;
  std::shared_ptr<RecordingObserver>                  observer;

  explicit SessionHarness(verification::VerificationPolicy verification = FastVerificationPolicy(),
                          core::SessionPolicy              policy       = core::SessionPolicy{}) {
    clock          = std::make_shared<util::ManualTimeSource>(util::FromUnixMillis(1'700'000'000'000));
    repository     = std::make_shared<db::memory::MemoryRepository>();
    links          = std::make_shared<link::LinkIssuer>(repository, clock, link::LinkPolicy{});
    biometric_sink = std::make_shared<SwitchableBiometricSink>();
    biometrics     = std::make_shared<biometrics::BiometricLogger>(biometric_sink, clock, biometrics::BiometricPolicy{});
    ocr            = std::make_shared<ScriptedOcr>();
    registry       = std::make_shared<ScriptedRegistry>();
    pipeline       = std::make_shared<verification::VerificationPipeline>(ocr, registry, verification);
    sessions       = std::make_shared<core::SessionManager>(repository, links, biometrics, pipeline, clock, std::move(policy));
    observer       = std::make_shared<RecordingObserver>();
    sessions->AddObserver(observer);
    sessions->AddObserver(biometrics);
    pipeline->Start();
  }

  ~SessionHarness() {
    pipeline->Stop();
  }

  // Issues a link and drives a fresh session to in-progress.
  vkyc::v1::Session StartImmediate(const std::string& customer_id = "cust-1") {
    const auto link    = links->Issue(customer_id);
    const auto created = sessions->CreateSession(link.token());
    sessions->ChooseMode(created.session_id(), vkyc::v1::SESSION_MODE_IMMEDIATE, std::nullopt);
    return sessions->BeginSession(created.session_id());
  }

  verification::CaptureFrame Frame(const std::string& session_id, vkyc::v1::DocumentType document_type) const {
    verification::CaptureFrame frame;
    frame.session_id    = session_id;
    frame.document_type = document_type;
    frame.image         = "jpeg-bytes";
    frame.captured_at   = clock->Now();
    return frame;
  }

  void RecordLiveness(const std::string& session_id) {
    biometrics->Append(session_id, vkyc::v1::BIOMETRIC_KIND_BLINK, "{}", 0);
    biometrics->Append(session_id, vkyc::v1::BIOMETRIC_KIND_HEAD_POSE, R"({"yaw":12.5})", 0);
  }

  vkyc::v1::RegistryStatus StatusOf(const std::string& session_id, vkyc::v1::DocumentType document_type) const {
    for (const auto& result : sessions->ListVerificationResults(session_id)) {
      if (result.document_type() == document_type) return result.registry_status();
    }
    return vkyc::v1::REGISTRY_STATUS_UNSPECIFIED;
  }

  bool WaitForStatus(const std::string& session_id, vkyc::v1::DocumentType document_type, vkyc::v1::RegistryStatus status) const {
    return WaitFor([&] { return StatusOf(session_id, document_type) == status; });
  }

  bool WaitForState(const std::string& session_id, vkyc::v1::SessionState state) const {
    return WaitFor([&] { return sessions->GetSession(session_id).state() == state; });
  }
};

} // namespace vkyc::testing
