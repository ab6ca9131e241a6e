#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "ocr_service.hpp"
#include "registry_service.hpp"
#include "verification_queue.hpp"

namespace vkyc::verification {

/*
  OCR then registry verification per (session, document type).

  Guarantees:
    - at most one attempt in flight per (session, document type)
    - registry calls for a pair are strictly sequential
    - a mismatch is never retried
    - results of cancelled sessions are discarded, never reported

  External calls run on the worker threads; Submit only enqueues.
*/
class VerificationPipeline {
 public:
  VerificationPipeline(std::shared_ptr<OcrService> ocr, std::shared_ptr<RegistryService> registry, VerificationPolicy policy);
  ~VerificationPipeline();

  VerificationPipeline(const VerificationPipeline&)            = delete;
  VerificationPipeline& operator=(const VerificationPipeline&) = delete;

  void Start();
  void Stop();

  // Throws VerificationBusy if the pair already has an attempt in flight,
  // InvalidArgument for an empty or untyped frame.
  void Submit(CaptureFrame frame, ReportCallback callback);

  // Cooperative: in-flight calls finish, their results are dropped.
  void CancelSession(const std::string& session_id);

  const VerificationPolicy& Policy() const {
    return policy_;
  }

 private:
  struct AttemptState {
    uint32_t ocr_attempts = 0;
    uint32_t ocr_errors   = 0;
    bool     in_flight    = false;
  };

  static std::string Key(const std::string& session_id, vkyc::v1::DocumentType document_type);

  void Run();
  void Process(VerificationJob& job);
  void RunRegistry(const VerificationJob& job, const std::map<std::string, std::string>& fields, VerificationReport* report);
  bool WaitBackoff(std::chrono::milliseconds delay, const std::atomic<bool>& cancelled);
  void Finish(const VerificationJob& job, const VerificationReport& report, bool reset_attempts);
  void Discard(const VerificationJob& job);

  std::shared_ptr<OcrService>      ocr_;
  std::shared_ptr<RegistryService> registry_;
  VerificationPolicy               policy_;

  mutable std::mutex                                                  mutex_;
  std::condition_variable                                             backoff_cv_;
  std::unordered_map<std::string, AttemptState>                       attempts_;
  std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> cancel_flags_;
  bool                                                                stopping_ = false;

  VerificationQueue        queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace vkyc::verification
