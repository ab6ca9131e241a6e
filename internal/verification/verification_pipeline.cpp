#include "verification_pipeline.hpp"

#include <algorithm>
#include <sstream>

#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vkyc::verification {

using namespace vkyc::v1;
using observability::DoubleField;
using observability::IntField;
using observability::SessionField;
using observability::StringField;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

std::string_view RegistryOutcomeName(RegistryOutcome outcome) {
  switch (outcome) {
    case RegistryOutcome::kMatched:
      return "matched";
    case RegistryOutcome::kMismatched:
      return "mismatched";
    case RegistryOutcome::kUnavailable:
      return "unavailable";
    case RegistryOutcome::kTimeout:
      return "timeout";
    case RegistryOutcome::kTransportError:
      return "transport_error";
    case RegistryOutcome::kRejected:
      return "rejected";
  }
  return "unknown";
}

} // namespace

std::string_view OutcomeName(VerificationOutcome outcome) {
  switch (outcome) {
    case VerificationOutcome::kRecaptureRequested:
      return "recapture_requested";
    case VerificationOutcome::kMatched:
      return "matched";
    case VerificationOutcome::kMismatched:
      return "mismatched";
    case VerificationOutcome::kUnavailable:
      return "unavailable";
    case VerificationOutcome::kLowConfidence:
      return "low_confidence";
    case VerificationOutcome::kOcrError:
      return "ocr_error";
  }
  return "unknown";
}

VerificationPipeline::VerificationPipeline(std::shared_ptr<OcrService> ocr, std::shared_ptr<RegistryService> registry,
                                           VerificationPolicy policy)
    : ocr_(std::move(ocr)), registry_(std::move(registry)), policy_(policy) {
  if (!ocr_ || !registry_) {
    throw std::invalid_argument("VerificationPipeline: OCR and registry services are required");
  }
  if (policy_.max_attempts == 0) policy_.max_attempts = 1;
  if (policy_.max_retries == 0) policy_.max_retries = 1;
  if (policy_.worker_threads == 0) policy_.worker_threads = 1;
}

VerificationPipeline::~VerificationPipeline() {
  Stop();
}

void VerificationPipeline::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (std::size_t i = 0; i < policy_.worker_threads; ++i) {
    workers_.emplace_back(&VerificationPipeline::Run, this);
  }
}

void VerificationPipeline::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  backoff_cv_.notify_all();
  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

std::string VerificationPipeline::Key(const std::string& session_id, DocumentType document_type) {
  return session_id + "#" + std::to_string(static_cast<int>(document_type));
}

void VerificationPipeline::Submit(CaptureFrame frame, ReportCallback callback) {
  if (frame.session_id.empty()) {
    throw util::InvalidArgument("frame has no session id");
  }
  if (frame.document_type != DOCUMENT_TYPE_PAN && frame.document_type != DOCUMENT_TYPE_AADHAAR) {
    throw util::InvalidArgument("frame has no supported document type");
  }
  if (frame.image.empty()) {
    throw util::InvalidArgument("frame image is empty");
  }
  if (!running_) {
    throw util::ResourceExhausted("verification pipeline is not running");
  }

  VerificationJob job;
  {
    std::lock_guard lock(mutex_);
    auto&           state = attempts_[Key(frame.session_id, frame.document_type)];
    if (state.in_flight) {
      throw util::VerificationBusy("verification already pending for " + std::string(model::DocumentName(frame.document_type)));
    }
    state.in_flight = true;

    auto& flag = cancel_flags_[frame.session_id];
    if (!flag) {
      flag = std::make_shared<std::atomic<bool>>(false);
    }
    job.cancelled = flag;
  }

  VKYC_LOG_DEBUG("verification frame accepted", {SessionField(frame.session_id),
                                                 StringField("document", model::DocumentName(frame.document_type)),
                                                 IntField("bytes", static_cast<std::int64_t>(frame.image.size()))});

  job.frame    = std::move(frame);
  job.callback = std::move(callback);
  queue_.Enqueue(std::move(job));
}

void VerificationPipeline::CancelSession(const std::string& session_id) {
  {
    std::lock_guard lock(mutex_);
    if (auto it = cancel_flags_.find(session_id); it != cancel_flags_.end()) {
      it->second->store(true);
      cancel_flags_.erase(it);
    }
    const auto prefix = session_id + "#";
    for (auto it = attempts_.begin(); it != attempts_.end();) {
      if (it->first.compare(0, prefix.size(), prefix) == 0) {
        it = attempts_.erase(it);
      } else {
        ++it;
      }
    }
  }
  backoff_cv_.notify_all();
}

void VerificationPipeline::Run() {
  while (auto job = queue_.Dequeue()) {
    bool stopping = false;
    {
      std::lock_guard lock(mutex_);
      stopping = stopping_;
    }
    if (stopping || job->cancelled->load()) {
      Discard(*job);
      continue;
    }

    try {
      Process(*job);
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("verification attempt failed", {SessionField(job->frame.session_id), StringField("error", e.what())});
      Discard(*job);
    }
  }
}

void VerificationPipeline::Process(VerificationJob& job) {
  const auto& frame = job.frame;
  const auto  key   = Key(frame.session_id, frame.document_type);

  uint32_t attempt = 0;
  {
    std::lock_guard lock(mutex_);
    attempt = ++attempts_[key].ocr_attempts;
  }

  OcrResult  ocr;
  const auto started = std::chrono::steady_clock::now();
  try {
    ocr = ocr_->Extract(frame.image, frame.document_type, policy_.ocr_timeout);
  } catch (const std::exception& e) {
    ocr       = OcrResult{};
    ocr.error = e.what();
  }
  observability::Metrics::Instance().ObserveExternalCallMs("ocr", ElapsedMs(started));

  // The raw image is not kept past OCR.
  job.frame.image.clear();
  job.frame.image.shrink_to_fit();

  if (job.cancelled->load()) {
    Discard(job);
    return;
  }

  VerificationReport report;
  auto&              result = report.result;
  result.set_session_id(frame.session_id);
  result.set_document_type(frame.document_type);
  result.set_ocr_attempts(attempt);

  if (!ocr.ok || ocr.confidence < policy_.confidence_threshold) {
    uint32_t errors = 0;
    {
      std::lock_guard lock(mutex_);
      auto&           state = attempts_[key];
      if (!ocr.ok) ++state.ocr_errors;
      errors = state.ocr_errors;
    }

    std::ostringstream detail;
    if (ocr.ok) {
      detail << "ocr confidence " << ocr.confidence << " below threshold " << policy_.confidence_threshold;
      result.set_ocr_confidence(ocr.confidence);
    } else {
      detail << "ocr error: " << ocr.error;
    }
    result.set_detail(detail.str());

    const bool exhausted = attempt >= policy_.max_attempts;
    if (!exhausted) {
      report.outcome = VerificationOutcome::kRecaptureRequested;
    } else {
      report.outcome = errors == attempt ? VerificationOutcome::kOcrError : VerificationOutcome::kLowConfidence;
    }

    VKYC_LOG_INFO("ocr attempt rejected", {SessionField(frame.session_id),
                                           StringField("document", model::DocumentName(frame.document_type)),
                                           IntField("attempt", attempt), DoubleField("confidence", ocr.confidence),
                                           StringField("outcome", OutcomeName(report.outcome))});
    Finish(job, report, exhausted);
    return;
  }

  result.set_ocr_confidence(ocr.confidence);
  result.mutable_fields()->insert(ocr.fields.begin(), ocr.fields.end());

  RunRegistry(job, ocr.fields, &report);
  if (job.cancelled->load()) {
    Discard(job);
    return;
  }
  Finish(job, report, true);
}

void VerificationPipeline::RunRegistry(const VerificationJob& job, const std::map<std::string, std::string>& fields,
                                       VerificationReport* report) {
  const auto& frame   = job.frame;
  auto&       result  = report->result;
  auto        backoff = policy_.initial_backoff;

  RegistryResponse last;
  for (uint32_t call = 1; call <= policy_.max_retries; ++call) {
    if (job.cancelled->load()) {
      return;
    }

    const auto started = std::chrono::steady_clock::now();
    try {
      last = registry_->Verify(fields, frame.document_type, policy_.registry_timeout);
    } catch (const std::exception& e) {
      last = RegistryResponse{RegistryOutcome::kTransportError, e.what()};
    }
    observability::Metrics::Instance().ObserveExternalCallMs("registry", ElapsedMs(started));
    result.set_registry_attempts(call);

    if (last.outcome == RegistryOutcome::kMatched) {
      report->outcome = VerificationOutcome::kMatched;
      result.set_registry_status(REGISTRY_STATUS_MATCHED);
      result.set_detail(last.message);
      return;
    }
    if (last.outcome == RegistryOutcome::kMismatched) {
      report->outcome = VerificationOutcome::kMismatched;
      result.set_registry_status(REGISTRY_STATUS_MISMATCHED);
      result.set_detail(last.message);
      return;
    }
    if (last.outcome == RegistryOutcome::kRejected) {
      VKYC_LOG_ERROR("registry rejected the request", {SessionField(frame.session_id),
                                                       StringField("document", model::DocumentName(frame.document_type)),
                                                       StringField("message", last.message)});
      report->outcome = VerificationOutcome::kUnavailable;
      result.set_registry_status(REGISTRY_STATUS_UNAVAILABLE);
      result.set_detail("registry rejected the request: " + last.message);
      observability::Metrics::Instance().RecordRegistryUnavailable(model::DocumentName(frame.document_type));
      return;
    }

    VKYC_LOG_WARN("registry call failed", {SessionField(frame.session_id),
                                           StringField("document", model::DocumentName(frame.document_type)), IntField("call", call),
                                           StringField("outcome", RegistryOutcomeName(last.outcome)), StringField("message", last.message)});

    if (call < policy_.max_retries) {
      if (!WaitBackoff(backoff, *job.cancelled)) {
        return;
      }
      backoff = std::min(backoff * 2, policy_.max_backoff);
    }
  }

  report->outcome = VerificationOutcome::kUnavailable;
  result.set_registry_status(REGISTRY_STATUS_UNAVAILABLE);
  result.set_detail("registry unavailable after " + std::to_string(policy_.max_retries) + " calls: " + last.message);
  observability::Metrics::Instance().RecordRegistryUnavailable(model::DocumentName(frame.document_type));
}

bool VerificationPipeline::WaitBackoff(std::chrono::milliseconds delay, const std::atomic<bool>& cancelled) {
  std::unique_lock lock(mutex_);
  const bool       interrupted = backoff_cv_.wait_for(lock, delay, [&] { return stopping_ || cancelled.load(); });
  return !interrupted;
}

// The pair stays in flight until the report is applied, so a resubmission
// cannot be overtaken by this older result.
void VerificationPipeline::Finish(const VerificationJob& job, const VerificationReport& report, bool reset_attempts) {
  if (!job.cancelled->load() && job.callback) {
    try {
      job.callback(report);
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("verification report handler failed", {SessionField(job.frame.session_id), StringField("error", e.what())});
    }
  }

  std::lock_guard lock(mutex_);
  if (auto it = attempts_.find(Key(job.frame.session_id, job.frame.document_type)); it != attempts_.end()) {
    it->second.in_flight = false;
    if (reset_attempts) {
      attempts_.erase(it);
    }
  }
}

void VerificationPipeline::Discard(const VerificationJob& job) {
  std::lock_guard lock(mutex_);
  if (auto it = attempts_.find(Key(job.frame.session_id, job.frame.document_type)); it != attempts_.end()) {
    it->second.in_flight = false;
  }
}

} // namespace vkyc::verification
