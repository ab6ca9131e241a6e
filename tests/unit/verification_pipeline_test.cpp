#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/verification/verification_pipeline.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using namespace vkyc::v1;
using vkyc::testing::RetryWhileBusy;
using vkyc::testing::ScriptedOcr;
using vkyc::testing::ScriptedRegistry;
using vkyc::testing::WaitFor;
using vkyc::verification::CaptureFrame;
using vkyc::verification::RegistryOutcome;
using vkyc::verification::VerificationOutcome;
using vkyc::verification::VerificationPipeline;
using vkyc::verification::VerificationReport;

struct Reports {
  std::mutex                      mutex;
  std::vector<VerificationReport> all;

  vkyc::verification::ReportCallback Callback() {
    return [this](const VerificationReport& report) {
      std::lock_guard lock(mutex);
      all.push_back(report);
    };
  }

  std::size_t Size() {
    std::lock_guard lock(mutex);
    return all.size();
  }

  VerificationReport At(std::size_t i) {
    std::lock_guard lock(mutex);
    return all.at(i);
  }
};

struct Fixture {
  Reports                           reports;
  std::shared_ptr<ScriptedOcr>      ocr      = std::make_shared<ScriptedOcr>();
  std::shared_ptr<ScriptedRegistry> registry = std::make_shared<ScriptedRegistry>();
  VerificationPipeline              pipeline;

  explicit Fixture(vkyc::verification::VerificationPolicy policy = vkyc::testing::FastVerificationPolicy())
      : pipeline(ocr, registry, policy) {
    pipeline.Start();
  }

  void Submit(const std::string& session_id, DocumentType document_type) {
    CaptureFrame frame;
    frame.session_id    = session_id;
    frame.document_type = document_type;
    frame.image         = "image";
    pipeline.Submit(std::move(frame), reports.Callback());
  }
};

void TestMatchedOnFirstCall() {
  Fixture f;
  f.Submit("s1", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));

  const auto report = f.reports.At(0);
  assert(report.outcome == VerificationOutcome::kMatched);
  assert(report.result.registry_status() == REGISTRY_STATUS_MATCHED);
  assert(report.result.registry_attempts() == 1);
  assert(report.result.ocr_attempts() == 1);
  assert(report.result.fields().at("name") == "A KUMAR");
}

void TestOneAttemptInFlightPerDocument() {
  Fixture f;
  f.registry->SetDelay(150ms);
  f.Submit("s1", DOCUMENT_TYPE_PAN);

  bool busy = false;
  try {
    f.Submit("s1", DOCUMENT_TYPE_PAN);
  } catch (const vkyc::util::VerificationBusy&) {
    busy = true;
  }
  assert(busy);

  // Other documents and sessions are independent.
  f.Submit("s1", DOCUMENT_TYPE_AADHAAR);
  f.Submit("s2", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 3; }));

  // Done: the pair accepts a new frame again.
  assert(RetryWhileBusy([&] { f.Submit("s1", DOCUMENT_TYPE_PAN); }));
  assert(WaitFor([&] { return f.reports.Size() == 4; }));
}

void TestMismatchIsNeverRetried() {
  Fixture f;
  f.registry->Push(RegistryOutcome::kMismatched);
  f.Submit("s1", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));

  assert(f.reports.At(0).outcome == VerificationOutcome::kMismatched);
  assert(f.reports.At(0).result.registry_status() == REGISTRY_STATUS_MISMATCHED);
  assert(f.registry->Calls() == 1);
}

void TestTransientFailureIsRetriedWithBackoff() {
  Fixture f;
  f.registry->Push(RegistryOutcome::kUnavailable);
  f.registry->Push(RegistryOutcome::kTransportError);
  f.registry->Push(RegistryOutcome::kMatched);
  f.Submit("s1", DOCUMENT_TYPE_AADHAAR);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));

  assert(f.reports.At(0).outcome == VerificationOutcome::kMatched);
  assert(f.reports.At(0).result.registry_attempts() == 3);
  assert(f.registry->Calls() == 3);
  assert(f.registry->MaxInFlight() == 1);
}

void TestExhaustedRetriesReportUnavailable() {
  Fixture f;
  f.registry->Push(RegistryOutcome::kTimeout);
  f.Submit("s1", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));

  assert(f.reports.At(0).outcome == VerificationOutcome::kUnavailable);
  assert(f.reports.At(0).result.registry_status() == REGISTRY_STATUS_UNAVAILABLE);
  assert(f.registry->Calls() == 3);
}

void TestRejectedRequestIsNotRetried() {
  Fixture f;
  f.registry->Push(RegistryOutcome::kRejected);
  f.Submit("s1", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));

  assert(f.reports.At(0).outcome == VerificationOutcome::kUnavailable);
  assert(f.reports.At(0).result.registry_status() == REGISTRY_STATUS_UNAVAILABLE);
  assert(f.reports.At(0).result.registry_attempts() == 1);
  assert(f.registry->Calls() == 1);
}

void TestPairStaysBusyWhileReportIsApplied() {
  Fixture f;
  bool    busy_during_report = false;

  CaptureFrame frame;
  frame.session_id    = "s1";
  frame.document_type = DOCUMENT_TYPE_PAN;
  frame.image         = "image";
  auto callback       = f.reports.Callback();
  f.pipeline.Submit(frame, [&, callback](const VerificationReport& report) {
    try {
      f.pipeline.Submit(frame, callback);
    } catch (const vkyc::util::VerificationBusy&) {
      busy_during_report = true;
    }
    callback(report);
  });
  assert(WaitFor([&] { return f.reports.Size() == 1; }));
  assert(busy_during_report);

  // Once applied, the pair takes a new frame.
  assert(RetryWhileBusy([&] { f.Submit("s1", DOCUMENT_TYPE_PAN); }));
  assert(WaitFor([&] { return f.reports.Size() == 2; }));
}

void TestLowConfidenceRequestsRecaptureUntilExhausted() {
  Fixture f;
  f.ocr->Push(ScriptedOcr::Confident(0.59));

  for (std::size_t attempt = 1; attempt <= 3; ++attempt) {
    assert(RetryWhileBusy([&] { f.Submit("s1", DOCUMENT_TYPE_PAN); }));
    assert(WaitFor([&] { return f.reports.Size() == attempt; }));
  }
  assert(f.reports.At(0).outcome == VerificationOutcome::kRecaptureRequested);
  assert(f.reports.At(1).outcome == VerificationOutcome::kRecaptureRequested);
  assert(f.reports.At(2).outcome == VerificationOutcome::kLowConfidence);
  assert(f.reports.At(2).result.ocr_attempts() == 3);
  assert(f.registry->Calls() == 0);

  // A fresh cycle starts after the terminal report.
  assert(RetryWhileBusy([&] { f.Submit("s1", DOCUMENT_TYPE_PAN); }));
  assert(WaitFor([&] { return f.reports.Size() == 4; }));
  assert(f.reports.At(3).outcome == VerificationOutcome::kRecaptureRequested);
  assert(f.reports.At(3).result.ocr_attempts() == 1);
}

void TestOcrErrorsAreReportedAsOcrError() {
  auto policy         = vkyc::testing::FastVerificationPolicy();
  policy.max_attempts = 2;
  Fixture f(policy);
  f.ocr->Push(ScriptedOcr::Failed("OCR API error: HTTP 500"));

  f.Submit("s1", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));
  assert(RetryWhileBusy([&] { f.Submit("s1", DOCUMENT_TYPE_PAN); }));
  assert(WaitFor([&] { return f.reports.Size() == 2; }));

  assert(f.reports.At(1).outcome == VerificationOutcome::kOcrError);
  assert(f.reports.At(1).result.detail().find("HTTP 500") != std::string::npos);
}

void TestCancelledSessionResultsAreDiscarded() {
  Fixture f;
  f.registry->SetDelay(100ms);
  f.Submit("s1", DOCUMENT_TYPE_PAN);
  std::this_thread::sleep_for(20ms);
  f.pipeline.CancelSession("s1");

  std::this_thread::sleep_for(300ms);
  assert(f.reports.Size() == 0);

  f.Submit("s1", DOCUMENT_TYPE_PAN);
  assert(WaitFor([&] { return f.reports.Size() == 1; }));
}

void TestInvalidFramesAreRejected() {
  Fixture      f;
  CaptureFrame frame;
  frame.session_id    = "s1";
  frame.document_type = DOCUMENT_TYPE_UNSPECIFIED;
  frame.image         = "image";

  bool rejected = false;
  try {
    f.pipeline.Submit(frame, f.reports.Callback());
  } catch (const vkyc::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);

  frame.document_type = DOCUMENT_TYPE_PAN;
  frame.image.clear();
  rejected = false;
  try {
    f.pipeline.Submit(frame, f.reports.Callback());
  } catch (const vkyc::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestMatchedOnFirstCall();
  TestOneAttemptInFlightPerDocument();
  TestMismatchIsNeverRetried();
  TestTransientFailureIsRetriedWithBackoff();
  TestExhaustedRetriesReportUnavailable();
  TestRejectedRequestIsNotRetried();
  TestPairStaysBusyWhileReportIsApplied();
  TestLowConfidenceRequestsRecaptureUntilExhausted();
  TestOcrErrorsAreReportedAsOcrError();
  TestCancelledSessionResultsAreDiscarded();
  TestInvalidFramesAreRejected();

  std::cout << "vkyc_unit_verification_pipeline: pass\n";
  return 0;
}
