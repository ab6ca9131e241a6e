#include "signaling_server.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#include "grpc_error.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"

namespace vkyc::grpc {

using namespace vkyc::v1;
using observability::SessionField;
using observability::StringField;

namespace {

using Stream = ::grpc::ServerReaderWriter<SignalEnvelope, SignalEnvelope>;

constexpr std::size_t kOutboxLimit = 256;
constexpr auto        kFlushTimeout = std::chrono::seconds(5);

// Queues outbound envelopes for a writer thread so a slow reader never
// blocks the caller. Writes stop once the handler finishes.
class GrpcPeerSink final : public signaling::PeerSink {
 public:
  explicit GrpcPeerSink(Stream* stream) : stream_(stream), writer_(&GrpcPeerSink::Run, this) {
  }

  ~GrpcPeerSink() override {
    Close();
    if (writer_.joinable()) writer_.join();
  }

  // False once the stream broke, closed, or the reader fell too far behind.
  bool Send(const SignalEnvelope& envelope) override {
    std::lock_guard lock(mutex_);
    if (closed_ || broken_ || outbox_.size() >= kOutboxLimit) {
      return false;
    }
    outbox_.push_back(envelope);
    cv_.notify_all();
    return true;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Lets queued envelopes go out, cancelling the call if the peer does not
  // read them in time. Must run before the handler returns.
  void Finish(::grpc::ServerContext* context) {
    Close();
    {
      std::unique_lock lock(mutex_);
      if (!drained_cv_.wait_for(lock, kFlushTimeout, [&] { return outbox_.empty() || broken_; })) {
        context->TryCancel();
      }
    }
    if (writer_.joinable()) writer_.join();
  }

 private:
  void Run() {
    for (;;) {
      SignalEnvelope next;
      {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return closed_ || !outbox_.empty(); });
        if (outbox_.empty()) {
          drained_cv_.notify_all();
          return;
        }
        next = std::move(outbox_.front());
        outbox_.pop_front();
      }
      if (!stream_->Write(next)) {
        std::lock_guard lock(mutex_);
        broken_ = true;
        outbox_.clear();
        drained_cv_.notify_all();
        return;
      }
      std::lock_guard lock(mutex_);
      if (outbox_.empty()) drained_cv_.notify_all();
    }
  }

  Stream*                    stream_;
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::condition_variable    drained_cv_;
  std::deque<SignalEnvelope> outbox_;
  bool                       closed_ = false;
  bool                       broken_ = false;
  std::thread                writer_;
};

} // namespace

SignalingServer::SignalingServer(std::shared_ptr<vkyc::signaling::SignalingHub> hub) : hub_(std::move(hub)) {
}

::grpc::Status SignalingServer::Connect(::grpc::ServerContext* context, Stream* stream) {
  SignalEnvelope first;
  if (!stream->Read(&first)) {
    return ::grpc::Status::OK;
  }
  if (!first.has_hello() || first.hello().session_id().empty()) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, "first message must be hello with a session_id"};
  }

  const auto session_id = first.hello().session_id();
  const auto role       = first.hello().role();
  auto       sink       = std::make_shared<GrpcPeerSink>(stream);

  try {
    hub_->Attach(session_id, role, sink, first.hello().agent_id());
  } catch (const std::exception& e) {
    sink->Finish(context);
    return ToStatus(e);
  }
  VKYC_LOG_INFO("peer attached", {SessionField(session_id), StringField("role", model::RoleName(role))});

  bool           left = false;
  SignalEnvelope envelope;
  while (!sink->Closed() && !context->IsCancelled() && stream->Read(&envelope)) {
    try {
      hub_->Deliver(session_id, role, envelope);
      left = envelope.has_leave();
    } catch (const std::exception& e) {
      if (!sink->Send(signaling::MakeNotice(NOTICE_KIND_ERROR, e.what()))) {
        break;
      }
    }
    if (left) {
      break;
    }
  }

  // The channel closes the sink when the session ends; that is not a drop.
  const bool expected = left || sink->Closed();
  hub_->Detach(session_id, role, sink.get(), expected);
  sink->Finish(context);

  VKYC_LOG_INFO("peer detached", {SessionField(session_id), StringField("role", model::RoleName(role)),
                                  observability::BoolField("expected", expected)});
  return ::grpc::Status::OK;
}

} // namespace vkyc::grpc
