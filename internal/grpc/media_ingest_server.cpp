#include "media_ingest_server.hpp"

#include <chrono>
#include <string>

#include "internal/observability/logging.hpp"

namespace vkyc::grpc {

using namespace vkyc::v1;
using observability::SessionField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kControlPoll{500};

} // namespace

MediaIngestServer::MediaIngestServer(std::shared_ptr<vkyc::media::QueuedMediaTransport> transport) : transport_(std::move(transport)) {
}

::grpc::Status MediaIngestServer::Push(::grpc::ServerContext* context, ::grpc::ServerReader<MediaChunk>* reader, MediaAck* ack) {
  std::string session_id;
  MediaChunk  chunk;
  while (reader->Read(&chunk)) {
    if (session_id.empty()) {
      session_id = chunk.session_id();
    }
    if (transport_->Push(chunk)) {
      ack->set_accepted_chunks(ack->accepted_chunks() + 1);
    } else {
      ack->set_rejected_chunks(ack->rejected_chunks() + 1);
    }
  }

  if (context->IsCancelled() && !session_id.empty()) {
    VKYC_LOG_WARN("media push cancelled", {SessionField(session_id)});
    transport_->Fail(session_id, "media push stream cancelled");
    return {::grpc::StatusCode::CANCELLED, "media push cancelled"};
  }
  return ::grpc::Status::OK;
}

::grpc::Status MediaIngestServer::Controls(::grpc::ServerContext* context, const ControlsRequest* req,
                                           ::grpc::ServerWriter<MediaControl>* writer) {
  if (req->session_id().empty()) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, "session_id is required"};
  }

  while (!context->IsCancelled()) {
    auto control = transport_->NextControl(req->session_id(), kControlPoll);
    if (!control) {
      continue;
    }
    if (!writer->Write(*control)) {
      break;
    }
    if (control->kind() == MEDIA_CONTROL_KIND_STOP_RECORDING) {
      break;
    }
  }
  return ::grpc::Status::OK;
}

} // namespace vkyc::grpc
