#include "recording_manager.hpp"

#include <algorithm>
#include <vector>

#include "internal/db/api/check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/arrow_utils.hpp"

namespace vkyc::recording {

using namespace vkyc::v1;
using observability::IntField;
using observability::SessionField;
using observability::StringField;

RecordingManager::RecordingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<media::MediaTransport> transport,
                                   std::shared_ptr<Compressor> compressor, std::shared_ptr<storage::ArtifactStore> store,
                                   std::shared_ptr<util::TimeSource> clock, std::weak_ptr<RecordingEvents> events, RecordingPolicy policy)
    : repository_(std::move(repository)),
      transport_(std::move(transport)),
      compressor_(std::move(compressor)),
      store_(std::move(store)),
      clock_(std::move(clock)),
      events_(std::move(events)),
      policy_(policy) {
  if (!repository_ || !transport_ || !compressor_ || !store_ || !clock_) {
    throw std::invalid_argument("RecordingManager: missing dependency");
  }
}

RecordingManager::~RecordingManager() {
  Stop();
}

void RecordingManager::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(work_mutex_);
    stopping_ = false;
  }
  worker_ = std::thread(&RecordingManager::RunWorker, this);
}

void RecordingManager::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  std::vector<std::shared_ptr<Active>> actives;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, active] : active_) {
      actives.push_back(active);
    }
  }
  for (const auto& active : actives) {
    std::lock_guard lock(active->mutex);
    if (active->stream) active->stream->Close();
  }

  {
    std::lock_guard lock(work_mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  if (worker_.joinable()) worker_.join();

  for (const auto& active : actives) {
    if (active->pump.joinable()) active->pump.join();
  }
}

// ------------------------------------------------------------------
// Buffering
// ------------------------------------------------------------------

void RecordingManager::StartRecording(const std::string& session_id) {
  auto active = std::make_shared<Active>();
  {
    std::lock_guard lock(mutex_);
    if (active_.count(session_id)) {
      return;
    }
    active->record.session_id    = session_id;
    active->record.state         = RECORDING_STATE_BUFFERING;
    active->record.updated_at_ms = util::ToUnixMillis(clock_->Now());
    active->started_at           = clock_->Now();
    active_[session_id]          = active;
  }

  Persist(active->record);

  MediaControl control;
  control.set_session_id(session_id);
  control.set_kind(MEDIA_CONTROL_KIND_START_RECORDING);
  try {
    transport_->SendControl(session_id, control);
  } catch (const std::exception& e) {
    VKYC_LOG_WARN("media start control failed", {SessionField(session_id), StringField("error", e.what())});
  }

  std::lock_guard lock(active->mutex);
  active->pump = std::thread(&RecordingManager::Pump, this, active);

  VKYC_LOG_INFO("recording started", {SessionField(session_id)});
}

void RecordingManager::Pump(std::shared_ptr<Active> active) {
  const auto session_id = active->record.session_id;
  const auto cap_ms     = static_cast<uint64_t>(policy_.max_duration.count());

  auto fail = [&](const std::string& error) {
    bool report = false;
    {
      std::lock_guard lock(active->mutex);
      if (active->record.state == RECORDING_STATE_BUFFERING) {
        active->record.state         = RECORDING_STATE_FAILED;
        active->record.error         = error;
        active->record.updated_at_ms = util::ToUnixMillis(clock_->Now());
        Persist(active->record);
        report = true;
      }
    }
    if (report) {
      observability::Metrics::Instance().RecordRecordingFailure("buffering");
      VKYC_LOG_ERROR("recording failed while buffering", {SessionField(session_id), StringField("error", error)});
      EmitFailed(session_id, error, true);
    }
  };

  std::shared_ptr<media::ChunkStream> stream;
  try {
    stream = transport_->OpenChannel(session_id);
  } catch (const std::exception& e) {
    fail(std::string("open media channel: ") + e.what());
    return;
  }
  {
    std::lock_guard lock(active->mutex);
    if (active->record.state != RECORDING_STATE_BUFFERING) {
      stream->Close();
      return;
    }
    active->stream = stream;
  }

  while (true) {
    std::optional<MediaChunk> chunk;
    try {
      chunk = stream->Next();
    } catch (const std::exception& e) {
      fail(e.what());
      return;
    }
    if (!chunk) {
      return;
    }

    bool        cap_hit = false;
    std::string append_error;
    {
      std::lock_guard lock(active->mutex);
      auto&           record = active->record;
      if (record.state != RECORDING_STATE_BUFFERING) {
        return;
      }

      const uint64_t remaining = cap_ms - record.buffered_ms;
      const uint64_t duration  = chunk->duration_ms();
      const auto&    data      = chunk->data();
      uint64_t       take      = data.size();

      if (duration > remaining) {
        // Keep only the share of the chunk that fits under the cap.
        take               = data.size() * remaining / duration;
        record.buffered_ms = cap_ms;
        cap_hit            = true;
      } else {
        record.buffered_ms += duration;
        cap_hit = record.buffered_ms >= cap_ms;
      }

      const auto status = active->buffer.Append(data.data(), static_cast<int64_t>(take));
      if (!status.ok()) {
        append_error = status.ToString();
      } else {
        record.raw_bytes += take;
        if (cap_hit) {
          StopBufferingLocked(*active, true);
        }
      }
    }

    if (!append_error.empty()) {
      fail("recording buffer append failed: " + append_error);
      return;
    }
    if (cap_hit) {
      VKYC_LOG_INFO("recording cap reached", {SessionField(session_id), IntField("buffered_ms", static_cast<int64_t>(cap_ms))});
      EmitCapReached(session_id);
      return;
    }
  }
}

void RecordingManager::StopBufferingLocked(Active& active, bool cap_reached) {
  auto& record         = active.record;
  record.state         = RECORDING_STATE_FINALIZING;
  record.cap_reached   = record.cap_reached || cap_reached;
  record.updated_at_ms = util::ToUnixMillis(clock_->Now());

  if (active.stream) {
    active.stream->Close();
  }

  MediaControl control;
  control.set_session_id(record.session_id);
  control.set_kind(MEDIA_CONTROL_KIND_STOP_RECORDING);
  control.set_reason(cap_reached ? "cap_reached" : "session_ended");
  try {
    transport_->SendControl(record.session_id, control);
  } catch (const std::exception& e) {
    VKYC_LOG_WARN("media stop control failed", {SessionField(record.session_id), StringField("error", e.what())});
  }

  Persist(record);

  if (!active.queued) {
    active.queued = true;
    {
      std::lock_guard lock(work_mutex_);
      work_.push_back(record.session_id);
    }
    work_cv_.notify_one();
  }
}

// ------------------------------------------------------------------
// Finalize
// ------------------------------------------------------------------

void RecordingManager::Finalize(const std::string& session_id) {
  auto active = Find(session_id);
  if (!active) {
    return;
  }

  std::lock_guard lock(active->mutex);
  switch (active->record.state) {
    case RECORDING_STATE_BUFFERING:
      StopBufferingLocked(*active, false);
      break;
    case RECORDING_STATE_FAILED:
      // Buffering already failed; only the pump needs reaping.
      if (!active->queued) {
        active->queued = true;
        {
          std::lock_guard work_lock(work_mutex_);
          work_.push_back(session_id);
        }
        work_cv_.notify_one();
      }
      break;
    default:
      break;
  }
}

void RecordingManager::RunWorker() {
  while (true) {
    std::string session_id;
    {
      std::unique_lock lock(work_mutex_);
      work_cv_.wait(lock, [&] { return stopping_ || !work_.empty(); });
      if (work_.empty()) {
        return;
      }
      session_id = std::move(work_.front());
      work_.pop_front();
    }

    auto active = Find(session_id);
    if (!active) {
      continue;
    }

    if (active->pump.joinable()) {
      active->pump.join();
    }
    FinalizeNow(active);

    std::lock_guard lock(mutex_);
    active_.erase(session_id);
  }
}

void RecordingManager::FinalizeNow(const std::shared_ptr<Active>& active) {
  std::shared_ptr<arrow::Buffer> raw;
  std::string                    session_id;
  {
    std::lock_guard lock(active->mutex);
    if (active->record.state != RECORDING_STATE_FINALIZING) {
      return;
    }
    session_id = active->record.session_id;
    const auto status = active->buffer.Finish(&raw);
    if (!status.ok()) {
      raw.reset();
    }
  }

  std::string location;
  uint64_t    compressed_bytes = 0;
  std::string error;
  try {
    if (!raw) {
      throw std::runtime_error("recording buffer could not be finished");
    }
    auto compressed  = compressor_->Compress(raw);
    compressed_bytes = static_cast<uint64_t>(compressed->size());
    location         = store_->Put(session_id + ".media" + compressor_->Extension(), compressed);
  } catch (const std::exception& e) {
    error = e.what();
  }

  db::model::RecordingRecord record;
  {
    std::lock_guard lock(active->mutex);
    auto&           rec = active->record;
    rec.updated_at_ms   = util::ToUnixMillis(clock_->Now());
    if (error.empty()) {
      rec.state            = RECORDING_STATE_DONE;
      rec.location         = location;
      rec.compressed_bytes = compressed_bytes;
    } else {
      rec.state = RECORDING_STATE_FAILED;
      rec.error = "finalize: " + error;
    }
    Persist(rec);
    record = rec;
  }

  if (error.empty()) {
    VKYC_LOG_INFO("recording finalized", {SessionField(session_id), StringField("location", location),
                                          IntField("raw_bytes", static_cast<int64_t>(record.raw_bytes)),
                                          IntField("compressed_bytes", static_cast<int64_t>(compressed_bytes))});
    EmitFinalized(session_id, ToProto(record));
  } else {
    observability::Metrics::Instance().RecordRecordingFailure("finalize");
    VKYC_LOG_ERROR("recording finalize failed", {SessionField(session_id), StringField("error", error)});
    EmitFailed(session_id, record.error, false);
  }
}

// ------------------------------------------------------------------
// Sweeps and recovery
// ------------------------------------------------------------------

void RecordingManager::SweepWallClock() {
  const auto now    = clock_->Now();
  const auto cap_ms = static_cast<uint64_t>(policy_.max_duration.count());

  std::vector<std::shared_ptr<Active>> actives;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, active] : active_) {
      actives.push_back(active);
    }
  }

  std::vector<std::string> capped;
  for (const auto& active : actives) {
    std::lock_guard lock(active->mutex);
    if (active->record.state != RECORDING_STATE_BUFFERING || now - active->started_at < policy_.max_duration) {
      continue;
    }
    active->record.buffered_ms = std::min(active->record.buffered_ms, cap_ms);
    StopBufferingLocked(*active, true);
    capped.push_back(active->record.session_id);
  }

  for (const auto& session_id : capped) {
    VKYC_LOG_WARN("recording wall-clock cap reached", {SessionField(session_id)});
    EmitCapReached(session_id);
  }
}

void RecordingManager::RecoverAfterRestart() {
  auto tx = repository_->Begin();

  std::vector<db::model::RecordingRecord> stale = repository_->ListRecordingsInState(*tx, RECORDING_STATE_BUFFERING);
  auto finalizing = repository_->ListRecordingsInState(*tx, RECORDING_STATE_FINALIZING);
  stale.insert(stale.end(), finalizing.begin(), finalizing.end());

  for (auto& record : stale) {
    record.state         = RECORDING_STATE_FAILED;
    record.error         = "process restarted before the recording was finalized";
    record.updated_at_ms = util::ToUnixMillis(clock_->Now());
    db::ThrowIfDbError(repository_->UpsertRecording(*tx, record), "recover recording");
    observability::Metrics::Instance().RecordRecordingFailure("restart");
    VKYC_LOG_WARN("recording lost across restart", {SessionField(record.session_id)});
  }
  tx->Commit();
}

// ------------------------------------------------------------------
// Observers and reads
// ------------------------------------------------------------------

void RecordingManager::OnSessionStarted(const Session& session) {
  try {
    StartRecording(session.session_id());
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("recording start failed", {SessionField(session.session_id()), StringField("error", e.what())});
  }
}

void RecordingManager::OnSessionEnded(const Session& session) {
  try {
    Finalize(session.session_id());
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("recording finalize request failed", {SessionField(session.session_id()), StringField("error", e.what())});
  }
}

std::optional<Recording> RecordingManager::Get(const std::string& session_id) const {
  if (auto active = Find(session_id)) {
    std::lock_guard lock(active->mutex);
    return ToProto(active->record);
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetRecording(*tx, session_id);
  tx->Commit();
  if (!record) {
    return std::nullopt;
  }
  return ToProto(*record);
}

std::shared_ptr<RecordingManager::Active> RecordingManager::Find(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  const auto      it = active_.find(session_id);
  return it == active_.end() ? nullptr : it->second;
}

void RecordingManager::Persist(const db::model::RecordingRecord& record) {
  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->UpsertRecording(*tx, record), "persist recording");
    tx->Commit();
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("recording state not persisted", {SessionField(record.session_id), StringField("error", e.what())});
  }
}

void RecordingManager::EmitCapReached(const std::string& session_id) {
  if (auto events = events_.lock()) {
    try {
      events->OnCapReached(session_id);
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("cap reached handler failed", {SessionField(session_id), StringField("error", e.what())});
    }
  }
}

void RecordingManager::EmitFailed(const std::string& session_id, const std::string& error, bool during_buffering) {
  if (auto events = events_.lock()) {
    try {
      events->OnRecordingFailed(session_id, error, during_buffering);
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("recording failure handler failed", {SessionField(session_id), StringField("error", e.what())});
    }
  }
}

void RecordingManager::EmitFinalized(const std::string& session_id, const Recording& recording) {
  if (auto events = events_.lock()) {
    try {
      events->OnRecordingFinalized(session_id, recording);
    } catch (const std::exception& e) {
      VKYC_LOG_ERROR("recording finalized handler failed", {SessionField(session_id), StringField("error", e.what())});
    }
  }
}

Recording RecordingManager::ToProto(const db::model::RecordingRecord& record) {
  Recording recording;
  recording.set_session_id(record.session_id);
  recording.set_state(record.state);
  recording.set_buffered_ms(record.buffered_ms);
  recording.set_cap_reached(record.cap_reached);
  recording.set_location(record.location);
  recording.set_raw_bytes(record.raw_bytes);
  recording.set_compressed_bytes(record.compressed_bytes);
  recording.set_error(record.error);
  return recording;
}

} // namespace vkyc::recording
