#pragma once

#include <arrow/buffer_builder.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "compressor.hpp"
#include "internal/core/session_observer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/media/media_transport.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/time.hpp"
#include "recording_events.hpp"

namespace vkyc::recording {

struct RecordingPolicy {
  std::chrono::milliseconds max_duration{std::chrono::seconds(600)};
};

/*
  Bounded session recording.

    buffering -> finalizing -> done | failed

  Each recording has a pump thread reading the media transport. The
  buffered duration never exceeds max_duration: the chunk crossing the cap
  is truncated, buffering stops and CapReached is emitted. Compression and
  storage run on a single finalize worker. Finalize is idempotent.
*/
class RecordingManager final : public core::SessionObserver {
 public:
  RecordingManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<media::MediaTransport> transport,
                   std::shared_ptr<Compressor> compressor, std::shared_ptr<storage::ArtifactStore> store,
                   std::shared_ptr<util::TimeSource> clock, std::weak_ptr<RecordingEvents> events, RecordingPolicy policy);
  ~RecordingManager() override;

  RecordingManager(const RecordingManager&)            = delete;
  RecordingManager& operator=(const RecordingManager&) = delete;

  void Start();
  void Stop();

  void StartRecording(const std::string& session_id);
  void Finalize(const std::string& session_id);

  // Live state if the recording is still tracked, else the persisted record.
  std::optional<vkyc::v1::Recording> Get(const std::string& session_id) const;

  // Recordings left buffering/finalizing by a previous process lost their
  // media; they are marked failed.
  void RecoverAfterRestart();

  // Stops recordings whose wall-clock age reached the cap even if the media
  // stream stalled.
  void SweepWallClock();

  void OnSessionStarted(const vkyc::v1::Session& session) override;
  void OnSessionEnded(const vkyc::v1::Session& session) override;

 private:
  struct Active {
    std::mutex mutex;

    db::model::RecordingRecord           record;
    arrow::BufferBuilder                 buffer;
    std::shared_ptr<media::ChunkStream>  stream;
    std::thread                          pump;
    util::TimePoint                      started_at{};
    bool                                 queued = false;
  };

  void Pump(std::shared_ptr<Active> active);
  void RunWorker();
  void FinalizeNow(const std::shared_ptr<Active>& active);

  // Caller holds active->mutex.
  void StopBufferingLocked(Active& active, bool cap_reached);
  void Persist(const db::model::RecordingRecord& record);

  void EmitCapReached(const std::string& session_id);
  void EmitFailed(const std::string& session_id, const std::string& error, bool during_buffering);
  void EmitFinalized(const std::string& session_id, const vkyc::v1::Recording& recording);

  std::shared_ptr<Active> Find(const std::string& session_id) const;

  static vkyc::v1::Recording ToProto(const db::model::RecordingRecord& record);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<media::MediaTransport>  transport_;
  std::shared_ptr<Compressor>             compressor_;
  std::shared_ptr<storage::ArtifactStore> store_;
  std::shared_ptr<util::TimeSource>       clock_;
  std::weak_ptr<RecordingEvents>          events_;
  RecordingPolicy                         policy_;

  mutable std::mutex                                       mutex_;
  std::unordered_map<std::string, std::shared_ptr<Active>> active_;

  std::mutex              work_mutex_;
  std::condition_variable work_cv_;
  std::deque<std::string> work_;
  bool                    stopping_ = false;
  std::thread             worker_;
  std::atomic<bool>       running_{false};
};

} // namespace vkyc::recording
