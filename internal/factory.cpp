#include "factory.hpp"

#include <map>
#include <stdexcept>
#include <string>

#include "internal/biometrics/biometric_logger.hpp"
#include "internal/biometrics/biometric_sink.hpp"
#include "internal/core/session_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/media_ingest_server.hpp"
#include "internal/grpc/session_server.hpp"
#include "internal/grpc/signaling_server.hpp"
#include "internal/link/link_issuer.hpp"
#include "internal/media/queued_media_transport.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recording/compressor.hpp"
#include "internal/recording/recording_manager.hpp"
#include "internal/scheduler/session_sweeper.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/session_service.hpp"
#include "internal/signaling/signaling_hub.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/time.hpp"
#include "internal/verification/http_ocr_client.hpp"
#include "internal/verification/http_registry_client.hpp"
#include "internal/verification/verification_pipeline.hpp"

namespace vkyc::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    const int applied = db::sql::RunMigrations(*sqlite_db, db::sql::SchemaMigrations());
    VKYC_LOG_INFO("sqlite repository ready",
                  {StringField("path", database.sqlite().path()), IntField("schema_version", sqlite_db->SchemaVersion()),
                   IntField("migrations_applied", applied)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  VKYC_LOG_WARN("in-memory repository: sessions do not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

verification::HttpEndpoint ToEndpoint(const config::HttpEndpoint& endpoint) {
  return {endpoint.url(), endpoint.bearer_token()};
}

link::LinkPolicy ToLinkPolicy(const config::LinkConfig& links) {
  link::LinkPolicy policy;
  policy.base_url           = links.base_url();
  policy.token_length       = links.token_length();
  policy.link_ttl           = util::ToMillis(links.link_ttl());
  policy.scheduled_link_ttl = util::ToMillis(links.scheduled_link_ttl());
  return policy;
}

verification::VerificationPolicy ToVerificationPolicy(const config::VerificationConfig& verification) {
  verification::VerificationPolicy policy;
  policy.confidence_threshold = verification.confidence_threshold();
  policy.max_attempts         = verification.max_attempts();
  policy.ocr_timeout          = util::ToMillis(verification.ocr_timeout());
  policy.registry_timeout     = util::ToMillis(verification.registry_timeout());
  policy.max_retries          = verification.max_retries();
  policy.initial_backoff      = util::ToMillis(verification.initial_backoff());
  policy.max_backoff          = util::ToMillis(verification.max_backoff());
  policy.worker_threads       = verification.worker_threads();
  return policy;
}

core::SessionPolicy ToSessionPolicy(const config::RuntimeConfig& config) {
  core::SessionPolicy policy;
  policy.required_documents.clear();
  for (const auto& name : config.verification().required_documents()) {
    if (auto document_type = model::ParseDocumentType(name)) {
      policy.required_documents.push_back(*document_type);
    }
  }
  policy.min_blink_count   = config.biometrics().min_blink_count();
  policy.require_head_pose = config.biometrics().require_head_pose();
  return policy;
}

} // namespace

void Application::Start() {
  biometrics->Start();
  pipeline->Start();
  recordings->Start();
  sweeper->Start();
}

void Application::Stop() {
  if (sweeper) sweeper->Stop();
  if (recordings) recordings->Stop();
  if (pipeline) pipeline->Stop();
  if (biometrics) biometrics->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store and clock
  // ------------------------------------------------------------------
  auto clock      = std::make_shared<util::SystemTimeSource>();
  app.repository  = BuildRepository(config);
  auto link_issuer = std::make_shared<link::LinkIssuer>(app.repository, clock, ToLinkPolicy(config.links()));

  // ------------------------------------------------------------------
  // Biometrics and verification
  // ------------------------------------------------------------------
  biometrics::BiometricPolicy biometric_policy;
  biometric_policy.queue_capacity = config.biometrics().queue_capacity();
  biometric_policy.flush_interval = util::ToMillis(config.biometrics().flush_interval());
  app.biometrics =
      std::make_shared<biometrics::BiometricLogger>(std::make_shared<biometrics::RepositoryBiometricSink>(app.repository), clock, biometric_policy);

  const auto& verification = config.verification();
  auto        ocr          = std::make_shared<verification::HttpOcrClient>(std::map<v1::DocumentType, verification::HttpEndpoint>{
      {v1::DOCUMENT_TYPE_PAN, ToEndpoint(verification.pan_ocr())},
      {v1::DOCUMENT_TYPE_AADHAAR, ToEndpoint(verification.aadhaar_ocr())},
  });
  auto registry = std::make_shared<verification::HttpRegistryClient>(ToEndpoint(verification.registry()));
  app.pipeline  = std::make_shared<verification::VerificationPipeline>(ocr, registry, ToVerificationPolicy(verification));

  // ------------------------------------------------------------------
  // Session state machine
  // ------------------------------------------------------------------
  app.sessions =
      std::make_shared<core::SessionManager>(app.repository, link_issuer, app.biometrics, app.pipeline, clock, ToSessionPolicy(config));

  // ------------------------------------------------------------------
  // Recording
  // ------------------------------------------------------------------
  auto transport  = std::make_shared<media::QueuedMediaTransport>();
  auto compressor = std::make_shared<recording::CodecCompressor>(config.recording().codec());
  auto store      = storage::FileSystemArtifactStore::FromUri(config.recording().storage_uri());

  recording::RecordingPolicy recording_policy;
  recording_policy.max_duration = util::ToMillis(config.recording().max_duration());
  app.recordings = std::make_shared<recording::RecordingManager>(app.repository, transport, compressor, store, clock,
                                                                 std::weak_ptr<recording::RecordingEvents>(app.sessions), recording_policy);

  // ------------------------------------------------------------------
  // Signaling
  // ------------------------------------------------------------------
  signaling::SignalingPolicy signaling_policy;
  signaling_policy.disconnect_grace = util::ToMillis(config.signaling().disconnect_grace());
  signaling_policy.max_frame_bytes  = config.signaling().max_frame_bytes();
  signaling_policy.mailbox_capacity = config.signaling().mailbox_capacity();
  app.hub = std::make_shared<signaling::SignalingHub>(app.sessions, app.biometrics, clock, signaling_policy);

  app.sessions->AddObserver(app.recordings);
  app.sessions->AddObserver(app.hub);
  app.sessions->AddObserver(app.biometrics);

  app.sweeper = std::make_shared<scheduler::SessionSweeper>(app.sessions, app.hub, app.recordings,
                                                            util::ToMillis(config.scheduler().sweep_interval()));

  // ------------------------------------------------------------------
  // Restart recovery
  // ------------------------------------------------------------------
  app.recordings->RecoverAfterRestart();
  if (const auto failed = app.sessions->RecoverAfterRestart(); failed > 0) {
    VKYC_LOG_WARN("sessions failed after restart", {IntField("count", static_cast<int64_t>(failed))});
  }

  // ------------------------------------------------------------------
  // Services and gRPC servers
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.sessions   = app.sessions;
  ctx.links      = link_issuer;
  ctx.biometrics = app.biometrics;
  ctx.recordings = app.recordings;

  app.grpc_services.push_back(std::make_unique<grpc::SessionServer>(std::make_shared<service::SessionService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::SignalingServer>(app.hub));
  app.grpc_services.push_back(std::make_unique<grpc::MediaIngestServer>(transport));

  return app;
}

} // namespace vkyc::factory
