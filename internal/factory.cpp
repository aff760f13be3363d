#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/generation_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/encoder/encoder_factory.hpp"
#include "internal/generation/generation_scheduler.hpp"
#include "internal/generation/generation_worker.hpp"
#include "internal/generation/single_flight.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/generation_server.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/project_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/local/local_artifact_store.hpp"
#if SLIDESHOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SLIDESHOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace slideshow::factory {

using namespace slideshow;

namespace {

constexpr std::size_t kDefaultPgConnections = 16;

std::shared_ptr<db::Repository> BuildRepository(const slideshow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SLIDESHOW_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->ApplySchema();
    SLIDESHOW_LOG_INFO("ledger backend", {observability::StringField("backend", "sqlite"),
                                          observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SLIDESHOW_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0
                                     ? kDefaultPgConnections
                                     : static_cast<std::size_t>(database.postgres().max_connections());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    auto repo = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repo->ApplySchema();
    SLIDESHOW_LOG_INFO("ledger backend", {observability::StringField("backend", "postgres")});
    return repo;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SLIDESHOW_LOG_WARN("ledger backend is in-memory; projects are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

encoder::EncodeOptions ToEncodeOptions(const slideshow::runtime::config::EncoderConfig& config) {
  encoder::EncodeOptions options;
  options.binary        = config.binary();
  options.output_width  = static_cast<int32_t>(config.output_width());
  options.output_height = static_cast<int32_t>(config.output_height());
  options.video_codec   = config.video_codec();
  options.pixel_format  = config.pixel_format();
  options.timeout       = std::chrono::milliseconds(config.timeout_ms());
  return options;
}

} // namespace

void Application::StopWorkers() {
  for (auto& worker : background_workers) {
    worker->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const slideshow::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage + ledger
  // ------------------------------------------------------------------
  auto store      = std::make_shared<storage::LocalArtifactStore>(config.storage().root_path());
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Encoder strategy (chosen once)
  // ------------------------------------------------------------------
  auto video_encoder = encoder::MakeEncoder(store, ToEncodeOptions(config.encoder()), config.encoder().allow_placeholder());

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  core::OrchestratorOptions orchestrator_options;
  orchestrator_options.videos_dir  = config.storage().videos_dir();
  orchestrator_options.staging_dir = config.storage().staging_dir();

  auto orchestrator = std::make_shared<core::GenerationOrchestrator>(repository, store, video_encoder, orchestrator_options);

  // ------------------------------------------------------------------
  // Generation workers
  // ------------------------------------------------------------------
  auto scheduler     = std::make_shared<generation::GenerationScheduler>();
  auto single_flight = std::make_shared<generation::SingleFlight>();

  for (uint32_t i = 0; i < config.generation().workers(); ++i) {
    auto worker = std::make_shared<generation::GenerationWorker>(scheduler, orchestrator);
    worker->Start();
    app.background_workers.push_back(std::move(worker));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository    = repository;
  ctx.store         = store;
  ctx.encoder       = video_encoder;
  ctx.orchestrator  = orchestrator;
  ctx.scheduler     = scheduler;
  ctx.single_flight = single_flight;
  ctx.images_dir    = config.storage().images_dir();

  auto project_service    = std::make_shared<service::ProjectService>(ctx);
  auto generation_service = std::make_shared<service::GenerationService>(ctx);
  auto admin_service      = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ProjectServer>(project_service));
  app.grpc_services.push_back(std::make_unique<grpc::GenerationServer>(generation_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.encoder = video_encoder;
  return app;
}

} // namespace slideshow::factory
