#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/transcription_server.hpp"
#include "internal/media/media_registry.hpp"
#include "internal/providers/provider_context.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transcription_service.hpp"
#include "internal/sources/youtube.hpp"
#include "internal/storage/disk/disk_media_store.hpp"
#if TRANSCRIPTION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace transcription::factory {

using transcription::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TRANSCRIPTION_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto media_root = config.media().root().empty() ? std::string("data/media") : config.media().root();
  auto       store      = std::make_shared<storage::DiskMediaStore>(media_root);
  auto       registry   = std::make_shared<media::MediaRegistry>(app.repository, store);

  // ------------------------------------------------------------------
  // Providers and sources
  // ------------------------------------------------------------------
  auto provider_context = providers::ProviderContext::FromConfig(config);
  auto youtube          = std::make_shared<sources::YoutubeSource>(
      config.providers().youtube().downloader_path().empty() ? std::string("yt-dlp") : config.providers().youtube().downloader_path());

  // ------------------------------------------------------------------
  // Job pipeline
  // ------------------------------------------------------------------
  core::ManagerOptions options;
  options.temp_root = config.providers().temp_dir();

  app.queue   = std::make_shared<jobs::JobQueue>();
  app.manager = std::make_shared<core::TranscriptionManager>(app.repository, registry, provider_context, app.queue, youtube, options);

  // before the workers start, so nothing is claimed twice
  app.manager->RecoverOnStartup();

  const std::size_t threads = config.workers().threads() == 0 ? 1 : config.workers().threads();
  app.worker                = std::make_shared<jobs::JobWorker>(app.queue, app.manager, threads);
  app.worker->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  auto transcription_service = std::make_shared<service::TranscriptionService>(ctx);

  app.grpc_services.push_back(std::make_unique<grpc::TranscriptionServer>(transcription_service));

  return app;
}

void Application::Shutdown() {
  if (queue) {
    queue->Shutdown();
  }
  if (worker) {
    worker->Stop();
  }
}

} // namespace transcription::factory
