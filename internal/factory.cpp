#include "factory.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/continuity/grpc_launcher.hpp"
#include "internal/continuity/launcher.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/events/memory_event_log.hpp"
#include "internal/grpc/work_unit_server.hpp"
#include "internal/hooks/grpc_customization_hook.hpp"
#include "internal/media/arrow_media_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recording/recording_finalizer.hpp"
#include "internal/recording/recording_store.hpp"
#include "internal/registry/memory_source_registry.hpp"
#include "internal/speech/grpc_speech_client.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#if CALLSCRIBE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/events/sqlite_event_log.hpp"
#include "internal/registry/sqlite_source_registry.hpp"
#endif

namespace callscribe::factory {

using namespace callscribe;
using observability::IntField;
using observability::StringField;
using storage::common::Unwrap;

namespace {

constexpr std::chrono::milliseconds kLaunchTimeout{10000};

#if CALLSCRIBE_DB_SQLITE
// Events and registry may share one database file.
class SqlitePool {
 public:
  std::shared_ptr<db::sqlite::SqliteDB> Open(const std::string& path) {
    auto it = dbs_.find(path);
    if (it != dbs_.end()) return it->second;
    auto db = std::make_shared<db::sqlite::SqliteDB>(path);
    dbs_.emplace(path, db);
    return db;
  }

 private:
  std::map<std::string, std::shared_ptr<db::sqlite::SqliteDB>> dbs_;
};
#else
class SqlitePool {};
#endif

std::shared_ptr<events::EventLog> BuildEventLog(const callscribe::runtime::config::EventsConfig& config, SqlitePool& pool) {
  if (config.has_sqlite()) {
#if CALLSCRIBE_DB_SQLITE
    return std::make_shared<events::SqliteEventLog>(pool.Open(config.sqlite().path()));
#else
    (void)pool;
    throw std::runtime_error("sqlite event log requested but not enabled at build time");
#endif
  }
  return std::make_shared<events::MemoryEventLog>();
}

std::shared_ptr<registry::SourceRegistry> BuildRegistry(const callscribe::runtime::config::RegistryConfig& config, SqlitePool& pool) {
  if (config.has_sqlite()) {
#if CALLSCRIBE_DB_SQLITE
    return std::make_shared<registry::SqliteSourceRegistry>(pool.Open(config.sqlite().path()));
#else
    (void)pool;
    throw std::runtime_error("sqlite source registry requested but not enabled at build time");
#endif
  }
  return std::make_shared<registry::MemorySourceRegistry>();
}

} // namespace

void Application::Stop() {
  if (scheduler) scheduler->Shutdown();
  for (auto& worker : workers) worker->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const callscribe::runtime::config::RuntimeConfig& config) {
  Application app;
  SqlitePool  sqlite;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  app.event_log = BuildEventLog(config.events(), sqlite);
  app.registry  = BuildRegistry(config.registry(), sqlite);

  auto [media_fs, media_root] = Unwrap(storage::common::ResolveFileSystem(config.media().root_uri()));
  auto media                  = std::make_shared<media::ArrowMediaSource>(
      media_fs, media_root, media::ArrowMediaSourceOptions{config.media().follow(), std::chrono::milliseconds(config.media().poll_interval_ms())});

  auto [recording_fs, recording_root] = Unwrap(storage::common::ResolveFileSystem(config.recording().root_uri()));
  auto recording_store                = std::make_shared<recording::RecordingStore>(recording_fs, recording_root);
  auto finalizer                      = std::make_shared<recording::RecordingFinalizer>(
      recording_store, recording::BuildRecordingOptions(config.recording(), config.audio().sample_rate_hz()));

  // ------------------------------------------------------------------
  // External services
  // ------------------------------------------------------------------
  auto speech =
      std::make_shared<speech::GrpcSpeechClient>(::grpc::CreateChannel(config.speech().target(), ::grpc::InsecureChannelCredentials()));

  std::shared_ptr<hooks::CustomizationHook> hook;
  if (!config.hook().target().empty()) {
    hook = std::make_shared<hooks::GrpcCustomizationHook>(::grpc::CreateChannel(config.hook().target(), ::grpc::InsecureChannelCredentials()),
                                                          std::chrono::milliseconds(config.hook().timeout_ms()));
  }

  auto sink = std::make_shared<events::EventSink>(
      app.event_log, events::EventSinkOptions{config.events().save_partial_transcripts(), config.events().emit_continue_events()});

  // ------------------------------------------------------------------
  // Work units
  // ------------------------------------------------------------------
  app.scheduler = std::make_shared<continuity::WorkUnitScheduler>();

  std::shared_ptr<continuity::WorkUnitLauncher> launcher;
  if (config.work_unit().launcher_target().empty()) {
    launcher = std::make_shared<continuity::LocalLauncher>(app.scheduler);
  } else {
    launcher = std::make_shared<continuity::GrpcLauncher>(
        ::grpc::CreateChannel(config.work_unit().launcher_target(), ::grpc::InsecureChannelCredentials()), kLaunchTimeout);
  }

  continuity::ContinuityDeps deps;
  deps.media     = media;
  deps.registry  = app.registry;
  deps.hook      = hook;
  deps.speech    = speech;
  deps.sink      = sink;
  deps.recording = finalizer;
  deps.launcher  = launcher;

  app.controller = std::make_shared<continuity::ContinuityController>(continuity::BuildControllerOptions(config), std::move(deps));

  for (uint32_t i = 0; i < config.work_unit().worker_threads(); ++i) {
    auto worker = std::make_shared<continuity::WorkUnitWorker>(app.scheduler, app.controller);
    worker->Start();
    app.workers.push_back(std::move(worker));
  }

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::WorkUnitServer>(app.scheduler, app.registry));

  CALLSCRIBE_LOG_INFO("Application built", {StringField("media_root", config.media().root_uri()),
                                            StringField("recording_root", config.recording().root_uri()),
                                            StringField("speech_target", config.speech().target()),
                                            StringField("hook_target", config.hook().target()),
                                            IntField("workers", config.work_unit().worker_threads())});
  return app;
}

} // namespace callscribe::factory
