#include "factory.hpp"

#include <arrow/filesystem/localfs.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/clipboard/clipboard_manager.hpp"
#include "internal/clipboard/native_clipboard.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/fileops/file_operations.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/clipboard_server.hpp"
#include "internal/grpc/file_server.hpp"
#include "internal/grpc/tiering_server.hpp"
#include "internal/grpc/transfer_server.hpp"
#include "internal/ledger/operation_ledger.hpp"
#include "internal/ledger/transfer_journal.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/clipboard_service.hpp"
#include "internal/service/file_service.hpp"
#include "internal/service/tiering_service.hpp"
#include "internal/service/transfer_service.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/storage/arrow/arrow_source_driver.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/tiering/tiering_coordinator.hpp"
#include "internal/transcode/transcode_coordinator.hpp"
#include "internal/transcode/transcoder.hpp"
#include "internal/transfer/transfer_engine.hpp"
#if TIERBRIDGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TIERBRIDGE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tierbridge::factory {

using namespace tierbridge;
using namespace tierbridge::vfs::core::v1;
using observability::IntField;
using observability::StringField;

namespace {

#if TIERBRIDGE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto* sql : db::sql::POSTGRES_SCHEMA) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,kind,status,part_index FROM transfers LIMIT 1;");
  tx.exec("SELECT id,type,source_category,seq FROM operations LIMIT 1;");
  tx.exec("SELECT source_id,path,tier FROM file_tiers LIMIT 1;");
  tx.exec("SELECT version FROM tierbridge_schema_migrations LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const tierbridge::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TIERBRIDGE_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path = database.sqlite().path();
    if (database.sqlite().busy_timeout_ms() != 0) options.busy_timeout_ms = database.sqlite().busy_timeout_ms();
    return std::make_shared<db::sqlite::SqliteRepository>(std::make_shared<db::sqlite::SqliteDB>(std::move(options)));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TIERBRIDGE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

// Configured sources plus the host filesystem as "native".
std::shared_ptr<source::SourceRegistry> BuildRegistry(const tierbridge::runtime::config::RuntimeConfig& config,
                                                      const storage::SourceDriverPtr& local_driver) {
  auto registry = std::make_shared<source::SourceRegistry>();

  for (const auto& source_config : config.sources()) {
    StorageSource source;
    source.set_id(source_config.id());
    source.set_name(source_config.name().empty() ? source_config.id() : source_config.name());
    source.set_category(source_config.category());
    for (const auto capability : source_config.capabilities()) {
      source.add_capabilities(static_cast<Capability>(capability));
    }
    source.set_provider(source_config.provider());
    source.set_default_tier(source_config.default_tier());
    source.set_status(SOURCE_STATUS_CONNECTED);

    registry->Mount(std::move(source), storage::StorageFactory::Build(source_config));
    TIERBRIDGE_LOG_INFO("source mounted", {StringField("source_id", source_config.id()), StringField("uri", source_config.uri())});
  }

  StorageSource native;
  native.set_id(source::kNativeSourceId);
  native.set_name("Local machine");
  native.set_category(SOURCE_CATEGORY_LOCAL);
  native.add_capabilities(CAPABILITY_ATOMIC_RENAME);
  native.set_status(SOURCE_STATUS_CONNECTED);
  registry->Mount(std::move(native), local_driver);

  return registry;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const tierbridge::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  storage::SourceDriverPtr local_driver =
      std::make_shared<storage::ArrowSourceDriver>(std::make_shared<arrow::fs::LocalFileSystem>(), "/");

  auto repository = BuildRepository(config);
  auto registry   = BuildRegistry(config, local_driver);

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  auto transfer_engine     = std::make_shared<transfer::TransferEngine>(repository, registry, local_driver, config.transfer());
  auto tiering_coordinator = std::make_shared<tiering::TieringCoordinator>(repository, registry, config.tiering());
  auto operation_ledger    = std::make_shared<ledger::OperationLedger>(repository, registry, config.ledger());
  operation_ledger->Load();

  auto file_operations = std::make_shared<fileops::FileOperations>(registry, transfer_engine, tiering_coordinator, operation_ledger,
                                                                   local_driver, config.transfer().staging_dir());

  auto clipboard_manager =
      std::make_shared<clipboard::ClipboardManager>(registry, file_operations, clipboard::MakeNativeClipboard(config.clipboard().native_backend()),
                                                    local_driver, config.clipboard());

  auto transcode_coordinator = std::make_shared<transcode::TranscodeCoordinator>(
      registry, file_operations, std::make_shared<transcode::FfmpegTranscoder>(config.transcode().ffmpeg_path()), local_driver,
      config.transcode(), config.transfer().staging_dir());

  auto transfer_journal = std::make_shared<ledger::TransferJournal>(transfer_engine, operation_ledger);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.registry   = registry;
  ctx.transfers  = transfer_engine;
  ctx.tiering    = tiering_coordinator;
  ctx.ledger     = operation_ledger;
  ctx.journal    = transfer_journal;
  ctx.files      = file_operations;
  ctx.clipboard  = clipboard_manager;
  ctx.transcode  = transcode_coordinator;

  auto catalog_service   = std::make_shared<service::CatalogService>(ctx);
  auto clipboard_service = std::make_shared<service::ClipboardService>(ctx);
  auto file_service      = std::make_shared<service::FileService>(ctx);
  auto tiering_service   = std::make_shared<service::TieringService>(ctx);
  auto transfer_service  = std::make_shared<service::TransferService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(catalog_service));
  app.grpc_services.push_back(std::make_unique<grpc::ClipboardServer>(clipboard_service));
  app.grpc_services.push_back(std::make_unique<grpc::FileServer>(file_service));
  app.grpc_services.push_back(std::make_unique<grpc::TieringServer>(tiering_service));
  app.grpc_services.push_back(std::make_unique<grpc::TransferServer>(transfer_service));

  app.context = std::move(ctx);

  TIERBRIDGE_LOG_INFO("application built", {IntField("sources", static_cast<int64_t>(registry->List().size())),
                                             IntField("transfer_workers", config.transfer().workers())});
  return app;
}

} // namespace tierbridge::factory
