#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_message_store.hpp"
#include "internal/observability/logging.hpp"
#if UNISON_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_message_store.hpp"
#endif
#if UNISON_DB_POSTGRES
#include "internal/db/postgres/pg_message_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace unison::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::MessageStore> BuildMessageStore(const unison::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if UNISON_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto store     = std::make_shared<db::sqlite::SqliteMessageStore>(std::move(sqlite_db));
    store->BootstrapSchema();
    UNISON_LOG_INFO("message store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return store;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if UNISON_DB_POSTGRES
    const auto& pg = database.postgres();
    if (pg.connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri is required");
    }
    const std::size_t max_connections = pg.max_connections() > 0 ? pg.max_connections() : 16;

    auto pool  = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), max_connections);
    auto store = std::make_shared<db::postgres::PgMessageStore>(std::move(pool));
    store->BootstrapSchema();
    UNISON_LOG_INFO("message store ready",
                    {StringField("backend", "postgres"), IntField("max_connections", static_cast<int64_t>(max_connections))});
    return store;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  UNISON_LOG_INFO("message store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryMessageStore>();
}

/*
    Build full queue dependency graph
*/
Runtime Build(const unison::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  runtime.store        = BuildMessageStore(config);
  runtime.client       = std::make_shared<queue::QueueClient>(runtime.store, queue::QueueClientOptions::FromConfig(config));
  runtime.orchestrator = std::make_shared<queue::RetryOrchestrator>(runtime.client);

  return runtime;
}

std::vector<std::unique_ptr<worker::QueueWorker>> BuildWorkers(const Runtime& runtime,
                                                               const unison::runtime::config::RuntimeConfig& config,
                                                               const queue::Handler& handler) {
  const auto& worker_config = config.worker();

  std::vector<std::unique_ptr<worker::QueueWorker>> workers;
  for (const auto& queue : worker_config.queues()) {
    worker::QueueWorkerOptions options;
    options.queue              = queue;
    options.visibility_timeout = std::chrono::seconds(worker_config.visibility_timeout_sec());
    if (worker_config.poll_interval_ms() > 0) {
      options.poll_interval = std::chrono::milliseconds(worker_config.poll_interval_ms());
    }
    workers.push_back(std::make_unique<worker::QueueWorker>(runtime.client, runtime.orchestrator, std::move(options), handler));
  }
  return workers;
}

} // namespace unison::factory
