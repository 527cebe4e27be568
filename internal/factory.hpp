#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/message_store.hpp"
#include "internal/queue/queue_client.hpp"
#include "internal/queue/retry_orchestrator.hpp"
#include "internal/worker/queue_worker.hpp"

namespace unison::factory {

/*
  Runtime

  Owns the long-lived objects of a queue process.
*/
struct Runtime {
  std::shared_ptr<db::MessageStore>         store;
  std::shared_ptr<queue::QueueClient>       client;
  std::shared_ptr<queue::RetryOrchestrator> orchestrator;
};

/*
  BuildMessageStore

  Selects the backend named by `database` (memory when unset) and
  bootstraps its schema.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
std::shared_ptr<db::MessageStore> BuildMessageStore(const unison::runtime::config::RuntimeConfig& config);

Runtime Build(const unison::runtime::config::RuntimeConfig& config);

// One stopped worker per `worker.queues` entry.
std::vector<std::unique_ptr<worker::QueueWorker>> BuildWorkers(const Runtime& runtime,
                                                               const unison::runtime::config::RuntimeConfig& config,
                                                               const queue::Handler& handler);

} // namespace unison::factory
