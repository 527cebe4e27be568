#pragma once

#include <mutex>
#include <unordered_set>

#include "internal/db/api/message_store.hpp"
#include "pg_pool.hpp"

namespace unison::db::postgres {

/*
  Message store backed by the pgmq extension.

  Every operation is a single pgmq function call in its own
  transaction on a pooled connection. Queues are created on first
  send; the set of queues known to exist is cached per process and
  invalidated when a send finds the queue table gone.
*/
class PgMessageStore final : public db::MessageStore {
public:
  explicit PgMessageStore(std::shared_ptr<PgPool> pool);

  // Installs the pgmq extension if missing.
  void BootstrapSchema();

  void CreateQueue(const std::string& queue) override;
  int64_t Send(const std::string& queue, const std::string& message_json) override;
  std::optional<model::MessageRecord> Read(const std::string& queue, std::chrono::seconds vt) override;
  bool Archive(const std::string& queue, int64_t msg_id) override;
  bool DropQueue(const std::string& queue) override;
  std::vector<std::string> ListQueues() override;
  uint64_t QueueLength(const std::string& queue) override;

private:
  int64_t SendOnce(const std::string& queue, const std::string& message_json);

  bool IsKnown(const std::string& queue);
  void MarkKnown(const std::string& queue);
  void Forget(const std::string& queue);

  [[noreturn]] static void Translate(const std::exception& e, const std::string& op);

  std::shared_ptr<PgPool> pool_;

  std::mutex known_mutex_;
  std::unordered_set<std::string> known_queues_;
};

}
