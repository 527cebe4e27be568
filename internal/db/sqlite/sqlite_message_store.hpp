#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include "internal/db/api/message_store.hpp"
#include "internal/util/time.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace unison::db::sqlite {

/*
  pgmq-compatible queue tables in a single SQLite file.

  All queues share queue_message / queue_archive, keyed by queue_name.
  msg_id comes from AUTOINCREMENT, so ids are never reused, even
  after archive.
*/
class SqliteMessageStore final : public db::MessageStore {
public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit SqliteMessageStore(std::shared_ptr<SqliteDB> db, ClockFn clock = util::Now);

  // Creates the queue tables if missing.
  void BootstrapSchema();

  void CreateQueue(const std::string& queue) override;
  int64_t Send(const std::string& queue, const std::string& message_json) override;
  std::optional<model::MessageRecord> Read(const std::string& queue, std::chrono::seconds vt) override;
  bool Archive(const std::string& queue, int64_t msg_id) override;
  bool DropQueue(const std::string& queue) override;
  std::vector<std::string> ListQueues() override;
  uint64_t QueueLength(const std::string& queue) override;

private:
  void InsertQueue(sqlite3* db, const std::string& queue, uint64_t now_ms);

  std::shared_ptr<SqliteDB> db_;
  ClockFn clock_;

  // one connection: transactions must not interleave across threads
  std::mutex mutex_;
};

}
