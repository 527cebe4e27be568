#include "pg_message_store.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace unison::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override { tx_.exec(sql); }

private:
  pqxx::work& tx_;
};

} // namespace

PgMessageStore::PgMessageStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgMessageStore::Translate(const std::exception& e, const std::string& op) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    throw util::StoreUnavailable("postgres connection lost during " + op + ": " + e.what());
  }
  throw util::StoreUnavailable("postgres " + op + " failed: " + e.what());
}

bool PgMessageStore::IsKnown(const std::string& queue) {
  std::lock_guard lock(known_mutex_);
  return known_queues_.contains(queue);
}

void PgMessageStore::MarkKnown(const std::string& queue) {
  std::lock_guard lock(known_mutex_);
  known_queues_.insert(queue);
}

void PgMessageStore::Forget(const std::string& queue) {
  std::lock_guard lock(known_mutex_);
  known_queues_.erase(queue);
}

void PgMessageStore::BootstrapSchema() {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    PgMigrationExecutor executor(tx);
    sql::RunMigrations(executor, sql::PostgresQueueSchema());
    tx.commit();
  } catch (const std::exception& e) {
    Translate(e, "bootstrap");
  }
}

void PgMessageStore::CreateQueue(const std::string& queue) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("pgmq_create", queue);
    tx.commit();
  } catch (const std::exception& e) {
    Translate(e, "create queue");
  }
  MarkKnown(queue);
}

int64_t PgMessageStore::SendOnce(const std::string& queue, const std::string& message_json) {
  const bool known = IsKnown(queue);

  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  if (!known) {
    tx.exec_prepared("pgmq_create", queue);
  }
  auto res = tx.exec_prepared("pgmq_send", queue, message_json);
  tx.commit();

  if (!known) {
    MarkKnown(queue);
  }
  return res[0][0].as<int64_t>();
}

int64_t PgMessageStore::Send(const std::string& queue, const std::string& message_json) {
  try {
    try {
      return SendOnce(queue, message_json);
    } catch (const pqxx::undefined_table&) {
      // dropped behind our back: recreate once
      Forget(queue);
      return SendOnce(queue, message_json);
    }
  } catch (const std::exception& e) {
    Translate(e, "send");
  }
}

std::optional<model::MessageRecord> PgMessageStore::Read(const std::string& queue, std::chrono::seconds vt) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("pgmq_read", queue, static_cast<int>(vt.count()));
    tx.commit();

    if (res.empty()) return std::nullopt;

    model::MessageRecord r;
    r.msg_id         = res[0][0].as<int64_t>();
    r.read_ct        = res[0][1].as<int32_t>();
    r.enqueued_at_ms = res[0][2].as<uint64_t>();
    r.vt_ms          = res[0][3].as<uint64_t>();
    r.message        = res[0][4].c_str();
    return r;
  } catch (const pqxx::undefined_table&) {
    Forget(queue);
    return std::nullopt;
  } catch (const std::exception& e) {
    Translate(e, "read");
  }
}

bool PgMessageStore::Archive(const std::string& queue, int64_t msg_id) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("pgmq_archive", queue, msg_id);
    tx.commit();
    return !res.empty() && !res[0][0].is_null() && res[0][0].as<bool>();
  } catch (const pqxx::undefined_table&) {
    Forget(queue);
    return false;
  } catch (const std::exception& e) {
    Translate(e, "archive");
  }
}

bool PgMessageStore::DropQueue(const std::string& queue) {
  Forget(queue);
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);

    // some pgmq releases raise instead of returning false for a missing queue
    auto exists = tx.exec_prepared("pgmq_queue_exists", queue);
    if (exists.empty() || !exists[0][0].as<bool>()) {
      tx.commit();
      return false;
    }

    auto res = tx.exec_prepared("pgmq_drop_queue", queue);
    tx.commit();
    return !res.empty() && !res[0][0].is_null() && res[0][0].as<bool>();
  } catch (const pqxx::undefined_table&) {
    return false;
  } catch (const std::exception& e) {
    Translate(e, "drop queue");
  }
}

std::vector<std::string> PgMessageStore::ListQueues() {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("pgmq_list_queues");
    tx.commit();

    std::vector<std::string> names;
    names.reserve(res.size());
    for (const auto& row : res) {
      names.emplace_back(row[0].c_str());
    }
    return names;
  } catch (const std::exception& e) {
    Translate(e, "list queues");
  }
}

uint64_t PgMessageStore::QueueLength(const std::string& queue) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("pgmq_queue_length", queue);
    tx.commit();
    if (res.empty()) return 0;
    return res[0][0].as<uint64_t>();
  } catch (const pqxx::undefined_table&) {
    return 0;
  } catch (const std::exception& e) {
    Translate(e, "queue length");
  }
}

} // namespace unison::db::postgres
