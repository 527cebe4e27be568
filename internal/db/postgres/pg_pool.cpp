#include "pg_pool.hpp"

namespace unison::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          try {
            PrepareStatements(*conn);
          } catch (...) {
            delete conn;
            throw;
          }
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("pgmq_create", "SELECT pgmq.create($1)");

  conn.prepare("pgmq_send", "SELECT pgmq.send($1, $2::jsonb)");

  conn.prepare("pgmq_read",
               "SELECT msg_id, read_ct, "
               "(EXTRACT(EPOCH FROM enqueued_at) * 1000)::bigint, "
               "(EXTRACT(EPOCH FROM vt) * 1000)::bigint, "
               "message::text "
               "FROM pgmq.read($1, $2, 1)");

  conn.prepare("pgmq_archive", "SELECT pgmq.archive($1, $2::bigint)");

  conn.prepare("pgmq_queue_exists", "SELECT EXISTS (SELECT 1 FROM pgmq.list_queues() WHERE queue_name = $1)");

  conn.prepare("pgmq_drop_queue", "SELECT pgmq.drop_queue($1)");

  conn.prepare("pgmq_list_queues", "SELECT queue_name FROM pgmq.list_queues() ORDER BY queue_name");

  conn.prepare("pgmq_queue_length", "SELECT queue_length FROM pgmq.metrics($1)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace unison::db::postgres
