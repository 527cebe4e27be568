#include "migrations.hpp"

namespace unison::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteQueueSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS queue_meta (queue_name TEXT PRIMARY KEY, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS queue_message (msg_id INTEGER PRIMARY KEY AUTOINCREMENT, queue_name TEXT NOT NULL REFERENCES queue_meta(queue_name) ON DELETE CASCADE, read_ct INTEGER NOT NULL DEFAULT 0, enqueued_at_ms INTEGER NOT NULL, vt_ms INTEGER NOT NULL, message TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS queue_message_visible_idx ON queue_message(queue_name, vt_ms, msg_id);",
      "CREATE TABLE IF NOT EXISTS queue_archive (msg_id INTEGER PRIMARY KEY, queue_name TEXT NOT NULL REFERENCES queue_meta(queue_name) ON DELETE CASCADE, read_ct INTEGER NOT NULL, enqueued_at_ms INTEGER NOT NULL, archived_at_ms INTEGER NOT NULL, vt_ms INTEGER NOT NULL, message TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS queue_archive_queue_idx ON queue_archive(queue_name);"};
  return kSchema;
}

const std::vector<std::string>& PostgresQueueSchema() {
  static const std::vector<std::string> kSchema = {"CREATE EXTENSION IF NOT EXISTS pgmq CASCADE;"};
  return kSchema;
}

} // namespace unison::db::sql
