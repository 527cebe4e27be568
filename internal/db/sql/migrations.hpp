#pragma once

#include <string>
#include <vector>

namespace unison::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Every statement must be idempotent
  (IF NOT EXISTS) since bootstrap runs on every process start.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Queue tables for the sqlite backend (pgmq layout, one shared table).
const std::vector<std::string>& SqliteQueueSchema();

// Postgres relies on the pgmq extension for its queue tables.
const std::vector<std::string>& PostgresQueueSchema();

} // namespace unison::db::sql
