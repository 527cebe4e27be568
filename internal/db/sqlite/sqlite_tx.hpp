#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace unison::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early, so a lease read and its
      visibility update cannot interleave with another process
  Destructor rolls back if not committed.
*/
class SqliteTransaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit();

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
