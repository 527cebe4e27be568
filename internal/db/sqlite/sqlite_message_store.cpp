#include "sqlite_message_store.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace unison::db::sqlite {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[noreturn]] void Translate(sqlite3* db, int rc, const char* what) {
    std::string msg = std::string(what) + ": " + sqlite3_errmsg(db);
    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            throw util::StoreUnavailable("sqlite busy, " + msg);
        case SQLITE_CORRUPT:
            throw util::StoreUnavailable("sqlite corruption, " + msg);
        default:
            throw util::StoreUnavailable(msg);
    }
}

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK) Translate(db, rc, "sqlite prepare");
    return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Step a statement that returns no rows.
void StepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) Translate(db, rc, what);
}

} // namespace

SqliteMessageStore::SqliteMessageStore(std::shared_ptr<SqliteDB> db, ClockFn clock)
    : db_(std::move(db)), clock_(std::move(clock)) {}

void SqliteMessageStore::BootstrapSchema() {
    std::scoped_lock lock(mutex_);
    sql::RunMigrations(*db_, sql::SqliteQueueSchema());
}

void SqliteMessageStore::InsertQueue(sqlite3* db, const std::string& queue, uint64_t now_ms) {
    auto st = Prepare(db, "INSERT OR IGNORE INTO queue_meta(queue_name, created_at_ms) VALUES(?,?);");
    BindText(st.get(), 1, queue);
    BindU64(st.get(), 2, now_ms);
    StepDone(db, st.get(), "sqlite create queue");
}

void SqliteMessageStore::CreateQueue(const std::string& queue) {
    std::scoped_lock lock(mutex_);
    SqliteTransaction tx(db_);
    InsertQueue(tx.Handle(), queue, util::ToUnixMillis(clock_()));
    tx.Commit();
}

int64_t SqliteMessageStore::Send(const std::string& queue, const std::string& message_json) {
    const auto now = util::ToUnixMillis(clock_());

    std::scoped_lock lock(mutex_);
    SqliteTransaction tx(db_);
    auto* db = tx.Handle();

    InsertQueue(db, queue, now);

    auto st = Prepare(db,
        "INSERT INTO queue_message(queue_name, read_ct, enqueued_at_ms, vt_ms, message) "
        "VALUES(?,0,?,?,?);");
    BindText(st.get(), 1, queue);
    BindU64(st.get(), 2, now);
    BindU64(st.get(), 3, now);
    BindText(st.get(), 4, message_json);
    StepDone(db, st.get(), "sqlite send");

    const auto msg_id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    tx.Commit();
    return msg_id;
}

std::optional<model::MessageRecord> SqliteMessageStore::Read(const std::string& queue, std::chrono::seconds vt) {
    const auto now = util::ToUnixMillis(clock_());

    std::scoped_lock lock(mutex_);
    SqliteTransaction tx(db_);
    auto* db = tx.Handle();

    auto select = Prepare(db,
        "SELECT msg_id, read_ct, enqueued_at_ms, message FROM queue_message "
        "WHERE queue_name=? AND vt_ms<=? ORDER BY msg_id ASC LIMIT 1;");
    BindText(select.get(), 1, queue);
    BindU64(select.get(), 2, now);

    int rc = sqlite3_step(select.get());
    if (rc == SQLITE_DONE) {
        tx.Commit();
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) Translate(db, rc, "sqlite read");

    model::MessageRecord r;
    r.msg_id         = sqlite3_column_int64(select.get(), 0);
    r.read_ct        = sqlite3_column_int(select.get(), 1) + 1;
    r.enqueued_at_ms = ColU64(select.get(), 2);
    r.message        = ColText(select.get(), 3);
    r.vt_ms          = now + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(vt).count());
    select.reset();

    auto lease = Prepare(db, "UPDATE queue_message SET vt_ms=?, read_ct=read_ct+1 WHERE msg_id=?;");
    BindU64(lease.get(), 1, r.vt_ms);
    BindI64(lease.get(), 2, r.msg_id);
    StepDone(db, lease.get(), "sqlite lease");

    tx.Commit();
    return r;
}

bool SqliteMessageStore::Archive(const std::string& queue, int64_t msg_id) {
    const auto now = util::ToUnixMillis(clock_());

    std::scoped_lock lock(mutex_);
    SqliteTransaction tx(db_);
    auto* db = tx.Handle();

    auto copy = Prepare(db,
        "INSERT INTO queue_archive(msg_id, queue_name, read_ct, enqueued_at_ms, archived_at_ms, vt_ms, message) "
        "SELECT msg_id, queue_name, read_ct, enqueued_at_ms, ?, vt_ms, message FROM queue_message "
        "WHERE queue_name=? AND msg_id=?;");
    BindU64(copy.get(), 1, now);
    BindText(copy.get(), 2, queue);
    BindI64(copy.get(), 3, msg_id);
    StepDone(db, copy.get(), "sqlite archive");

    if (sqlite3_changes(db) == 0) {
        tx.Commit();
        return false;
    }

    auto remove = Prepare(db, "DELETE FROM queue_message WHERE queue_name=? AND msg_id=?;");
    BindText(remove.get(), 1, queue);
    BindI64(remove.get(), 2, msg_id);
    StepDone(db, remove.get(), "sqlite archive delete");

    tx.Commit();
    return true;
}

bool SqliteMessageStore::DropQueue(const std::string& queue) {
    std::scoped_lock lock(mutex_);
    SqliteTransaction tx(db_);
    auto* db = tx.Handle();

    // queue_message and queue_archive rows cascade
    auto st = Prepare(db, "DELETE FROM queue_meta WHERE queue_name=?;");
    BindText(st.get(), 1, queue);
    StepDone(db, st.get(), "sqlite drop queue");

    const bool dropped = sqlite3_changes(db) > 0;
    tx.Commit();
    return dropped;
}

std::vector<std::string> SqliteMessageStore::ListQueues() {
    std::scoped_lock lock(mutex_);
    auto* db = db_->Handle();

    auto st = Prepare(db, "SELECT queue_name FROM queue_meta ORDER BY queue_name ASC;");
    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        names.push_back(ColText(st.get(), 0));
    }
    if (rc != SQLITE_DONE) Translate(db, rc, "sqlite list queues");
    return names;
}

uint64_t SqliteMessageStore::QueueLength(const std::string& queue) {
    std::scoped_lock lock(mutex_);
    auto* db = db_->Handle();

    auto st = Prepare(db, "SELECT COUNT(*) FROM queue_message WHERE queue_name=?;");
    BindText(st.get(), 1, queue);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) Translate(db, rc, "sqlite queue length");
    return ColU64(st.get(), 0);
}

} // namespace unison::db::sqlite
