#include "tether/backing_store.hpp"
#include "tether/log.hpp"

namespace tether {

namespace {

record record_from_row(const database::row_t& row) {
    record r;
    r.id = column_text(row, "id");
    r.name = column_text(row, "name");
    r.owner_id = column_text(row, "owner_id");
    r.created_at = parse_timestamp(column_text(row, "created_at")).value_or(timestamp_t{});
    r.updated_at = parse_timestamp(column_text(row, "updated_at")).value_or(r.created_at);
    r.deleted = column_int(row, "deleted") != 0;
    return r;
}

} // namespace

sqlite_backing_store::sqlite_backing_store(const std::string& path)
    : db_(path) {
    ensure_schema();
    LOG_INFO("sqlite", "Opened backing store at %s", path.c_str());
}

void sqlite_backing_store::ensure_schema() {
    if (!db_.table_exists("Record")) {
        db_.execute(
            "CREATE TABLE Record ("
            "id TEXT PRIMARY KEY NOT NULL, "
            "name TEXT NOT NULL, "
            "owner_id TEXT NOT NULL, "
            "created_at TEXT NOT NULL, "
            "updated_at TEXT NOT NULL, "
            "deleted INTEGER NOT NULL DEFAULT 0)");
        db_.execute("CREATE INDEX idx_Record_owner ON Record(owner_id)");
    }
    if (!db_.table_exists("SyncOperation")) {
        db_.execute(
            "CREATE TABLE SyncOperation ("
            "id TEXT PRIMARY KEY NOT NULL, "
            "kind TEXT NOT NULL, "
            "record_id TEXT NOT NULL UNIQUE, "
            "payload TEXT NOT NULL, "
            "status TEXT NOT NULL, "
            "attempts INTEGER NOT NULL DEFAULT 0, "
            "last_error TEXT, "
            "failure TEXT, "
            "created_at TEXT NOT NULL, "
            "last_attempt_at TEXT, "
            "revision INTEGER NOT NULL DEFAULT 0, "
            "sequence INTEGER NOT NULL DEFAULT 0)");
    }
}

std::vector<record> sqlite_backing_store::load_records() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<record> result;
    for (const auto& row : db_.query("SELECT * FROM Record ORDER BY rowid")) {
        result.push_back(record_from_row(row));
    }
    return result;
}

void sqlite_backing_store::save_record(const record& r) {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.insert("Record", {
        {"id", r.id},
        {"name", r.name},
        {"owner_id", r.owner_id},
        {"created_at", format_timestamp(r.created_at)},
        {"updated_at", format_timestamp(r.updated_at)},
        {"deleted", to_column_value(r.deleted)},
    }, {"id"});
}

void sqlite_backing_store::erase_record(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.remove("Record", "id", id);
}

std::vector<sync_operation> sqlite_backing_store::load_operations() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<sync_operation> result;
    for (const auto& row : db_.query("SELECT * FROM SyncOperation ORDER BY sequence")) {
        auto kind = operation_kind_from_string(column_text(row, "kind"));
        auto status = sync_status_from_string(column_text(row, "status"));
        auto payload = record::from_json(column_text(row, "payload"));
        if (!kind || !status || !payload) {
            LOG_ERROR("sqlite", "Skipping unreadable SyncOperation %s", column_text(row, "id").c_str());
            continue;
        }

        sync_operation op;
        op.id = column_text(row, "id");
        op.kind = *kind;
        op.record_id = column_text(row, "record_id");
        op.payload = *payload;
        op.status = *status;
        op.attempts = static_cast<int>(column_int(row, "attempts"));
        op.last_error = column_text(row, "last_error");
        op.failure = failure_kind_from_string(column_text(row, "failure"));
        op.created_at = parse_timestamp(column_text(row, "created_at")).value_or(timestamp_t{});
        if (!column_is_null(row, "last_attempt_at")) {
            op.last_attempt_at = parse_timestamp(column_text(row, "last_attempt_at"));
        }
        op.revision = static_cast<uint64_t>(column_int(row, "revision"));
        op.sequence = static_cast<uint64_t>(column_int(row, "sequence"));
        result.push_back(std::move(op));
    }
    return result;
}

void sqlite_backing_store::save_operation(const sync_operation& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    column_value_t last_attempt = nullptr;
    if (op.last_attempt_at) {
        last_attempt = format_timestamp(*op.last_attempt_at);
    }

    // A replacing delete gets a fresh id for the same record_id
    transaction tx(db_);
    db_.execute("DELETE FROM SyncOperation WHERE record_id = ? AND id != ?", {op.record_id, op.id});
    db_.insert("SyncOperation", {
        {"id", op.id},
        {"kind", std::string(to_string(op.kind))},
        {"record_id", op.record_id},
        {"payload", op.payload.to_json()},
        {"status", std::string(to_string(op.status))},
        {"attempts", to_column_value(op.attempts)},
        {"last_error", op.last_error},
        {"failure", std::string(to_string(op.failure))},
        {"created_at", format_timestamp(op.created_at)},
        {"last_attempt_at", last_attempt},
        {"revision", static_cast<int64_t>(op.revision)},
        {"sequence", static_cast<int64_t>(op.sequence)},
    }, {"id"});
    tx.commit();
}

void sqlite_backing_store::erase_operation(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.remove("SyncOperation", "id", id);
}

void sqlite_backing_store::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    transaction tx(db_);
    db_.execute("DELETE FROM SyncOperation");
    db_.execute("DELETE FROM Record");
    tx.commit();
}

} // namespace tether
