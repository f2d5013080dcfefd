#pragma once

#include "db.hpp"
#include "record.hpp"
#include "sync_queue.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// backing_store - persistence substrate behind the record store and queue
// ============================================================================
//
// Implementations must be safe to call from multiple threads. Failures are
// reported as db_error.

class backing_store {
public:
    virtual ~backing_store() = default;

    // Records in insertion order
    virtual std::vector<record> load_records() = 0;
    virtual void save_record(const record& r) = 0;
    virtual void erase_record(const std::string& id) = 0;

    virtual std::vector<sync_operation> load_operations() = 0;
    virtual void save_operation(const sync_operation& op) = 0;
    virtual void erase_operation(const std::string& id) = 0;

    // Drops every record and operation
    virtual void clear() = 0;
};

// Keeps nothing: state lives only as long as the process
class null_backing_store : public backing_store {
public:
    std::vector<record> load_records() override { return {}; }
    void save_record(const record&) override {}
    void erase_record(const std::string&) override {}
    std::vector<sync_operation> load_operations() override { return {}; }
    void save_operation(const sync_operation&) override {}
    void erase_operation(const std::string&) override {}
    void clear() override {}
};

// SQLite tables "Record" and "SyncOperation"
class sqlite_backing_store : public backing_store {
public:
    explicit sqlite_backing_store(const std::string& path);

    std::vector<record> load_records() override;
    void save_record(const record& r) override;
    void erase_record(const std::string& id) override;

    std::vector<sync_operation> load_operations() override;
    void save_operation(const sync_operation& op) override;
    void erase_operation(const std::string& id) override;

    void clear() override;

private:
    void ensure_schema();

    std::mutex mutex_;
    database db_;
};

} // namespace tether
