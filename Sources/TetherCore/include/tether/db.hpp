#pragma once

#include "errors.hpp"
#include <sqlite3.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tether {

// SQLite column value
using column_value_t = std::variant<std::nullptr_t, int64_t, double, std::string>;

inline column_value_t to_column_value(int64_t v) { return v; }
inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
inline column_value_t to_column_value(const std::string& v) { return v; }

class database {
public:
    // ":memory:" opens a private in-memory database
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name) const;

    // INSERT, or INSERT ... ON CONFLICT (conflict_columns) DO UPDATE when
    // conflict_columns is non-empty
    void insert(const std::string& table,
                const std::vector<std::pair<std::string, column_value_t>>& values,
                const std::vector<std::string>& conflict_columns = {});

    // DELETE FROM table WHERE key_column = key
    void remove(const std::string& table, const std::string& key_column, const column_value_t& key);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();

    // Execute SQL with optional params (for statements without a result set)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    const std::string& path() const { return path_; }

private:
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);

    sqlite3* db_ = nullptr;
    std::string path_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

// Typed accessors for query rows. Missing or NULL columns yield the fallback.
std::string column_text(const database::row_t& row, const std::string& name, const std::string& fallback = "");
int64_t column_int(const database::row_t& row, const std::string& name, int64_t fallback = 0);
bool column_is_null(const database::row_t& row, const std::string& name);

} // namespace tether
