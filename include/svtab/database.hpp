/**
 * svtab/database.hpp - RAII SQLite connection with virtual table helpers
 *
 * Part of libsvtab - SQLite virtual tables from tables, cursors and row iterators.
 *
 * Example usage:
 *
 *   svtab::Database db;
 *   if (!db.is_open()) {
 *       fprintf(stderr, "Error: %s\n", db.last_error().c_str());
 *       return 1;
 *   }
 *
 *   db.register_source("csv", std::make_shared<svtab::csv::CsvSource>());
 *   db.create_virtual_table("people", "csv", {"'people.csv'"});
 *
 *   auto result = db.query("SELECT name FROM people WHERE age > 30");
 *   if (!result.ok()) {
 *       fprintf(stderr, "Query error: %s\n", result.error.c_str());
 *       return 1;
 *   }
 *   for (const auto& row : result) {
 *       printf("%s\n", row[0].c_str());
 *   }
 *
 * Failures are reported through return values and last_error(), never by
 * throwing.
 */

#pragma once

#include "module.hpp"

#include <sqlite3.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace svtab {

// ============================================================================
// Query Results
// ============================================================================

// Every column rendered as text; NULL reads as ""
struct ResultRow {
    std::vector<std::string> values;

    const std::string& operator[](size_t i) const { return values[i]; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

struct Result {
    std::vector<std::string> columns;
    std::vector<ResultRow> rows;
    std::string error;   // empty on success; rows fetched before a failure are kept

    bool ok() const { return error.empty(); }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const ResultRow& operator[](size_t i) const { return rows[i]; }

    std::vector<ResultRow>::const_iterator begin() const { return rows.begin(); }
    std::vector<ResultRow>::const_iterator end() const { return rows.end(); }
};

namespace detail {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

inline std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text) return std::string();
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

} // namespace detail

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    // Opens an in-memory database; check is_open()
    Database() { open(":memory:"); }
    explicit Database(const char* path) { open(path); }
    explicit Database(const std::string& path) { open(path); }
    ~Database() { close(); }

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Database(Database&& other) noexcept
        : db_(std::exchange(other.db_, nullptr)),
          last_error_(std::move(other.last_error_)) {}

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = std::exchange(other.db_, nullptr);
            last_error_ = std::move(other.last_error_);
        }
        return *this;
    }

    // ========================================================================
    // Connection
    // ========================================================================

    bool open(const char* path = ":memory:") {
        close();
        sqlite3* db = nullptr;
        int rc = sqlite3_open(path, &db);
        if (rc != SQLITE_OK) {
            last_error_ = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close(db);
            return false;
        }
        db_ = db;
        last_error_.clear();
        return true;
    }

    bool open(const std::string& path) { return open(path.c_str()); }

    // Disconnects every virtual table and drops the module registrations
    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }
    sqlite3* handle() const { return db_; }
    const std::string& last_error() const { return last_error_; }

    // ========================================================================
    // Virtual Tables
    // ========================================================================

    bool register_source(const std::string& module_name,
                         std::shared_ptr<TableSource> source,
                         ModuleOptions options = {}) {
        if (!require_open()) return false;
        int rc = svtab::register_source(db_, module_name, std::move(source), std::move(options));
        if (rc != SQLITE_OK) {
            return fail("cannot register module " + module_name + ": " + sqlite3_errstr(rc));
        }
        return succeed();
    }

    // Arguments are passed through verbatim; quote string literals yourself
    bool create_virtual_table(const std::string& table_name,
                              const std::string& module_name,
                              const std::vector<std::string>& args = {}) {
        if (!require_open()) return false;
        std::string error;
        if (svtab::create_virtual_table(db_, table_name, module_name, args, &error) != SQLITE_OK) {
            return fail(error);
        }
        return succeed();
    }

    // ========================================================================
    // Statements
    // ========================================================================

    Result query(const std::string& sql) {
        Result result;
        if (!db_) {
            result.error = "Database not open";
            return result;
        }

        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            result.error = sqlite3_errmsg(db_);
            return result;
        }
        detail::Statement stmt(raw);

        const int ncols = sqlite3_column_count(stmt.get());
        for (int i = 0; i < ncols; ++i) {
            const char* name = sqlite3_column_name(stmt.get(), i);
            result.columns.emplace_back(name ? name : "");
        }

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            ResultRow row;
            row.values.reserve(static_cast<size_t>(ncols));
            for (int i = 0; i < ncols; ++i) {
                row.values.push_back(detail::column_text(stmt.get(), i));
            }
            result.rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            result.error = sqlite3_errmsg(db_);
        }
        return result;
    }

    // First column of the first row, or "" when there is none or on error
    std::string scalar(const std::string& sql) {
        Result result = query(sql);
        if (!result.ok() || result.empty() || result[0].empty()) return std::string();
        return result[0][0];
    }

    // Runs one or more statements, discarding rows
    int exec(const std::string& sql) {
        if (!require_open()) return SQLITE_ERROR;
        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            fail(err ? err : sqlite3_errmsg(db_));
        } else {
            succeed();
        }
        sqlite3_free(err);
        return rc;
    }

private:
    bool require_open() {
        if (db_) return true;
        return fail("Database not open");
    }

    bool fail(std::string msg) {
        last_error_ = std::move(msg);
        return false;
    }

    bool succeed() {
        last_error_.clear();
        return true;
    }

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace svtab
