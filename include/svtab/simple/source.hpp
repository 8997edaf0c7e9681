/**
 * @file source.hpp
 * @brief Declarative in-memory table source
 *
 * Declares a fixed set of tables up front, each a column list plus a
 * factory producing JSON records. Record keys are matched to column names;
 * missing keys read as NULL.
 *
 * Usage:
 *   auto source = svtab::simple::simple_source()
 *       .table("people", {"name", "age"}, svtab::simple::records(svtab::json::parse(R"([
 *           {"name": "alice", "age": 31},
 *           {"name": "bob"}
 *       ])")))
 *       .build();
 *
 *   source->register_tables(db, "simple");   // CREATE VIRTUAL TABLE per table
 *   db.query("SELECT name FROM people");
 *
 * Sources must be owned by a std::shared_ptr (build() returns one) for
 * register_tables() to work.
 */

#pragma once

#include <svtab/database.hpp>
#include <svtab/json.hpp>
#include <svtab/module.hpp>
#include <svtab/table.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace svtab::simple {

// ============================================================================
// Records
// ============================================================================

// Pull closure over one pass of records; std::nullopt ends the pass
using RecordGenerator = std::function<std::optional<json>()>;

// Called once per scan; each call starts a fresh pass
using RecordFactory = std::function<RecordGenerator()>;

inline RecordFactory records(std::vector<json> items) {
    auto shared = std::make_shared<const std::vector<json>>(std::move(items));
    return [shared]() -> RecordGenerator {
        size_t pos = 0;
        return [shared, pos]() mutable -> std::optional<json> {
            if (pos >= shared->size()) return std::nullopt;
            return (*shared)[pos++];
        };
    };
}

// Records from a JSON array
inline RecordFactory records(const json& array) {
    if (!array.is_array()) {
        throw ArgumentError("records must be a JSON array, got " + std::string(array.type_name()));
    }
    return records(std::vector<json>(array.begin(), array.end()));
}

struct SimpleTableDef {
    std::vector<std::string> columns;
    RecordFactory make_records;   // null: the table is empty
};

// ============================================================================
// Table and Cursor
// ============================================================================

class SimpleTable;

class SimpleCursor : public BasicCursor<SimpleTable> {
public:
    using BasicCursor::BasicCursor;

protected:
    std::unique_ptr<RowIterator> row_iterator(int, const std::string&,
                                              const std::vector<Value>&) override;
};

class SimpleTable : public BasicTable<SimpleTable, SimpleCursor> {
public:
    SimpleTable(std::string name, SimpleTableDef def)
        : name_(std::move(name)), def_(std::move(def)) {}

    std::vector<std::string> column_names() const override { return def_.columns; }
    std::string table_name() const override { return name_; }

    const SimpleTableDef& definition() const { return def_; }

private:
    std::string name_;
    SimpleTableDef def_;
};

inline std::unique_ptr<RowIterator> SimpleCursor::row_iterator(int, const std::string&,
                                                               const std::vector<Value>&) {
    const SimpleTableDef& def = table().definition();
    if (!def.make_records) {
        return make_row_iterator(std::vector<Row>{});
    }

    RecordGenerator gen = def.make_records();
    const std::vector<std::string>* columns = &def.columns;
    int64_t next_id = 0;

    return make_row_iterator([gen, columns, next_id]() mutable -> std::optional<Row> {
        if (!gen) return std::nullopt;
        std::optional<json> record = gen();
        if (!record) return std::nullopt;
        if (!record->is_object()) {
            throw DataSourceError("record " + std::to_string(next_id) + " is a JSON " +
                                  record->type_name() + ", expected an object");
        }

        Row row;
        row.row_id = next_id++;
        row.values.reserve(columns->size());
        for (const auto& name : *columns) {
            auto it = record->find(name);
            row.values.push_back(it == record->end() ? Value() : json_to_value(*it));
        }
        return row;
    });
}

// ============================================================================
// Source
// ============================================================================

class SimpleSource : public TableSource, public std::enable_shared_from_this<SimpleSource> {
public:
    explicit SimpleSource(std::map<std::string, SimpleTableDef> defs) {
        for (auto& [name, def] : defs) {
            tables_.emplace(name, std::make_shared<SimpleTable>(name, std::move(def)));
        }
    }

    // Declared tables take no arguments
    std::shared_ptr<Table> connect_table(sqlite3*, const std::string&, const std::string&,
                                         const std::string& table_name,
                                         const std::vector<std::string>& args) override {
        if (!args.empty()) {
            throw ArgumentError("table " + table_name + " takes no arguments, got " +
                                std::to_string(args.size()));
        }
        auto it = tables_.find(table_name);
        if (it == tables_.end()) {
            throw LookupError("no such declared table: " + table_name);
        }
        return it->second;
    }

    std::vector<std::string> table_names() const {
        std::vector<std::string> names;
        names.reserve(tables_.size());
        for (const auto& entry : tables_) {
            names.push_back(entry.first);
        }
        return names;
    }

    /**
     * Register this source as module_name and create one virtual table per
     * declared table, in name order. Stops at the first failure.
     * @return SQLite result code; *error receives the message on failure
     */
    int register_tables(sqlite3* db, const std::string& module_name,
                        ModuleOptions options = {}, std::string* error = nullptr) {
        int rc = register_source(db, module_name, shared_from_this(), std::move(options));
        if (rc != SQLITE_OK) {
            if (error) *error = "cannot register module " + module_name + ": " + sqlite3_errstr(rc);
            return rc;
        }
        for (const auto& entry : tables_) {
            rc = create_virtual_table(db, entry.first, module_name, {}, error);
            if (rc != SQLITE_OK) return rc;
        }
        return SQLITE_OK;
    }

    bool register_tables(Database& db, const std::string& module_name,
                         ModuleOptions options = {}) {
        if (!db.register_source(module_name, shared_from_this(), std::move(options))) {
            return false;
        }
        for (const auto& entry : tables_) {
            if (!db.create_virtual_table(entry.first, module_name)) return false;
        }
        return true;
    }

private:
    std::map<std::string, std::shared_ptr<SimpleTable>> tables_;
};

// ============================================================================
// Builder (Fluent API)
// ============================================================================

class SimpleSourceBuilder {
    std::map<std::string, SimpleTableDef> defs_;
public:
    SimpleSourceBuilder& table(const std::string& name, std::vector<std::string> columns,
                               RecordFactory make_records = nullptr) {
        if (defs_.count(name)) {
            throw ArgumentError("table declared twice: " + name);
        }
        defs_.emplace(name, SimpleTableDef{std::move(columns), std::move(make_records)});
        return *this;
    }

    std::shared_ptr<SimpleSource> build() {
        return std::make_shared<SimpleSource>(std::move(defs_));
    }
};

inline SimpleSourceBuilder simple_source() {
    return SimpleSourceBuilder();
}

} // namespace svtab::simple
