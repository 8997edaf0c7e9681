/**
 * svtab/table.hpp - Table, Cursor and TableSource contracts
 *
 * Part of libsvtab - SQLite virtual tables from tables, cursors and row iterators.
 *
 * The host engine drives a fixed callback protocol (xCreate/xConnect,
 * xOpen, xFilter, xNext, xEof, xColumn, xRowid, xClose, ...). These classes
 * present that protocol as three overridable roles:
 *
 *   TableSource  - answers CREATE VIRTUAL TABLE / reconnect requests
 *   Table        - declares columns, manufactures cursors
 *   Cursor       - turns one RowIterator per filter() into the
 *                  positioned/eof state the host polls
 *
 * Required capabilities are pure virtual; optional ones default to no-ops.
 *
 * Example:
 *
 *   class NumbersTable;
 *
 *   class NumbersCursor : public svtab::BasicCursor<NumbersTable> {
 *   public:
 *       using BasicCursor::BasicCursor;
 *   protected:
 *       std::unique_ptr<svtab::RowIterator> row_iterator(
 *           int, const std::string&, const std::vector<svtab::Value>&) override;
 *   };
 *
 *   class NumbersTable : public svtab::BasicTable<NumbersTable, NumbersCursor> {
 *   public:
 *       std::vector<std::string> column_names() const override { return {"n"}; }
 *   };
 */

#pragma once

#include "error.hpp"
#include "row.hpp"
#include "value.hpp"

#include <sqlite3.h>
#include <cctype>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace svtab {

class Table;

// ============================================================================
// Identifier Quoting
// ============================================================================

// "name" with embedded double quotes doubled
inline std::string quote_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (char ch : name) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

// Column lists must be non-empty and unique (SQLite compares names ASCII case-insensitively)
inline void validate_columns(const std::vector<std::string>& names) {
    if (names.empty()) {
        throw ArgumentError("table declares no columns");
    }
    std::set<std::string> seen;
    for (const auto& name : names) {
        std::string folded = name;
        for (char& ch : folded) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (!seen.insert(folded).second) {
            throw ArgumentError("duplicate column name: " + name);
        }
    }
}

// ============================================================================
// Index Planning
// ============================================================================

struct IndexConstraint {
    int column;     // -1 for rowid
    int op;         // SQLITE_INDEX_CONSTRAINT_*
    bool usable;
};

struct IndexOrderBy {
    int column;
    bool descending;
};

struct IndexHint {
    int index_number = 0;
    std::string index_name;

    // Positions into the constraint list. Their right-hand values reach
    // row_iterator() in this order.
    std::vector<size_t> used_constraints;

    // The iterator enforces the used constraints itself
    bool omit_checks = false;

    double estimated_cost = 1000000.0;
    std::optional<int64_t> estimated_rows;
    bool order_by_consumed = false;
};

// ============================================================================
// Cursor
// ============================================================================

enum class CursorState {
    Unfiltered,
    Positioned,
    Exhausted
};

inline const char* cursor_state_name(CursorState s) {
    switch (s) {
        case CursorState::Unfiltered: return "unfiltered";
        case CursorState::Positioned: return "positioned";
        case CursorState::Exhausted:  return "exhausted";
    }
    return "unfiltered";
}

/**
 * One open cursor on a table.
 *
 * Cursors are created by Table::open_cursor() and must not outlive the
 * table; they hold it by reference only. Subclasses supply row_iterator()
 * and, when they own resources, close(). Constructors should stay trivial:
 * per-scan setup belongs in row_iterator().
 */
class Cursor {
public:
    explicit Cursor(const Table& table);
    virtual ~Cursor() = default;

    // Non-copyable
    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    // ========================================================================
    // Host Entry Points
    // ========================================================================

    /**
     * (Re-)position the cursor: discard any previous iterator, obtain a
     * fresh one from row_iterator() and prime the first row.
     */
    void filter(int index_number, const std::string& index_name,
                const std::vector<Value>& args) {
        if (released_) {
            throw ContractError("filter() called on a released cursor");
        }
        iter_.reset();
        row_.reset();
        state_ = CursorState::Unfiltered;

        iter_ = row_iterator(index_number, index_name, args);
        if (!iter_) {
            throw ContractError("row_iterator() returned no iterator");
        }
        next();
    }

    void next() {
        if (state_ == CursorState::Exhausted) return;
        if (!iter_) {
            throw ContractError("next() called before filter()");
        }

        std::optional<Row> row = iter_->next();
        if (!row) {
            iter_.reset();
            row_.reset();
            state_ = CursorState::Exhausted;
            return;
        }
        if (row->values.size() != column_count_) {
            std::string msg = "row " + std::to_string(row->row_id) + " has " +
                              std::to_string(row->values.size()) + " values, table declares " +
                              std::to_string(column_count_) + " columns";
            // The scan is abandoned; only a new filter() can restart it
            iter_.reset();
            row_.reset();
            state_ = CursorState::Unfiltered;
            throw ContractError(msg);
        }
        row_ = std::move(row);
        state_ = CursorState::Positioned;
    }

    bool eof() const { return state_ == CursorState::Exhausted; }

    const Value& column(int index) const {
        const Row& row = current("column");
        if (index < 0 || static_cast<size_t>(index) >= row.values.size()) {
            throw ContractError("column index " + std::to_string(index) + " out of range [0, " +
                                std::to_string(row.values.size()) + ")");
        }
        return row.values[static_cast<size_t>(index)];
    }

    int64_t row_id() const { return current("row_id").row_id; }

    // Cursor teardown; runs close() exactly once
    void release() {
        if (released_) return;
        released_ = true;
        iter_.reset();
        row_.reset();
        close();
    }

    // ========================================================================
    // Inspection
    // ========================================================================

    CursorState state() const { return state_; }
    const Table& table() const { return table_; }
    size_t column_count() const { return column_count_; }

protected:
    /**
     * Produce the rows for one scan. Called once per filter(); each call
     * must return a fresh, independent sequence. The index parameters are
     * meaningful only when the table suggested an index.
     */
    virtual std::unique_ptr<RowIterator> row_iterator(int index_number,
                                                      const std::string& index_name,
                                                      const std::vector<Value>& args) = 0;

    // Release resources held across scans (file handles, ...)
    virtual void close() {}

private:
    const Row& current(const char* op) const {
        if (state_ != CursorState::Positioned) {
            throw ContractError(std::string(op) + "() called while cursor is " +
                                cursor_state_name(state_));
        }
        return *row_;
    }

    const Table& table_;
    size_t column_count_;
    std::unique_ptr<RowIterator> iter_;
    std::optional<Row> row_;
    CursorState state_ = CursorState::Unfiltered;
    bool released_ = false;
};

// Cursor with a typed back-reference to its table
template<typename TableT>
class BasicCursor : public Cursor {
public:
    explicit BasicCursor(const TableT& table)
        : Cursor(table), table_(table) {}

    const TableT& table() const { return table_; }

private:
    const TableT& table_;
};

// ============================================================================
// Table
// ============================================================================

class Table {
public:
    virtual ~Table() = default;

    // Order must match the value order of every Row this table produces
    virtual std::vector<std::string> column_names() const = 0;

    // Cosmetic; only used in the schema declaration
    virtual std::string table_name() const { return "<unnamed>"; }

    // No index support by default: the host falls back to full scans
    virtual std::optional<IndexHint> suggest_index(const std::vector<IndexConstraint>&,
                                                   const std::vector<IndexOrderBy>&) const {
        return std::nullopt;
    }

    // Connection let go of the table; backing data survives
    virtual void disconnect() {}

    // DROP TABLE; release whatever create_table() provisioned
    virtual void drop() {}

    std::string schema_declaration() const {
        std::vector<std::string> columns = column_names();
        std::ostringstream ss;
        ss << "CREATE TABLE " << quote_identifier(table_name()) << " (";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << quote_identifier(columns[i]);
        }
        ss << ")";
        return ss.str();
    }

    std::unique_ptr<Cursor> open_cursor() const {
        std::unique_ptr<Cursor> cursor = make_cursor();
        if (!cursor) {
            throw Error("table " + table_name() + " cannot open a cursor");
        }
        return cursor;
    }

protected:
    virtual std::unique_ptr<Cursor> make_cursor() const = 0;
};

inline Cursor::Cursor(const Table& table)
    : table_(table), column_count_(table.column_names().size()) {}

// Table whose cursors are CursorT(const Derived&)
template<typename Derived, typename CursorT>
class BasicTable : public Table {
protected:
    std::unique_ptr<Cursor> make_cursor() const override {
        return std::make_unique<CursorT>(static_cast<const Derived&>(*this));
    }
};

// ============================================================================
// Table Source
// ============================================================================

struct Declaration {
    std::string schema;
    std::shared_ptr<Table> table;
};

/**
 * Registration root for one module name on a connection.
 *
 * Register with svtab::register_source() or Database::register_source();
 * afterwards
 *
 *   CREATE VIRTUAL TABLE name USING module(arg, ...)
 *
 * routes to create_table(), and reopening a database whose schema already
 * records the table routes to connect_table(). Arguments arrive verbatim.
 */
class TableSource {
public:
    virtual ~TableSource() = default;

    virtual std::shared_ptr<Table> connect_table(sqlite3* db,
                                                 const std::string& module_name,
                                                 const std::string& db_name,
                                                 const std::string& table_name,
                                                 const std::vector<std::string>& args) = 0;

    // Override only when creation must provision something connection does not
    virtual std::shared_ptr<Table> create_table(sqlite3* db,
                                                const std::string& module_name,
                                                const std::string& db_name,
                                                const std::string& table_name,
                                                const std::vector<std::string>& args) {
        return connect_table(db, module_name, db_name, table_name, args);
    }

    Declaration create(sqlite3* db, const std::string& module_name, const std::string& db_name,
                       const std::string& table_name, const std::vector<std::string>& args) {
        return declare(create_table(db, module_name, db_name, table_name, args));
    }

    Declaration connect(sqlite3* db, const std::string& module_name, const std::string& db_name,
                        const std::string& table_name, const std::vector<std::string>& args) {
        return declare(connect_table(db, module_name, db_name, table_name, args));
    }

private:
    static Declaration declare(std::shared_ptr<Table> table) {
        if (!table) {
            throw ContractError("table source returned no table");
        }
        validate_columns(table->column_names());
        std::string schema = table->schema_declaration();
        return Declaration{std::move(schema), std::move(table)};
    }
};

} // namespace svtab
