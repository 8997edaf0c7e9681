/**
 * svtab/module.hpp - sqlite3_module glue for TableSource/Table/Cursor
 *
 * Part of libsvtab - SQLite virtual tables from tables, cursors and row iterators.
 *
 * Translates SQLite's handle-and-flag callback protocol into calls on the
 * C++ objects from table.hpp. No exception crosses back into SQLite: each
 * callback reports failures through zErrMsg / *pzErr and a result code.
 *
 * Example:
 *
 *   auto source = std::make_shared<MySource>();
 *   svtab::register_source(db, "mymodule", source);
 *   svtab::create_virtual_table(db, "t", "mymodule", {"'data.bin'"});
 */

#pragma once

#include "error.hpp"
#include "table.hpp"

#include <sqlite3.h>
#include <cstring>
#include <functional>
#include <iostream>
#include <memory>
#include <new>
#include <string>
#include <vector>

namespace svtab {

// ============================================================================
// Module Options
// ============================================================================

using LogFunc = std::function<void(const std::string& msg)>;

struct ModuleOptions {
    // Log table lifecycle events, and fall back to stderr without log_func
    bool verbose = false;
    LogFunc log_func;
};

namespace detail {

// ============================================================================
// Registration State (owned by the connection)
// ============================================================================

struct ModuleContext {
    std::string name;
    std::shared_ptr<TableSource> source;
    ModuleOptions options;

    void log(const std::string& msg) const {
        if (options.log_func) {
            options.log_func(msg);
        } else if (options.verbose) {
            std::cerr << "[svtab] " << msg << std::endl;
        }
    }

    void trace(const std::string& msg) const {
        if (options.verbose) log(msg);
    }
};

struct Vtab {
    sqlite3_vtab base;
    const ModuleContext* context;
    std::shared_ptr<Table> table;
    std::string name;
};

struct VtabCursor {
    sqlite3_vtab_cursor base;
    std::unique_ptr<Cursor> cursor;
};

inline Vtab* vtab_of(sqlite3_vtab* pVtab) {
    return reinterpret_cast<Vtab*>(pVtab);
}

inline VtabCursor* cursor_of(sqlite3_vtab_cursor* pCursor) {
    return reinterpret_cast<VtabCursor*>(pCursor);
}

// ============================================================================
// Error Reporting
// ============================================================================

inline int error_code(const std::exception& e) {
    if (const auto* err = dynamic_cast<const Error*>(&e)) return err->code();
    if (dynamic_cast<const std::bad_alloc*>(&e)) return SQLITE_NOMEM;
    return SQLITE_ERROR;
}

inline void set_error(char** slot, const std::string& msg) {
    if (!slot) return;
    sqlite3_free(*slot);
    *slot = sqlite3_mprintf("%s", msg.c_str());
}

inline int report(sqlite3_vtab* pVtab, const char* callback, const std::exception& e) {
    Vtab* vtab = vtab_of(pVtab);
    set_error(&pVtab->zErrMsg, e.what());
    vtab->context->log(std::string(callback) + " failed on " + vtab->name + ": " + e.what());
    return error_code(e);
}

// ============================================================================
// Table Callbacks
// ============================================================================

inline int declare(sqlite3* db, void* pAux, int argc, const char* const* argv,
                   sqlite3_vtab** ppVtab, char** pzErr, bool create) {
    const auto* context = static_cast<const ModuleContext*>(pAux);
    std::string table_name = argc > 2 ? argv[2] : "";

    try {
        std::string module_name = argc > 0 ? argv[0] : "";
        std::string db_name = argc > 1 ? argv[1] : "";
        std::vector<std::string> args;
        for (int i = 3; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        Declaration decl = create
            ? context->source->create(db, module_name, db_name, table_name, args)
            : context->source->connect(db, module_name, db_name, table_name, args);

        int rc = sqlite3_declare_vtab(db, decl.schema.c_str());
        if (rc != SQLITE_OK) {
            set_error(pzErr, "cannot declare " + decl.schema + ": " + sqlite3_errmsg(db));
            context->log("declare failed on " + table_name + ": " + sqlite3_errmsg(db));
            return rc;
        }

        auto vtab = std::make_unique<Vtab>();
        memset(&vtab->base, 0, sizeof(vtab->base));
        vtab->context = context;
        vtab->table = std::move(decl.table);
        vtab->name = table_name;
        *ppVtab = &vtab.release()->base;

        context->trace(std::string(create ? "created " : "connected ") + table_name +
                       " using " + context->name);
        return SQLITE_OK;
    } catch (const std::exception& e) {
        set_error(pzErr, e.what());
        context->log(std::string(create ? "xCreate" : "xConnect") + " failed on " +
                     table_name + ": " + e.what());
        return error_code(e);
    }
}

// xCreate
inline int vtab_create(sqlite3* db, void* pAux, int argc, const char* const* argv,
                       sqlite3_vtab** ppVtab, char** pzErr) {
    return declare(db, pAux, argc, argv, ppVtab, pzErr, true);
}

// xConnect
inline int vtab_connect(sqlite3* db, void* pAux, int argc, const char* const* argv,
                        sqlite3_vtab** ppVtab, char** pzErr) {
    return declare(db, pAux, argc, argv, ppVtab, pzErr, false);
}

inline void free_vtab(Vtab* vtab) {
    sqlite3_free(vtab->base.zErrMsg);
    delete vtab;
}

// xDisconnect - SQLite forgets the handle whatever we return
inline int vtab_disconnect(sqlite3_vtab* pVtab) {
    Vtab* vtab = vtab_of(pVtab);
    int rc = SQLITE_OK;
    try {
        vtab->table->disconnect();
        vtab->context->trace("disconnected " + vtab->name);
    } catch (const std::exception& e) {
        vtab->context->log("xDisconnect failed on " + vtab->name + ": " + e.what());
        rc = error_code(e);
    }
    free_vtab(vtab);
    return rc;
}

// xDestroy - on failure the DROP fails and SQLite keeps the handle
inline int vtab_destroy(sqlite3_vtab* pVtab) {
    Vtab* vtab = vtab_of(pVtab);
    try {
        vtab->table->drop();
        vtab->context->trace("destroyed " + vtab->name);
    } catch (const std::exception& e) {
        return report(pVtab, "xDestroy", e);
    }
    free_vtab(vtab);
    return SQLITE_OK;
}

// xBestIndex - ask the table for a hint, otherwise plan a full scan
inline int vtab_best_index(sqlite3_vtab* pVtab, sqlite3_index_info* pInfo) {
    Vtab* vtab = vtab_of(pVtab);
    try {
        std::vector<IndexConstraint> constraints;
        constraints.reserve(static_cast<size_t>(pInfo->nConstraint));
        for (int i = 0; i < pInfo->nConstraint; ++i) {
            const auto& c = pInfo->aConstraint[i];
            constraints.push_back(IndexConstraint{c.iColumn, c.op, c.usable != 0});
        }

        std::vector<IndexOrderBy> orderings;
        orderings.reserve(static_cast<size_t>(pInfo->nOrderBy));
        for (int i = 0; i < pInfo->nOrderBy; ++i) {
            const auto& o = pInfo->aOrderBy[i];
            orderings.push_back(IndexOrderBy{o.iColumn, o.desc != 0});
        }

        std::optional<IndexHint> hint = vtab->table->suggest_index(constraints, orderings);
        if (!hint) {
            pInfo->idxNum = 0;
            pInfo->estimatedCost = 1000000.0;
            return SQLITE_OK;
        }

        int argv_index = 1;
        for (size_t pos : hint->used_constraints) {
            if (pos >= constraints.size() || !constraints[pos].usable) {
                throw ContractError("index hint uses constraint " + std::to_string(pos) +
                                    ", which is missing or unusable");
            }
            auto& usage = pInfo->aConstraintUsage[pos];
            if (usage.argvIndex != 0) {
                throw ContractError("index hint uses constraint " + std::to_string(pos) + " twice");
            }
            usage.argvIndex = argv_index++;
            usage.omit = hint->omit_checks ? 1 : 0;
        }

        pInfo->idxNum = hint->index_number;
        if (!hint->index_name.empty()) {
            pInfo->idxStr = sqlite3_mprintf("%s", hint->index_name.c_str());
            pInfo->needToFreeIdxStr = 1;
        }
        pInfo->estimatedCost = hint->estimated_cost;
        if (hint->estimated_rows) {
            pInfo->estimatedRows = *hint->estimated_rows;
        }
        pInfo->orderByConsumed = hint->order_by_consumed ? 1 : 0;
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pVtab, "xBestIndex", e);
    }
}

// ============================================================================
// Cursor Callbacks
// ============================================================================

// xOpen
inline int vtab_open(sqlite3_vtab* pVtab, sqlite3_vtab_cursor** ppCursor) {
    Vtab* vtab = vtab_of(pVtab);
    try {
        auto cursor = std::make_unique<VtabCursor>();
        memset(&cursor->base, 0, sizeof(cursor->base));
        cursor->cursor = vtab->table->open_cursor();
        *ppCursor = &cursor.release()->base;
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pVtab, "xOpen", e);
    }
}

// xClose
inline int vtab_close(sqlite3_vtab_cursor* pCursor) {
    std::unique_ptr<VtabCursor> cursor(cursor_of(pCursor));
    try {
        cursor->cursor->release();
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pCursor->pVtab, "xClose", e);
    }
}

// xFilter - one fresh iterator per call, primed on the first row
inline int vtab_filter(sqlite3_vtab_cursor* pCursor, int idxNum, const char* idxStr,
                       int argc, sqlite3_value** argv) {
    try {
        std::vector<Value> args;
        args.reserve(static_cast<size_t>(argc));
        for (int i = 0; i < argc; ++i) {
            args.push_back(value_from_sqlite(argv[i]));
        }
        cursor_of(pCursor)->cursor->filter(idxNum, idxStr ? idxStr : "", args);
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pCursor->pVtab, "xFilter", e);
    }
}

// xNext
inline int vtab_next(sqlite3_vtab_cursor* pCursor) {
    try {
        cursor_of(pCursor)->cursor->next();
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pCursor->pVtab, "xNext", e);
    }
}

// xEof
inline int vtab_eof(sqlite3_vtab_cursor* pCursor) {
    return cursor_of(pCursor)->cursor->eof() ? 1 : 0;
}

// xColumn
inline int vtab_column(sqlite3_vtab_cursor* pCursor, sqlite3_context* ctx, int col) {
    try {
        result_value(ctx, cursor_of(pCursor)->cursor->column(col));
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pCursor->pVtab, "xColumn", e);
    }
}

// xRowid
inline int vtab_rowid(sqlite3_vtab_cursor* pCursor, sqlite3_int64* pRowid) {
    try {
        *pRowid = static_cast<sqlite3_int64>(cursor_of(pCursor)->cursor->row_id());
        return SQLITE_OK;
    } catch (const std::exception& e) {
        return report(pCursor->pVtab, "xRowid", e);
    }
}

// Read-only: no xUpdate, no transactions
inline sqlite3_module create_module() {
    sqlite3_module mod = {};
    mod.iVersion = 0;
    mod.xCreate = vtab_create;
    mod.xConnect = vtab_connect;
    mod.xBestIndex = vtab_best_index;
    mod.xDisconnect = vtab_disconnect;
    mod.xDestroy = vtab_destroy;
    mod.xOpen = vtab_open;
    mod.xClose = vtab_close;
    mod.xFilter = vtab_filter;
    mod.xNext = vtab_next;
    mod.xEof = vtab_eof;
    mod.xColumn = vtab_column;
    mod.xRowid = vtab_rowid;
    return mod;
}

inline const sqlite3_module& get_module() {
    static const sqlite3_module mod = create_module();
    return mod;
}

inline void destroy_context(void* ptr) {
    delete static_cast<ModuleContext*>(ptr);
}

} // namespace detail

// ============================================================================
// Registration
// ============================================================================

/**
 * Bind a source to a module name for the lifetime of the connection.
 * The connection keeps the source alive until it closes or the module is
 * replaced. Returns the sqlite3_create_module_v2() result code.
 */
inline int register_source(sqlite3* db, const std::string& module_name,
                           std::shared_ptr<TableSource> source,
                           ModuleOptions options = {}) {
    if (!source) return SQLITE_MISUSE;
    auto* context = new detail::ModuleContext{module_name, std::move(source), std::move(options)};
    // sqlite3_create_module_v2 runs the destructor itself on failure
    return sqlite3_create_module_v2(db, module_name.c_str(), &detail::get_module(),
                                    context, detail::destroy_context);
}

inline std::string create_virtual_table_sql(const std::string& table_name,
                                            const std::string& module_name,
                                            const std::vector<std::string>& args = {}) {
    std::string sql = "CREATE VIRTUAL TABLE " + quote_identifier(table_name) +
                      " USING " + module_name;
    if (!args.empty()) {
        sql += "(";
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += args[i];
        }
        sql += ")";
    }
    return sql;
}

/**
 * Issue CREATE VIRTUAL TABLE. Arguments are passed through verbatim, so
 * string literals must carry their own quotes. On failure the SQLite
 * message is stored in *error when given.
 */
inline int create_virtual_table(sqlite3* db, const std::string& table_name,
                                const std::string& module_name,
                                const std::vector<std::string>& args = {},
                                std::string* error = nullptr) {
    std::string sql = create_virtual_table_sql(table_name, module_name, args);
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (err) {
        if (error) *error = err;
        sqlite3_free(err);
    } else if (rc != SQLITE_OK && error) {
        *error = sqlite3_errmsg(db);
    }
    return rc;
}

} // namespace svtab
