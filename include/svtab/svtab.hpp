/**
 * svtab/svtab.hpp - Master include for libsvtab
 *
 * libsvtab - SQLite virtual tables from tables, cursors and row iterators
 *
 * Include this single header to get the core framework:
 *   - TableSource, Table, Cursor - the three roles a virtual table module plays
 *   - RowIterator - lazy, restartable row sequences behind each cursor
 *   - register_source() - bind a source to a module name on a connection
 *   - Database - RAII connection wrapper with query helpers
 *
 * Bundled sources live in their own headers:
 *   - <svtab/csv/csv.hpp>          CSV files, one table per file
 *   - <svtab/simple/source.hpp>    declarative tables over JSON records
 *
 * Example:
 *
 *   #include <svtab/svtab.hpp>
 *
 *   class CountCursor : public svtab::Cursor {
 *   public:
 *       using Cursor::Cursor;
 *   protected:
 *       std::unique_ptr<svtab::RowIterator> row_iterator(
 *               int, const std::string&, const std::vector<svtab::Value>&) override {
 *           int64_t i = 0;
 *           return svtab::make_row_iterator([i]() mutable -> std::optional<svtab::Row> {
 *               if (i == 10) return std::nullopt;
 *               int64_t id = i++;
 *               return svtab::Row{id, {svtab::Value(id)}};
 *           });
 *       }
 *   };
 *
 *   class CountTable : public svtab::BasicTable<CountTable, CountCursor> {
 *   public:
 *       std::vector<std::string> column_names() const override { return {"n"}; }
 *   };
 */

#pragma once

#include "error.hpp"
#include "value.hpp"
#include "row.hpp"
#include "table.hpp"
#include "module.hpp"
#include "database.hpp"
