/**
 * indexed_table.cpp - Custom table with an equality index hint
 *
 * Demonstrates suggest_index(): WHERE "to" = ? is answered from a
 * multimap instead of a full scan.
 */

#include <svtab/svtab.hpp>
#include <cstdio>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Simulated cross-reference data
struct Xref {
    int64_t from;
    int64_t to;
    int type;
};

class XrefTable;

class XrefCursor : public svtab::BasicCursor<XrefTable> {
public:
    using BasicCursor::BasicCursor;

protected:
    std::unique_ptr<svtab::RowIterator> row_iterator(int index_number,
                                                     const std::string& index_name,
                                                     const std::vector<svtab::Value>& args) override;
};

class XrefTable : public svtab::BasicTable<XrefTable, XrefCursor> {
public:
    static constexpr int kByTarget = 1;

    explicit XrefTable(std::vector<Xref> xrefs) : xrefs_(std::move(xrefs)) {
        for (size_t i = 0; i < xrefs_.size(); i++) {
            by_target_.emplace(xrefs_[i].to, i);
        }
    }

    std::vector<std::string> column_names() const override { return {"from", "to", "type"}; }
    std::string table_name() const override { return "xrefs"; }

    std::optional<svtab::IndexHint> suggest_index(
            const std::vector<svtab::IndexConstraint>& constraints,
            const std::vector<svtab::IndexOrderBy>&) const override {
        for (size_t i = 0; i < constraints.size(); ++i) {
            if (constraints[i].usable && constraints[i].column == 1 &&
                constraints[i].op == SQLITE_INDEX_CONSTRAINT_EQ) {
                svtab::IndexHint hint;
                hint.index_number = kByTarget;
                hint.index_name = "by_target";
                hint.used_constraints = {i};
                hint.omit_checks = true;
                hint.estimated_cost = 10.0;
                hint.estimated_rows = 2;
                return hint;
            }
        }
        return std::nullopt;
    }

    svtab::Row row(size_t i) const {
        const Xref& x = xrefs_[i];
        return svtab::Row{static_cast<int64_t>(i),
                          {svtab::Value(x.from), svtab::Value(x.to), svtab::Value(x.type)}};
    }

    size_t size() const { return xrefs_.size(); }

    std::vector<size_t> lookup(int64_t target) const {
        std::vector<size_t> hits;
        auto range = by_target_.equal_range(target);
        for (auto it = range.first; it != range.second; ++it) {
            hits.push_back(it->second);
        }
        return hits;
    }

private:
    std::vector<Xref> xrefs_;
    std::multimap<int64_t, size_t> by_target_;
};

std::unique_ptr<svtab::RowIterator> XrefCursor::row_iterator(int index_number,
                                                             const std::string&,
                                                             const std::vector<svtab::Value>& args) {
    const XrefTable& t = table();
    std::vector<size_t> picks;

    if (index_number == XrefTable::kByTarget) {
        // SQLite passes the constraint value as-is; non-integers match nothing
        if (args.at(0).type() == svtab::ColumnType::Integer) {
            picks = t.lookup(args[0].as_int64());
        }
        printf("  [by_target lookup: %zu rows]\n", picks.size());
    } else {
        for (size_t i = 0; i < t.size(); i++) picks.push_back(i);
        printf("  [full scan: %zu rows]\n", picks.size());
    }

    size_t pos = 0;
    return svtab::make_row_iterator([&t, picks, pos]() mutable -> std::optional<svtab::Row> {
        if (pos >= picks.size()) return std::nullopt;
        return t.row(picks[pos++]);
    });
}

// Hands the same table to every CREATE VIRTUAL TABLE
class XrefSource : public svtab::TableSource {
public:
    explicit XrefSource(std::shared_ptr<XrefTable> table) : table_(std::move(table)) {}

    std::shared_ptr<svtab::Table> connect_table(sqlite3*, const std::string&, const std::string&,
                                                const std::string&,
                                                const std::vector<std::string>&) override {
        return table_;
    }

private:
    std::shared_ptr<XrefTable> table_;
};

int main() {
    auto table = std::make_shared<XrefTable>(std::vector<Xref>{
        {0x1000, 0x2000, 1},
        {0x1004, 0x2000, 1},
        {0x1008, 0x3000, 2},
        {0x100C, 0x2000, 1},
        {0x2000, 0x3000, 1},
        {0x2004, 0x4000, 2},
        {0x3000, 0x4000, 1},
    });

    svtab::Database db;
    if (!db.register_source("xrefs", std::make_shared<XrefSource>(table)) ||
        !db.create_virtual_table("xrefs", "xrefs")) {
        fprintf(stderr, "Error: %s\n", db.last_error().c_str());
        return 1;
    }

    printf("Query 1: All xrefs\n");
    auto result = db.query("SELECT printf('0x%X', \"from\"), printf('0x%X', \"to\"), type FROM xrefs");
    for (const auto& row : result) {
        printf("  %s -> %s (type %s)\n", row[0].c_str(), row[1].c_str(), row[2].c_str());
    }

    printf("\nQuery 2: xrefs to 0x2000\n");
    result = db.query("SELECT printf('0x%X', \"from\") FROM xrefs WHERE \"to\" = 8192");
    if (!result.ok()) {
        fprintf(stderr, "Query error: %s\n", result.error.c_str());
        return 1;
    }
    for (const auto& row : result) {
        printf("  from %s\n", row[0].c_str());
    }

    printf("\nQuery 3: count by target\n");
    result = db.query("SELECT printf('0x%X', \"to\"), COUNT(*) FROM xrefs GROUP BY \"to\"");
    for (const auto& row : result) {
        printf("  %s: %s\n", row[0].c_str(), row[1].c_str());
    }

    return 0;
}
