/**
 * declarative_tables.cpp - Tables declared up front from JSON records
 *
 * Demonstrates simple_source(): each table is a column list plus a
 * factory that produces records for one scan.
 */

#include <svtab/svtab.hpp>
#include <svtab/simple/source.hpp>
#include <cstdio>
#include <optional>
#include <string>

int main() {
    using svtab::json;

    // Generated on every scan
    auto squares = []() -> svtab::simple::RecordGenerator {
        int n = 1;
        return [n]() mutable -> std::optional<json> {
            if (n > 5) return std::nullopt;
            json record = {{"n", n}, {"square", n * n}};
            ++n;
            return record;
        };
    };

    auto source = svtab::simple::simple_source()
        .table("people", {"name", "age", "team"}, svtab::simple::records(json::parse(R"([
            {"name": "alice", "age": 31, "team": "core"},
            {"name": "bob", "age": 27},
            {"name": "carol", "age": 45, "team": "core"},
            {"name": "dave", "team": "tools"}
        ])")))
        .table("squares", {"n", "square"}, squares)
        .build();

    svtab::Database db;
    if (!source->register_tables(db, "simple")) {
        fprintf(stderr, "Error: %s\n", db.last_error().c_str());
        return 1;
    }

    printf("Declared tables:\n");
    for (const auto& row : db.query("SELECT name, sql FROM sqlite_master ORDER BY name")) {
        printf("  %s: %s\n", row[0].c_str(), row[1].c_str());
    }

    printf("\nPeople by team:\n");
    auto result = db.query("SELECT coalesce(team, '(none)'), group_concat(name, ', '), "
                           "avg(age) FROM people GROUP BY team ORDER BY team");
    if (!result.ok()) {
        fprintf(stderr, "Query error: %s\n", result.error.c_str());
        return 1;
    }
    for (const auto& row : result) {
        printf("  %-8s %-20s avg age %s\n", row[0].c_str(), row[1].c_str(), row[2].c_str());
    }

    printf("\nSquares over 5:\n");
    result = db.query("SELECT n, square FROM squares WHERE square > 5");
    for (const auto& row : result) {
        printf("  %s^2 = %s\n", row[0].c_str(), row[1].c_str());
    }
    printf("  sum = %s\n", db.scalar("SELECT sum(square) FROM squares").c_str());

    return 0;
}
