/**
 * csv_query.cpp - Query a CSV file through the csv module
 *
 * Usage: csv_query [file.csv]
 * Without an argument a small sample file is written to the temp directory.
 */

#include <svtab/svtab.hpp>
#include <svtab/csv/csv.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

static std::string write_sample() {
    auto path = std::filesystem::temp_directory_path() / "svtab_products.csv";
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "id,name,price\n"
        << "1,Apple,1.50\n"
        << "2,Banana,0.75\n"
        << "3,\"Cherry, dark\",3.00\n"
        << "4,Date,2.25\n"
        << "5,Elderberry,4.50\n";
    return path.string();
}

int main(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : write_sample();

    svtab::Database db;
    if (!db.is_open()) {
        fprintf(stderr, "Failed to open database: %s\n", db.last_error().c_str());
        return 1;
    }

    svtab::ModuleOptions options;
    options.verbose = true;
    if (!svtab::csv::register_csv_module(db, "csv", {}, options)) {
        fprintf(stderr, "Error: %s\n", db.last_error().c_str());
        return 1;
    }

    std::string quoted = "'";
    for (char c : path) {
        quoted += c;
        if (c == '\'') quoted += c;
    }
    quoted += "'";
    if (!db.create_virtual_table("products", "csv", {quoted})) {
        fprintf(stderr, "Error: %s\n", db.last_error().c_str());
        return 1;
    }

    // Query: All rows
    printf("All rows:\n");
    auto result = db.query("SELECT rowid, * FROM products");
    if (!result.ok()) {
        fprintf(stderr, "Query error: %s\n", result.error.c_str());
        return 1;
    }
    for (const auto& column : result.columns) {
        printf("  %-12s", column.c_str());
    }
    printf("\n");
    for (const auto& row : result) {
        for (size_t i = 0; i < row.size(); ++i) {
            printf("  %-12s", row[i].c_str());
        }
        printf("\n");
    }

    if (argc > 1) return 0;

    // Values are TEXT; cast for numeric comparisons
    printf("\nProducts over $2:\n");
    result = db.query("SELECT name, price FROM products WHERE CAST(price AS REAL) > 2.0");
    for (const auto& row : result) {
        printf("  %s: $%s\n", row[0].c_str(), row[1].c_str());
    }

    result = db.query("SELECT COUNT(*), AVG(price), MAX(CAST(price AS REAL)) FROM products");
    if (result.ok() && !result.empty()) {
        printf("\nStats: count=%s, avg=$%s, max=$%s\n",
               result[0][0].c_str(), result[0][1].c_str(), result[0][2].c_str());
    }

    return 0;
}
