/**
 * @file source.hpp
 * @brief Virtual tables over CSV files
 *
 * Usage:
 *   svtab::csv::register_csv_module(db);
 *
 *   CREATE VIRTUAL TABLE people USING csv('people.csv');
 *   CREATE VIRTUAL TABLE prices USING csv('prices.tsv', delimiter=tab);
 *   CREATE VIRTUAL TABLE names USING csv('names.csv', blank_lines=keep);
 *
 * The header row names the columns. Every scan re-reads the file from the
 * start and numbers data rows from 0. All values are TEXT.
 */

#pragma once

#include "reader.hpp"

#include <svtab/database.hpp>
#include <svtab/module.hpp>
#include <svtab/table.hpp>

#include <cctype>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace svtab::csv {

// ============================================================================
// Argument Parsing
// ============================================================================

// Strip surrounding whitespace and one level of SQL quoting ('x', "x", `x`, [x])
inline std::string unquote_argument(const std::string& arg) {
    size_t b = 0;
    size_t e = arg.size();
    while (b < e && std::isspace(static_cast<unsigned char>(arg[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(arg[e - 1]))) --e;
    std::string s = arg.substr(b, e - b);
    if (s.size() < 2) return s;

    char open = s.front();
    char close = open == '[' ? ']' : open;
    if ((open != '\'' && open != '"' && open != '`' && open != '[') || s.back() != close) {
        return s;
    }

    std::string out;
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        out += s[i];
        if (s[i] == close && close != ']' && i + 2 < s.size() && s[i + 1] == close) ++i;
    }
    return out;
}

inline char parse_option_char(const std::string& key, const std::string& value) {
    if (value == "tab" || value == "\\t") return '\t';
    if (value.size() != 1) {
        throw ArgumentError("csv: " + key + " must be a single character, got '" + value + "'");
    }
    return value[0];
}

inline void apply_option(CsvOptions& options, const std::string& arg) {
    size_t eq = arg.find('=');
    if (eq == std::string::npos) {
        throw ArgumentError("csv: expected key=value option, got '" + arg + "'");
    }
    std::string key = unquote_argument(arg.substr(0, eq));
    std::string value = unquote_argument(arg.substr(eq + 1));

    if (key == "delimiter") {
        options.delimiter = parse_option_char(key, value);
    } else if (key == "quote") {
        options.quote = parse_option_char(key, value);
    } else if (key == "blank_lines") {
        if (value == "skip") {
            options.skip_blank_lines = true;
        } else if (value == "keep") {
            options.skip_blank_lines = false;
        } else {
            throw ArgumentError("csv: blank_lines must be 'skip' or 'keep', got '" + value + "'");
        }
    } else {
        throw ArgumentError("csv: unknown option '" + key + "'");
    }
}

// ============================================================================
// Table and Cursor
// ============================================================================

inline std::unique_ptr<std::ifstream> open_csv(const std::string& path) {
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*in) {
        throw DataSourceError("cannot open CSV file: " + path);
    }
    return in;
}

class CsvRowIterator : public RowIterator {
    CsvReader reader_;
    std::string path_;
    size_t width_;
    int64_t next_id_ = 0;

public:
    CsvRowIterator(std::istream& in, CsvOptions options, std::string path, size_t width)
        : reader_(in, options), path_(std::move(path)), width_(width) {
        reader_.read_record();  // header
    }

    std::optional<Row> next() override {
        auto fields = reader_.read_record();
        if (!fields) return std::nullopt;
        if (fields->size() != width_) {
            throw DataSourceError(path_ + ":" + std::to_string(reader_.record_line()) + ": expected " +
                                  std::to_string(width_) + " fields, found " +
                                  std::to_string(fields->size()));
        }

        Row row;
        row.row_id = next_id_++;
        row.values.reserve(fields->size());
        for (auto& field : *fields) {
            row.values.emplace_back(std::move(field));
        }
        return row;
    }
};

class CsvTable;

class CsvCursor : public BasicCursor<CsvTable> {
public:
    using BasicCursor::BasicCursor;

protected:
    std::unique_ptr<RowIterator> row_iterator(int, const std::string&,
                                              const std::vector<Value>&) override;

    void close() override { stream_.reset(); }

private:
    std::unique_ptr<std::ifstream> stream_;
};

class CsvTable : public BasicTable<CsvTable, CsvCursor> {
public:
    /**
     * Reads the header row immediately.
     * @throws DataSourceError if the file cannot be opened or is empty
     */
    CsvTable(std::string table_name, std::string path, CsvOptions options = {})
        : table_name_(std::move(table_name)), path_(std::move(path)), options_(options) {
        auto in = open_csv(path_);
        CsvReader reader(*in, options_);
        auto header = reader.read_record();
        if (!header) {
            throw DataSourceError("CSV file has no header row: " + path_);
        }
        // UTF-8 byte order mark
        if (!header->empty() && (*header)[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
            (*header)[0].erase(0, 3);
        }
        columns_ = std::move(*header);
    }

    std::vector<std::string> column_names() const override { return columns_; }
    std::string table_name() const override { return table_name_; }

    const std::string& path() const { return path_; }
    const CsvOptions& options() const { return options_; }

private:
    std::string table_name_;
    std::string path_;
    CsvOptions options_;
    std::vector<std::string> columns_;
};

inline std::unique_ptr<RowIterator> CsvCursor::row_iterator(int, const std::string&,
                                                            const std::vector<Value>&) {
    stream_ = open_csv(table().path());
    return std::make_unique<CsvRowIterator>(*stream_, table().options(), table().path(),
                                            column_count());
}

// ============================================================================
// Source
// ============================================================================

class CsvSource : public TableSource {
public:
    explicit CsvSource(CsvOptions defaults = {}) : defaults_(defaults) {}

    std::shared_ptr<Table> connect_table(sqlite3*, const std::string&, const std::string&,
                                         const std::string& table_name,
                                         const std::vector<std::string>& args) override {
        if (args.empty()) {
            throw ArgumentError("csv: usage: CREATE VIRTUAL TABLE " + table_name +
                                " USING csv(path [, delimiter=c] [, quote=c]"
                                " [, blank_lines=skip|keep])");
        }
        std::string path = unquote_argument(args[0]);
        if (path.empty()) {
            throw ArgumentError("csv: empty file name");
        }

        CsvOptions options = defaults_;
        for (size_t i = 1; i < args.size(); ++i) {
            apply_option(options, args[i]);
        }
        return std::make_shared<CsvTable>(table_name, path, options);
    }

    const CsvOptions& defaults() const { return defaults_; }

private:
    CsvOptions defaults_;
};

// ============================================================================
// Registration
// ============================================================================

inline int register_csv_module(sqlite3* db, const std::string& module_name = "csv",
                               CsvOptions defaults = {}, ModuleOptions options = {}) {
    return register_source(db, module_name, std::make_shared<CsvSource>(defaults),
                           std::move(options));
}

inline bool register_csv_module(Database& db, const std::string& module_name = "csv",
                                CsvOptions defaults = {}, ModuleOptions options = {}) {
    return db.register_source(module_name, std::make_shared<CsvSource>(defaults),
                              std::move(options));
}

} // namespace svtab::csv
