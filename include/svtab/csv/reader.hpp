/**
 * @file reader.hpp
 * @brief Streaming RFC 4180 record reader
 *
 * Handles quoted fields, doubled quotes, delimiters and newlines inside
 * quotes, and LF or CRLF line endings.
 *
 * Blank lines are skipped by default. In a one-column file that also drops
 * rows whose only field is empty and unquoted; quote it ("") or set
 * skip_blank_lines = false to read every blank line as one empty field.
 */

#pragma once

#include <svtab/error.hpp>

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace svtab::csv {

struct CsvOptions {
    char delimiter = ',';
    char quote = '"';
    bool skip_blank_lines = true;
};

class CsvReader {
public:
    explicit CsvReader(std::istream& in, CsvOptions options = {})
        : in_(in), options_(options) {}

    // Non-copyable
    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    /**
     * Read the next record.
     * @return fields, or std::nullopt at end of input
     * @throws DataSourceError on unterminated quotes or stream failure
     */
    std::optional<std::vector<std::string>> read_record() {
        for (;;) {
            if (in_.peek() == std::char_traits<char>::eof()) {
                if (in_.bad()) throw DataSourceError("read error on line " + std::to_string(line_));
                return std::nullopt;
            }

            record_line_ = line_;
            std::vector<std::string> fields;
            std::string field;
            bool in_quotes = false;
            bool quoted = false;
            bool any = false;

            for (;;) {
                int ch = in_.get();
                if (ch == std::char_traits<char>::eof()) {
                    if (in_.bad()) {
                        throw DataSourceError("read error on line " + std::to_string(line_));
                    }
                    if (in_quotes) {
                        throw DataSourceError("unterminated quoted field starting on line " +
                                              std::to_string(record_line_));
                    }
                    break;
                }
                char c = static_cast<char>(ch);

                if (in_quotes) {
                    if (c == options_.quote) {
                        if (in_.peek() == static_cast<unsigned char>(options_.quote)) {
                            in_.get();
                            field += c;
                        } else {
                            in_quotes = false;
                        }
                    } else {
                        if (c == '\n') ++line_;
                        field += c;
                    }
                    continue;
                }

                if (c == options_.quote && field.empty() && !quoted) {
                    in_quotes = true;
                    quoted = true;
                    any = true;
                } else if (c == options_.delimiter) {
                    fields.push_back(std::move(field));
                    field.clear();
                    quoted = false;
                    any = true;
                } else if (c == '\r') {
                    if (in_.peek() == '\n') in_.get();
                    ++line_;
                    break;
                } else if (c == '\n') {
                    ++line_;
                    break;
                } else {
                    field += c;
                    any = true;
                }
            }

            if (!any && options_.skip_blank_lines) continue;
            fields.push_back(std::move(field));
            return fields;
        }
    }

    // Line on which the most recent record started (1-based)
    size_t record_line() const { return record_line_; }

private:
    std::istream& in_;
    CsvOptions options_;
    size_t line_ = 1;
    size_t record_line_ = 0;
};

} // namespace svtab::csv
