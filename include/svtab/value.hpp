/**
 * svtab/value.hpp - Column values and conversion to/from SQLite
 *
 * Part of libsvtab - SQLite virtual tables from tables, cursors and row iterators.
 */

#pragma once

#include "error.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace svtab {

// ============================================================================
// Column Types
// ============================================================================

enum class ColumnType {
    Null,
    Integer,
    Real,
    Text,
    Blob
};

inline const char* column_type_name(ColumnType t) {
    switch (t) {
        case ColumnType::Null:    return "NULL";
        case ColumnType::Integer: return "INTEGER";
        case ColumnType::Real:    return "REAL";
        case ColumnType::Text:    return "TEXT";
        case ColumnType::Blob:    return "BLOB";
    }
    return "NULL";
}

using Blob = std::vector<uint8_t>;

// ============================================================================
// Value
// ============================================================================

class Value {
public:
    Value() = default;
    Value(std::nullptr_t) {}
    // Any integer type, including bool and sqlite3_int64; stored as int64
    template<typename T, typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
    Value(T v) : data_(static_cast<int64_t>(v)) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(Blob v) : data_(std::move(v)) {}

    ColumnType type() const {
        switch (data_.index()) {
            case 1: return ColumnType::Integer;
            case 2: return ColumnType::Real;
            case 3: return ColumnType::Text;
            case 4: return ColumnType::Blob;
        }
        return ColumnType::Null;
    }

    bool is_null() const { return data_.index() == 0; }

    int64_t as_int64() const { return get<int64_t>(ColumnType::Integer); }
    double as_double() const { return get<double>(ColumnType::Real); }
    const std::string& as_text() const { return get<std::string>(ColumnType::Text); }
    const Blob& as_blob() const { return get<Blob>(ColumnType::Blob); }

    // Rendering used for diagnostics and test output; blobs print as x'..'
    std::string to_string() const {
        switch (type()) {
            case ColumnType::Null:    return "NULL";
            case ColumnType::Integer: return std::to_string(as_int64());
            case ColumnType::Real: {
                std::ostringstream ss;
                ss << as_double();
                return ss.str();
            }
            case ColumnType::Text:    return as_text();
            case ColumnType::Blob: {
                static const char* hex = "0123456789ABCDEF";
                std::string out = "x'";
                for (uint8_t b : as_blob()) {
                    out += hex[b >> 4];
                    out += hex[b & 0x0F];
                }
                return out + "'";
            }
        }
        return "NULL";
    }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return data_ != other.data_; }

private:
    template<typename T>
    const T& get(ColumnType wanted) const {
        if (const T* p = std::get_if<T>(&data_)) return *p;
        throw TypeError(std::string("value is ") + column_type_name(type()) +
                        ", not " + column_type_name(wanted));
    }

    std::variant<std::monostate, int64_t, double, std::string, Blob> data_;
};

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    if (v.type() == ColumnType::Text) return os << '"' << v.as_text() << '"';
    return os << v.to_string();
}

// ============================================================================
// SQLite Conversions
// ============================================================================

inline void result_value(sqlite3_context* ctx, const Value& v) {
    switch (v.type()) {
        case ColumnType::Null:
            sqlite3_result_null(ctx);
            break;
        case ColumnType::Integer:
            sqlite3_result_int64(ctx, v.as_int64());
            break;
        case ColumnType::Real:
            sqlite3_result_double(ctx, v.as_double());
            break;
        case ColumnType::Text: {
            const std::string& s = v.as_text();
            sqlite3_result_text(ctx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
            break;
        }
        case ColumnType::Blob: {
            const Blob& b = v.as_blob();
            sqlite3_result_blob(ctx, b.data(), static_cast<int>(b.size()), SQLITE_TRANSIENT);
            break;
        }
    }
}

inline Value value_from_sqlite(sqlite3_value* val) {
    switch (sqlite3_value_type(val)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_value_int64(val)));
        case SQLITE_FLOAT:
            return Value(sqlite3_value_double(val));
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_value_text(val));
            return Value(std::string(text ? text : "", static_cast<size_t>(sqlite3_value_bytes(val))));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_value_blob(val));
            int n = sqlite3_value_bytes(val);
            return Value(data ? Blob(data, data + n) : Blob());
        }
    }
    return Value();
}

} // namespace svtab
