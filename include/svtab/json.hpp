#pragma once
/// @file json.hpp
/// @brief JSON types for record-based sources
///
/// Record sources (see simple/source.hpp) describe rows as JSON objects.
/// svtab::json wraps nlohmann/json; json_to_value() maps a JSON scalar onto
/// a column value.

#include "value.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace svtab {

using json = nlohmann::json;

/// Ordered JSON (preserves insertion order)
using ordered_json = nlohmann::ordered_json;

/// Convert a JSON scalar to a column value.
/// Booleans become 0/1, arrays and objects their compact JSON text.
inline Value json_to_value(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(j.get<bool>() ? 1 : 0);
        case json::value_t::number_integer:
            return Value(j.get<int64_t>());
        case json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value(static_cast<double>(u));
            }
            return Value(static_cast<int64_t>(u));
        }
        case json::value_t::number_float:
            return Value(j.get<double>());
        case json::value_t::string:
            return Value(j.get<std::string>());
        default:
            return Value(j.dump());
    }
}

} // namespace svtab
