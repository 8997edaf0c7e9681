/**
 * svtab/row.hpp - Result rows and lazy row sequences
 *
 * Part of libsvtab - SQLite virtual tables from tables, cursors and row iterators.
 *
 * A RowIterator is a forward-only, pull-based sequence of rows. Work happens
 * only when next() is called, so a cursor can stream arbitrarily large
 * result sets without buffering them.
 *
 * Example (pull closure):
 *
 *   int64_t i = 0;
 *   auto it = svtab::make_row_iterator([i]() mutable -> std::optional<svtab::Row> {
 *       if (i == 3) return std::nullopt;
 *       int64_t id = i++;
 *       return svtab::Row{id, {svtab::Value(id * 10)}};
 *   });
 */

#pragma once

#include "value.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace svtab {

// ============================================================================
// Row
// ============================================================================

struct Row {
    int64_t row_id = 0;
    std::vector<Value> values;
};

// ============================================================================
// Row Iterator
// ============================================================================

class RowIterator {
public:
    virtual ~RowIterator() = default;

    // Next row, or std::nullopt once the sequence is exhausted.
    // May throw; errors propagate out of Cursor::filter()/next().
    virtual std::optional<Row> next() = 0;
};

// Walks a prebuilt vector of rows
class VectorRowIterator : public RowIterator {
    std::vector<Row> rows_;
    size_t pos_ = 0;

public:
    explicit VectorRowIterator(std::vector<Row> rows)
        : rows_(std::move(rows)) {}

    std::optional<Row> next() override {
        if (pos_ >= rows_.size()) return std::nullopt;
        return std::move(rows_[pos_++]);
    }
};

using RowGenerator = std::function<std::optional<Row>()>;

// Adapts a pull closure
class GeneratorRowIterator : public RowIterator {
    RowGenerator gen_;
    bool done_ = false;

public:
    explicit GeneratorRowIterator(RowGenerator gen)
        : gen_(std::move(gen)) {}

    std::optional<Row> next() override {
        if (done_ || !gen_) return std::nullopt;
        std::optional<Row> row = gen_();
        if (!row) done_ = true;
        return row;
    }
};

inline std::unique_ptr<RowIterator> make_row_iterator(std::vector<Row> rows) {
    return std::make_unique<VectorRowIterator>(std::move(rows));
}

inline std::unique_ptr<RowIterator> make_row_iterator(RowGenerator gen) {
    return std::make_unique<GeneratorRowIterator>(std::move(gen));
}

} // namespace svtab
