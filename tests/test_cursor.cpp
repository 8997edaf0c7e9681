/**
 * test_cursor.cpp - Cursor positioning state machine and row iterators
 */

#include <gtest/gtest.h>
#include <svtab/svtab.hpp>

#include "list_table.hpp"

#include <optional>
#include <string>
#include <vector>

using testing_tables::ListTable;
using testing_tables::xyz_rows;

namespace {

struct Scanned {
    int64_t row_id;
    std::string name;
    int64_t n;
};

std::vector<Scanned> scan(svtab::Cursor& cursor) {
    std::vector<Scanned> out;
    cursor.filter(0, "", {});
    while (!cursor.eof()) {
        out.push_back({cursor.row_id(), cursor.column(0).as_text(), cursor.column(1).as_int64()});
        cursor.next();
    }
    return out;
}

} // namespace

class CursorTest : public ::testing::Test {
protected:
    ListTable table_{{"a", "b"}, xyz_rows()};
};

TEST_F(CursorTest, StartsUnfiltered) {
    auto cursor = table_.open_cursor();
    EXPECT_EQ(cursor->state(), svtab::CursorState::Unfiltered);
    EXPECT_FALSE(cursor->eof());
    EXPECT_EQ(&cursor->table(), &table_);
    EXPECT_EQ(table_.iterators_made, 0);
}

TEST_F(CursorTest, FilterPrimesFirstRow) {
    auto cursor = table_.open_cursor();
    cursor->filter(0, "", {});

    EXPECT_EQ(cursor->state(), svtab::CursorState::Positioned);
    EXPECT_FALSE(cursor->eof());
    EXPECT_EQ(cursor->row_id(), 10);
    EXPECT_EQ(cursor->column(0), svtab::Value("x"));
    EXPECT_EQ(cursor->column(1), svtab::Value(1));
}

TEST_F(CursorTest, FullScanYieldsIteratorOrder) {
    auto cursor = table_.open_cursor();
    auto rows = scan(*cursor);

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].row_id, 10);
    EXPECT_EQ(rows[0].name, "x");
    EXPECT_EQ(rows[0].n, 1);
    EXPECT_EQ(rows[1].row_id, 11);
    EXPECT_EQ(rows[1].name, "y");
    EXPECT_EQ(rows[1].n, 2);
    EXPECT_EQ(rows[2].row_id, 12);
    EXPECT_EQ(rows[2].name, "z");
    EXPECT_EQ(rows[2].n, 3);

    EXPECT_TRUE(cursor->eof());
    EXPECT_EQ(cursor->state(), svtab::CursorState::Exhausted);
}

TEST_F(CursorTest, EmptySequenceIsEofAfterFilter) {
    ListTable empty({"a", "b"}, {});
    auto cursor = empty.open_cursor();
    cursor->filter(0, "", {});

    EXPECT_TRUE(cursor->eof());
    EXPECT_EQ(cursor->state(), svtab::CursorState::Exhausted);
}

TEST_F(CursorTest, FilterAgainRestartsFromTheBeginning) {
    auto cursor = table_.open_cursor();
    cursor->filter(0, "", {});
    cursor->next();
    EXPECT_EQ(cursor->row_id(), 11);

    auto again = scan(*cursor);
    ASSERT_EQ(again.size(), 3u);
    EXPECT_EQ(again[0].row_id, 10);
    EXPECT_EQ(table_.iterators_made, 2);

    auto third = scan(*cursor);
    ASSERT_EQ(third.size(), 3u);
    EXPECT_EQ(third[2].name, "z");
}

TEST_F(CursorTest, FilterAfterExhaustionRepositions) {
    auto cursor = table_.open_cursor();
    scan(*cursor);
    ASSERT_TRUE(cursor->eof());

    cursor->filter(0, "", {});
    EXPECT_FALSE(cursor->eof());
    EXPECT_EQ(cursor->row_id(), 10);
}

TEST_F(CursorTest, NextAfterExhaustionStaysExhausted) {
    auto cursor = table_.open_cursor();
    scan(*cursor);
    cursor->next();
    EXPECT_TRUE(cursor->eof());
}

TEST_F(CursorTest, IndexArgumentsReachIterator) {
    auto cursor = table_.open_cursor();
    cursor->filter(7, "by_key", {svtab::Value(42), svtab::Value("k")});

    EXPECT_EQ(table_.last_index_number, 7);
    EXPECT_EQ(table_.last_index_name, "by_key");
    ASSERT_EQ(table_.last_args.size(), 2u);
    EXPECT_EQ(table_.last_args[0], svtab::Value(42));
    EXPECT_EQ(table_.last_args[1], svtab::Value("k"));
}

TEST_F(CursorTest, CursorsOnOneTableAreIndependent) {
    auto first = table_.open_cursor();
    auto second = table_.open_cursor();

    first->filter(0, "", {});
    first->next();
    second->filter(0, "", {});

    EXPECT_EQ(first->row_id(), 11);
    EXPECT_EQ(second->row_id(), 10);

    second->next();
    second->next();
    first->next();
    EXPECT_EQ(first->row_id(), 12);
    EXPECT_EQ(second->row_id(), 12);
}

// ============================================================================
// Contract Violations
// ============================================================================

TEST_F(CursorTest, NextBeforeFilterIsContractError) {
    auto cursor = table_.open_cursor();
    EXPECT_THROW(cursor->next(), svtab::ContractError);
}

TEST_F(CursorTest, ReadingUnpositionedCursorIsContractError) {
    auto cursor = table_.open_cursor();
    EXPECT_THROW(cursor->column(0), svtab::ContractError);
    EXPECT_THROW(cursor->row_id(), svtab::ContractError);

    scan(*cursor);
    EXPECT_THROW(cursor->column(0), svtab::ContractError);
    EXPECT_THROW(cursor->row_id(), svtab::ContractError);
}

TEST_F(CursorTest, ColumnOutOfRangeIsContractError) {
    auto cursor = table_.open_cursor();
    cursor->filter(0, "", {});
    EXPECT_THROW(cursor->column(-1), svtab::ContractError);
    EXPECT_THROW(cursor->column(2), svtab::ContractError);
    EXPECT_NO_THROW(cursor->column(1));
}

TEST_F(CursorTest, RowWidthMustMatchColumns) {
    ListTable narrow({"a", "b"}, {svtab::Row{0, {svtab::Value("only")}}});
    auto cursor = narrow.open_cursor();
    EXPECT_THROW(cursor->filter(0, "", {}), svtab::ContractError);
}

TEST_F(CursorTest, RowWidthErrorLeavesCursorUnfiltered) {
    ListTable mixed({"a", "b"}, {
        svtab::Row{1, {svtab::Value("x"), svtab::Value(1)}},
        svtab::Row{2, {svtab::Value("bad")}},
        svtab::Row{3, {svtab::Value("z"), svtab::Value(3)}},
    });
    auto cursor = mixed.open_cursor();
    cursor->filter(0, "", {});
    ASSERT_EQ(cursor->row_id(), 1);

    EXPECT_THROW(cursor->next(), svtab::ContractError);
    EXPECT_EQ(cursor->state(), svtab::CursorState::Unfiltered);
    EXPECT_FALSE(cursor->eof());
    EXPECT_THROW(cursor->row_id(), svtab::ContractError);
    EXPECT_THROW(cursor->column(0), svtab::ContractError);

    // The bad row is not skipped by carrying on
    EXPECT_THROW(cursor->next(), svtab::ContractError);
    EXPECT_EQ(cursor->state(), svtab::CursorState::Unfiltered);

    cursor->filter(0, "", {});
    EXPECT_EQ(cursor->state(), svtab::CursorState::Positioned);
    EXPECT_EQ(cursor->row_id(), 1);
}

TEST_F(CursorTest, ContractErrorsMapToMisuse) {
    auto cursor = table_.open_cursor();
    try {
        cursor->next();
        FAIL() << "expected ContractError";
    } catch (const svtab::ContractError& e) {
        EXPECT_EQ(e.code(), SQLITE_MISUSE);
    }
}

// ============================================================================
// Release
// ============================================================================

TEST_F(CursorTest, ReleaseRunsCloseExactlyOnce) {
    auto cursor = table_.open_cursor();
    cursor->filter(0, "", {});
    cursor->release();
    cursor->release();
    EXPECT_EQ(table_.closes, 1);

    EXPECT_THROW(cursor->filter(0, "", {}), svtab::ContractError);
}

TEST_F(CursorTest, ReleaseWithoutFilterStillCloses) {
    auto cursor = table_.open_cursor();
    cursor->release();
    EXPECT_EQ(table_.closes, 1);
}

// ============================================================================
// Data Source Errors
// ============================================================================

TEST_F(CursorTest, IteratorErrorsPropagateFromNext) {
    table_.producer = []() {
        int calls = 0;
        return svtab::make_row_iterator([calls]() mutable -> std::optional<svtab::Row> {
            if (calls++ == 0) return svtab::Row{0, {svtab::Value("x"), svtab::Value(1)}};
            throw svtab::DataSourceError("disk on fire");
        });
    };

    auto cursor = table_.open_cursor();
    ASSERT_NO_THROW(cursor->filter(0, "", {}));
    EXPECT_EQ(cursor->row_id(), 0);
    EXPECT_THROW(cursor->next(), svtab::DataSourceError);
}

TEST_F(CursorTest, IteratorErrorsPropagateFromFilter) {
    table_.producer = []() -> std::unique_ptr<svtab::RowIterator> {
        throw svtab::DataSourceError("cannot start scan");
    };

    auto cursor = table_.open_cursor();
    EXPECT_THROW(cursor->filter(0, "", {}), svtab::DataSourceError);
    EXPECT_EQ(cursor->state(), svtab::CursorState::Unfiltered);
}

TEST_F(CursorTest, MissingIteratorIsContractError) {
    table_.producer = []() { return std::unique_ptr<svtab::RowIterator>(); };
    auto cursor = table_.open_cursor();
    EXPECT_THROW(cursor->filter(0, "", {}), svtab::ContractError);
}

// ============================================================================
// Row Iterators
// ============================================================================

TEST(RowIteratorTest, VectorIteratorWalksInOrder) {
    auto it = svtab::make_row_iterator(xyz_rows());
    auto a = it->next();
    auto b = it->next();
    auto c = it->next();
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(a->row_id, 10);
    EXPECT_EQ(b->row_id, 11);
    EXPECT_EQ(c->row_id, 12);
    EXPECT_FALSE(it->next());
    EXPECT_FALSE(it->next());
}

TEST(RowIteratorTest, GeneratorStopsPullingAfterEnd) {
    int pulls = 0;
    auto it = svtab::make_row_iterator([&pulls]() -> std::optional<svtab::Row> {
        ++pulls;
        if (pulls > 2) return std::nullopt;
        return svtab::Row{pulls, {}};
    });

    EXPECT_TRUE(it->next());
    EXPECT_TRUE(it->next());
    EXPECT_FALSE(it->next());
    EXPECT_FALSE(it->next());
    EXPECT_EQ(pulls, 3);
}

TEST(RowIteratorTest, NullGeneratorIsEmpty) {
    auto it = svtab::make_row_iterator(svtab::RowGenerator());
    EXPECT_FALSE(it->next());
}
