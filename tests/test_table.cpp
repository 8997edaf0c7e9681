/**
 * test_table.cpp - Table/TableSource contracts, schema declarations, values
 */

#include <gtest/gtest.h>
#include <svtab/svtab.hpp>

#include "list_table.hpp"

#include <memory>
#include <string>
#include <vector>

using testing_tables::ListSource;
using testing_tables::ListTable;
using testing_tables::xyz_rows;

namespace {

class EmptyCursor : public svtab::Cursor {
public:
    using Cursor::Cursor;

protected:
    std::unique_ptr<svtab::RowIterator> row_iterator(int, const std::string&,
                                                     const std::vector<svtab::Value>&) override {
        return svtab::make_row_iterator(std::vector<svtab::Row>{});
    }
};

class UnnamedTable : public svtab::BasicTable<UnnamedTable, EmptyCursor> {
public:
    std::vector<std::string> column_names() const override { return {"a"}; }
};

class BrokenTable : public svtab::Table {
public:
    std::vector<std::string> column_names() const override { return {"a"}; }

protected:
    std::unique_ptr<svtab::Cursor> make_cursor() const override { return nullptr; }
};

// Counts create_table separately from connect_table
class ProvisioningSource : public ListSource {
public:
    using ListSource::ListSource;

    std::shared_ptr<svtab::Table> create_table(sqlite3* db, const std::string& module_name,
                                               const std::string& db_name,
                                               const std::string& table_name,
                                               const std::vector<std::string>& args) override {
        ++creates;
        return connect_table(db, module_name, db_name, table_name, args);
    }

    int creates = 0;
};

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

} // namespace

// ============================================================================
// Schema Declaration
// ============================================================================

TEST(SchemaTest, DeclaresNameAndColumns) {
    ListTable table({"a", "b"}, {});
    EXPECT_EQ(table.schema_declaration(), "CREATE TABLE \"mytable\" (\"a\", \"b\")");
}

TEST(SchemaTest, ContainsEveryColumnOnceInOrder) {
    ListTable table({"alpha", "beta", "gamma", "delta"}, {}, "greek");
    std::string schema = table.schema_declaration();

    size_t last = 0;
    for (const auto& name : table.column_names()) {
        std::string quoted = "\"" + name + "\"";
        EXPECT_EQ(count_occurrences(schema, quoted), 1u) << name;
        size_t pos = schema.find(quoted);
        EXPECT_GT(pos, last) << name;
        last = pos;
    }
}

TEST(SchemaTest, RecomputedOnEveryCall) {
    ListTable table({"a"}, {});
    std::string before = table.schema_declaration();
    table.columns.push_back("b");
    EXPECT_NE(table.schema_declaration(), before);
    EXPECT_EQ(table.schema_declaration(), "CREATE TABLE \"mytable\" (\"a\", \"b\")");
}

TEST(SchemaTest, DefaultTableNameIsPlaceholder) {
    UnnamedTable table;
    EXPECT_EQ(table.table_name(), "<unnamed>");
    EXPECT_EQ(table.schema_declaration(), "CREATE TABLE \"<unnamed>\" (\"a\")");
}

TEST(SchemaTest, EscapesEmbeddedQuotes) {
    EXPECT_EQ(svtab::quote_identifier("plain"), "\"plain\"");
    EXPECT_EQ(svtab::quote_identifier("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(svtab::quote_identifier(""), "\"\"");

    ListTable table({"x\"y"}, {}, "t\"");
    EXPECT_EQ(table.schema_declaration(), "CREATE TABLE \"t\"\"\" (\"x\"\"y\")");
}

TEST(SchemaTest, EscapedSchemaIsAcceptedBySQLite) {
    auto table = std::make_shared<ListTable>(
        std::vector<std::string>{"we\"ird", "a b"},
        std::vector<svtab::Row>{svtab::Row{0, {svtab::Value(1), svtab::Value(2)}}},
        "odd\"name");

    svtab::Database db;
    ASSERT_TRUE(db.register_source("list", std::make_shared<ListSource>(table)));
    ASSERT_TRUE(db.create_virtual_table("t", "list")) << db.last_error();

    auto result = db.query("SELECT \"we\"\"ird\", \"a b\" FROM t");
    ASSERT_TRUE(result.ok()) << result.error;
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0][0], "1");
    EXPECT_EQ(result[0][1], "2");
}

// ============================================================================
// Column Validation
// ============================================================================

TEST(ValidateColumnsTest, RejectsEmptyList) {
    EXPECT_THROW(svtab::validate_columns({}), svtab::ArgumentError);
}

TEST(ValidateColumnsTest, RejectsDuplicatesIgnoringCase) {
    EXPECT_THROW(svtab::validate_columns({"a", "b", "a"}), svtab::ArgumentError);
    EXPECT_THROW(svtab::validate_columns({"Name", "NAME"}), svtab::ArgumentError);
    EXPECT_NO_THROW(svtab::validate_columns({"a", "b", "c"}));
}

// ============================================================================
// Table Capabilities
// ============================================================================

TEST(TableTest, SuggestIndexDefaultsToNoHint) {
    ListTable table({"a"}, {});
    std::vector<svtab::IndexConstraint> constraints = {{0, SQLITE_INDEX_CONSTRAINT_EQ, true}};
    std::vector<svtab::IndexOrderBy> orderings = {{0, false}};
    EXPECT_FALSE(table.suggest_index(constraints, orderings).has_value());
}

TEST(TableTest, OpenCursorBindsToTable) {
    ListTable table({"a", "b"}, xyz_rows());
    auto cursor = table.open_cursor();
    ASSERT_NE(cursor, nullptr);
    EXPECT_EQ(&cursor->table(), &table);
    EXPECT_EQ(cursor->column_count(), 2u);
}

TEST(TableTest, OpenCursorFailsWhenTableCannotMakeOne) {
    BrokenTable table;
    EXPECT_THROW(table.open_cursor(), svtab::Error);
}

TEST(TableTest, LifecycleHooksDefaultToNoOps) {
    UnnamedTable table;
    EXPECT_NO_THROW(table.disconnect());
    EXPECT_NO_THROW(table.drop());
}

// ============================================================================
// Table Source
// ============================================================================

TEST(TableSourceTest, CreateDelegatesToConnectByDefault) {
    auto table = std::make_shared<ListTable>(std::vector<std::string>{"a", "b"},
                                             std::vector<svtab::Row>{});
    ListSource source(table);

    auto decl = source.create(nullptr, "list", "main", "t", {"'x'", "42"});
    EXPECT_EQ(source.connects, 1);
    EXPECT_EQ(decl.table, table);
    EXPECT_EQ(decl.schema, "CREATE TABLE \"mytable\" (\"a\", \"b\")");
    EXPECT_EQ(source.last_module, "list");
    EXPECT_EQ(source.last_db, "main");
    EXPECT_EQ(source.last_table, "t");
    EXPECT_EQ(source.last_args, (std::vector<std::string>{"'x'", "42"}));
}

TEST(TableSourceTest, ConnectUsesConnectTable) {
    auto table = std::make_shared<ListTable>(std::vector<std::string>{"a"},
                                             std::vector<svtab::Row>{});
    ProvisioningSource source(table);

    source.connect(nullptr, "list", "main", "t", {});
    EXPECT_EQ(source.creates, 0);
    EXPECT_EQ(source.connects, 1);

    source.create(nullptr, "list", "main", "t", {});
    EXPECT_EQ(source.creates, 1);
    EXPECT_EQ(source.connects, 2);
}

TEST(TableSourceTest, DeclarationRejectsMissingTable) {
    ListSource source(nullptr);
    EXPECT_THROW(source.connect(nullptr, "list", "main", "t", {}), svtab::ContractError);
}

TEST(TableSourceTest, DeclarationRejectsEmptyColumns) {
    ListSource source(std::make_shared<ListTable>(std::vector<std::string>{},
                                                  std::vector<svtab::Row>{}));
    EXPECT_THROW(source.create(nullptr, "list", "main", "t", {}), svtab::ArgumentError);
}

// ============================================================================
// Values
// ============================================================================

TEST(ValueTest, ReportsStorageClass) {
    EXPECT_EQ(svtab::Value().type(), svtab::ColumnType::Null);
    EXPECT_EQ(svtab::Value(nullptr).type(), svtab::ColumnType::Null);
    EXPECT_EQ(svtab::Value(7).type(), svtab::ColumnType::Integer);
    EXPECT_EQ(svtab::Value(int64_t{1} << 40).type(), svtab::ColumnType::Integer);
    EXPECT_EQ(svtab::Value(2.5).type(), svtab::ColumnType::Real);
    EXPECT_EQ(svtab::Value("x").type(), svtab::ColumnType::Text);
    EXPECT_EQ(svtab::Value(svtab::Blob{1, 2}).type(), svtab::ColumnType::Blob);
    EXPECT_TRUE(svtab::Value().is_null());
}

TEST(ValueTest, AcceptsEveryIntegerType) {
    sqlite3_int64 wide = int64_t{1} << 40;
    EXPECT_EQ(svtab::Value(wide), svtab::Value(int64_t{1} << 40));
    EXPECT_EQ(svtab::Value(7LL), svtab::Value(int64_t{7}));
    EXPECT_EQ(svtab::Value(size_t{3}), svtab::Value(int64_t{3}));
    EXPECT_EQ(svtab::Value(3u), svtab::Value(int64_t{3}));
    EXPECT_EQ(svtab::Value(static_cast<short>(-2)), svtab::Value(int64_t{-2}));
    EXPECT_EQ(svtab::Value(true), svtab::Value(int64_t{1}));
    EXPECT_EQ(svtab::Value(size_t{3}).type(), svtab::ColumnType::Integer);

    std::vector<svtab::Value> values = {std::vector<int>{1, 2}.size(), wide};
    EXPECT_EQ(values[0].as_int64(), 2);
}

TEST(ValueTest, WrongAccessorThrowsTypeError) {
    svtab::Value v("text");
    EXPECT_EQ(v.as_text(), "text");
    EXPECT_THROW(v.as_int64(), svtab::TypeError);
    EXPECT_THROW(svtab::Value().as_double(), svtab::TypeError);
}

TEST(ValueTest, ToString) {
    EXPECT_EQ(svtab::Value().to_string(), "NULL");
    EXPECT_EQ(svtab::Value(-3).to_string(), "-3");
    EXPECT_EQ(svtab::Value(1.5).to_string(), "1.5");
    EXPECT_EQ(svtab::Value(svtab::Blob{0x0A, 0xFF}).to_string(), "x'0AFF'");
}

TEST(ValueTest, EqualityIsTypeSensitive) {
    EXPECT_EQ(svtab::Value(1), svtab::Value(int64_t{1}));
    EXPECT_NE(svtab::Value(1), svtab::Value(1.0));
    EXPECT_NE(svtab::Value("1"), svtab::Value(1));
}
