/**
 * @file table_engine_test.cpp
 * @brief Tests for the in-memory and SQLite table engines.
 */

#include "test_util.h"

#include "tabflow/sqlite_table_engine.h"

#include <gtest/gtest.h>
#include <sqlite3.h>

using namespace tabflow;
using test_util::TempDir;

namespace {

std::vector<ColumnSchema> make_schema() {
  std::vector<ColumnSchema> schema(4);
  schema[0].name = "id";
  schema[0].type = DataType::INT64;
  schema[1].name = "label";
  schema[1].type = DataType::STRING;
  schema[2].name = "score";
  schema[2].type = DataType::FLOAT64;
  schema[3].name = "flag";
  schema[3].type = DataType::BOOL;
  for (size_t i = 0; i < schema.size(); ++i)
    schema[i].index = i;
  return schema;
}

std::vector<Row> make_rows(int64_t first, size_t n) {
  std::vector<Row> rows;
  for (size_t i = 0; i < n; ++i) {
    int64_t id = first + static_cast<int64_t>(i);
    rows.push_back(Row{id, std::string("row ") + std::to_string(id), id * 0.5, id % 2 == 0});
  }
  return rows;
}

// Runs the same contract checks against any engine.
void check_engine_contract(TableEngine& engine) {
  auto schema = make_schema();
  EXPECT_FALSE(engine.has_table("t"));
  ASSERT_TRUE(engine.create_table_from_rows("t", make_rows(0, 3), schema));
  EXPECT_TRUE(engine.has_table("t"));

  auto again = engine.create_table_from_rows("t", make_rows(0, 1), schema);
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error.kind, ErrorKind::MATERIALIZATION);
  EXPECT_EQ(again.error.message, "table already exists");

  ASSERT_TRUE(engine.append_rows("t", make_rows(3, 4), schema));
  ASSERT_TRUE(engine.append_rows("t", {}, schema));
  auto count = engine.row_count("t");
  ASSERT_TRUE(count);
  EXPECT_EQ(count.value, 7u);

  auto missing = engine.append_rows("nope", make_rows(0, 1), schema);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error.message, "table does not exist");
  EXPECT_EQ(missing.error.context, "nope");

  std::vector<Row> narrow{Row{int64_t{1}, std::string("x")}};
  auto bad = engine.append_rows("t", narrow, schema);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error.message, "row 0 has 2 cells, table has 4 columns");
  EXPECT_EQ(engine.row_count("t").value, 7u);

  ASSERT_TRUE(engine.drop_table("t"));
  EXPECT_FALSE(engine.has_table("t"));
  EXPECT_FALSE(engine.drop_table("t"));
  EXPECT_FALSE(engine.row_count("t"));
}

} // namespace

// =============================================================================
// Row width checks
// =============================================================================

TEST(RowWidthTest, MatchingRowsPass) {
  EXPECT_TRUE(check_row_widths(make_rows(0, 5), make_schema()));
  EXPECT_TRUE(check_row_widths({}, make_schema()));
}

TEST(RowWidthTest, ReportsFirstBadRow) {
  auto rows = make_rows(0, 5);
  rows[3].pop_back();
  auto r = check_row_widths(rows, make_schema());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error.message, "row 3 has 3 cells, table has 4 columns");
}

// =============================================================================
// MemoryTableEngine
// =============================================================================

TEST(MemoryTableEngineTest, Contract) {
  MemoryTableEngine engine;
  check_engine_contract(engine);
}

TEST(MemoryTableEngineTest, ScanPreservesOrder) {
  MemoryTableEngine engine;
  auto schema = make_schema();
  ASSERT_TRUE(engine.create_table_from_rows("t", make_rows(0, 2), schema));
  ASSERT_TRUE(engine.append_rows("t", make_rows(2, 3), schema));
  auto rows = engine.scan("t");
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows.value.size(), 5u);
  for (size_t i = 0; i < 5; ++i)
    EXPECT_EQ(std::get<int64_t>(rows.value[i][0]), static_cast<int64_t>(i));
  EXPECT_EQ(std::get<std::string>(rows.value[4][1]), "row 4");
}

TEST(MemoryTableEngineTest, EmptyTable) {
  MemoryTableEngine engine;
  ASSERT_TRUE(engine.create_table_from_rows("empty", {}, make_schema()));
  EXPECT_EQ(engine.row_count("empty").value, 0u);
  auto schema = engine.schema("empty");
  ASSERT_TRUE(schema);
  EXPECT_EQ(schema.value.size(), 4u);
  EXPECT_EQ(schema.value[2].name, "score");
  EXPECT_EQ(engine.table_count(), 1u);
}

TEST(MemoryTableEngineTest, RejectsBadCreate) {
  MemoryTableEngine engine;
  EXPECT_EQ(engine.create_table_from_rows("", {}, make_schema()).error.message,
            "table name must not be empty");
  EXPECT_EQ(engine.create_table_from_rows("t", {}, {}).error.message,
            "table needs at least one column");
  EXPECT_EQ(engine.table_count(), 0u);
}

TEST(MemoryTableEngineTest, AppendChecksColumns) {
  MemoryTableEngine engine;
  auto schema = make_schema();
  ASSERT_TRUE(engine.create_table_from_rows("t", {}, schema));

  auto renamed = schema;
  renamed[1].name = "other";
  auto r = engine.append_rows("t", make_rows(0, 1), renamed);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error.message, "column 'other' does not match table");

  auto fewer = schema;
  fewer.pop_back();
  EXPECT_EQ(engine.append_rows("t", {}, fewer).error.message, "column count mismatch");
}

TEST(MemoryTableEngineTest, ScanMissingTable) {
  MemoryTableEngine engine;
  EXPECT_FALSE(engine.scan("missing"));
  EXPECT_FALSE(engine.schema("missing"));
}

// =============================================================================
// SqliteTableEngine
// =============================================================================

TEST(SqliteHelpersTest, QuoteIdentifier) {
  EXPECT_EQ(quote_identifier("sales"), "\"sales\"");
  EXPECT_EQ(quote_identifier("a\"b"), "\"a\"\"b\"");
  EXPECT_EQ(quote_identifier(""), "\"\"");
}

TEST(SqliteHelpersTest, ColumnAffinity) {
  EXPECT_STREQ(sqlite_column_type(DataType::INT64), "INTEGER");
  EXPECT_STREQ(sqlite_column_type(DataType::BOOL), "INTEGER");
  EXPECT_STREQ(sqlite_column_type(DataType::FLOAT64), "REAL");
  EXPECT_STREQ(sqlite_column_type(DataType::STRING), "TEXT");
  EXPECT_STREQ(sqlite_column_type(DataType::DATE), "TEXT");
  EXPECT_STREQ(sqlite_column_type(DataType::TIMESTAMP), "TEXT");
}

TEST(SqliteTableEngineTest, ContractInMemory) {
  auto engine = SqliteTableEngine::open(":memory:");
  ASSERT_TRUE(engine) << engine.error.to_string();
  check_engine_contract(*engine.value);
}

TEST(SqliteTableEngineTest, OpenCreatesDatabaseFile) {
  TempDir dir;
  std::string path = dir.path() + "/fresh.sqlite";
  auto engine = SqliteTableEngine::open(path);
  ASSERT_TRUE(engine) << engine.error.to_string();
  ASSERT_NE(engine.value, nullptr);
  EXPECT_EQ(engine.value->path(), path);
  EXPECT_FALSE(engine.value->has_table("anything"));
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(SqliteTableEngineTest, OpenFailure) {
  TempDir dir;
  auto engine = SqliteTableEngine::open(dir.path() + "/no/such/dir/db.sqlite");
  ASSERT_FALSE(engine);
  EXPECT_EQ(engine.error.kind, ErrorKind::MATERIALIZATION);
  EXPECT_EQ(engine.error.message.rfind("cannot open database", 0), 0u);
}

TEST(SqliteTableEngineTest, ValuesStoredWithAffinity) {
  TempDir dir;
  std::string path = dir.path() + "/tables.db";
  {
    auto engine = SqliteTableEngine::open(path);
    ASSERT_TRUE(engine);
    EXPECT_EQ(engine.value->path(), path);
    std::vector<Row> rows{Row{int64_t{7}, std::string("it's \"quoted\""), 2.25, true},
                          Row{std::monostate{}, std::monostate{}, std::monostate{}, false}};
    ASSERT_TRUE(engine.value->create_table_from_rows("my \"table\"", rows, make_schema()));
  }

  sqlite3* db = nullptr;
  ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
  sqlite3_stmt* stmt = nullptr;
  ASSERT_EQ(sqlite3_prepare_v2(db,
                               "SELECT id, typeof(id), label, score, flag, typeof(label) "
                               "FROM \"my \"\"table\"\"\" ORDER BY rowid",
                               -1, &stmt, nullptr),
            SQLITE_OK);

  ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
  EXPECT_EQ(sqlite3_column_int64(stmt, 0), 7);
  EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)), "integer");
  EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)), "it's \"quoted\"");
  EXPECT_DOUBLE_EQ(sqlite3_column_double(stmt, 3), 2.25);
  EXPECT_EQ(sqlite3_column_int(stmt, 4), 1);

  ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
  EXPECT_EQ(sqlite3_column_type(stmt, 0), SQLITE_NULL);
  EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5)), "null");
  EXPECT_EQ(sqlite3_column_int(stmt, 4), 0);

  EXPECT_EQ(sqlite3_step(stmt), SQLITE_DONE);
  sqlite3_finalize(stmt);
  sqlite3_close(db);
}

TEST(SqliteTableEngineTest, FailedCreateLeavesNoTable) {
  auto engine = SqliteTableEngine::open(":memory:");
  ASSERT_TRUE(engine);
  auto schema = make_schema();
  schema[1].name = "id";
  auto r = engine.value->create_table_from_rows("dup", make_rows(0, 2), schema);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error.kind, ErrorKind::MATERIALIZATION);
  EXPECT_EQ(r.error.context, "dup");
  EXPECT_FALSE(engine.value->has_table("dup"));

  // The connection is usable after the rollback
  ASSERT_TRUE(engine.value->create_table_from_rows("ok", make_rows(0, 2), make_schema()));
  EXPECT_EQ(engine.value->row_count("ok").value, 2u);
}

TEST(SqliteTableEngineTest, ManyRowsInOneBatch) {
  auto engine = SqliteTableEngine::open(":memory:");
  ASSERT_TRUE(engine);
  ASSERT_TRUE(engine.value->create_table_from_rows("big", make_rows(0, 5000), make_schema()));
  ASSERT_TRUE(engine.value->append_rows("big", make_rows(5000, 5000), make_schema()));
  EXPECT_EQ(engine.value->row_count("big").value, 10000u);
}
