#include "tabflow/sqlite_table_engine.h"

#include <sqlite3.h>

#include <type_traits>
#include <variant>

namespace tabflow {

namespace {

class Statement {
public:
  Statement() = default;
  ~Statement() {
    if (stmt_)
      sqlite3_finalize(stmt_);
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt** out() { return &stmt_; }
  sqlite3_stmt* get() const { return stmt_; }

private:
  sqlite3_stmt* stmt_ = nullptr;
};

Error sqlite_error(sqlite3* db, const std::string& what, const std::string& table) {
  return Error::materialization(what + ": " + sqlite3_errmsg(db), table);
}

int bind_value(sqlite3_stmt* stmt, int idx, const Value& value) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return sqlite3_bind_null(stmt, idx);
        } else if constexpr (std::is_same_v<T, bool>) {
          return sqlite3_bind_int(stmt, idx, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(stmt, idx, v);
        } else {
          return sqlite3_bind_text(stmt, idx, v.data(), static_cast<int>(v.size()),
                                   SQLITE_TRANSIENT);
        }
      },
      value);
}

} // namespace

std::string quote_identifier(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 2);
  out += '"';
  for (char c : name) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}

const char* sqlite_column_type(DataType type) {
  switch (type) {
  case DataType::BOOL:
  case DataType::INT64:
    return "INTEGER";
  case DataType::FLOAT64:
    return "REAL";
  default:
    return "TEXT";
  }
}

Result<std::unique_ptr<SqliteTableEngine>> SqliteTableEngine::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    if (db)
      sqlite3_close(db);
    return Result<std::unique_ptr<SqliteTableEngine>>::failure(
        Error::materialization("cannot open database: " + msg, path));
  }
  return Result<std::unique_ptr<SqliteTableEngine>>::success(
      std::make_unique<SqliteTableEngine>(OpenKey{}, db, path));
}

SqliteTableEngine::~SqliteTableEngine() {
  if (db_)
    sqlite3_close(db_);
}

Result<void> SqliteTableEngine::exec(const std::string& sql, const std::string& table) const {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    return Result<void>::failure(Error::materialization(msg, table));
  }
  return Result<void>::success();
}

Result<void> SqliteTableEngine::rollback(Error cause, const std::string& table) const {
  auto undone = exec("ROLLBACK", table);
  if (!undone)
    cause.message += "; rollback failed: " + undone.error.message;
  return Result<void>::failure(std::move(cause));
}

bool SqliteTableEngine::has_table_locked(const std::string& table) const {
  Statement stmt;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1", -1,
                         stmt.out(), nullptr) != SQLITE_OK)
    return false;
  sqlite3_bind_text(stmt.get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

Result<void> SqliteTableEngine::insert_rows(const std::string& table, const std::vector<Row>& rows,
                                            size_t num_columns) {
  if (rows.empty())
    return Result<void>::success();

  std::string sql = "INSERT INTO " + quote_identifier(table) + " VALUES (";
  for (size_t c = 0; c < num_columns; ++c) {
    if (c > 0)
      sql += ", ";
    sql += '?';
  }
  sql += ')';

  Statement stmt;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
    return Result<void>::failure(sqlite_error(db_, "prepare insert failed", table));

  for (const auto& row : rows) {
    for (size_t c = 0; c < num_columns; ++c) {
      if (bind_value(stmt.get(), static_cast<int>(c + 1), row[c]) != SQLITE_OK)
        return Result<void>::failure(sqlite_error(db_, "bind failed", table));
    }
    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
      return Result<void>::failure(sqlite_error(db_, "insert failed", table));
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
  }
  return Result<void>::success();
}

Result<void> SqliteTableEngine::create_table_from_rows(const std::string& table,
                                                       const std::vector<Row>& rows,
                                                       const std::vector<ColumnSchema>& schema) {
  if (table.empty())
    return Result<void>::failure(Error::materialization("table name must not be empty"));
  if (schema.empty())
    return Result<void>::failure(Error::materialization("table needs at least one column", table));
  auto widths = check_row_widths(rows, schema);
  if (!widths)
    return Result<void>::failure(Error::materialization(widths.error.message, table));

  std::string ddl = "CREATE TABLE " + quote_identifier(table) + " (";
  for (size_t c = 0; c < schema.size(); ++c) {
    if (c > 0)
      ddl += ", ";
    ddl += quote_identifier(schema[c].name);
    ddl += ' ';
    ddl += sqlite_column_type(schema[c].type);
  }
  ddl += ')';

  std::lock_guard<std::mutex> lock(mutex_);
  if (has_table_locked(table))
    return Result<void>::failure(Error::materialization("table already exists", table));

  auto begin = exec("BEGIN", table);
  if (!begin)
    return begin;
  auto created = exec(ddl, table);
  if (created)
    created = insert_rows(table, rows, schema.size());
  if (!created)
    return rollback(created.error, table);
  return exec("COMMIT", table);
}

Result<void> SqliteTableEngine::append_rows(const std::string& table, const std::vector<Row>& rows,
                                            const std::vector<ColumnSchema>& schema) {
  auto widths = check_row_widths(rows, schema);
  if (!widths)
    return Result<void>::failure(Error::materialization(widths.error.message, table));

  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_table_locked(table))
    return Result<void>::failure(Error::materialization("table does not exist", table));

  auto begin = exec("BEGIN", table);
  if (!begin)
    return begin;
  auto inserted = insert_rows(table, rows, schema.size());
  if (!inserted)
    return rollback(inserted.error, table);
  return exec("COMMIT", table);
}

Result<void> SqliteTableEngine::drop_table(const std::string& table) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_table_locked(table))
    return Result<void>::failure(Error::materialization("table does not exist", table));
  return exec("DROP TABLE " + quote_identifier(table), table);
}

bool SqliteTableEngine::has_table(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_table_locked(table);
}

Result<uint64_t> SqliteTableEngine::row_count(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_table_locked(table))
    return Result<uint64_t>::failure(Error::materialization("table does not exist", table));
  Statement stmt;
  std::string sql = "SELECT COUNT(*) FROM " + quote_identifier(table);
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.out(), nullptr) != SQLITE_OK)
    return Result<uint64_t>::failure(sqlite_error(db_, "count failed", table));
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return Result<uint64_t>::failure(sqlite_error(db_, "count failed", table));
  return Result<uint64_t>::success(static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0)));
}

} // namespace tabflow
