#pragma once

#include "table_engine.h"

#include <memory>
#include <mutex>
#include <string>
#include <utility>

struct sqlite3;

namespace tabflow {

// TableEngine backed by an SQLite database file (or ":memory:").
//
// Column types map to SQLite affinities: BOOL and INT64 to INTEGER, FLOAT64 to
// REAL, everything else to TEXT. Each create/append runs as one transaction
// through a single prepared INSERT, so a failed batch leaves no partial rows.
class SqliteTableEngine : public TableEngine {
  // Only open() can name this, so only open() can construct an engine
  struct OpenKey {
    explicit OpenKey() = default;
  };

public:
  static Result<std::unique_ptr<SqliteTableEngine>> open(const std::string& path);

  SqliteTableEngine(OpenKey, sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

  ~SqliteTableEngine() override;

  SqliteTableEngine(const SqliteTableEngine&) = delete;
  SqliteTableEngine& operator=(const SqliteTableEngine&) = delete;

  Result<void> create_table_from_rows(const std::string& table, const std::vector<Row>& rows,
                                      const std::vector<ColumnSchema>& schema) override;
  Result<void> append_rows(const std::string& table, const std::vector<Row>& rows,
                           const std::vector<ColumnSchema>& schema) override;
  Result<void> drop_table(const std::string& table) override;
  bool has_table(const std::string& table) const override;
  Result<uint64_t> row_count(const std::string& table) const override;

  const std::string& path() const { return path_; }

private:
  Result<void> exec(const std::string& sql, const std::string& table) const;
  Result<void> rollback(Error cause, const std::string& table) const;
  Result<void> insert_rows(const std::string& table, const std::vector<Row>& rows,
                           size_t num_columns);
  bool has_table_locked(const std::string& table) const;

  sqlite3* db_;
  std::string path_;
  mutable std::mutex mutex_;
};

// "name" with embedded quotes doubled.
std::string quote_identifier(const std::string& name);

const char* sqlite_column_type(DataType type);

} // namespace tabflow
