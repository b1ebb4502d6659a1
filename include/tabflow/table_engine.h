#pragma once

#include "error.h"
#include "types.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tabflow {

// The embedded analytical engine, as seen by the materializer.
// Implementations must be safe to call from several sessions at once.
class TableEngine {
public:
  virtual ~TableEngine() = default;

  // Fails if the table already exists or a row does not match the schema width.
  virtual Result<void> create_table_from_rows(const std::string& table,
                                              const std::vector<Row>& rows,
                                              const std::vector<ColumnSchema>& schema) = 0;

  // Fails if the table does not exist or its columns differ from schema.
  virtual Result<void> append_rows(const std::string& table, const std::vector<Row>& rows,
                                   const std::vector<ColumnSchema>& schema) = 0;

  virtual Result<void> drop_table(const std::string& table) = 0;
  virtual bool has_table(const std::string& table) const = 0;
  virtual Result<uint64_t> row_count(const std::string& table) const = 0;
};

// Tables held in memory as a list of appended row batches.
class MemoryTableEngine : public TableEngine {
public:
  Result<void> create_table_from_rows(const std::string& table, const std::vector<Row>& rows,
                                      const std::vector<ColumnSchema>& schema) override;
  Result<void> append_rows(const std::string& table, const std::vector<Row>& rows,
                           const std::vector<ColumnSchema>& schema) override;
  Result<void> drop_table(const std::string& table) override;
  bool has_table(const std::string& table) const override;
  Result<uint64_t> row_count(const std::string& table) const override;

  // All rows of a table in insertion order
  Result<std::vector<Row>> scan(const std::string& table) const;
  Result<std::vector<ColumnSchema>> schema(const std::string& table) const;
  size_t table_count() const;

private:
  struct StoredTable {
    std::vector<ColumnSchema> schema;
    std::vector<std::vector<Row>> batches;
    uint64_t num_rows = 0;
  };

  mutable std::mutex mutex_;
  std::map<std::string, StoredTable> tables_;
};

// Checks every row has exactly schema.size() cells.
Result<void> check_row_widths(const std::vector<Row>& rows, const std::vector<ColumnSchema>& schema);

} // namespace tabflow
