#include "tabflow/table_engine.h"

namespace tabflow {

Result<void> check_row_widths(const std::vector<Row>& rows,
                              const std::vector<ColumnSchema>& schema) {
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].size() != schema.size()) {
      return Result<void>::failure(Error::materialization(
          "row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
          " cells, table has " + std::to_string(schema.size()) + " columns"));
    }
  }
  return Result<void>::success();
}

Result<void> MemoryTableEngine::create_table_from_rows(const std::string& table,
                                                       const std::vector<Row>& rows,
                                                       const std::vector<ColumnSchema>& schema) {
  if (table.empty())
    return Result<void>::failure(Error::materialization("table name must not be empty"));
  if (schema.empty())
    return Result<void>::failure(Error::materialization("table needs at least one column", table));
  auto widths = check_row_widths(rows, schema);
  if (!widths)
    return Result<void>::failure(Error::materialization(widths.error.message, table));

  std::lock_guard<std::mutex> lock(mutex_);
  if (tables_.count(table))
    return Result<void>::failure(Error::materialization("table already exists", table));
  StoredTable stored;
  stored.schema = schema;
  stored.num_rows = rows.size();
  if (!rows.empty())
    stored.batches.push_back(rows);
  tables_.emplace(table, std::move(stored));
  return Result<void>::success();
}

Result<void> MemoryTableEngine::append_rows(const std::string& table, const std::vector<Row>& rows,
                                            const std::vector<ColumnSchema>& schema) {
  auto widths = check_row_widths(rows, schema);
  if (!widths)
    return Result<void>::failure(Error::materialization(widths.error.message, table));

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tables_.find(table);
  if (it == tables_.end())
    return Result<void>::failure(Error::materialization("table does not exist", table));
  const auto& existing = it->second.schema;
  if (existing.size() != schema.size())
    return Result<void>::failure(Error::materialization("column count mismatch", table));
  for (size_t c = 0; c < schema.size(); ++c) {
    if (existing[c].name != schema[c].name)
      return Result<void>::failure(
          Error::materialization("column '" + schema[c].name + "' does not match table", table));
  }
  if (!rows.empty()) {
    it->second.batches.push_back(rows);
    it->second.num_rows += rows.size();
  }
  return Result<void>::success();
}

Result<void> MemoryTableEngine::drop_table(const std::string& table) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (tables_.erase(table) == 0)
    return Result<void>::failure(Error::materialization("table does not exist", table));
  return Result<void>::success();
}

bool MemoryTableEngine::has_table(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tables_.count(table) > 0;
}

Result<uint64_t> MemoryTableEngine::row_count(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tables_.find(table);
  if (it == tables_.end())
    return Result<uint64_t>::failure(Error::materialization("table does not exist", table));
  return Result<uint64_t>::success(uint64_t(it->second.num_rows));
}

Result<std::vector<Row>> MemoryTableEngine::scan(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tables_.find(table);
  if (it == tables_.end())
    return Result<std::vector<Row>>::failure(Error::materialization("table does not exist", table));
  std::vector<Row> rows;
  rows.reserve(it->second.num_rows);
  for (const auto& batch : it->second.batches)
    rows.insert(rows.end(), batch.begin(), batch.end());
  return Result<std::vector<Row>>::success(std::move(rows));
}

Result<std::vector<ColumnSchema>> MemoryTableEngine::schema(const std::string& table) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tables_.find(table);
  if (it == tables_.end())
    return Result<std::vector<ColumnSchema>>::failure(
        Error::materialization("table does not exist", table));
  auto copy = it->second.schema;
  return Result<std::vector<ColumnSchema>>::success(std::move(copy));
}

size_t MemoryTableEngine::table_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tables_.size();
}

} // namespace tabflow
