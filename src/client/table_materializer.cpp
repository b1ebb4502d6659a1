#include "tabflow/table_materializer.h"

#include "tabflow/cancel_token.h"
#include "tabflow/trace.h"

#include <functional>

namespace tabflow {

TableMaterializer::TableMaterializer(TableEngine& engine, PartialTablePolicy policy,
                                     CancelToken* cancel, const Trace* trace)
    : engine_(engine), policy_(policy), cancel_(cancel), trace_(trace) {}

Result<void> TableMaterializer::guarded(const char* what,
                                        const std::function<Result<void>()>& call) {
  if (!cancel_)
    return call();
  Result<void> result = Result<void>::success();
  bool ran = cancel_->run_unless_cancelled([&] { result = call(); });
  if (!ran) {
    TABFLOW_TRACE(trace_, TraceLevel::DEBUG, "skipped %s of %s after cancel", what,
                  table_name_.c_str());
    return Result<void>::failure(Error::cancelled());
  }
  return result;
}

Result<void> TableMaterializer::on_metadata(const FileMetadataRecord& record) {
  if (finished_)
    return Result<void>::failure(Error::stream("metadata after the load finished"));
  if (record_)
    return Result<void>::failure(Error::stream("duplicate metadata event"));
  if (record.schema.empty())
    return Result<void>::failure(Error::metadata("record has no columns", record.filename));
  record_ = record;
  table_name_ = record.table_name;
  return Result<void>::success();
}

Result<void> TableMaterializer::on_chunk(const ChunkEvent& chunk) {
  if (finished_)
    return Result<void>::failure(Error::stream("chunk after the load finished"));
  if (!record_)
    return Result<void>::failure(Error::stream("chunk before metadata"));
  if (chunk.index != loaded_chunks_)
    return Result<void>::failure(Error::stream("chunk " + std::to_string(chunk.index) +
                                               " out of order, expected " +
                                               std::to_string(loaded_chunks_)));

  const auto& schema = record_->schema;
  Result<void> result = Result<void>::success();
  if (!table_created_) {
    result = guarded("create", [&] {
      return engine_.create_table_from_rows(table_name_, chunk.rows, schema);
    });
    if (result)
      table_created_ = true;
  } else {
    result = guarded("append", [&] { return engine_.append_rows(table_name_, chunk.rows, schema); });
  }
  if (!result)
    return result;

  loaded_rows_ += chunk.rows.size();
  ++loaded_chunks_;
  TABFLOW_TRACE(trace_, TraceLevel::DEBUG, "chunk %llu loaded into %s (%llu rows total)",
                static_cast<unsigned long long>(chunk.index), table_name_.c_str(),
                static_cast<unsigned long long>(loaded_rows_));
  return Result<void>::success();
}

Result<MaterializedTable> TableMaterializer::on_complete(const CompleteEvent& complete) {
  if (finished_)
    return Result<MaterializedTable>::failure(Error::stream("complete after the load finished"));
  if (!record_)
    return Result<MaterializedTable>::failure(Error::stream("complete before metadata"));

  if (complete.final_row_count != loaded_rows_) {
    Error err = Error::stream("stream announced " + std::to_string(complete.final_row_count) +
                              " rows but " + std::to_string(loaded_rows_) + " were loaded");
    abandon(err);
    return Result<MaterializedTable>::failure(std::move(err));
  }

  if (!table_created_) {
    std::vector<Row> none;
    auto created = guarded("create", [&] {
      return engine_.create_table_from_rows(table_name_, none, record_->schema);
    });
    if (!created) {
      finished_ = true;
      return Result<MaterializedTable>::failure(created.error);
    }
    table_created_ = true;
  }

  finished_ = true;
  MaterializedTable table;
  table.table_id = record_->id;
  table.table_name = table_name_;
  table.row_count = loaded_rows_;
  return Result<MaterializedTable>::success(std::move(table));
}

Error TableMaterializer::on_error(const ErrorEvent& event) {
  std::string context;
  if (event.chunk_index)
    context = "chunk " + std::to_string(*event.chunk_index);
  Error err = Error::stream(event.message, context);
  abandon(err);
  return err;
}

void TableMaterializer::abandon(const Error& cause) {
  if (finished_)
    return;
  finished_ = true;
  TABFLOW_TRACE(trace_, TraceLevel::INFO, "load of %s stopped: %s",
                table_name_.empty() ? "(no table)" : table_name_.c_str(),
                cause.to_string().c_str());
  auto policy = apply_policy();
  if (!policy)
    TABFLOW_TRACE(trace_, TraceLevel::WARNING, "partial table cleanup failed: %s",
                  policy.error.to_string().c_str());
}

Result<void> TableMaterializer::apply_policy() {
  if (!table_created_)
    return Result<void>::success();
  if (trace_)
    trace_->log_decision(policy_ == PartialTablePolicy::DROP ? "drop partial table"
                                                             : "keep partial table",
                         table_name_.c_str());
  if (policy_ == PartialTablePolicy::KEEP)
    return Result<void>::success();
  // Cleanup runs even after cancellation: it is not a create or append.
  auto dropped = engine_.drop_table(table_name_);
  if (dropped)
    table_created_ = false;
  return dropped;
}

Result<MaterializedTable> TableMaterializer::load_whole(const FileMetadataRecord& record,
                                                        const std::vector<Row>& rows) {
  auto meta = on_metadata(record);
  if (!meta)
    return Result<MaterializedTable>::failure(meta.error);

  auto created = guarded("create", [&] {
    return engine_.create_table_from_rows(table_name_, rows, record_->schema);
  });
  finished_ = true;
  if (!created)
    return Result<MaterializedTable>::failure(created.error);
  table_created_ = true;
  loaded_rows_ = rows.size();
  loaded_chunks_ = 1;

  MaterializedTable table;
  table.table_id = record_->id;
  table.table_name = table_name_;
  table.row_count = loaded_rows_;
  return Result<MaterializedTable>::success(std::move(table));
}

} // namespace tabflow
