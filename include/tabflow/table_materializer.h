#pragma once

#include "error.h"
#include "options.h"
#include "stream_event.h"
#include "table_engine.h"
#include "types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tabflow {

class CancelToken;
class Trace;

/**
 * @brief Turns a decoded event stream into one engine table.
 *
 * The first chunk creates the table from its rows, every later chunk is
 * appended. Each engine call goes through the session's cancel token, so once
 * cancellation is requested no further create or append starts.
 *
 * @note Not thread-safe. A materializer belongs to a single session.
 */
class TableMaterializer {
public:
  TableMaterializer(TableEngine& engine, PartialTablePolicy policy = PartialTablePolicy::DROP,
                    CancelToken* cancel = nullptr, const Trace* trace = nullptr);

  // Remembers schema and table name. No engine mutation.
  Result<void> on_metadata(const FileMetadataRecord& record);

  Result<void> on_chunk(const ChunkEvent& chunk);

  /// Checks the announced row count against what was loaded and returns the
  /// table handle. A stream without chunks still produces an empty table.
  Result<MaterializedTable> on_complete(const CompleteEvent& complete);

  /// Ends the load as failed and applies the partial table policy. Returns
  /// the error carried by the event.
  Error on_error(const ErrorEvent& event);

  /// Ends the load after a failure raised outside the stream (decoder error,
  /// cancellation). Applies the partial table policy.
  void abandon(const Error& cause);

  // WHOLE_FILE path: one create call with every row.
  Result<MaterializedTable> load_whole(const FileMetadataRecord& record,
                                       const std::vector<Row>& rows);

  uint64_t loaded_rows() const { return loaded_rows_; }
  uint64_t loaded_chunks() const { return loaded_chunks_; }
  bool table_created() const { return table_created_; }
  bool finished() const { return finished_; }
  const std::string& table_name() const { return table_name_; }

private:
  Result<void> guarded(const char* what, const std::function<Result<void>()>& call);
  Result<void> apply_policy();

  TableEngine& engine_;
  PartialTablePolicy policy_;
  CancelToken* cancel_;
  const Trace* trace_;

  std::optional<FileMetadataRecord> record_;
  std::string table_name_;
  uint64_t loaded_rows_ = 0;
  uint64_t loaded_chunks_ = 0;
  bool table_created_ = false;
  bool finished_ = false;
};

} // namespace tabflow
