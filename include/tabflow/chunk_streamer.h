#pragma once

#include "blob_store.h"
#include "cancel_token.h"
#include "error.h"
#include "options.h"
#include "row_reader.h"
#include "types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabflow {

class Trace;

// Destination of encoded frames. write() returns false once the client has gone.
class FrameSink {
public:
  virtual ~FrameSink() = default;
  virtual bool write(std::string_view frame) = 0;
};

// Collects frames in memory
class StringFrameSink : public FrameSink {
public:
  bool write(std::string_view frame) override {
    data_.append(frame.data(), frame.size());
    return true;
  }
  const std::string& data() const { return data_; }

private:
  std::string data_;
};

struct StreamSummary {
  uint64_t chunks_sent = 0;
  uint64_t rows_sent = 0;
  bool completed = false;   // A complete event was written
  bool client_gone = false; // The sink refused a write
  std::optional<Error> error;
};

// Re-reads a stored file sequentially and streams it as ordered frames:
// one metadata event, one chunk event per StreamOptions::chunk_rows records,
// then a complete event. Memory is bounded by one chunk.
class ChunkStreamer {
public:
  ChunkStreamer(const PipelineOptions& options, BlobStore& store, const Trace* trace = nullptr);

  // A malformed record ends the stream with a single error event; no chunk at
  // or after the failing one is written.
  StreamSummary stream(const FileMetadataRecord& record, FrameSink& sink,
                       CancelToken* cancel = nullptr);

  // Parse every record of the stored file into memory. Used for small files.
  Result<std::vector<Row>> read_all_rows(const FileMetadataRecord& record);

private:
  using RowVisitor = std::function<bool(Row&& row)>;

  // Visits each data record converted to the record's schema. The visitor
  // returns false to stop early. Errors carry ErrorKind::STREAM and the line.
  Result<void> for_each_row(const FileMetadataRecord& record, CancelToken* cancel,
                            const RowVisitor& visit, size_t* failed_line);

  PipelineOptions options_;
  BlobStore& store_;
  const Trace* trace_;
};

} // namespace tabflow
