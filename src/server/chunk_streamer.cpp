#include "tabflow/chunk_streamer.h"

#include "tabflow/frame_decoder.h"
#include "tabflow/metadata_extractor.h"
#include "tabflow/stream_event.h"
#include "tabflow/trace.h"
#include "tabflow/type_inference.h"

namespace tabflow {

ChunkStreamer::ChunkStreamer(const PipelineOptions& options, BlobStore& store, const Trace* trace)
    : options_(options), store_(store), trace_(trace) {}

Result<void> ChunkStreamer::for_each_row(const FileMetadataRecord& record, CancelToken* cancel,
                                         const RowVisitor& visit, size_t* failed_line) {
  auto source = store_.open(record.storage_path);
  if (!source)
    return Result<void>::failure(Error::stream(source.error.message, record.storage_path));

  CsvOptions csv = csv_options_for(options_.csv, record.filename);
  RowReader reader(*source.value, csv, options_.stream.read_block_bytes);
  ValueParser parser(csv);
  const size_t ncols = record.schema.size();

  CsvRow row;
  if (csv.has_header) {
    auto header = reader.next(row);
    if (!header)
      return Result<void>::failure(header.error);
    if (!header.value)
      return Result<void>::success();
  }

  while (true) {
    if (cancel && cancel->is_requested())
      return Result<void>::failure(Error::cancelled("stream abandoned"));

    auto r = reader.next(row);
    if (!r)
      return Result<void>::failure(r.error);
    if (!r.value)
      break;
    if (row.fields.size() != ncols) {
      if (failed_line)
        *failed_line = row.line;
      return Result<void>::failure(Error::stream(
          "row has " + std::to_string(row.fields.size()) + " fields, expected " +
              std::to_string(ncols),
          "line " + std::to_string(row.line)));
    }
    if (!visit(parser.parse_row(row.fields, record.schema)))
      break;
  }

  if (trace_ && parser.fallback_count() > 0) {
    trace_->warn("%zu cells in %s did not match their column type and were kept as text",
                 parser.fallback_count(), record.filename.c_str());
  }
  return Result<void>::success();
}

StreamSummary ChunkStreamer::stream(const FileMetadataRecord& record, FrameSink& sink,
                                    CancelToken* cancel) {
  StreamSummary summary;
  auto emit = [&](const StreamEvent& event) {
    if (summary.client_gone)
      return false;
    if (!sink.write(encode_frame(event))) {
      summary.client_gone = true;
      if (trace_)
        trace_->info("client closed the stream for %s", record.table_name.c_str());
      return false;
    }
    return true;
  };

  if (!emit(MetadataEvent{record}))
    return summary;

  const size_t chunk_rows = options_.stream.chunk_rows;
  ChunkEvent chunk;
  chunk.rows.reserve(chunk_rows);

  auto flush = [&]() {
    chunk.row_count = chunk.rows.size();
    chunk.cumulative_rows = summary.rows_sent + chunk.row_count;
    chunk.total_rows = record.total_row_estimate;
    StreamEvent event(std::move(chunk));
    bool sent = emit(event);
    chunk = std::move(std::get<ChunkEvent>(event));
    if (!sent)
      return false;
    summary.rows_sent = chunk.cumulative_rows;
    ++summary.chunks_sent;
    ++chunk.index;
    chunk.rows.clear();
    return true;
  };

  if (trace_)
    trace_->start_phase("stream");
  size_t failed_line = 0;
  auto result = for_each_row(
      record, cancel,
      [&](Row&& row) {
        chunk.rows.push_back(std::move(row));
        if (chunk.rows.size() < chunk_rows)
          return true;
        return flush();
      },
      &failed_line);
  if (trace_)
    trace_->end_phase(record.size_bytes);

  if (summary.client_gone)
    return summary;

  if (!result) {
    summary.error = result.error;
    if (result.error.is_cancellation())
      return summary;
    if (trace_)
      trace_->warn("streaming %s failed at chunk %llu: %s", record.filename.c_str(),
                   static_cast<unsigned long long>(chunk.index),
                   result.error.to_string().c_str());
    ErrorEvent err;
    err.message = result.error.message;
    if (!result.error.context.empty())
      err.message += " (" + result.error.context + ")";
    err.chunk_index = chunk.index;
    if (failed_line > 0)
      err.line = failed_line;
    emit(err);
    return summary;
  }

  if (!chunk.rows.empty() && !flush())
    return summary;

  if (emit(CompleteEvent{summary.rows_sent, summary.chunks_sent})) {
    summary.completed = true;
    if (trace_)
      trace_->info("streamed %llu rows in %llu chunks for %s",
                   static_cast<unsigned long long>(summary.rows_sent),
                   static_cast<unsigned long long>(summary.chunks_sent),
                   record.table_name.c_str());
  }
  return summary;
}

Result<std::vector<Row>> ChunkStreamer::read_all_rows(const FileMetadataRecord& record) {
  std::vector<Row> rows;
  rows.reserve(record.total_row_estimate);
  auto result = for_each_row(
      record, nullptr,
      [&](Row&& row) {
        rows.push_back(std::move(row));
        return true;
      },
      nullptr);
  if (!result)
    return Result<std::vector<Row>>::failure(
        Error::metadata(result.error.message, result.error.context));
  return Result<std::vector<Row>>::success(std::move(rows));
}

} // namespace tabflow
