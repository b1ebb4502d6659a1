#include "tabflow/ingest_pipeline.h"

#include "tabflow/catalog.h"
#include "tabflow/frame_decoder.h"
#include "tabflow/table_materializer.h"
#include "tabflow/trace.h"

#include <algorithm>
#include <optional>
#include <type_traits>
#include <variant>

namespace tabflow {

IngestPipeline::IngestPipeline(const PipelineOptions& options, BlobStore& store,
                               IngestTransport& transport, TableEngine& engine, const Trace* trace)
    : options_(options), store_(store), transport_(transport), engine_(engine), trace_(trace),
      router_(options.routing, trace), uploader_(store, trace) {}

std::unique_ptr<IngestSession> IngestPipeline::create_session(const LocalFile& file) const {
  return std::make_unique<IngestSession>(make_record_id(), file, router_.route(file.size_bytes),
                                         options_.progress);
}

Result<MaterializedTable> IngestPipeline::run(IngestSession& session, const UploadTarget& target) {
  auto result = run_stages(session, target);
  CancelToken& cancel = session.cancel_token();

  if (result) {
    if (session.complete(result.value))
      return result;
    // cancel() won the race against the final transition
    return Result<MaterializedTable>::failure(Error::cancelled());
  }

  Error err = cancel.is_requested() ? Error::cancelled() : result.error;
  session.fail(err);
  if (!err.is_cancellation())
    TABFLOW_TRACE(trace_, TraceLevel::WARNING, "session %s failed: %s", session.id().c_str(),
                  err.to_string().c_str());
  return Result<MaterializedTable>::failure(std::move(err));
}

Result<MaterializedTable> IngestPipeline::ingest(const LocalFile& file, const UploadTarget& target,
                                                 SessionObserver* observer) {
  auto session = create_session(file);
  session->subscribe(observer);
  return run(*session, target);
}

Result<MaterializedTable> IngestPipeline::run_stages(IngestSession& session,
                                                     const UploadTarget& target) {
  auto valid = validate_options(options_);
  if (!valid)
    return Result<MaterializedTable>::failure(valid.error);

  const LocalFile& file = session.file();
  if (!session.begin_upload())
    return Result<MaterializedTable>::failure(
        Error::upload("session already started", session.id()));

  if (file.size_bytes > options_.routing.max_file_bytes)
    return Result<MaterializedTable>::failure(Error::upload(
        "file is larger than the " + std::to_string(options_.routing.max_file_bytes) +
            " byte limit",
        file.name));

  std::string storage_path = make_storage_path(target.workspace_id, target.page_id, now_millis(),
                                               file.name, session.id().substr(0, 12));
  auto blob = uploader_.upload(
      file, storage_path, [&session](int percent) { session.report_upload(percent); },
      &session.cancel_token());
  if (!blob)
    return Result<MaterializedTable>::failure(blob.error);

  if (!session.begin_processing())
    return Result<MaterializedTable>::failure(Error::cancelled());

  IngestRequest request;
  request.page_id = target.page_id;
  request.workspace_id = target.workspace_id;
  request.storage_url = blob.value.url;
  request.storage_path = blob.value.path;
  request.filename = file.name;
  request.file_size = blob.value.size_bytes;
  request.mime_type = file.mime_type.empty() ? guess_mime_type(file.name) : file.mime_type;

  TABFLOW_TRACE(trace_, TraceLevel::INFO, "session %s: %s %s (%llu bytes)", session.id().c_str(),
                strategy_name(session.strategy()), file.name.c_str(),
                static_cast<unsigned long long>(request.file_size));

  request.mode = RequestMode::METADATA;
  auto response = transport_.fetch_metadata(request);
  if (!response)
    return Result<MaterializedTable>::failure(
        Error::metadata(response.error.message, response.error.context));
  if (!response.value.success)
    return Result<MaterializedTable>::failure(Error::metadata(response.value.error, request.filename));
  if (session.cancel_token().is_requested())
    return Result<MaterializedTable>::failure(Error::cancelled());
  session.report_metadata();

  if (session.strategy() == Strategy::WHOLE_FILE)
    return run_whole_file(session, response.value);

  // The stream reuses the record the metadata call stored
  request.mode = RequestMode::STREAM;
  request.data_file_id = response.value.data_file.id;
  return run_progressive(session, request);
}

Result<MaterializedTable> IngestPipeline::run_whole_file(IngestSession& session,
                                                         const MetadataResponse& response) {
  if (!response.has_rows)
    return Result<MaterializedTable>::failure(Error::metadata(
        "response carries no rows for a whole-file load", response.data_file.filename));

  TableMaterializer materializer(engine_, options_.partial_table_policy, &session.cancel_token(),
                                 trace_);
  auto table = materializer.load_whole(response.data_file, response.rows);
  if (table)
    session.report_loaded(table.value.row_count);
  return table;
}

Result<MaterializedTable> IngestPipeline::run_progressive(IngestSession& session,
                                                          const IngestRequest& request) {
  CancelToken& cancel = session.cancel_token();

  auto opened = transport_.open_stream(request);
  if (!opened)
    return Result<MaterializedTable>::failure(
        Error::stream(opened.error.message, opened.error.context));
  std::unique_ptr<ResponseStream> stream = std::move(opened.value);
  ResponseStream* raw_stream = stream.get();
  // Declared after the stream so it is unregistered before the stream closes.
  ScopedCancelCallback abort_on_cancel(&cancel, [raw_stream] { raw_stream->abort(); });

  FrameDecoder decoder(options_.decoder, trace_);
  TableMaterializer materializer(engine_, options_.partial_table_policy, &cancel, trace_);
  uint64_t row_estimate = 0;
  std::optional<MaterializedTable> finished;

  auto handler = [&](StreamEvent&& event) -> Result<void> {
    if (cancel.is_requested())
      return Result<void>::failure(Error::cancelled());
    return std::visit(
        [&](auto& e) -> Result<void> {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, MetadataEvent>) {
            auto meta = materializer.on_metadata(e.record);
            if (!meta)
              return meta;
            row_estimate = e.record.total_row_estimate;
            session.report_metadata();
            return Result<void>::success();
          } else if constexpr (std::is_same_v<T, ChunkEvent>) {
            auto loaded = materializer.on_chunk(e);
            if (!loaded)
              return loaded;
            row_estimate = std::max(row_estimate, e.total_rows);
            session.report_chunk(e.index, materializer.loaded_rows(), row_estimate);
            return Result<void>::success();
          } else if constexpr (std::is_same_v<T, CompleteEvent>) {
            auto table = materializer.on_complete(e);
            if (!table)
              return Result<void>::failure(table.error);
            finished = std::move(table.value);
            return Result<void>::success();
          } else {
            return Result<void>::failure(materializer.on_error(e));
          }
        },
        event);
  };

  auto decoded = decode_stream(*stream, decoder, handler, options_.stream.read_block_bytes);

  if (cancel.is_requested()) {
    materializer.abandon(Error::cancelled());
    return Result<MaterializedTable>::failure(Error::cancelled());
  }
  if (!decoded) {
    materializer.abandon(decoded.error);
    return Result<MaterializedTable>::failure(decoded.error);
  }
  if (!finished) {
    Error err = Error::stream("stream ended without a complete event", request.filename);
    materializer.abandon(err);
    return Result<MaterializedTable>::failure(std::move(err));
  }

  TABFLOW_TRACE(trace_, TraceLevel::INFO, "session %s: %llu rows in %llu chunks into %s",
                session.id().c_str(), static_cast<unsigned long long>(finished->row_count),
                static_cast<unsigned long long>(materializer.loaded_chunks()),
                finished->table_name.c_str());
  return Result<MaterializedTable>::success(std::move(*finished));
}

} // namespace tabflow
