#include "tabflow/ingest_service.h"

#include "tabflow/frame_decoder.h"
#include "tabflow/trace.h"
#include "tabflow/wire.h"

namespace tabflow {

namespace {

MetadataResponse failed_response(const Error& error) {
  MetadataResponse response;
  response.success = false;
  response.error = error.message;
  if (!error.context.empty())
    response.error += " (" + error.context + ")";
  return response;
}

} // namespace

IngestService::IngestService(const PipelineOptions& options, BlobStore& store, Catalog& catalog,
                             const Trace* trace)
    : options_(options), store_(store), catalog_(catalog),
      extractor_(options, store, catalog, trace), streamer_(options, store, trace),
      router_(options.routing, trace), trace_(trace) {}

MetadataResponse IngestService::handle_metadata(const IngestRequest& request) {
  if (trace_)
    trace_->debug("metadata request for %s (page %s)", request.filename.c_str(),
                  request.page_id.c_str());

  auto record = extractor_.extract(request.storage_path, request.filename);
  if (!record) {
    if (trace_)
      trace_->warn("metadata extraction failed: %s", record.error.to_string().c_str());
    return failed_response(record.error);
  }

  MetadataResponse response;
  response.success = true;
  response.progressive = router_.route(record.value.size_bytes) == Strategy::PROGRESSIVE;

  if (!response.progressive) {
    auto rows = streamer_.read_all_rows(record.value);
    if (!rows) {
      if (trace_)
        trace_->warn("parsing %s failed: %s", request.filename.c_str(),
                     rows.error.to_string().c_str());
      return failed_response(rows.error);
    }
    response.rows = std::move(rows.value);
    response.has_rows = true;
  }
  response.data_file = std::move(record.value);
  return response;
}

StreamSummary IngestService::handle_stream(const IngestRequest& request, FrameSink& sink,
                                           CancelToken* cancel) {
  std::optional<FileMetadataRecord> record;
  if (!request.data_file_id.empty())
    record = catalog_.find(request.data_file_id);

  if (!record) {
    auto extracted = extractor_.extract(request.storage_path, request.filename);
    if (!extracted) {
      StreamSummary summary;
      summary.error = extracted.error;
      ErrorEvent err;
      err.message = extracted.error.message;
      if (!sink.write(encode_frame(err)))
        summary.client_gone = true;
      return summary;
    }
    record = std::move(extracted.value);
  }
  return streamer_.stream(*record, sink, cancel);
}

std::string IngestService::handle_metadata_json(std::string_view body) {
  auto json = parse_json(body);
  if (!json)
    return write_json(response_to_json(failed_response(Error::metadata(json.error.message))));
  auto request = request_from_json(json.value);
  if (!request)
    return write_json(response_to_json(failed_response(request.error)));
  return write_json(response_to_json(handle_metadata(request.value)));
}

StreamSummary IngestService::handle_stream_json(std::string_view body, FrameSink& sink,
                                                CancelToken* cancel) {
  Error error;
  auto json = parse_json(body);
  if (json) {
    auto request = request_from_json(json.value);
    if (request)
      return handle_stream(request.value, sink, cancel);
    error = request.error;
  } else {
    error = Error::metadata(json.error.message);
  }

  StreamSummary summary;
  summary.error = error;
  ErrorEvent err;
  err.message = error.message;
  if (!sink.write(encode_frame(err)))
    summary.client_gone = true;
  return summary;
}

} // namespace tabflow
