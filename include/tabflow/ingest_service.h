#pragma once

#include "blob_store.h"
#include "cancel_token.h"
#include "catalog.h"
#include "chunk_streamer.h"
#include "metadata_extractor.h"
#include "options.h"
#include "protocol.h"
#include "size_router.h"

#include <string>
#include <string_view>

namespace tabflow {

class Trace;

// Server-side request handler for both request modes.
//
// metadata: extract and persist the record; small files also get every row in
//           the reply so the client can load them in one call.
// stream:   write the framed event stream for the file to a sink.
class IngestService {
public:
  IngestService(const PipelineOptions& options, BlobStore& store, Catalog& catalog,
                const Trace* trace = nullptr);

  MetadataResponse handle_metadata(const IngestRequest& request);

  StreamSummary handle_stream(const IngestRequest& request, FrameSink& sink,
                              CancelToken* cancel = nullptr);

  // Wire-level entry points: JSON request body in, JSON response body out.
  std::string handle_metadata_json(std::string_view body);
  StreamSummary handle_stream_json(std::string_view body, FrameSink& sink,
                                   CancelToken* cancel = nullptr);

  Catalog& catalog() { return catalog_; }

private:
  PipelineOptions options_;
  BlobStore& store_;
  Catalog& catalog_;
  MetadataExtractor extractor_;
  ChunkStreamer streamer_;
  SizeRouter router_;
  const Trace* trace_;
};

} // namespace tabflow
