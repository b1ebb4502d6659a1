#pragma once

#include "blob_store.h"
#include "blob_uploader.h"
#include "error.h"
#include "ingest_session.h"
#include "options.h"
#include "size_router.h"
#include "table_engine.h"
#include "transport.h"
#include "types.h"

#include <memory>
#include <string>

namespace tabflow {

class Trace;

// Where an upload belongs. Both ids end up in the storage path.
struct UploadTarget {
  std::string workspace_id;
  std::string page_id;
};

/**
 * @brief Client-side driver: upload, fetch or stream, materialize.
 *
 * One pipeline serves any number of sessions; store, transport and engine are
 * shared and must be thread-safe. Each run() is sequential within its session:
 * a frame is fully loaded into the engine before the next one is decoded.
 *
 * Every session first makes a metadata request. WHOLE_FILE sessions load the
 * rows it carries with a single create call. PROGRESSIVE sessions then open an
 * event stream for the stored record and create the table from the first
 * chunk, appending the rest.
 *
 * Example:
 * @code
 *   tabflow::IngestPipeline pipeline(options, store, transport, engine);
 *   auto file = tabflow::LocalFile::from_path("sales.csv");
 *   auto session = pipeline.create_session(file.value);
 *   auto table = pipeline.run(*session, {"ws-1", "page-7"});
 *   if (!table)
 *     std::cerr << table.error.to_string() << "\n";
 * @endcode
 */
class IngestPipeline {
public:
  IngestPipeline(const PipelineOptions& options, BlobStore& store, IngestTransport& transport,
                 TableEngine& engine, const Trace* trace = nullptr);

  // New Idle session, routed by the file's size.
  std::unique_ptr<IngestSession> create_session(const LocalFile& file) const;

  /// Drives the session to Complete, Error or (after cancel()) Idle. The
  /// returned result matches the session's terminal state.
  Result<MaterializedTable> run(IngestSession& session, const UploadTarget& target);

  // create_session() + run() in one call.
  Result<MaterializedTable> ingest(const LocalFile& file, const UploadTarget& target,
                                   SessionObserver* observer = nullptr);

  const PipelineOptions& options() const { return options_; }
  const SizeRouter& router() const { return router_; }

private:
  Result<MaterializedTable> run_stages(IngestSession& session, const UploadTarget& target);
  Result<MaterializedTable> run_whole_file(IngestSession& session,
                                           const MetadataResponse& response);
  Result<MaterializedTable> run_progressive(IngestSession& session, const IngestRequest& request);

  PipelineOptions options_;
  BlobStore& store_;
  IngestTransport& transport_;
  TableEngine& engine_;
  const Trace* trace_;
  SizeRouter router_;
  BlobUploader uploader_;
};

} // namespace tabflow
