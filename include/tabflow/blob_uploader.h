#pragma once

#include "blob_store.h"
#include "cancel_token.h"
#include "error.h"
#include "types.h"

#include <cstdint>
#include <string>

namespace tabflow {

class Trace;

// A file selected for upload
struct LocalFile {
  std::string path;
  std::string name; // Display name, used for the storage path and table name
  uint64_t size_bytes = 0;
  std::string mime_type;

  // Describe a file on disk. The name defaults to the path's filename.
  static Result<LocalFile> from_path(const std::string& path, const std::string& name = "");
};

// Moves a local file into blob storage, reporting monotonic progress.
class BlobUploader {
public:
  explicit BlobUploader(BlobStore& store, const Trace* trace = nullptr)
      : store_(store), trace_(trace) {}

  // Upsert the file at destination_path. Progress is non-decreasing in [0, 100]
  // and reaches 100 only on success. All failures are UPLOAD errors except
  // cancellation, which is reported as CANCELLED.
  Result<BlobRef> upload(const LocalFile& file, const std::string& destination_path,
                         const ProgressCallback& on_progress, CancelToken* cancel = nullptr);

private:
  BlobStore& store_;
  const Trace* trace_;
};

} // namespace tabflow
