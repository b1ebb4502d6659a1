#pragma once

#include "byte_source.h"
#include "cancel_token.h"
#include "error.h"
#include "types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tabflow {

class Trace;

// Receives transfer progress in [0, 100]
using ProgressCallback = std::function<void(int percent)>;

struct PutOptions {
  bool upsert = true;
  std::string content_type;
  ProgressCallback on_progress;
  CancelToken* cancel = nullptr;
};

// Object storage for uploaded files. One store instance addresses one bucket.
//
// put() must be atomic: a failed or cancelled put never leaves a visible
// object (or a half-written replacement) at the destination path.
class BlobStore {
public:
  virtual ~BlobStore() = default;

  // Copies exactly size bytes from data to path.
  virtual Result<BlobRef> put(const std::string& path, ByteSource& data, uint64_t size,
                              const PutOptions& options) = 0;
  virtual Result<std::unique_ptr<ByteSource>> open(const std::string& path) const = 0;
  virtual Result<uint64_t> size(const std::string& path) const = 0;
  virtual bool exists(const std::string& path) const = 0;
  virtual Result<void> remove(const std::string& path) = 0;
  virtual std::string url_for(const std::string& path) const = 0;
  virtual const std::string& bucket() const = 0;
};

// Bucket stored as a directory tree: <root>/<bucket>/<path>.
class FileBlobStore : public BlobStore {
public:
  FileBlobStore(std::string root_dir, std::string bucket, const Trace* trace = nullptr);

  Result<BlobRef> put(const std::string& path, ByteSource& data, uint64_t size,
                      const PutOptions& options) override;
  Result<std::unique_ptr<ByteSource>> open(const std::string& path) const override;
  Result<uint64_t> size(const std::string& path) const override;
  bool exists(const std::string& path) const override;
  Result<void> remove(const std::string& path) override;
  std::string url_for(const std::string& path) const override;
  const std::string& bucket() const override { return bucket_; }

  // Per-object size limit (0 = unlimited)
  void set_max_object_bytes(uint64_t limit) { max_object_bytes_ = limit; }

  std::string full_path(const std::string& path) const;

private:
  std::string root_;
  std::string bucket_;
  uint64_t max_object_bytes_ = 0;
  const Trace* trace_;
};

// Relative object paths only: no leading '/', no empty or ".." segments.
bool is_valid_object_path(std::string_view path);

// Replace every character outside [A-Za-z0-9.-] with '_'.
std::string sanitize_filename(std::string_view filename);

// "{workspace}/{page}/{timestamp_ms}_{sanitized filename}", or
// "{workspace}/{page}/{timestamp_ms}_{unique_id}_{sanitized filename}" when a
// unique id is given. Uploads of one filename in the same millisecond only
// stay apart with distinct unique ids.
std::string make_storage_path(std::string_view workspace_id, std::string_view page_id,
                              uint64_t timestamp_ms, std::string_view filename,
                              std::string_view unique_id = {});

// MIME type from the filename extension, "application/octet-stream" if unknown.
std::string guess_mime_type(std::string_view filename);

} // namespace tabflow
