#include "tabflow/blob_store.h"

#include "tabflow/trace.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <random>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tabflow {

namespace {

// Removes the temporary object unless the put committed.
class TempObject {
public:
  explicit TempObject(std::string path) : path_(std::move(path)) {}
  ~TempObject() {
    if (file_)
      std::fclose(file_);
    if (!committed_) {
      std::error_code ec;
      fs::remove(path_, ec);
    }
  }

  bool open() {
    file_ = std::fopen(path_.c_str(), "wb");
    return file_ != nullptr;
  }
  bool write(const char* data, size_t n) { return std::fwrite(data, 1, n, file_) == n; }
  bool close() {
    int rc = std::fclose(file_);
    file_ = nullptr;
    return rc == 0;
  }
  void commit() { committed_ = true; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  FILE* file_ = nullptr;
  bool committed_ = false;
};

} // namespace

bool is_valid_object_path(std::string_view path) {
  if (path.empty() || path.front() == '/' || path.back() == '/')
    return false;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos)
      end = path.size();
    std::string_view segment = path.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..")
      return false;
    start = end + 1;
  }
  return path.find('\0') == std::string_view::npos && path.find('\\') == std::string_view::npos;
}

std::string sanitize_filename(std::string_view filename) {
  std::string out(filename);
  for (auto& c : out) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (!(std::isalnum(uc) || c == '.' || c == '-'))
      c = '_';
  }
  return out;
}

std::string make_storage_path(std::string_view workspace_id, std::string_view page_id,
                              uint64_t timestamp_ms, std::string_view filename,
                              std::string_view unique_id) {
  std::string path;
  path.append(workspace_id.data(), workspace_id.size());
  path += '/';
  path.append(page_id.data(), page_id.size());
  path += '/';
  path += std::to_string(timestamp_ms);
  path += '_';
  if (!unique_id.empty()) {
    path += sanitize_filename(unique_id);
    path += '_';
  }
  path += sanitize_filename(filename);
  return path;
}

std::string guess_mime_type(std::string_view filename) {
  size_t dot = filename.rfind('.');
  if (dot == std::string_view::npos)
    return "application/octet-stream";
  std::string ext(filename.substr(dot + 1));
  for (auto& c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == "csv")
    return "text/csv";
  if (ext == "tsv")
    return "text/tab-separated-values";
  if (ext == "txt")
    return "text/plain";
  if (ext == "xlsx")
    return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
  if (ext == "xls")
    return "application/vnd.ms-excel";
  return "application/octet-stream";
}

FileBlobStore::FileBlobStore(std::string root_dir, std::string bucket, const Trace* trace)
    : root_(std::move(root_dir)), bucket_(std::move(bucket)), trace_(trace) {}

std::string FileBlobStore::full_path(const std::string& path) const {
  return (fs::path(root_) / bucket_ / path).string();
}

std::string FileBlobStore::url_for(const std::string& path) const {
  return "file://" + fs::absolute(fs::path(full_path(path))).lexically_normal().string();
}

Result<BlobRef> FileBlobStore::put(const std::string& path, ByteSource& data, uint64_t size,
                                   const PutOptions& options) {
  if (!is_valid_object_path(path))
    return Result<BlobRef>::failure(Error::upload("invalid object path", path));
  if (max_object_bytes_ > 0 && size > max_object_bytes_) {
    return Result<BlobRef>::failure(Error::upload(
        "object exceeds storage quota of " + std::to_string(max_object_bytes_) + " bytes", path));
  }

  fs::path dest(full_path(path));
  std::error_code ec;
  if (!options.upsert && fs::exists(dest, ec))
    return Result<BlobRef>::failure(Error::upload("object already exists", path));

  fs::create_directories(dest.parent_path(), ec);
  if (ec)
    return Result<BlobRef>::failure(Error::upload("cannot create directory: " + ec.message(), path));

  // Write to temp file first (use PID + random to avoid races)
  TempObject tmp(dest.string() + ".tmp." + std::to_string(getpid()) + "." +
                 std::to_string(std::random_device{}()));
  if (!tmp.open())
    return Result<BlobRef>::failure(Error::upload("cannot create temporary object", path));

  int last_percent = -1;
  auto report = [&](int percent) {
    if (percent > last_percent) {
      last_percent = percent;
      if (options.on_progress)
        options.on_progress(percent);
    }
  };
  report(0);

  std::vector<char> buffer(64 * 1024);
  uint64_t written = 0;
  while (true) {
    if (options.cancel && options.cancel->is_requested())
      return Result<BlobRef>::failure(Error::cancelled());

    auto r = data.read(buffer.data(), buffer.size());
    if (!r)
      return Result<BlobRef>::failure(Error::upload(r.error.message, path));
    if (r.value == 0)
      break;
    if (written + r.value > size) {
      return Result<BlobRef>::failure(
          Error::upload("source is larger than the declared " + std::to_string(size) + " bytes",
                        path));
    }
    if (!tmp.write(buffer.data(), r.value))
      return Result<BlobRef>::failure(Error::upload("write failed", path));
    written += r.value;
    // Hold back 100 until the object is committed
    report(static_cast<int>(std::min<uint64_t>(99, written * 100 / size)));
  }

  if (written != size) {
    return Result<BlobRef>::failure(Error::upload(
        "source ended after " + std::to_string(written) + " of " + std::to_string(size) + " bytes",
        path));
  }
  if (!tmp.close())
    return Result<BlobRef>::failure(Error::upload("flush failed", path));

  // Atomic rename
  fs::rename(tmp.path(), dest, ec);
  if (ec)
    return Result<BlobRef>::failure(Error::upload("rename failed: " + ec.message(), path));
  tmp.commit();
  report(100);

  if (trace_)
    trace_->debug("stored %s/%s (%llu bytes)", bucket_.c_str(), path.c_str(),
                  static_cast<unsigned long long>(size));

  BlobRef ref;
  ref.url = url_for(path);
  ref.path = path;
  ref.size_bytes = size;
  return Result<BlobRef>::success(std::move(ref));
}

Result<std::unique_ptr<ByteSource>> FileBlobStore::open(const std::string& path) const {
  if (!is_valid_object_path(path))
    return Result<std::unique_ptr<ByteSource>>::failure(Error::upload("invalid object path", path));
  auto r = FileByteSource::open(full_path(path));
  if (!r)
    return Result<std::unique_ptr<ByteSource>>::failure(
        Error::upload("object not found", path));
  return Result<std::unique_ptr<ByteSource>>::success(std::move(r.value));
}

Result<uint64_t> FileBlobStore::size(const std::string& path) const {
  if (!is_valid_object_path(path))
    return Result<uint64_t>::failure(Error::upload("invalid object path", path));
  std::error_code ec;
  auto n = fs::file_size(fs::path(full_path(path)), ec);
  if (ec)
    return Result<uint64_t>::failure(Error::upload("object not found", path));
  return Result<uint64_t>::success(static_cast<uint64_t>(n));
}

bool FileBlobStore::exists(const std::string& path) const {
  if (!is_valid_object_path(path))
    return false;
  std::error_code ec;
  return fs::is_regular_file(fs::path(full_path(path)), ec);
}

Result<void> FileBlobStore::remove(const std::string& path) {
  if (!is_valid_object_path(path))
    return Result<void>::failure(Error::upload("invalid object path", path));
  std::error_code ec;
  if (!fs::remove(fs::path(full_path(path)), ec) || ec)
    return Result<void>::failure(Error::upload("object not found", path));
  return Result<void>::success();
}

} // namespace tabflow
