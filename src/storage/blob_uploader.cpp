#include "tabflow/blob_uploader.h"

#include "tabflow/byte_source.h"
#include "tabflow/trace.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace tabflow {

Result<LocalFile> LocalFile::from_path(const std::string& path, const std::string& name) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return Result<LocalFile>::failure(Error::upload("not a regular file", path));
  auto size = fs::file_size(path, ec);
  if (ec)
    return Result<LocalFile>::failure(Error::upload("cannot stat file: " + ec.message(), path));

  LocalFile file;
  file.path = path;
  file.name = name.empty() ? fs::path(path).filename().string() : name;
  file.size_bytes = static_cast<uint64_t>(size);
  file.mime_type = guess_mime_type(file.name);
  return Result<LocalFile>::success(std::move(file));
}

Result<BlobRef> BlobUploader::upload(const LocalFile& file, const std::string& destination_path,
                                     const ProgressCallback& on_progress, CancelToken* cancel) {
  if (cancel && cancel->is_requested())
    return Result<BlobRef>::failure(Error::cancelled());

  auto source = FileByteSource::open(file.path);
  if (!source)
    return Result<BlobRef>::failure(Error::upload(source.error.message, file.path));

  int reported = -1;
  PutOptions options;
  options.upsert = true;
  options.content_type = file.mime_type.empty() ? guess_mime_type(file.name) : file.mime_type;
  options.cancel = cancel;
  options.on_progress = [&](int percent) {
    percent = std::clamp(percent, 0, 100);
    if (percent <= reported)
      return;
    reported = percent;
    if (on_progress)
      on_progress(percent);
  };

  if (trace_)
    trace_->start_phase("upload");
  auto ref = store_.put(destination_path, *source.value, file.size_bytes, options);
  if (trace_)
    trace_->end_phase(ref ? file.size_bytes : 0);

  if (!ref) {
    if (trace_)
      trace_->warn("upload of %s failed: %s", file.name.c_str(), ref.error.to_string().c_str());
    if (ref.error.is_cancellation())
      return ref;
    return Result<BlobRef>::failure(Error::upload(ref.error.message, ref.error.context));
  }
  if (trace_)
    trace_->info("uploaded %s to %s/%s", file.name.c_str(), store_.bucket().c_str(),
                 destination_path.c_str());
  return ref;
}

} // namespace tabflow
