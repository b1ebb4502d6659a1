#include "tabflow/options.h"

namespace tabflow {

Result<void> validate_options(const PipelineOptions& options) {
  const auto& csv = options.csv;
  if (csv.separator == csv.quote)
    return Result<void>::failure(
        Error::metadata("separator and quote character must differ"));
  if (csv.separator == '\n' || csv.separator == '\r' || csv.quote == '\n' || csv.quote == '\r')
    return Result<void>::failure(
        Error::metadata("separator and quote must not be line terminators"));
  if (csv.max_row_bytes == 0)
    return Result<void>::failure(Error::metadata("max_row_bytes must be positive"));
  if (options.stream.chunk_rows == 0)
    return Result<void>::failure(Error::stream("chunk_rows must be positive"));
  if (options.stream.read_block_bytes == 0 || options.stream.channel_bytes == 0)
    return Result<void>::failure(Error::stream("read and channel buffer sizes must be positive"));
  if (options.metadata.sample_rows == 0)
    return Result<void>::failure(Error::metadata("sample_rows must be positive"));
  if (options.routing.max_file_bytes == 0)
    return Result<void>::failure(Error::upload("max_file_bytes must be positive"));
  if (options.decoder.max_frame_bytes == 0)
    return Result<void>::failure(Error::stream("max_frame_bytes must be positive"));
  const auto& p = options.progress;
  if (p.upload_weight < 0 || p.metadata_weight < 0 || p.upload_weight + p.metadata_weight > 98)
    return Result<void>::failure(
        Error::stream("progress weights must leave room for row progress below 100"));
  if (options.bucket.empty())
    return Result<void>::failure(Error::upload("bucket name must not be empty"));
  return Result<void>::success();
}

} // namespace tabflow
