#pragma once

#include "error.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace tabflow {

// CSV parsing options
struct CsvOptions {
  char separator = ',';
  char quote = '"';
  bool has_header = true;
  bool skip_empty_rows = true;
  bool trim_ws = false;
  bool guess_integer = true;
  std::string null_values = "NA,null,NULL,"; // Comma-separated
  std::string true_values = "true,TRUE,True,yes,YES,Yes";
  std::string false_values = "false,FALSE,False,no,NO,No";

  // A single row larger than this is treated as malformed
  size_t max_row_bytes = 16 * 1024 * 1024;
};

// Strategy selection and upload limits
struct RoutingOptions {
  // Files at or below this size are parsed whole; larger ones are streamed
  uint64_t size_threshold_bytes = 2 * 1024 * 1024;
  uint64_t max_file_bytes = 50 * 1024 * 1024;
};

// Server-side schema inference
struct MetadataOptions {
  size_t sample_rows = 100;  // Rows to sample for type inference
  size_t sample_values = 5;  // Raw values kept per column
  bool exact_row_count = false; // Count every row instead of estimating
};

// Server-side chunking and transport buffering
struct StreamOptions {
  size_t chunk_rows = 1000;
  size_t read_block_bytes = 64 * 1024;
  size_t channel_bytes = 256 * 1024; // Loopback channel capacity
};

// Client-side frame decoding
struct DecoderOptions {
  ErrorMode error_mode = ErrorMode::FAIL_FAST;
  size_t max_frame_bytes = 64 * 1024 * 1024;
};

// Progress weighting. Upload occupies [0, upload_weight], the metadata checkpoint
// adds metadata_weight, rows fill the remainder up to 99.
struct ProgressOptions {
  int upload_weight = 40;
  int metadata_weight = 10;
};

// What happens to a partially built table when a session fails or is cancelled
enum class PartialTablePolicy : uint8_t { DROP, KEEP };

inline const char* partial_table_policy_name(PartialTablePolicy policy) {
  return policy == PartialTablePolicy::DROP ? "drop" : "keep";
}

// Combined options for the whole pipeline
struct PipelineOptions {
  CsvOptions csv;
  RoutingOptions routing;
  MetadataOptions metadata;
  StreamOptions stream;
  DecoderOptions decoder;
  ProgressOptions progress;
  PartialTablePolicy partial_table_policy = PartialTablePolicy::DROP;
  std::string bucket = "user-uploads";
};

// Reject option combinations that cannot work.
Result<void> validate_options(const PipelineOptions& options);

} // namespace tabflow
