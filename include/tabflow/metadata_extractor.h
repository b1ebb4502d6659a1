#pragma once

#include "blob_store.h"
#include "byte_source.h"
#include "catalog.h"
#include "error.h"
#include "options.h"
#include "types.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tabflow {

class Trace;

// Header and sample rows read from the start of a file.
struct SampleResult {
  std::vector<ColumnSchema> schema;
  uint64_t sampled_rows = 0;  // Well-formed records that fed type inference
  uint64_t header_bytes = 0;
  uint64_t sample_bytes = 0;   // Bytes of the sampled data records
  bool reached_end = false;    // The whole file fit in the sample
  uint64_t counted_rows = 0;   // Records read, exact when reached_end
};

// Server-side schema inference and row estimation.
//
// Memory use is bounded by the sample: the header plus MetadataOptions::sample_rows
// records, independent of file size. When exact_row_count is set the rest of
// the file is scanned record by record without being retained.
class MetadataExtractor {
public:
  MetadataExtractor(const PipelineOptions& options, BlobStore& store, Catalog& catalog,
                    const Trace* trace = nullptr);

  // Validate, sample and infer the stored object at storage_path, then persist
  // the record in the catalog. Failures are METADATA errors; no record is
  // persisted on failure.
  Result<FileMetadataRecord> extract(const std::string& storage_path, const std::string& filename);

  // Sample an arbitrary source without touching storage or the catalog.
  Result<SampleResult> sample(ByteSource& source, const CsvOptions& csv) const;

  // Options effective for a filename (".tsv" switches to a tab separator).
  CsvOptions csv_options_for(std::string_view filename) const;

private:
  PipelineOptions options_;
  BlobStore& store_;
  Catalog& catalog_;
  const Trace* trace_;
};

// Options effective for a filename (".tsv" switches to a tab separator).
CsvOptions csv_options_for(const CsvOptions& base, std::string_view filename);

// Accepted upload extensions, lower-case with the dot
bool is_supported_extension(std::string_view filename);
// .xlsx, .xls, .xlsm and .ods; rejected with a message asking for a CSV export
bool is_spreadsheet_extension(std::string_view filename);

// Normalize header names: blanks become column_N, duplicates get _2, _3 suffixes.
std::vector<std::string> normalize_column_names(const std::vector<std::string>& names);

// True if s is well-formed UTF-8
bool is_valid_utf8(std::string_view s);

} // namespace tabflow
