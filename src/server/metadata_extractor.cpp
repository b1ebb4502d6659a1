#include "tabflow/metadata_extractor.h"

#include "tabflow/row_reader.h"
#include "tabflow/trace.h"
#include "tabflow/type_inference.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace tabflow {

namespace {

std::string lower_extension(std::string_view filename) {
  size_t dot = filename.rfind('.');
  if (dot == std::string_view::npos)
    return "";
  std::string ext(filename.substr(dot));
  for (auto& c : ext)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

Error as_metadata_error(const Error& e) { return Error::metadata(e.message, e.context); }

} // namespace

bool is_supported_extension(std::string_view filename) {
  std::string ext = lower_extension(filename);
  return ext == ".csv" || ext == ".tsv" || ext == ".txt";
}

bool is_spreadsheet_extension(std::string_view filename) {
  std::string ext = lower_extension(filename);
  return ext == ".xlsx" || ext == ".xls" || ext == ".xlsm" || ext == ".ods";
}

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len;
    uint32_t cp;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > s.size())
      return false;
    for (size_t k = 1; k < len; ++k) {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong encodings, surrogates and out-of-range code points
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
        (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      return false;
    i += len;
  }
  return true;
}

std::vector<std::string> normalize_column_names(const std::vector<std::string>& names) {
  std::vector<std::string> out;
  out.reserve(names.size());
  std::set<std::string> seen;
  for (size_t i = 0; i < names.size(); ++i) {
    std::string name = names[i];
    size_t begin = name.find_first_not_of(" \t");
    size_t end = name.find_last_not_of(" \t");
    name = begin == std::string::npos ? "" : name.substr(begin, end - begin + 1);
    if (name.empty())
      name = "column_" + std::to_string(i + 1);
    if (seen.count(name)) {
      std::string base = name;
      for (size_t n = 2;; ++n) {
        name = base + "_" + std::to_string(n);
        if (!seen.count(name))
          break;
      }
    }
    seen.insert(name);
    out.push_back(std::move(name));
  }
  return out;
}

MetadataExtractor::MetadataExtractor(const PipelineOptions& options, BlobStore& store,
                                     Catalog& catalog, const Trace* trace)
    : options_(options), store_(store), catalog_(catalog), trace_(trace) {}

CsvOptions csv_options_for(const CsvOptions& base, std::string_view filename) {
  CsvOptions csv = base;
  if (lower_extension(filename) == ".tsv")
    csv.separator = '\t';
  return csv;
}

CsvOptions MetadataExtractor::csv_options_for(std::string_view filename) const {
  return tabflow::csv_options_for(options_.csv, filename);
}

Result<SampleResult> MetadataExtractor::sample(ByteSource& source, const CsvOptions& csv) const {
  using R = Result<SampleResult>;
  RowReader reader(source, csv, options_.stream.read_block_bytes);
  SampleResult result;

  CsvRow row;
  auto first = reader.next(row);
  if (!first)
    return R::failure(as_metadata_error(first.error));
  if (!first.value)
    return R::failure(Error::metadata("file is empty"));

  // The header must be readable text
  if (row.has_nul)
    return R::failure(Error::metadata("header contains binary data", "line 1"));
  bool any_name = false;
  for (const auto& f : row.fields) {
    if (!is_valid_utf8(f))
      return R::failure(Error::metadata("header is not valid UTF-8 text", "line 1"));
    if (f.find_first_not_of(" \t") != std::string::npos)
      any_name = true;
  }
  if (csv.has_header && !any_name)
    return R::failure(Error::metadata("header row is empty", "line 1"));

  std::vector<std::string> names;
  if (csv.has_header) {
    names = normalize_column_names(row.fields);
    result.header_bytes = reader.bytes_consumed();
  } else {
    for (size_t i = 0; i < row.fields.size(); ++i)
      names.push_back("column_" + std::to_string(i + 1));
  }
  const size_t ncols = names.size();

  TypeInference inference(csv);
  std::vector<DataType> types(ncols, DataType::UNKNOWN);
  std::vector<bool> saw_null(ncols, false);
  std::vector<std::vector<std::string>> samples(ncols);

  auto observe = [&](const CsvRow& r) {
    ++result.counted_rows;
    result.sample_bytes += r.byte_size;
    // Malformed records are left for the streamer to report
    if (r.fields.size() != ncols)
      return;
    inference.update(types, r.fields);
    for (size_t c = 0; c < ncols; ++c) {
      if (inference.is_null(r.fields[c])) {
        saw_null[c] = true;
      } else if (samples[c].size() < options_.metadata.sample_values) {
        samples[c].push_back(r.fields[c]);
      }
    }
    ++result.sampled_rows;
  };

  if (!csv.has_header)
    observe(row);

  while (result.counted_rows < options_.metadata.sample_rows) {
    auto r = reader.next(row);
    if (!r)
      return R::failure(as_metadata_error(r.error));
    if (!r.value) {
      result.reached_end = true;
      break;
    }
    observe(row);
  }

  if (!result.reached_end) {
    // One record past the sample tells whether the sample covered the file
    bool keep_counting = options_.metadata.exact_row_count;
    do {
      auto r = reader.next(row);
      if (!r)
        return R::failure(as_metadata_error(r.error));
      if (!r.value) {
        result.reached_end = true;
        break;
      }
      ++result.counted_rows;
      result.sample_bytes += row.byte_size;
    } while (keep_counting);
  }

  for (size_t c = 0; c < ncols; ++c) {
    ColumnSchema col;
    col.name = names[c];
    col.type = TypeInference::finalize(types[c]);
    col.nullable = saw_null[c] || !result.reached_end;
    col.index = c;
    col.sample_values = std::move(samples[c]);
    result.schema.push_back(std::move(col));
  }
  return R::success(std::move(result));
}

Result<FileMetadataRecord> MetadataExtractor::extract(const std::string& storage_path,
                                                      const std::string& filename) {
  using R = Result<FileMetadataRecord>;
  if (is_spreadsheet_extension(filename))
    return R::failure(
        Error::metadata("unsupported file type: spreadsheets must be exported as CSV", filename));
  if (!is_supported_extension(filename))
    return R::failure(Error::metadata("unsupported file type", filename));

  auto size = store_.size(storage_path);
  if (!size)
    return R::failure(as_metadata_error(size.error));
  if (size.value == 0)
    return R::failure(Error::metadata("file is empty", storage_path));
  if (size.value > options_.routing.max_file_bytes) {
    return R::failure(Error::metadata("file exceeds the " +
                                          std::to_string(options_.routing.max_file_bytes) +
                                          " byte limit",
                                      storage_path));
  }

  auto source = store_.open(storage_path);
  if (!source)
    return R::failure(as_metadata_error(source.error));

  if (trace_)
    trace_->start_phase("metadata");
  auto sampled = sample(*source.value, csv_options_for(filename));
  if (trace_)
    trace_->end_phase(sampled ? sampled.value.header_bytes + sampled.value.sample_bytes : 0);
  if (!sampled) {
    Error e = sampled.error;
    if (e.context.empty())
      e.context = storage_path;
    return R::failure(e);
  }
  const SampleResult& s = sampled.value;

  FileMetadataRecord record;
  record.id = make_record_id();
  record.filename = filename;
  record.table_name =
      sanitize_table_name(filename, to_base36(now_millis()) + "_" + record.id.substr(0, 8));
  record.schema = s.schema;
  record.size_bytes = size.value;
  record.storage_path = storage_path;
  record.storage_url = store_.url_for(storage_path);

  if (s.reached_end) {
    record.total_row_estimate = s.counted_rows;
    record.row_count_exact = true;
  } else {
    uint64_t data_bytes = size.value > s.header_bytes ? size.value - s.header_bytes : 0;
    uint64_t sample_records = s.counted_rows > 0 ? s.counted_rows : 1;
    double mean = static_cast<double>(s.sample_bytes) / static_cast<double>(sample_records);
    uint64_t estimate =
        mean > 0 ? static_cast<uint64_t>(static_cast<double>(data_bytes) / mean + 0.999999) : 0;
    record.total_row_estimate = std::max(estimate, s.counted_rows);
    record.row_count_exact = false;
  }
  record.estimated_chunk_count =
      chunk_count_for(record.total_row_estimate, options_.stream.chunk_rows);

  auto stored = catalog_.insert(record);
  if (!stored)
    return R::failure(as_metadata_error(stored.error));

  if (trace_) {
    trace_->info("metadata for %s: %zu columns, %s%llu rows, %llu chunks", filename.c_str(),
                 record.schema.size(), record.row_count_exact ? "" : "~",
                 static_cast<unsigned long long>(record.total_row_estimate),
                 static_cast<unsigned long long>(record.estimated_chunk_count));
  }
  return R::success(std::move(record));
}

} // namespace tabflow
