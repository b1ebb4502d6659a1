#pragma once

#include "byte_source.h"
#include "error.h"
#include "options.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tabflow {

// One parsed CSV record
struct CsvRow {
  std::vector<std::string> fields;
  size_t line = 0;       // 1-based physical line where the record starts
  size_t byte_size = 0;  // Bytes consumed including the terminator
  bool has_nul = false;  // Record contained a NUL byte
};

// Incremental, quote-aware CSV record reader.
//
// Pulls fixed-size blocks from a ByteSource and yields one record at a time.
// Memory is bounded by the block size plus the longest record; a record longer
// than CsvOptions::max_row_bytes is reported as malformed.
//
//   RowReader reader(source, options);
//   CsvRow row;
//   while (true) {
//     auto r = reader.next(row);
//     if (!r) ...          // malformed input or read failure
//     if (!r.value) break; // end of input
//   }
class RowReader {
public:
  RowReader(ByteSource& source, const CsvOptions& options, size_t block_size = 64 * 1024);

  // Reads the next record into row. Returns true when a record was produced,
  // false at end of input. Errors carry ErrorKind::STREAM.
  Result<bool> next(CsvRow& row);

  // Total bytes handed out as records (header included)
  uint64_t bytes_consumed() const { return bytes_consumed_; }
  size_t records_read() const { return records_read_; }

private:
  // Scans for the end of the record starting at pos_. Returns the offset one past
  // the terminator, or 0 if more input is needed.
  size_t find_record_end();
  Result<bool> fill();
  void compact_buffer();
  void split_record(size_t begin, size_t content_end, CsvRow& row) const;

  ByteSource& source_;
  CsvOptions options_;
  size_t block_size_;

  std::string buffer_;
  size_t pos_ = 0;
  bool eof_ = false;
  bool bom_checked_ = false;

  // Scan state carried across fills so a long record is scanned once
  size_t scan_pos_ = 0;
  bool scan_in_quote_ = false;
  size_t scan_newlines_ = 0;

  size_t line_ = 1;
  uint64_t bytes_consumed_ = 0;
  size_t records_read_ = 0;
};

} // namespace tabflow
