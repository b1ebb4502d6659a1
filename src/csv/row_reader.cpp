#include "tabflow/row_reader.h"

#include <algorithm>
#include <cstring>

namespace tabflow {

namespace {

void trim_in_place(std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && (s[begin] == ' ' || s[begin] == '\t'))
    ++begin;
  size_t end = s.size();
  while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t'))
    --end;
  if (begin > 0 || end < s.size())
    s = s.substr(begin, end - begin);
}

} // namespace

RowReader::RowReader(ByteSource& source, const CsvOptions& options, size_t block_size)
    : source_(source), options_(options), block_size_(block_size == 0 ? 64 * 1024 : block_size) {}

void RowReader::compact_buffer() {
  if (pos_ > 0) {
    size_t remaining = buffer_.size() - pos_;
    if (remaining > 0) {
      std::memmove(buffer_.data(), buffer_.data() + pos_, remaining);
    }
    buffer_.resize(remaining);
    scan_pos_ -= std::min(scan_pos_, pos_);
    pos_ = 0;
  }
}

Result<bool> RowReader::fill() {
  compact_buffer();
  size_t old_size = buffer_.size();
  buffer_.resize(old_size + block_size_);
  auto r = source_.read(buffer_.data() + old_size, block_size_);
  if (!r) {
    buffer_.resize(old_size);
    return Result<bool>::failure(Error::stream(r.error.message, r.error.context));
  }
  buffer_.resize(old_size + r.value);
  if (r.value == 0)
    eof_ = true;
  return Result<bool>::success(r.value > 0);
}

size_t RowReader::find_record_end() {
  size_t i = std::max(scan_pos_, pos_);
  const char quote = options_.quote;
  for (; i < buffer_.size(); ++i) {
    char c = buffer_[i];
    // Doubled quotes toggle twice, so a plain toggle tracks quoting correctly
    if (c == quote) {
      scan_in_quote_ = !scan_in_quote_;
    } else if (c == '\n') {
      ++scan_newlines_;
      if (!scan_in_quote_) {
        scan_pos_ = i + 1;
        return i + 1;
      }
    }
  }
  scan_pos_ = i;
  return 0;
}

void RowReader::split_record(size_t begin, size_t content_end, CsvRow& row) const {
  row.fields.clear();
  row.has_nul = false;
  const char quote = options_.quote;
  const char sep = options_.separator;
  const char* data = buffer_.data();

  std::string field;
  bool in_q = false;
  for (size_t i = begin; i < content_end; ++i) {
    char c = data[i];
    if (c == quote) {
      if (in_q && i + 1 < content_end && data[i + 1] == quote) {
        field += quote;
        ++i;
      } else {
        in_q = !in_q;
      }
    } else if (c == sep && !in_q) {
      row.fields.push_back(std::move(field));
      field.clear();
    } else {
      if (c == '\0')
        row.has_nul = true;
      field += c;
    }
  }
  row.fields.push_back(std::move(field));

  if (options_.trim_ws) {
    for (auto& f : row.fields)
      trim_in_place(f);
  }
}

Result<bool> RowReader::next(CsvRow& row) {
  while (true) {
    if (!bom_checked_) {
      if (buffer_.size() - pos_ < 3 && !eof_) {
        auto r = fill();
        if (!r)
          return r;
        continue;
      }
      bom_checked_ = true;
      // A UTF-8 byte order mark is not part of the first column name
      if (buffer_.compare(pos_, 3, "\xEF\xBB\xBF") == 0) {
        pos_ += 3;
        scan_pos_ = pos_;
        bytes_consumed_ += 3;
      }
    }

    if (pos_ >= buffer_.size()) {
      if (eof_)
        return Result<bool>::success(false);
      auto r = fill();
      if (!r)
        return r;
      continue;
    }

    size_t end = find_record_end();
    if (end == 0) {
      if (!eof_) {
        if (buffer_.size() - pos_ > options_.max_row_bytes) {
          return Result<bool>::failure(
              Error::stream("record exceeds " + std::to_string(options_.max_row_bytes) + " bytes",
                            "line " + std::to_string(line_)));
        }
        auto r = fill();
        if (!r)
          return r;
        continue;
      }
      if (scan_in_quote_) {
        return Result<bool>::failure(
            Error::stream("unclosed quote at end of input", "line " + std::to_string(line_)));
      }
      // Final record without a terminator
      end = buffer_.size();
    }

    size_t content_end = end;
    if (content_end > pos_ && buffer_[content_end - 1] == '\n')
      --content_end;
    if (content_end > pos_ && buffer_[content_end - 1] == '\r')
      --content_end;

    size_t begin = pos_;
    size_t start_line = line_;
    line_ += scan_newlines_;
    scan_newlines_ = 0;
    scan_in_quote_ = false;
    scan_pos_ = end;
    pos_ = end;
    bytes_consumed_ += end - begin;

    if (content_end == begin && options_.skip_empty_rows)
      continue;

    split_record(begin, content_end, row);
    row.line = start_line;
    row.byte_size = end - begin;
    ++records_read_;
    return Result<bool>::success(true);
  }
}

} // namespace tabflow
