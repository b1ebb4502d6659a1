#pragma once

#include "options.h"
#include "types.h"

#include <string>
#include <string_view>
#include <vector>

namespace tabflow {

// Membership test against a comma-separated value list such as CsvOptions::null_values
class ValueList {
public:
  explicit ValueList(std::string_view csv_list);

  bool contains(std::string_view value) const;
  bool empty() const { return values_.empty(); }

private:
  std::vector<std::string> values_;
};

// Per-field type detection driven by CsvOptions (null/true/false lists, guess_integer).
class TypeInference {
public:
  explicit TypeInference(const CsvOptions& options);

  // Classify one raw field. Null-like values return NA.
  DataType infer_field(std::string_view value) const;

  // Widen the running per-column types with one record's fields.
  void update(std::vector<DataType>& types, const std::vector<std::string>& fields) const;

  // Resolve a column type after sampling. Columns that saw only nulls become STRING.
  static DataType finalize(DataType type);

  bool is_null(std::string_view value) const { return value.empty() || nulls_.contains(value); }

private:
  CsvOptions options_;
  ValueList nulls_;
  ValueList trues_;
  ValueList falses_;
};

// Converts raw fields into typed cells for a fixed schema.
// A field that does not parse as its column type is kept as text.
class ValueParser {
public:
  explicit ValueParser(const CsvOptions& options);

  Value parse(std::string_view field, DataType type) const;

  // Convert a whole record. fields.size() must equal schema.size().
  Row parse_row(const std::vector<std::string>& fields,
                const std::vector<ColumnSchema>& schema) const;

  // Number of fields that fell back to text since construction
  size_t fallback_count() const { return fallbacks_; }

private:
  TypeInference inference_;
  ValueList trues_;
  ValueList falses_;
  mutable size_t fallbacks_ = 0;
};

} // namespace tabflow
