#include "tabflow/type_inference.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <initializer_list>
#include <fast_float/fast_float.h>

namespace tabflow {

namespace {

bool all_digits(std::string_view s, std::initializer_list<size_t> positions) {
  for (size_t i : positions) {
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i])))
      return false;
  }
  return true;
}

bool looks_like_date(std::string_view value) {
  return value.size() == 10 && (value[4] == '-' || value[4] == '/') && value[7] == value[4] &&
         all_digits(value, {0, 1, 2, 3, 5, 6, 8, 9});
}

// YYYY-MM-DDTHH:MM:SS or YYYY-MM-DD HH:MM:SS, optional fraction and zone
bool looks_like_timestamp(std::string_view value) {
  return value.size() >= 19 && (value[4] == '-' || value[4] == '/') && value[7] == value[4] &&
         all_digits(value, {0, 1, 2, 3, 5, 6, 8, 9}) && (value[10] == 'T' || value[10] == ' ') &&
         value[13] == ':' && value[16] == ':' && all_digits(value, {11, 12, 14, 15, 17, 18});
}

bool parse_double(std::string_view value, double& out) {
  if (!value.empty() && value[0] == '+')
    value.remove_prefix(1);
  auto [ptr, ec] = fast_float::from_chars(value.data(), value.data() + value.size(), out);
  return ec == std::errc() && ptr == value.data() + value.size() && std::isfinite(out);
}

bool parse_int64(std::string_view value, int64_t& out) {
  if (!value.empty() && value[0] == '+')
    value.remove_prefix(1);
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  return ec == std::errc() && ptr == value.data() + value.size();
}

} // namespace

ValueList::ValueList(std::string_view csv_list) {
  size_t start = 0;
  while (start <= csv_list.size()) {
    size_t end = csv_list.find(',', start);
    if (end == std::string_view::npos)
      end = csv_list.size();
    std::string_view item = csv_list.substr(start, end - start);
    if (!item.empty())
      values_.emplace_back(item);
    start = end + 1;
  }
}

bool ValueList::contains(std::string_view value) const {
  for (const auto& v : values_) {
    if (value == v)
      return true;
  }
  return false;
}

TypeInference::TypeInference(const CsvOptions& options)
    : options_(options), nulls_(options.null_values), trues_(options.true_values),
      falses_(options.false_values) {}

DataType TypeInference::infer_field(std::string_view value) const {
  // Empty or null values don't help inference
  if (is_null(value))
    return DataType::NA;

  if (trues_.contains(value) || falses_.contains(value))
    return DataType::BOOL;

  // Integer: optional sign followed by digits only
  size_t i = (value[0] == '-' || value[0] == '+') ? 1 : 0;
  bool has_digit = false;
  bool digits_only = true;
  for (; i < value.size(); ++i) {
    if (value[i] >= '0' && value[i] <= '9') {
      has_digit = true;
    } else {
      digits_only = false;
      break;
    }
  }
  if (digits_only && has_digit) {
    if (!options_.guess_integer)
      return DataType::FLOAT64;
    int64_t v;
    if (parse_int64(value, v))
      return DataType::INT64;
    // Too wide for int64
    return DataType::FLOAT64;
  }

  double d;
  if (parse_double(value, d))
    return DataType::FLOAT64;

  if (looks_like_date(value))
    return DataType::DATE;
  if (looks_like_timestamp(value))
    return DataType::TIMESTAMP;

  return DataType::STRING;
}

void TypeInference::update(std::vector<DataType>& types,
                           const std::vector<std::string>& fields) const {
  size_t n = std::min(types.size(), fields.size());
  for (size_t c = 0; c < n; ++c) {
    types[c] = wider_type(types[c], infer_field(fields[c]));
  }
}

DataType TypeInference::finalize(DataType type) {
  if (type == DataType::NA || type == DataType::UNKNOWN)
    return DataType::STRING;
  return type;
}

ValueParser::ValueParser(const CsvOptions& options)
    : inference_(options), trues_(options.true_values), falses_(options.false_values) {}

Value ValueParser::parse(std::string_view field, DataType type) const {
  if (inference_.is_null(field))
    return std::monostate{};

  switch (type) {
  case DataType::BOOL:
    if (trues_.contains(field))
      return true;
    if (falses_.contains(field))
      return false;
    break;
  case DataType::INT64: {
    int64_t v;
    if (parse_int64(field, v))
      return v;
    break;
  }
  case DataType::FLOAT64: {
    double d;
    if (parse_double(field, d))
      return d;
    break;
  }
  case DataType::DATE:
    if (looks_like_date(field))
      return std::string(field);
    break;
  case DataType::TIMESTAMP:
    if (looks_like_timestamp(field) || looks_like_date(field))
      return std::string(field);
    break;
  default:
    return std::string(field);
  }
  ++fallbacks_;
  return std::string(field);
}

Row ValueParser::parse_row(const std::vector<std::string>& fields,
                           const std::vector<ColumnSchema>& schema) const {
  Row row;
  row.reserve(schema.size());
  for (size_t c = 0; c < schema.size() && c < fields.size(); ++c) {
    row.push_back(parse(fields[c], schema[c].type));
  }
  return row;
}

} // namespace tabflow
