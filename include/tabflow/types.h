#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabflow {

// Type hierarchy: BOOL < INT64 < FLOAT64 < STRING
// DATE and TIMESTAMP only widen to each other or to STRING
enum class DataType : uint8_t {
  UNKNOWN = 0,
  BOOL = 1,
  INT64 = 2,
  FLOAT64 = 3,
  DATE = 4,      // ISO8601 date
  TIMESTAMP = 5, // ISO8601 timestamp
  STRING = 6,
  NA = 255 // Null/missing value
};

// Get the wider type between two types
inline DataType wider_type(DataType a, DataType b) {
  if (a == DataType::NA || a == DataType::UNKNOWN)
    return b;
  if (b == DataType::NA || b == DataType::UNKNOWN)
    return a;
  if (a == b)
    return a;
  if (a == DataType::STRING || b == DataType::STRING)
    return DataType::STRING;
  bool a_temporal = a == DataType::DATE || a == DataType::TIMESTAMP;
  bool b_temporal = b == DataType::DATE || b == DataType::TIMESTAMP;
  if (a_temporal && b_temporal)
    return DataType::TIMESTAMP;
  if (a_temporal || b_temporal)
    return DataType::STRING;
  return static_cast<uint8_t>(a) > static_cast<uint8_t>(b) ? a : b;
}

// String representation of types
inline const char* type_name(DataType type) {
  switch (type) {
  case DataType::UNKNOWN:
    return "UNKNOWN";
  case DataType::BOOL:
    return "BOOL";
  case DataType::INT64:
    return "INT64";
  case DataType::FLOAT64:
    return "FLOAT64";
  case DataType::DATE:
    return "DATE";
  case DataType::TIMESTAMP:
    return "TIMESTAMP";
  case DataType::STRING:
    return "STRING";
  case DataType::NA:
    return "NA";
  default:
    return "INVALID";
  }
}

// Name used for a type in the JSON wire format.
inline const char* wire_type_name(DataType type) {
  switch (type) {
  case DataType::BOOL:
    return "boolean";
  case DataType::INT64:
    return "integer";
  case DataType::FLOAT64:
    return "number";
  case DataType::DATE:
    return "date";
  case DataType::TIMESTAMP:
    return "datetime";
  default:
    return "string";
  }
}

inline std::optional<DataType> parse_wire_type(std::string_view name) {
  if (name == "boolean")
    return DataType::BOOL;
  if (name == "integer")
    return DataType::INT64;
  if (name == "number")
    return DataType::FLOAT64;
  if (name == "date")
    return DataType::DATE;
  if (name == "datetime")
    return DataType::TIMESTAMP;
  if (name == "string")
    return DataType::STRING;
  return std::nullopt;
}

// A single typed cell. monostate is null.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

// One row, aligned with the schema column order
using Row = std::vector<Value>;

inline bool is_null(const Value& v) { return std::holds_alternative<std::monostate>(v); }

// Column schema information
struct ColumnSchema {
  std::string name;
  DataType type = DataType::STRING;
  bool nullable = true;
  size_t index = 0;                        // Original column index in the file
  std::vector<std::string> sample_values; // First few non-null raw values
};

// Immutable description of an ingested file, produced once by the metadata extractor.
struct FileMetadataRecord {
  std::string id;
  std::string filename;
  std::string table_name;
  std::vector<ColumnSchema> schema;
  uint64_t total_row_estimate = 0;
  bool row_count_exact = false;
  uint64_t estimated_chunk_count = 0;
  uint64_t size_bytes = 0;
  std::string storage_path;
  std::string storage_url;
};

// Location of an uploaded object
struct BlobRef {
  std::string url;
  std::string path;
  uint64_t size_bytes = 0;
};

// Final description of a table built by the materializer
struct MaterializedTable {
  std::string table_id;
  std::string table_name;
  uint64_t row_count = 0;
};

// Number of fixed-size chunks needed for a row count (ceil division)
inline uint64_t chunk_count_for(uint64_t rows, size_t chunk_rows) {
  if (chunk_rows == 0)
    return 0;
  return (rows + chunk_rows - 1) / chunk_rows;
}

} // namespace tabflow
