#pragma once

#include "error.h"
#include "stream_event.h"
#include "types.h"

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

namespace tabflow {

// JSON encoding shared by the ingest service and its clients.
//
// Rows travel as JSON arrays in schema order. Integers are written as JSON
// integers and doubles keep a fractional part, but readers coerce numbers to
// the column type when a schema is known.

Json::Value value_to_json(const Value& value);
Value value_from_json(const Json::Value& json, DataType type);

Json::Value row_to_json(const Row& row);
// schema may be empty, in which case cells keep their JSON type
Result<Row> row_from_json(const Json::Value& json, const std::vector<ColumnSchema>& schema);

Json::Value schema_to_json(const std::vector<ColumnSchema>& schema);
Result<std::vector<ColumnSchema>> schema_from_json(const Json::Value& json);

// {id, filename, tableName, schema, rowCount, rowCountExact, estimatedChunks,
//  sizeBytes, storagePath, storageUrl}
Json::Value record_to_json(const FileMetadataRecord& record);
Result<FileMetadataRecord> record_from_json(const Json::Value& json);

// Payload of one frame's data line
Json::Value event_to_json(const StreamEvent& event);
Result<StreamEvent> event_from_json(EventType type, const Json::Value& json,
                                    const std::vector<ColumnSchema>& schema);

// Optional members with a fallback when absent or null. A member of the wrong
// JSON type is an error rather than a jsoncpp exception.
Result<std::string> read_optional_string(const Json::Value& obj, const char* key,
                                         const std::string& fallback);
Result<bool> read_optional_bool(const Json::Value& obj, const char* key, bool fallback);

// Single-line JSON text
std::string write_json(const Json::Value& value);
Result<Json::Value> parse_json(std::string_view text);

} // namespace tabflow
