#pragma once

#include "error.h"
#include "types.h"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tabflow {

enum class RequestMode : uint8_t { METADATA, STREAM };

inline const char* request_mode_name(RequestMode mode) {
  return mode == RequestMode::METADATA ? "metadata" : "stream";
}

// Body of an ingest request: routing identifiers plus the uploaded blob.
struct IngestRequest {
  std::string page_id;
  std::string workspace_id;
  RequestMode mode = RequestMode::METADATA;
  std::string storage_url;
  std::string storage_path;
  std::string filename;
  uint64_t file_size = 0;
  std::string mime_type;
  std::string data_file_id; // Stream mode: reuse the record from the metadata call
};

// Reply to a metadata-mode request.
struct MetadataResponse {
  bool success = false;
  std::string error;
  FileMetadataRecord data_file;
  bool progressive = false;
  bool has_rows = false; // WHOLE_FILE replies carry every row
  std::vector<Row> rows;
};

Json::Value request_to_json(const IngestRequest& request);
Result<IngestRequest> request_from_json(const Json::Value& json);

// Success: {success: true, dataFile: {..., progressive, data?}}
// Failure: {success: false, error}
Json::Value response_to_json(const MetadataResponse& response);
Result<MetadataResponse> response_from_json(const Json::Value& json);

} // namespace tabflow
