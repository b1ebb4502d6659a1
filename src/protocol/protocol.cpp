#include "tabflow/protocol.h"

#include "tabflow/wire.h"

#include <cstddef>
#include <initializer_list>

namespace tabflow {

Json::Value request_to_json(const IngestRequest& request) {
  Json::Value out(Json::objectValue);
  out["pageId"] = request.page_id;
  out["workspaceId"] = request.workspace_id;
  out["mode"] = request_mode_name(request.mode);
  out["storageUrl"] = request.storage_url;
  out["storagePath"] = request.storage_path;
  out["filename"] = request.filename;
  out["fileSize"] = static_cast<Json::UInt64>(request.file_size);
  out["mimeType"] = request.mime_type;
  if (!request.data_file_id.empty())
    out["dataFileId"] = request.data_file_id;
  return out;
}

Result<IngestRequest> request_from_json(const Json::Value& json) {
  using R = Result<IngestRequest>;
  if (!json.isObject())
    return R::failure(Error::metadata("request body must be a JSON object"));

  IngestRequest request;
  for (const char* key : {"pageId", "workspaceId", "storagePath", "filename"}) {
    if (!json[key].isString() || json[key].asString().empty())
      return R::failure(Error::metadata(std::string("missing required field '") + key + "'"));
  }
  auto mode = read_optional_string(json, "mode", "metadata");
  if (!mode)
    return R::failure(Error::metadata(mode.error.message));
  if (mode.value == "metadata") {
    request.mode = RequestMode::METADATA;
  } else if (mode.value == "stream") {
    request.mode = RequestMode::STREAM;
  } else {
    return R::failure(Error::metadata("unknown mode '" + mode.value + "'"));
  }
  const Json::Value& size = json["fileSize"];
  if (!size.isNull() && (!size.isIntegral() || (size.isInt64() && size.asInt64() < 0)))
    return R::failure(Error::metadata("fileSize must be a non-negative integer"));

  // Optional string members
  std::string* targets[] = {&request.storage_url, &request.mime_type, &request.data_file_id};
  const char* keys[] = {"storageUrl", "mimeType", "dataFileId"};
  for (size_t i = 0; i < 3; ++i) {
    auto value = read_optional_string(json, keys[i], "");
    if (!value)
      return R::failure(Error::metadata(value.error.message));
    *targets[i] = std::move(value.value);
  }

  request.page_id = json["pageId"].asString();
  request.workspace_id = json["workspaceId"].asString();
  request.storage_path = json["storagePath"].asString();
  request.filename = json["filename"].asString();
  request.file_size = size.isNull() ? 0 : size.asUInt64();
  return R::success(std::move(request));
}

Json::Value response_to_json(const MetadataResponse& response) {
  Json::Value out(Json::objectValue);
  out["success"] = response.success;
  if (!response.success) {
    out["error"] = response.error;
    return out;
  }
  Json::Value file = record_to_json(response.data_file);
  file["progressive"] = response.progressive;
  if (response.has_rows) {
    Json::Value data(Json::arrayValue);
    for (const auto& row : response.rows)
      data.append(row_to_json(row));
    file["data"] = std::move(data);
  }
  out["dataFile"] = std::move(file);
  return out;
}

Result<MetadataResponse> response_from_json(const Json::Value& json) {
  using R = Result<MetadataResponse>;
  if (!json.isObject())
    return R::failure(Error::metadata("response must be a JSON object"));

  MetadataResponse response;
  auto success = read_optional_bool(json, "success", false);
  if (!success)
    return R::failure(Error::metadata(success.error.message));
  response.success = success.value;
  if (!response.success) {
    auto error = read_optional_string(json, "error", "metadata request failed");
    if (!error)
      return R::failure(Error::metadata(error.error.message));
    response.error = std::move(error.value);
    return R::success(std::move(response));
  }

  const Json::Value& file = json["dataFile"];
  auto record = record_from_json(file);
  if (!record)
    return R::failure(Error::metadata(record.error.message, "dataFile"));
  response.data_file = std::move(record.value);
  auto progressive = read_optional_bool(file, "progressive", false);
  if (!progressive)
    return R::failure(Error::metadata(progressive.error.message, "dataFile"));
  response.progressive = progressive.value;

  const Json::Value& data = file["data"];
  if (data.isArray()) {
    response.has_rows = true;
    response.rows.reserve(data.size());
    for (const auto& r : data) {
      auto row = row_from_json(r, response.data_file.schema);
      if (!row)
        return R::failure(Error::metadata(row.error.message, "dataFile.data"));
      response.rows.push_back(std::move(row.value));
    }
  }
  return R::success(std::move(response));
}

} // namespace tabflow
