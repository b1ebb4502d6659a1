#include "tabflow/wire.h"

#include <limits>
#include <memory>

namespace tabflow {

namespace {

const Json::StreamWriterBuilder& compact_writer() {
  static const Json::StreamWriterBuilder builder = [] {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    return b;
  }();
  return builder;
}

const Json::CharReaderBuilder& strict_reader() {
  static const Json::CharReaderBuilder builder = [] {
    Json::CharReaderBuilder b;
    b["collectComments"] = false;
    b["failIfExtra"] = true;
    return b;
  }();
  return builder;
}

bool is_json_integer(const Json::Value& v) {
  return v.type() == Json::intValue || v.type() == Json::uintValue;
}

Json::Value json_uint(uint64_t v) { return Json::Value(static_cast<Json::UInt64>(v)); }

// Reads a non-negative integer member. Fails if present with the wrong type,
// or if absent and required.
Result<uint64_t> read_count(const Json::Value& obj, const char* key, bool required) {
  const Json::Value& v = obj[key];
  if (v.isNull()) {
    if (required)
      return Result<uint64_t>::failure(Error::stream(std::string("missing field '") + key + "'"));
    return Result<uint64_t>::success(0);
  }
  if (!v.isIntegral() || (v.isInt64() && v.asInt64() < 0)) {
    return Result<uint64_t>::failure(
        Error::stream(std::string("field '") + key + "' must be a non-negative integer"));
  }
  return Result<uint64_t>::success(v.asUInt64());
}

Result<std::string> read_string(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (!v.isString())
    return Result<std::string>::failure(
        Error::stream(std::string("field '") + key + "' must be a string"));
  return Result<std::string>::success(v.asString());
}

} // namespace

Result<std::string> read_optional_string(const Json::Value& obj, const char* key,
                                         const std::string& fallback) {
  const Json::Value& v = obj[key];
  if (v.isNull())
    return Result<std::string>::success(std::string(fallback));
  if (!v.isString())
    return Result<std::string>::failure(
        Error::stream(std::string("field '") + key + "' must be a string"));
  return Result<std::string>::success(v.asString());
}

Result<bool> read_optional_bool(const Json::Value& obj, const char* key, bool fallback) {
  const Json::Value& v = obj[key];
  if (v.isNull())
    return Result<bool>::success(bool(fallback));
  if (!v.isBool())
    return Result<bool>::failure(Error::stream(std::string("field '") + key + "' must be a boolean"));
  return Result<bool>::success(v.asBool());
}

Json::Value value_to_json(const Value& value) {
  switch (value.index()) {
  case 1:
    return Json::Value(std::get<bool>(value));
  case 2:
    return Json::Value(static_cast<Json::Int64>(std::get<int64_t>(value)));
  case 3:
    return Json::Value(std::get<double>(value));
  case 4:
    return Json::Value(std::get<std::string>(value));
  default:
    return Json::Value(Json::nullValue);
  }
}

Value value_from_json(const Json::Value& json, DataType type) {
  switch (json.type()) {
  case Json::nullValue:
    return std::monostate{};
  case Json::booleanValue:
    return json.asBool();
  case Json::intValue:
    if (type == DataType::FLOAT64)
      return json.asDouble();
    return static_cast<int64_t>(json.asInt64());
  case Json::uintValue:
    if (type == DataType::FLOAT64 || json.asUInt64() > static_cast<Json::UInt64>(
                                                           std::numeric_limits<int64_t>::max()))
      return json.asDouble();
    return static_cast<int64_t>(json.asUInt64());
  case Json::realValue:
    if (type == DataType::INT64 && json.isInt64())
      return static_cast<int64_t>(json.asInt64());
    return json.asDouble();
  case Json::stringValue:
    return json.asString();
  default:
    return write_json(json);
  }
}

Json::Value row_to_json(const Row& row) {
  Json::Value out(Json::arrayValue);
  for (const auto& cell : row)
    out.append(value_to_json(cell));
  return out;
}

Result<Row> row_from_json(const Json::Value& json, const std::vector<ColumnSchema>& schema) {
  if (!json.isArray())
    return Result<Row>::failure(Error::stream("row must be a JSON array"));
  if (!schema.empty() && json.size() != schema.size()) {
    return Result<Row>::failure(Error::stream("row has " + std::to_string(json.size()) +
                                              " cells, expected " + std::to_string(schema.size())));
  }
  Row row;
  row.reserve(json.size());
  for (Json::ArrayIndex i = 0; i < json.size(); ++i) {
    DataType type = schema.empty() ? DataType::UNKNOWN : schema[i].type;
    row.push_back(value_from_json(json[i], type));
  }
  return Result<Row>::success(std::move(row));
}

Json::Value schema_to_json(const std::vector<ColumnSchema>& schema) {
  Json::Value out(Json::arrayValue);
  for (const auto& col : schema) {
    Json::Value c(Json::objectValue);
    c["name"] = col.name;
    c["type"] = wire_type_name(col.type);
    c["nullable"] = col.nullable;
    Json::Value samples(Json::arrayValue);
    for (const auto& s : col.sample_values)
      samples.append(s);
    c["sampleValues"] = samples;
    out.append(c);
  }
  return out;
}

Result<std::vector<ColumnSchema>> schema_from_json(const Json::Value& json) {
  using R = Result<std::vector<ColumnSchema>>;
  if (!json.isArray())
    return R::failure(Error::stream("schema must be an array"));
  std::vector<ColumnSchema> schema;
  for (Json::ArrayIndex i = 0; i < json.size(); ++i) {
    const Json::Value& c = json[i];
    if (!c.isObject() || !c["name"].isString() || !c["type"].isString())
      return R::failure(Error::stream("schema column " + std::to_string(i) + " is malformed"));
    auto type = parse_wire_type(c["type"].asString());
    if (!type)
      return R::failure(Error::stream("unknown column type '" + c["type"].asString() + "'"));
    auto nullable = read_optional_bool(c, "nullable", true);
    if (!nullable)
      return R::failure(Error::stream(nullable.error.message, "schema column " + std::to_string(i)));
    ColumnSchema col;
    col.name = c["name"].asString();
    col.type = *type;
    col.nullable = nullable.value;
    col.index = i;
    const Json::Value& samples = c["sampleValues"];
    if (samples.isArray()) {
      for (const auto& s : samples) {
        if (s.isString())
          col.sample_values.push_back(s.asString());
      }
    }
    schema.push_back(std::move(col));
  }
  return R::success(std::move(schema));
}

Json::Value record_to_json(const FileMetadataRecord& record) {
  Json::Value out(Json::objectValue);
  out["id"] = record.id;
  out["filename"] = record.filename;
  out["tableName"] = record.table_name;
  out["schema"] = schema_to_json(record.schema);
  out["rowCount"] = json_uint(record.total_row_estimate);
  out["rowCountExact"] = record.row_count_exact;
  out["estimatedChunks"] = json_uint(record.estimated_chunk_count);
  out["sizeBytes"] = json_uint(record.size_bytes);
  out["storagePath"] = record.storage_path;
  out["storageUrl"] = record.storage_url;
  return out;
}

Result<FileMetadataRecord> record_from_json(const Json::Value& json) {
  using R = Result<FileMetadataRecord>;
  if (!json.isObject())
    return R::failure(Error::stream("metadata must be an object"));

  FileMetadataRecord record;
  auto id = read_string(json, "id");
  if (!id)
    return R::failure(id.error);
  auto table = read_string(json, "tableName");
  if (!table)
    return R::failure(table.error);
  auto schema = schema_from_json(json["schema"]);
  if (!schema)
    return R::failure(schema.error);
  auto rows = read_count(json, "rowCount", true);
  if (!rows)
    return R::failure(rows.error);
  auto chunks = read_count(json, "estimatedChunks", false);
  if (!chunks)
    return R::failure(chunks.error);
  auto size = read_count(json, "sizeBytes", false);
  if (!size)
    return R::failure(size.error);

  auto filename = read_optional_string(json, "filename", "");
  if (!filename)
    return R::failure(filename.error);
  auto exact = read_optional_bool(json, "rowCountExact", false);
  if (!exact)
    return R::failure(exact.error);
  auto storage_path = read_optional_string(json, "storagePath", "");
  if (!storage_path)
    return R::failure(storage_path.error);
  auto storage_url = read_optional_string(json, "storageUrl", "");
  if (!storage_url)
    return R::failure(storage_url.error);

  record.id = id.value;
  record.table_name = table.value;
  record.schema = std::move(schema.value);
  record.total_row_estimate = rows.value;
  record.estimated_chunk_count = chunks.value;
  record.size_bytes = size.value;
  record.filename = filename.value;
  record.row_count_exact = exact.value;
  record.storage_path = storage_path.value;
  record.storage_url = storage_url.value;
  return R::success(std::move(record));
}

Json::Value event_to_json(const StreamEvent& event) {
  Json::Value out(Json::objectValue);
  if (const auto* m = std::get_if<MetadataEvent>(&event)) {
    return record_to_json(m->record);
  } else if (const auto* c = std::get_if<ChunkEvent>(&event)) {
    out["chunkIndex"] = json_uint(c->index);
    out["rowCount"] = json_uint(c->row_count);
    Json::Value data(Json::arrayValue);
    for (const auto& row : c->rows)
      data.append(row_to_json(row));
    out["data"] = std::move(data);
    out["totalRowsStreamed"] = json_uint(c->cumulative_rows);
    out["totalRows"] = json_uint(c->total_rows);
  } else if (const auto* done = std::get_if<CompleteEvent>(&event)) {
    out["totalChunks"] = json_uint(done->total_chunks);
    out["totalRows"] = json_uint(done->final_row_count);
  } else if (const auto* e = std::get_if<ErrorEvent>(&event)) {
    out["error"] = e->message;
    if (e->chunk_index)
      out["chunkIndex"] = json_uint(*e->chunk_index);
    if (e->line)
      out["line"] = json_uint(*e->line);
  }
  return out;
}

Result<StreamEvent> event_from_json(EventType type, const Json::Value& json,
                                    const std::vector<ColumnSchema>& schema) {
  using R = Result<StreamEvent>;
  if (!json.isObject())
    return R::failure(Error::stream(std::string(event_type_name(type)) +
                                    " payload must be a JSON object"));

  switch (type) {
  case EventType::METADATA: {
    auto record = record_from_json(json);
    if (!record)
      return R::failure(record.error);
    return R::success(MetadataEvent{std::move(record.value)});
  }
  case EventType::CHUNK: {
    ChunkEvent chunk;
    auto index = read_count(json, "chunkIndex", true);
    if (!index)
      return R::failure(index.error);
    auto count = read_count(json, "rowCount", true);
    if (!count)
      return R::failure(count.error);
    auto streamed = read_count(json, "totalRowsStreamed", true);
    if (!streamed)
      return R::failure(streamed.error);
    auto total = read_count(json, "totalRows", false);
    if (!total)
      return R::failure(total.error);
    const Json::Value& data = json["data"];
    if (!data.isArray())
      return R::failure(Error::stream("chunk data must be an array"));
    if (data.size() != count.value) {
      return R::failure(Error::stream("chunk rowCount " + std::to_string(count.value) +
                                      " does not match " + std::to_string(data.size()) +
                                      " data rows"));
    }
    chunk.rows.reserve(data.size());
    for (const auto& r : data) {
      auto row = row_from_json(r, schema);
      if (!row)
        return R::failure(row.error);
      chunk.rows.push_back(std::move(row.value));
    }
    chunk.index = index.value;
    chunk.row_count = count.value;
    chunk.cumulative_rows = streamed.value;
    chunk.total_rows = total.value;
    return R::success(std::move(chunk));
  }
  case EventType::COMPLETE: {
    auto rows = read_count(json, "totalRows", true);
    if (!rows)
      return R::failure(rows.error);
    auto chunks = read_count(json, "totalChunks", true);
    if (!chunks)
      return R::failure(chunks.error);
    return R::success(CompleteEvent{rows.value, chunks.value});
  }
  case EventType::STREAM_ERROR: {
    ErrorEvent err;
    auto message = read_optional_string(json, "error", "stream failed");
    if (!message)
      return R::failure(message.error);
    err.message = message.value;
    if (json.isMember("chunkIndex")) {
      auto idx = read_count(json, "chunkIndex", true);
      if (!idx)
        return R::failure(idx.error);
      err.chunk_index = idx.value;
    }
    if (json.isMember("line")) {
      auto line = read_count(json, "line", true);
      if (!line)
        return R::failure(line.error);
      err.line = line.value;
    }
    return R::success(std::move(err));
  }
  }
  return R::failure(Error::stream("unknown event type"));
}

std::string write_json(const Json::Value& value) {
  return Json::writeString(compact_writer(), value);
}

Result<Json::Value> parse_json(std::string_view text) {
  std::unique_ptr<Json::CharReader> reader(strict_reader().newCharReader());
  Json::Value root;
  std::string errors;
  try {
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
      return Result<Json::Value>::failure(Error::stream("invalid JSON: " + errors));
  } catch (const Json::Exception& e) {
    return Result<Json::Value>::failure(Error::stream(std::string("invalid JSON: ") + e.what()));
  }
  return Result<Json::Value>::success(std::move(root));
}

} // namespace tabflow
