#pragma once

#include "types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabflow {

// Frame type tags on the wire: metadata, chunk, complete, error
enum class EventType : uint8_t { METADATA = 0, CHUNK = 1, COMPLETE = 2, STREAM_ERROR = 3 };

inline const char* event_type_name(EventType type) {
  switch (type) {
  case EventType::METADATA:
    return "metadata";
  case EventType::CHUNK:
    return "chunk";
  case EventType::COMPLETE:
    return "complete";
  case EventType::STREAM_ERROR:
    return "error";
  default:
    return "unknown";
  }
}

inline std::optional<EventType> parse_event_type(std::string_view name) {
  if (name == "metadata")
    return EventType::METADATA;
  if (name == "chunk")
    return EventType::CHUNK;
  if (name == "complete")
    return EventType::COMPLETE;
  if (name == "error")
    return EventType::STREAM_ERROR;
  return std::nullopt;
}

struct MetadataEvent {
  FileMetadataRecord record;
};

struct ChunkEvent {
  uint64_t index = 0;
  std::vector<Row> rows;
  uint64_t row_count = 0;       // Rows in this chunk
  uint64_t cumulative_rows = 0; // Rows streamed so far, this chunk included
  uint64_t total_rows = 0;      // Server's row estimate
};

struct CompleteEvent {
  uint64_t final_row_count = 0;
  uint64_t total_chunks = 0;
};

struct ErrorEvent {
  std::string message;
  std::optional<uint64_t> chunk_index;
  std::optional<uint64_t> line;
};

using StreamEvent = std::variant<MetadataEvent, ChunkEvent, CompleteEvent, ErrorEvent>;

inline EventType event_type(const StreamEvent& event) {
  return static_cast<EventType>(event.index());
}

inline bool is_terminal(const StreamEvent& event) {
  return std::holds_alternative<CompleteEvent>(event) || std::holds_alternative<ErrorEvent>(event);
}

} // namespace tabflow
