#pragma once

#include "byte_source.h"
#include "error.h"
#include "options.h"
#include "stream_event.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabflow {

class Trace;

// Serialize one event as "event: <type>\ndata: <json>\n\n".
std::string encode_frame(const StreamEvent& event);

// Incremental event-stream decoder.
//
// Pull-model API:
//   feed(data, size)  -- provide bytes exactly as they arrived from the network
//   next_event()      -- take the next decoded event, in stream order
//   finish()          -- signal end of input; rejects a truncated trailing frame
//
// The sequence of events is identical for every partition of the same byte
// stream into feed() calls. Lines may end in "\n" or "\r\n"; a blank line ends
// a frame; lines starting with ':' are comments; multiple data lines are joined
// with '\n'. Chunk frames are checked for ordering: indexes must run 0, 1, 2...
// and totalRowsStreamed must equal the running sum of rowCount. Ordering
// violations always fail; unparseable frames fail or are dropped according to
// DecoderOptions::error_mode.
class FrameDecoder {
public:
  explicit FrameDecoder(const DecoderOptions& options = DecoderOptions{},
                        const Trace* trace = nullptr);
  ~FrameDecoder();

  FrameDecoder(const FrameDecoder&) = delete;
  FrameDecoder& operator=(const FrameDecoder&) = delete;
  FrameDecoder(FrameDecoder&&) noexcept;
  FrameDecoder& operator=(FrameDecoder&&) noexcept;

  // Returns failure on a fatal stream error; later calls keep failing.
  Result<void> feed(const char* data, size_t size);

  std::optional<StreamEvent> next_event();

  Result<void> finish();

  bool failed() const;
  bool terminal_seen() const;
  uint64_t frames_decoded() const;
  uint64_t frames_dropped() const;

  // Warnings recorded for frames dropped in PERMISSIVE mode
  const std::vector<Error>& warnings() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Receives each decoded event. A failure stops decoding and is returned.
using EventHandler = std::function<Result<void>(StreamEvent&&)>;

// Read source to the end, decoding and dispatching events in order.
// Returns the number of events delivered.
Result<uint64_t> decode_stream(ByteSource& source, FrameDecoder& decoder,
                               const EventHandler& handler, size_t read_size = 64 * 1024);

} // namespace tabflow
