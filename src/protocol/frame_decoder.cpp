#include "tabflow/frame_decoder.h"

#include "tabflow/trace.h"
#include "tabflow/wire.h"

#include <cstring>
#include <deque>
#include <string_view>

namespace tabflow {

std::string encode_frame(const StreamEvent& event) {
  std::string frame = "event: ";
  frame += event_type_name(event_type(event));
  frame += "\ndata: ";
  frame += write_json(event_to_json(event));
  frame += "\n\n";
  return frame;
}

struct FrameDecoder::Impl {
  DecoderOptions options;
  const Trace* trace;

  // Bytes of the line currently being accumulated (no terminator yet)
  std::string line;

  // Fields of the frame being assembled
  bool frame_started = false;
  size_t frame_bytes = 0;
  bool has_event = false;
  std::string event_name;
  bool has_data = false;
  std::string data;

  std::deque<StreamEvent> ready;

  // Sequencing state
  std::vector<ColumnSchema> schema;
  uint64_t next_chunk_index = 0;
  uint64_t rows_streamed = 0;
  bool terminal = false;

  bool failed = false;
  Error failure;
  uint64_t decoded = 0;
  uint64_t dropped = 0;
  std::vector<Error> warnings;

  Impl(const DecoderOptions& opts, const Trace* t) : options(opts), trace(t) {}

  Result<void> fail(Error e) {
    failed = true;
    failure = std::move(e);
    if (trace)
      trace->log_str(TraceLevel::FAILURE, "frame decoder: " + failure.to_string());
    return Result<void>::failure(failure);
  }

  // Malformed frames follow the configured error mode
  Result<void> reject_frame(Error e) {
    if (options.error_mode == ErrorMode::FAIL_FAST)
      return fail(std::move(e));
    ++dropped;
    if (trace)
      trace->log_str(TraceLevel::WARNING, "dropping malformed frame: " + e.message);
    warnings.push_back(std::move(e));
    return Result<void>::success();
  }

  void reset_frame() {
    frame_started = false;
    frame_bytes = 0;
    has_event = false;
    event_name.clear();
    has_data = false;
    data.clear();
  }

  Result<void> check_sequence(const StreamEvent& event) {
    if (terminal)
      return fail(Error::stream("event received after the terminal event"));

    if (const auto* m = std::get_if<MetadataEvent>(&event)) {
      if (next_chunk_index > 0)
        return fail(Error::stream("metadata event after chunk events"));
      schema = m->record.schema;
    } else if (const auto* c = std::get_if<ChunkEvent>(&event)) {
      if (c->index != next_chunk_index) {
        return fail(Error::stream("chunk index " + std::to_string(c->index) +
                                  " out of order, expected " + std::to_string(next_chunk_index)));
      }
      if (c->cumulative_rows != rows_streamed + c->row_count) {
        return fail(Error::stream("chunk " + std::to_string(c->index) + " reports " +
                                  std::to_string(c->cumulative_rows) + " rows streamed, expected " +
                                  std::to_string(rows_streamed + c->row_count)));
      }
      ++next_chunk_index;
      rows_streamed = c->cumulative_rows;
    } else if (const auto* done = std::get_if<CompleteEvent>(&event)) {
      if (done->final_row_count != rows_streamed) {
        return fail(Error::stream("complete reports " + std::to_string(done->final_row_count) +
                                  " rows but " + std::to_string(rows_streamed) +
                                  " were streamed"));
      }
      if (done->total_chunks != next_chunk_index) {
        return fail(Error::stream("complete reports " + std::to_string(done->total_chunks) +
                                  " chunks but " + std::to_string(next_chunk_index) +
                                  " were received"));
      }
      terminal = true;
    } else {
      terminal = true;
    }
    return Result<void>::success();
  }

  Result<void> dispatch_frame() {
    if (terminal)
      return fail(Error::stream("frame received after the terminal event"));
    if (!has_event)
      return reject_frame(Error::stream("frame has no event field"));
    auto type = parse_event_type(event_name);
    if (!type)
      return reject_frame(Error::stream("unknown event type '" + event_name + "'"));
    if (!has_data)
      return reject_frame(Error::stream(event_name + " frame has no data field"));

    auto json = parse_json(data);
    if (!json)
      return reject_frame(Error::stream(json.error.message, event_name + " frame"));
    auto event = event_from_json(*type, json.value, schema);
    if (!event)
      return reject_frame(Error::stream(event.error.message, event_name + " frame"));

    auto seq = check_sequence(event.value);
    if (!seq)
      return seq;

    ready.push_back(std::move(event.value));
    ++decoded;
    return Result<void>::success();
  }

  Result<void> process_line(std::string_view l) {
    if (!l.empty() && l.back() == '\r')
      l.remove_suffix(1);

    if (l.empty()) {
      if (!frame_started)
        return Result<void>::success();
      auto r = dispatch_frame();
      reset_frame();
      return r;
    }
    if (l.front() == ':')
      return Result<void>::success();

    std::string_view name = l;
    std::string_view value;
    size_t colon = l.find(':');
    if (colon != std::string_view::npos) {
      name = l.substr(0, colon);
      value = l.substr(colon + 1);
      if (!value.empty() && value.front() == ' ')
        value.remove_prefix(1);
    }

    frame_started = true;
    if (name == "event") {
      has_event = true;
      event_name.assign(value.data(), value.size());
    } else if (name == "data") {
      if (has_data)
        data += '\n';
      data.append(value.data(), value.size());
      has_data = true;
    }
    // id, retry and unknown fields are ignored
    return Result<void>::success();
  }

  Result<void> feed(const char* bytes, size_t size) {
    if (failed)
      return Result<void>::failure(failure);

    size_t pos = 0;
    while (pos < size) {
      const void* nl = std::memchr(bytes + pos, '\n', size - pos);
      size_t end = nl ? static_cast<size_t>(static_cast<const char*>(nl) - bytes) : size;
      size_t n = end - pos;

      if (frame_bytes + line.size() + n > options.max_frame_bytes) {
        return fail(Error::stream("frame exceeds " + std::to_string(options.max_frame_bytes) +
                                  " bytes"));
      }

      if (!nl) {
        line.append(bytes + pos, n);
        break;
      }

      Result<void> r;
      if (line.empty()) {
        r = process_line(std::string_view(bytes + pos, n));
      } else {
        line.append(bytes + pos, n);
        r = process_line(line);
        line.clear();
      }
      frame_bytes += n + 1;
      if (!frame_started)
        frame_bytes = 0;
      if (!r)
        return r;
      pos = end + 1;
    }
    return Result<void>::success();
  }

  Result<void> finish() {
    if (failed)
      return Result<void>::failure(failure);

    bool trailing_content = line.find_first_not_of(" \t\r") != std::string::npos;
    line.clear();
    if (trailing_content || frame_started) {
      reset_frame();
      if (terminal)
        return Result<void>::success();
      return reject_frame(Error::stream("stream ended inside a frame"));
    }
    return Result<void>::success();
  }
};

FrameDecoder::FrameDecoder(const DecoderOptions& options, const Trace* trace)
    : impl_(std::make_unique<Impl>(options, trace)) {}

FrameDecoder::~FrameDecoder() = default;
FrameDecoder::FrameDecoder(FrameDecoder&&) noexcept = default;
FrameDecoder& FrameDecoder::operator=(FrameDecoder&&) noexcept = default;

Result<void> FrameDecoder::feed(const char* data, size_t size) { return impl_->feed(data, size); }

std::optional<StreamEvent> FrameDecoder::next_event() {
  if (impl_->ready.empty())
    return std::nullopt;
  StreamEvent event = std::move(impl_->ready.front());
  impl_->ready.pop_front();
  return event;
}

Result<void> FrameDecoder::finish() { return impl_->finish(); }

bool FrameDecoder::failed() const { return impl_->failed; }
bool FrameDecoder::terminal_seen() const { return impl_->terminal; }
uint64_t FrameDecoder::frames_decoded() const { return impl_->decoded; }
uint64_t FrameDecoder::frames_dropped() const { return impl_->dropped; }
const std::vector<Error>& FrameDecoder::warnings() const { return impl_->warnings; }

Result<uint64_t> decode_stream(ByteSource& source, FrameDecoder& decoder,
                               const EventHandler& handler, size_t read_size) {
  std::vector<char> buffer(read_size == 0 ? 64 * 1024 : read_size);
  uint64_t delivered = 0;

  auto drain = [&]() -> Result<void> {
    while (auto event = decoder.next_event()) {
      auto r = handler(std::move(*event));
      ++delivered;
      if (!r)
        return r;
    }
    return Result<void>::success();
  };

  while (true) {
    auto n = source.read(buffer.data(), buffer.size());
    if (!n)
      return Result<uint64_t>::failure(Error::stream(n.error.message, n.error.context));
    if (n.value == 0)
      break;
    auto fed = decoder.feed(buffer.data(), n.value);
    // Events decoded before a failure are still delivered first
    auto handled = drain();
    if (!handled)
      return Result<uint64_t>::failure(handled.error);
    if (!fed)
      return Result<uint64_t>::failure(fed.error);
  }

  auto finished = decoder.finish();
  auto handled = drain();
  if (!handled)
    return Result<uint64_t>::failure(handled.error);
  if (!finished)
    return Result<uint64_t>::failure(finished.error);
  return Result<uint64_t>::success(std::move(delivered));
}

} // namespace tabflow
