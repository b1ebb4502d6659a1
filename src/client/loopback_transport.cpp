#include "tabflow/transport.h"

#include "tabflow/byte_channel.h"
#include "tabflow/cancel_token.h"
#include "tabflow/chunk_streamer.h"
#include "tabflow/ingest_service.h"
#include "tabflow/trace.h"
#include "tabflow/wire.h"

#include <thread>

namespace tabflow {

namespace {

class ChannelSink : public FrameSink {
public:
  explicit ChannelSink(ByteChannel& channel) : channel_(channel) {}
  bool write(std::string_view frame) override { return channel_.write(frame); }

private:
  ByteChannel& channel_;
};

class ChannelStream : public ResponseStream {
public:
  ChannelStream(IngestService& service, std::string body, size_t capacity, const Trace* trace)
      : channel_(capacity) {
    producer_ = std::thread([this, &service, trace, body = std::move(body)] {
      ChannelSink sink(channel_);
      auto summary = service.handle_stream_json(body, sink, &cancel_);
      if (trace && summary.client_gone)
        trace->debug("loopback stream closed by reader after %llu chunks",
                     static_cast<unsigned long long>(summary.chunks_sent));
      channel_.close_writer();
    });
  }

  ~ChannelStream() override {
    abort();
    if (producer_.joinable())
      producer_.join();
  }

  Result<size_t> read(char* buffer, size_t max_len) override {
    return Result<size_t>::success(channel_.read(buffer, max_len));
  }

  void abort() override {
    channel_.abort();
    cancel_.request();
  }

private:
  ByteChannel channel_;
  CancelToken cancel_;
  std::thread producer_;
};

} // namespace

Result<MetadataResponse> LoopbackTransport::fetch_metadata(const IngestRequest& request) {
  std::string reply = service_.handle_metadata_json(write_json(request_to_json(request)));
  auto json = parse_json(reply);
  if (!json)
    return Result<MetadataResponse>::failure(Error::metadata(json.error.message, "response body"));
  return response_from_json(json.value);
}

Result<std::unique_ptr<ResponseStream>> LoopbackTransport::open_stream(
    const IngestRequest& request) {
  std::string body = write_json(request_to_json(request));
  if (trace_)
    trace_->debug("opening loopback stream for %s", request.filename.c_str());
  return Result<std::unique_ptr<ResponseStream>>::success(
      std::make_unique<ChannelStream>(service_, std::move(body), channel_bytes_, trace_));
}

} // namespace tabflow
