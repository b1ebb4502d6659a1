#pragma once

#include "byte_source.h"
#include "error.h"
#include "protocol.h"

#include <cstddef>
#include <memory>

namespace tabflow {

class IngestService;
class Trace;

// Body of a stream-mode response. abort() may be called from any thread and
// makes a blocked or future read() return end of input promptly.
class ResponseStream : public ByteSource {
public:
  virtual void abort() = 0;
};

// Client view of the ingest endpoint.
class IngestTransport {
public:
  virtual ~IngestTransport() = default;

  // Fails only on transport problems; a server-side rejection comes back as a
  // response with success == false.
  virtual Result<MetadataResponse> fetch_metadata(const IngestRequest& request) = 0;

  virtual Result<std::unique_ptr<ResponseStream>> open_stream(const IngestRequest& request) = 0;
};

// In-process transport that serves requests from an IngestService.
//
// Requests and metadata replies go through their JSON encoding. Each stream
// runs the service on a producer thread writing into a bounded ByteChannel;
// aborting or destroying the stream stops the producer and joins it.
class LoopbackTransport : public IngestTransport {
public:
  explicit LoopbackTransport(IngestService& service, size_t channel_bytes = 256 * 1024,
                             const Trace* trace = nullptr)
      : service_(service), channel_bytes_(channel_bytes), trace_(trace) {}

  Result<MetadataResponse> fetch_metadata(const IngestRequest& request) override;
  Result<std::unique_ptr<ResponseStream>> open_stream(const IngestRequest& request) override;

private:
  IngestService& service_;
  size_t channel_bytes_;
  const Trace* trace_;
};

} // namespace tabflow
