#include "tabflow.h"

#include <algorithm>
#include <benchmark/benchmark.h>
#include <string>
#include <vector>

namespace {

// Encoded stream: metadata, `chunks` chunks of `rows_per_chunk` rows, complete.
std::string build_stream(size_t chunks, size_t rows_per_chunk) {
  tabflow::FileMetadataRecord record;
  record.id = "bench";
  record.filename = "bench.csv";
  record.table_name = "bench_t";
  tabflow::ColumnSchema id;
  id.name = "id";
  id.type = tabflow::DataType::INT64;
  tabflow::ColumnSchema price;
  price.name = "price";
  price.type = tabflow::DataType::FLOAT64;
  price.index = 1;
  tabflow::ColumnSchema label;
  label.name = "label";
  label.index = 2;
  record.schema = {id, price, label};
  record.total_row_estimate = chunks * rows_per_chunk;

  std::string out = tabflow::encode_frame(tabflow::MetadataEvent{record});
  uint64_t streamed = 0;
  for (size_t c = 0; c < chunks; ++c) {
    tabflow::ChunkEvent chunk;
    chunk.index = c;
    for (size_t r = 0; r < rows_per_chunk; ++r) {
      int64_t n = static_cast<int64_t>(streamed + r);
      chunk.rows.push_back(tabflow::Row{n, n * 0.25, std::string("label ") + std::to_string(n)});
    }
    chunk.row_count = rows_per_chunk;
    streamed += rows_per_chunk;
    chunk.cumulative_rows = streamed;
    chunk.total_rows = record.total_row_estimate;
    out += tabflow::encode_frame(chunk);
  }
  out += tabflow::encode_frame(tabflow::CompleteEvent{streamed, chunks});
  return out;
}

const std::string& shared_stream() {
  static const std::string stream = build_stream(100, 1000);
  return stream;
}

} // namespace

// Decode the whole stream, feeding it in blocks of state.range(0) bytes
static void BM_DecodeStream_FeedSize(benchmark::State& state) {
  const std::string& stream = shared_stream();
  const size_t feed = static_cast<size_t>(state.range(0));

  for (auto _ : state) {
    tabflow::FrameDecoder decoder;
    size_t events = 0;
    for (size_t pos = 0; pos < stream.size(); pos += feed) {
      size_t n = std::min(feed, stream.size() - pos);
      if (!decoder.feed(stream.data() + pos, n)) {
        state.SkipWithError("decode failed");
        return;
      }
      while (decoder.next_event())
        ++events;
    }
    if (!decoder.finish()) {
      state.SkipWithError("truncated stream");
      return;
    }
    benchmark::DoNotOptimize(events);
  }

  state.SetBytesProcessed(static_cast<int64_t>(stream.size() * state.iterations()));
  state.counters["StreamBytes"] = static_cast<double>(stream.size());
}
BENCHMARK(BM_DecodeStream_FeedSize)
    ->RangeMultiplier(8)
    ->Range(64, 256 * 1024)
    ->Unit(benchmark::kMillisecond);

static void BM_EncodeChunk(benchmark::State& state) {
  const size_t rows = static_cast<size_t>(state.range(0));
  tabflow::ChunkEvent chunk;
  for (size_t r = 0; r < rows; ++r) {
    int64_t n = static_cast<int64_t>(r);
    chunk.rows.push_back(tabflow::Row{n, n * 0.25, std::string("label ") + std::to_string(n)});
  }
  chunk.row_count = rows;
  chunk.cumulative_rows = rows;

  size_t bytes = 0;
  for (auto _ : state) {
    std::string frame = tabflow::encode_frame(chunk);
    bytes = frame.size();
    benchmark::DoNotOptimize(frame);
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
  state.counters["Rows"] = static_cast<double>(rows);
}
BENCHMARK(BM_EncodeChunk)->Arg(100)->Arg(1000)->Arg(10000)->Unit(benchmark::kMicrosecond);
