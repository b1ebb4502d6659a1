#include "tabflow.h"

#include <atomic>
#include <benchmark/benchmark.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

std::string make_csv(size_t rows) {
  std::ostringstream oss;
  oss << "id,name,price,active,joined\n";
  for (size_t r = 0; r < rows; ++r) {
    oss << r << ",\"name " << r << "\"," << (r % 100) << "." << (r % 7 + 1) << ","
        << (r % 2 == 0 ? "true" : "false") << ",2024-0" << (r % 9 + 1) << "-1" << (r % 9)
        << '\n';
  }
  return oss.str();
}

// Scratch directory removed when the benchmark finishes.
class ScratchDir {
public:
  ScratchDir() {
    static std::atomic<uint64_t> counter{0};
    path_ = (std::filesystem::temp_directory_path() /
             ("tabflow_bench_" + std::to_string(tabflow::now_millis()) + "_" +
              std::to_string(counter++)))
                .string();
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace

// Server side only: stored file to encoded frames
static void BM_ChunkStreamer(benchmark::State& state) {
  const size_t rows = static_cast<size_t>(state.range(0));
  ScratchDir dir;
  tabflow::PipelineOptions options;
  tabflow::FileBlobStore store(dir.path(), options.bucket);
  tabflow::MemoryCatalog catalog;
  tabflow::MetadataExtractor extractor(options, store, catalog);
  tabflow::ChunkStreamer streamer(options, store);

  std::string csv = make_csv(rows);
  tabflow::MemoryByteSource source(csv);
  std::string path = tabflow::make_storage_path("ws", "pg", 1, "bench.csv");
  if (!store.put(path, source, csv.size(), tabflow::PutOptions{})) {
    state.SkipWithError("put failed");
    return;
  }
  auto record = extractor.extract(path, "bench.csv");
  if (!record) {
    state.SkipWithError(record.error.to_string().c_str());
    return;
  }

  for (auto _ : state) {
    tabflow::StringFrameSink sink;
    auto summary = streamer.stream(record.value, sink);
    benchmark::DoNotOptimize(summary.rows_sent);
  }
  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.SetItemsProcessed(static_cast<int64_t>(rows * state.iterations()));
}
BENCHMARK(BM_ChunkStreamer)->Arg(10000)->Arg(100000)->Unit(benchmark::kMillisecond);

// Full client run: upload, stream through the loopback transport, load into memory
static void BM_ProgressiveIngest(benchmark::State& state) {
  const size_t rows = static_cast<size_t>(state.range(0));
  ScratchDir dir;
  tabflow::PipelineOptions options;
  options.routing.size_threshold_bytes = 1;
  tabflow::FileBlobStore store(dir.path() + "/store", options.bucket);
  tabflow::MemoryCatalog catalog;
  tabflow::IngestService service(options, store, catalog);
  tabflow::LoopbackTransport transport(service, options.stream.channel_bytes);

  std::string csv = make_csv(rows);
  std::string local = dir.path() + "/bench.csv";
  {
    std::ofstream out(local, std::ios::binary);
    out.write(csv.data(), static_cast<std::streamsize>(csv.size()));
  }
  auto file = tabflow::LocalFile::from_path(local);
  if (!file) {
    state.SkipWithError(file.error.to_string().c_str());
    return;
  }

  for (auto _ : state) {
    tabflow::MemoryTableEngine engine;
    tabflow::IngestPipeline pipeline(options, store, transport, engine);
    auto table = pipeline.ingest(file.value, {"ws", "pg"});
    if (!table) {
      state.SkipWithError(table.error.to_string().c_str());
      return;
    }
    benchmark::DoNotOptimize(table.value.row_count);
  }
  state.SetBytesProcessed(static_cast<int64_t>(csv.size() * state.iterations()));
  state.SetItemsProcessed(static_cast<int64_t>(rows * state.iterations()));
}
BENCHMARK(BM_ProgressiveIngest)->Arg(10000)->Arg(100000)->Unit(benchmark::kMillisecond);
