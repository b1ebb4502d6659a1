/**
 * @file test_util.h
 * @brief Shared test utilities for tabflow test files.
 *
 * Provides:
 * - TempCsvFile / TempDir: RAII temporary files and directories
 * - generate_csv() / generate_mixed_csv(): deterministic CSV content
 * - RecordingEngine: TableEngine that logs every call and can inject failures
 * - RecordingObserver: SessionObserver that keeps every notification
 * - PipelineHarness: store, catalog, service, loopback transport and pipeline
 *   wired together in a temporary directory
 */

#pragma once

#include "tabflow.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace test_util {

/// Thread-safe counter for unique temp file naming across all test files.
inline std::atomic<uint64_t>& temp_counter() {
  static std::atomic<uint64_t> counter{0};
  return counter;
}

inline std::string unique_temp_path(const std::string& suffix) {
  uint64_t id = temp_counter().fetch_add(1);
  return "/tmp/tabflow_test_" + std::to_string(getpid()) + "_" + std::to_string(id) + suffix;
}

/**
 * RAII helper that writes string content to a temporary CSV file.
 * The file is automatically deleted on destruction.
 * Each instance gets a unique filename using PID + atomic counter.
 */
class TempCsvFile {
public:
  explicit TempCsvFile(const std::string& content, const std::string& extension = ".csv") {
    path_ = unique_temp_path(extension);
    std::ofstream f(path_, std::ios::binary);
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    f.close();
  }
  ~TempCsvFile() { std::remove(path_.c_str()); }
  const std::string& path() const { return path_; }

  TempCsvFile(const TempCsvFile&) = delete;
  TempCsvFile& operator=(const TempCsvFile&) = delete;

private:
  std::string path_;
};

/// RAII temporary directory, removed recursively on destruction.
class TempDir {
public:
  TempDir() : path_(unique_temp_path("_dir")) { std::filesystem::create_directories(path_); }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::string& path() const { return path_; }

  // Write content to a file below the directory and return its full path.
  std::string write(const std::string& name, const std::string& content) const {
    std::filesystem::path full = std::filesystem::path(path_) / name;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream f(full, std::ios::binary);
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    return full.string();
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

private:
  std::string path_;
};

// ---------------------------------------------------------------------------
// CSV data generators
// ---------------------------------------------------------------------------

// Header col0..colN-1, integer cells r * cols + c.
inline std::string generate_csv(size_t rows, size_t cols) {
  std::ostringstream oss;
  for (size_t c = 0; c < cols; ++c) {
    if (c > 0)
      oss << ',';
    oss << "col" << c;
  }
  oss << '\n';
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c > 0)
        oss << ',';
      oss << (r * cols + c);
    }
    oss << '\n';
  }
  return oss.str();
}

// id (INT64), name (STRING), price (FLOAT64), active (BOOL), joined (DATE)
inline std::string generate_mixed_csv(size_t rows) {
  std::ostringstream oss;
  oss << "id,name,price,active,joined\n";
  for (size_t r = 0; r < rows; ++r) {
    oss << r << ",\"name " << r << "\"," << (r % 100) << "." << (r % 7 + 1) << ","
        << (r % 2 == 0 ? "true" : "false") << ",2024-0" << (r % 9 + 1) << "-1" << (r % 9)
        << '\n';
  }
  return oss.str();
}

// ---------------------------------------------------------------------------
// Recording engine
// ---------------------------------------------------------------------------

enum class EngineCall { CREATE, APPEND, DROP };

struct EngineCallRecord {
  EngineCall kind;
  std::string table;
  size_t rows = 0;
};

/**
 * TableEngine that delegates to a MemoryTableEngine and logs every call.
 * fail_on_append (1-based) makes that append fail with a MATERIALIZATION error.
 */
class RecordingEngine : public tabflow::TableEngine {
public:
  tabflow::Result<void> create_table_from_rows(
      const std::string& table, const std::vector<tabflow::Row>& rows,
      const std::vector<tabflow::ColumnSchema>& schema) override {
    record(EngineCall::CREATE, table, rows.size());
    if (fail_on_create)
      return tabflow::Result<void>::failure(tabflow::Error::materialization("injected", table));
    return inner_.create_table_from_rows(table, rows, schema);
  }

  tabflow::Result<void> append_rows(const std::string& table,
                                    const std::vector<tabflow::Row>& rows,
                                    const std::vector<tabflow::ColumnSchema>& schema) override {
    size_t n = record(EngineCall::APPEND, table, rows.size());
    if (fail_on_append != 0 && n == fail_on_append)
      return tabflow::Result<void>::failure(tabflow::Error::materialization("injected", table));
    return inner_.append_rows(table, rows, schema);
  }

  tabflow::Result<void> drop_table(const std::string& table) override {
    record(EngineCall::DROP, table, 0);
    return inner_.drop_table(table);
  }

  bool has_table(const std::string& table) const override { return inner_.has_table(table); }

  tabflow::Result<uint64_t> row_count(const std::string& table) const override {
    return inner_.row_count(table);
  }

  std::vector<EngineCallRecord> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  size_t count(EngineCall kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(),
                                              [kind](const auto& c) { return c.kind == kind; }));
  }

  tabflow::MemoryTableEngine& inner() { return inner_; }

  bool fail_on_create = false;
  size_t fail_on_append = 0;

private:
  // Returns the 1-based ordinal of this call among calls of the same kind.
  size_t record(EngineCall kind, const std::string& table, size_t rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back({kind, table, rows});
    return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(),
                                              [kind](const auto& c) { return c.kind == kind; }));
  }

  tabflow::MemoryTableEngine inner_;
  mutable std::mutex mutex_;
  std::vector<EngineCallRecord> calls_;
};

// ---------------------------------------------------------------------------
// Recording observer
// ---------------------------------------------------------------------------

class RecordingObserver : public tabflow::SessionObserver {
public:
  void on_state_changed(const std::string&, tabflow::SessionState,
                        tabflow::SessionState to) override {
    std::lock_guard<std::mutex> lock(mutex_);
    states.push_back(to);
  }
  void on_progress(const std::string&, int percent) override {
    std::lock_guard<std::mutex> lock(mutex_);
    progress.push_back(percent);
  }
  void on_chunk_loaded(const std::string&, uint64_t chunk_index, uint64_t) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      chunks.push_back(chunk_index);
    }
    if (on_chunk)
      on_chunk(chunk_index);
  }
  void on_complete(const std::string&, const tabflow::MaterializedTable& t) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++terminal_count;
    table = t;
  }
  void on_error(const std::string&, const tabflow::Error& e) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++terminal_count;
    error = e;
  }

  std::vector<tabflow::SessionState> states;
  std::vector<int> progress;
  std::vector<uint64_t> chunks;
  int terminal_count = 0;
  std::optional<tabflow::MaterializedTable> table;
  std::optional<tabflow::Error> error;
  // Called on the pipeline thread after each chunk notification
  std::function<void(uint64_t)> on_chunk;

private:
  std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Recording transport
// ---------------------------------------------------------------------------

/// Forwards to another transport and keeps every request and metadata reply.
class RecordingTransport : public tabflow::IngestTransport {
public:
  explicit RecordingTransport(tabflow::IngestTransport& inner) : inner_(inner) {}

  tabflow::Result<tabflow::MetadataResponse>
  fetch_metadata(const tabflow::IngestRequest& request) override {
    auto response = inner_.fetch_metadata(request);
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (response)
      responses_.push_back(response.value);
    return response;
  }

  tabflow::Result<std::unique_ptr<tabflow::ResponseStream>>
  open_stream(const tabflow::IngestRequest& request) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
    }
    return inner_.open_stream(request);
  }

  std::vector<tabflow::IngestRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }
  std::vector<tabflow::MetadataResponse> responses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_;
  }

private:
  tabflow::IngestTransport& inner_;
  mutable std::mutex mutex_;
  std::vector<tabflow::IngestRequest> requests_;
  std::vector<tabflow::MetadataResponse> responses_;
};

// ---------------------------------------------------------------------------
// Pipeline harness
// ---------------------------------------------------------------------------

inline tabflow::PipelineOptions default_test_options() {
  tabflow::PipelineOptions options;
  options.stream.channel_bytes = 16 * 1024;
  return options;
}

/**
 * Everything a client-side test needs: a blob store rooted in a temp dir, an
 * in-memory catalog, the ingest service behind a loopback transport, a
 * recording engine and the pipeline itself.
 */
struct PipelineHarness {
  explicit PipelineHarness(const tabflow::PipelineOptions& opts = default_test_options())
      : options(opts), store(dir.path() + "/store", opts.bucket), service(opts, store, catalog),
        transport(service, opts.stream.channel_bytes), pipeline(opts, store, transport, engine) {}

  // Write a local file to upload and describe it.
  tabflow::LocalFile local_file(const std::string& name, const std::string& content) {
    std::string path = dir.write("local/" + name, content);
    auto file = tabflow::LocalFile::from_path(path);
    EXPECT_TRUE(file.ok) << file.error.to_string();
    return file.value;
  }

  TempDir dir;
  tabflow::PipelineOptions options;
  tabflow::FileBlobStore store;
  tabflow::MemoryCatalog catalog;
  tabflow::IngestService service;
  tabflow::LoopbackTransport transport;
  RecordingEngine engine;
  tabflow::IngestPipeline pipeline;
};

inline const tabflow::UploadTarget kTarget{"ws-1", "page-1"};

// Store content directly and return the request the client would send.
inline tabflow::IngestRequest store_for_request(tabflow::BlobStore& store,
                                                const std::string& filename,
                                                const std::string& content,
                                                tabflow::RequestMode mode) {
  std::string path = tabflow::make_storage_path("ws-1", "page-1", 1700000000000ULL, filename);
  tabflow::MemoryByteSource source(content);
  auto ref = store.put(path, source, content.size(), tabflow::PutOptions{});
  EXPECT_TRUE(ref.ok) << ref.error.to_string();
  tabflow::IngestRequest request;
  request.page_id = "page-1";
  request.workspace_id = "ws-1";
  request.mode = mode;
  request.storage_url = ref.value.url;
  request.storage_path = ref.value.path;
  request.filename = filename;
  request.file_size = content.size();
  request.mime_type = tabflow::guess_mime_type(filename);
  return request;
}

// Collect every event of an encoded stream, failing the test on decode errors.
inline std::vector<tabflow::StreamEvent> decode_all(const std::string& frames,
                                                    size_t max_read = 0) {
  tabflow::MemoryByteSource source(frames, max_read);
  tabflow::FrameDecoder decoder;
  std::vector<tabflow::StreamEvent> events;
  auto result = tabflow::decode_stream(source, decoder, [&](tabflow::StreamEvent&& e) {
    events.push_back(std::move(e));
    return tabflow::Result<void>::success();
  });
  EXPECT_TRUE(result.ok) << result.error.to_string();
  return events;
}

} // namespace test_util
