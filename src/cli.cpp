/**
 * tabflow - Command-line driver for the progressive ingestion pipeline
 */

#include "tabflow.h"

#include <json/json.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unistd.h>
#include <variant>

using namespace std;

constexpr int EXIT_PIPELINE_FAILURE = 1;
constexpr int EXIT_USAGE = 2;
constexpr const char* DEFAULT_STORE_DIR = "tabflow-store";

// =============================================================================
// Progress Bar Support
// =============================================================================

/**
 * @brief Simple text-based progress bar for terminal output.
 *
 * Displays a progress bar like: [====================] 100%
 * Observes a session and redraws on every progress increase.
 */
class ProgressBar : public tabflow::SessionObserver {
public:
  explicit ProgressBar(bool enabled, size_t width = 40) : enabled_(enabled), width_(width) {}

  void update(int percent) {
    if (!enabled_ || percent == last_percent_)
      return;
    last_percent_ = percent;

    size_t filled = (static_cast<size_t>(percent) * width_) / 100;
    std::string bar(width_, ' ');
    for (size_t i = 0; i < filled && i < width_; ++i) {
      bar[i] = '=';
    }
    if (filled < width_) {
      bar[filled] = '>';
    }
    std::cerr << "\r[" << bar << "] " << std::setw(3) << percent << "%" << std::flush;
  }

  void finish() {
    if (enabled_) {
      std::string bar(width_, '=');
      std::cerr << "\r[" << bar << "] 100%" << std::endl;
    }
  }

  // Clear the bar after an error or cancellation.
  void clear() {
    if (enabled_) {
      std::cerr << "\r" << std::string(width_ + 7, ' ') << "\r" << std::flush;
    }
  }

  void on_progress(const std::string&, int percent) override { update(percent); }
  void on_complete(const std::string&, const tabflow::MaterializedTable&) override { finish(); }
  void on_error(const std::string&, const tabflow::Error&) override { clear(); }

private:
  bool enabled_;
  size_t width_;
  int last_percent_ = -1;
};

// Reads the event stream for `decode` from standard input.
class StdinByteSource : public tabflow::ByteSource {
public:
  tabflow::Result<size_t> read(char* buffer, size_t max_len) override {
    size_t n = fread(buffer, 1, max_len, stdin);
    if (n < max_len && ferror(stdin))
      return tabflow::Result<size_t>::failure(
          tabflow::Error::stream(string("read error: ") + strerror(errno), "stdin"));
    return tabflow::Result<size_t>::success(std::move(n));
  }
};

// Writes frames straight to stdout for `stream`.
class StdoutFrameSink : public tabflow::FrameSink {
public:
  bool write(std::string_view frame) override {
    return fwrite(frame.data(), 1, frame.size(), stdout) == frame.size();
  }
};

struct CliConfig {
  tabflow::PipelineOptions options;
  string store_dir = DEFAULT_STORE_DIR;
  string db_path;
  string workspace_id = "local";
  string page_id = "cli";
  bool show_progress = true;
};

void printVersion() {
  cout << "tabflow version " << TABFLOW_VERSION_STRING << '\n';
}

void printUsage(const char* prog) {
  cerr << "tabflow - Progressive tabular ingestion pipeline\n\n";
  cerr << "Usage: " << prog << " <command> [options] <file>\n\n";
  cerr << "Commands:\n";
  cerr << "  ingest        Upload a file and load it into a table\n";
  cerr << "  metadata      Upload a file and print the metadata response\n";
  cerr << "  stream        Upload a file and write its event stream to stdout\n";
  cerr << "  decode        Decode an event stream from a file or stdin ('-')\n";
  cerr << "\nOptions:\n";
  cerr << "  --store <dir>         Blob store directory (default: " << DEFAULT_STORE_DIR << ")\n";
  cerr << "  --db <path>           Load into this SQLite database (default: in memory)\n";
  cerr << "  --workspace <id>      Workspace id used in the storage path\n";
  cerr << "  --page <id>           Page id used in the storage path\n";
  cerr << "  --threshold <bytes>   Size above which files are streamed (default: 2097152)\n";
  cerr << "  --chunk-rows <n>      Rows per streamed chunk (default: 1000)\n";
  cerr << "  --sample-rows <n>     Rows sampled for type inference (default: 100)\n";
  cerr << "  --exact-count         Count every row instead of estimating\n";
  cerr << "  --permissive          Drop malformed frames instead of failing\n";
  cerr << "  --keep-partial        Keep the partial table when a load fails\n";
  cerr << "  --no-progress         Disable progress bar\n";
  cerr << "  --verbose             Log pipeline decisions to stderr\n";
  cerr << "  --timing              Print phase timings\n";
  cerr << "  -h, --help            Show this help message\n";
  cerr << "  -v, --version         Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " ingest sales.csv\n";
  cerr << "  " << prog << " ingest --db sales.db --chunk-rows 5000 big.csv\n";
  cerr << "  " << prog << " metadata small.csv\n";
  cerr << "  " << prog << " stream big.csv > big.events\n";
  cerr << "  " << prog << " decode big.events\n";
}

static bool parseCount(const char* text, uint64_t& out) {
  char* endptr = nullptr;
  errno = 0;
  unsigned long long val = strtoull(text, &endptr, 10);
  if (errno != 0 || endptr == text || *endptr != '\0' || text[0] == '-')
    return false;
  out = static_cast<uint64_t>(val);
  return true;
}

static void reportError(const tabflow::Error& error) {
  cerr << "Error: " << error.to_string() << "\n";
}

// Uploads the file and builds the request the server side expects.
static tabflow::Result<tabflow::IngestRequest>
uploadForRequest(const CliConfig& config, tabflow::BlobStore& store, const tabflow::Trace& trace,
                 const char* filename, tabflow::RequestMode mode) {
  using tabflow::Result;
  auto file = tabflow::LocalFile::from_path(filename);
  if (!file)
    return Result<tabflow::IngestRequest>::failure(file.error);

  tabflow::BlobUploader uploader(store, &trace);
  string path = tabflow::make_storage_path(config.workspace_id, config.page_id,
                                           tabflow::now_millis(), file.value.name);
  auto blob = uploader.upload(file.value, path, nullptr);
  if (!blob)
    return Result<tabflow::IngestRequest>::failure(blob.error);

  tabflow::IngestRequest request;
  request.page_id = config.page_id;
  request.workspace_id = config.workspace_id;
  request.mode = mode;
  request.storage_url = blob.value.url;
  request.storage_path = blob.value.path;
  request.filename = file.value.name;
  request.file_size = blob.value.size_bytes;
  request.mime_type = file.value.mime_type;
  return Result<tabflow::IngestRequest>::success(std::move(request));
}

int cmdIngest(const CliConfig& config, const tabflow::Trace& trace, const char* filename) {
  auto file = tabflow::LocalFile::from_path(filename);
  if (!file) {
    reportError(file.error);
    return EXIT_PIPELINE_FAILURE;
  }

  tabflow::FileBlobStore store(config.store_dir, config.options.bucket, &trace);
  tabflow::MemoryCatalog catalog;
  tabflow::IngestService service(config.options, store, catalog, &trace);
  tabflow::LoopbackTransport transport(service, config.options.stream.channel_bytes, &trace);

  std::unique_ptr<tabflow::TableEngine> engine;
  if (config.db_path.empty()) {
    engine = std::make_unique<tabflow::MemoryTableEngine>();
  } else {
    auto opened = tabflow::SqliteTableEngine::open(config.db_path);
    if (!opened) {
      reportError(opened.error);
      return EXIT_PIPELINE_FAILURE;
    }
    engine = std::move(opened.value);
  }

  tabflow::IngestPipeline pipeline(config.options, store, transport, *engine, &trace);
  auto session = pipeline.create_session(file.value);
  ProgressBar progress_bar(config.show_progress);
  session->subscribe(&progress_bar);

  auto table = pipeline.run(*session, {config.workspace_id, config.page_id});
  session->unsubscribe(&progress_bar);
  if (!table) {
    reportError(table.error);
    return EXIT_PIPELINE_FAILURE;
  }

  auto snap = session->snapshot();
  cout << "Table:     " << table.value.table_name << '\n';
  cout << "Table id:  " << table.value.table_id << '\n';
  cout << "Rows:      " << table.value.row_count << '\n';
  cout << "Strategy:  " << tabflow::strategy_name(snap.strategy) << '\n';
  cout << "Chunks:    " << snap.loaded_chunks << '\n';
  if (!config.db_path.empty())
    cout << "Database:  " << config.db_path << '\n';
  return 0;
}

int cmdMetadata(const CliConfig& config, const tabflow::Trace& trace, const char* filename) {
  tabflow::FileBlobStore store(config.store_dir, config.options.bucket, &trace);
  auto request =
      uploadForRequest(config, store, trace, filename, tabflow::RequestMode::METADATA);
  if (!request) {
    reportError(request.error);
    return EXIT_PIPELINE_FAILURE;
  }

  tabflow::MemoryCatalog catalog;
  tabflow::IngestService service(config.options, store, catalog, &trace);
  auto response = service.handle_metadata(request.value);

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  cout << Json::writeString(builder, tabflow::response_to_json(response)) << '\n';
  return response.success ? 0 : EXIT_PIPELINE_FAILURE;
}

int cmdStream(const CliConfig& config, const tabflow::Trace& trace, const char* filename) {
  tabflow::FileBlobStore store(config.store_dir, config.options.bucket, &trace);
  auto request = uploadForRequest(config, store, trace, filename, tabflow::RequestMode::STREAM);
  if (!request) {
    reportError(request.error);
    return EXIT_PIPELINE_FAILURE;
  }

  tabflow::MemoryCatalog catalog;
  tabflow::IngestService service(config.options, store, catalog, &trace);
  StdoutFrameSink sink;
  auto summary = service.handle_stream(request.value, sink);
  fflush(stdout);
  if (summary.error) {
    reportError(*summary.error);
    return EXIT_PIPELINE_FAILURE;
  }
  return summary.completed ? 0 : EXIT_PIPELINE_FAILURE;
}

int cmdDecode(const CliConfig& config, const tabflow::Trace& trace, const char* filename) {
  std::unique_ptr<tabflow::ByteSource> source;
  if (filename == nullptr || strcmp(filename, "-") == 0) {
    source = std::make_unique<StdinByteSource>();
  } else {
    auto opened = tabflow::FileByteSource::open(filename);
    if (!opened) {
      reportError(opened.error);
      return EXIT_PIPELINE_FAILURE;
    }
    source = std::move(opened.value);
  }

  tabflow::FrameDecoder decoder(config.options.decoder, &trace);
  bool saw_error_event = false;
  auto handler = [&](tabflow::StreamEvent&& event) -> tabflow::Result<void> {
    std::visit(
        [&](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, tabflow::MetadataEvent>) {
            cout << "metadata  table=" << e.record.table_name
                 << " columns=" << e.record.schema.size()
                 << " rows~" << e.record.total_row_estimate << '\n';
          } else if constexpr (std::is_same_v<T, tabflow::ChunkEvent>) {
            cout << "chunk     index=" << e.index << " rows=" << e.row_count
                 << " streamed=" << e.cumulative_rows << '\n';
          } else if constexpr (std::is_same_v<T, tabflow::CompleteEvent>) {
            cout << "complete  rows=" << e.final_row_count << " chunks=" << e.total_chunks
                 << '\n';
          } else {
            saw_error_event = true;
            cout << "error     " << e.message;
            if (e.chunk_index)
              cout << " chunk=" << *e.chunk_index;
            if (e.line)
              cout << " line=" << *e.line;
            cout << '\n';
          }
        },
        event);
    return tabflow::Result<void>::success();
  };

  auto decoded = tabflow::decode_stream(*source, decoder, handler);
  for (const auto& warning : decoder.warnings())
    cerr << "Warning: " << warning.to_string() << '\n';
  if (!decoded) {
    reportError(decoded.error);
    return EXIT_PIPELINE_FAILURE;
  }
  if (!decoder.terminal_seen()) {
    cerr << "Error: stream ended without a complete or error event\n";
    return EXIT_PIPELINE_FAILURE;
  }
  return saw_error_event ? EXIT_PIPELINE_FAILURE : 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return EXIT_USAGE;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  string command = argv[1];
  // Skip command for option parsing
  optind = 2;

  CliConfig config;
  bool verbose = false;
  bool timing = false;
  bool progress_flag = true;

  enum LongOnly {
    OPT_STORE = 1000,
    OPT_DB,
    OPT_WORKSPACE,
    OPT_PAGE,
    OPT_THRESHOLD,
    OPT_CHUNK_ROWS,
    OPT_SAMPLE_ROWS,
    OPT_EXACT_COUNT,
    OPT_PERMISSIVE,
    OPT_KEEP_PARTIAL,
    OPT_NO_PROGRESS,
    OPT_VERBOSE,
    OPT_TIMING
  };
  static const struct option long_options[] = {
      {"store", required_argument, nullptr, OPT_STORE},
      {"db", required_argument, nullptr, OPT_DB},
      {"workspace", required_argument, nullptr, OPT_WORKSPACE},
      {"page", required_argument, nullptr, OPT_PAGE},
      {"threshold", required_argument, nullptr, OPT_THRESHOLD},
      {"chunk-rows", required_argument, nullptr, OPT_CHUNK_ROWS},
      {"sample-rows", required_argument, nullptr, OPT_SAMPLE_ROWS},
      {"exact-count", no_argument, nullptr, OPT_EXACT_COUNT},
      {"permissive", no_argument, nullptr, OPT_PERMISSIVE},
      {"keep-partial", no_argument, nullptr, OPT_KEEP_PARTIAL},
      {"no-progress", no_argument, nullptr, OPT_NO_PROGRESS},
      {"verbose", no_argument, nullptr, OPT_VERBOSE},
      {"timing", no_argument, nullptr, OPT_TIMING},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, 'v'},
      {nullptr, 0, nullptr, 0}};

  int c;
  while ((c = getopt_long(argc, argv, "hv", long_options, nullptr)) != -1) {
    uint64_t value = 0;
    switch (c) {
    case OPT_STORE:
      config.store_dir = optarg;
      break;
    case OPT_DB:
      config.db_path = optarg;
      break;
    case OPT_WORKSPACE:
      config.workspace_id = optarg;
      break;
    case OPT_PAGE:
      config.page_id = optarg;
      break;
    case OPT_THRESHOLD:
      if (!parseCount(optarg, value)) {
        cerr << "Error: Invalid threshold '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      config.options.routing.size_threshold_bytes = value;
      break;
    case OPT_CHUNK_ROWS:
      if (!parseCount(optarg, value) || value == 0) {
        cerr << "Error: Invalid chunk row count '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      config.options.stream.chunk_rows = static_cast<size_t>(value);
      break;
    case OPT_SAMPLE_ROWS:
      if (!parseCount(optarg, value) || value == 0) {
        cerr << "Error: Invalid sample size '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      config.options.metadata.sample_rows = static_cast<size_t>(value);
      break;
    case OPT_EXACT_COUNT:
      config.options.metadata.exact_row_count = true;
      break;
    case OPT_PERMISSIVE:
      config.options.decoder.error_mode = tabflow::ErrorMode::PERMISSIVE;
      break;
    case OPT_KEEP_PARTIAL:
      config.options.partial_table_policy = tabflow::PartialTablePolicy::KEEP;
      break;
    case OPT_NO_PROGRESS:
      progress_flag = false;
      break;
    case OPT_VERBOSE:
      verbose = true;
      break;
    case OPT_TIMING:
      timing = true;
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return EXIT_USAGE;
    }
  }

  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }
  if (filename == nullptr && command != "decode") {
    cerr << "Error: " << command << " needs a file argument\n";
    printUsage(argv[0]);
    return EXIT_USAGE;
  }

  auto valid = tabflow::validate_options(config.options);
  if (!valid) {
    cerr << "Error: " << valid.error.message << "\n";
    return EXIT_USAGE;
  }

  tabflow::TraceConfig trace_config;
  trace_config.verbose = verbose;
  trace_config.timing = timing;
  if (verbose)
    trace_config.min_level = tabflow::TraceLevel::DEBUG;
  tabflow::Trace trace(trace_config);

  // Progress is drawn only for an interactive stderr.
  config.show_progress = progress_flag && !verbose && isatty(STDERR_FILENO);

  int result = 0;
  if (command == "ingest") {
    result = cmdIngest(config, trace, filename);
  } else if (command == "metadata") {
    result = cmdMetadata(config, trace, filename);
  } else if (command == "stream") {
    result = cmdStream(config, trace, filename);
  } else if (command == "decode") {
    result = cmdDecode(config, trace, filename);
  } else {
    cerr << "Error: Unknown command '" << command << "'\n";
    printUsage(argv[0]);
    return EXIT_USAGE;
  }

  if (timing)
    trace.print_timing_summary();

  std::cout.flush();
  std::cerr.flush();
  return result;
}
