/**
 * @file trace.h
 * @brief Leveled logging and phase timing for tabflow components.
 */

#ifndef TABFLOW_TRACE_H
#define TABFLOW_TRACE_H

#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tabflow {

enum class TraceLevel : int { DEBUG = 0, INFO = 1, WARNING = 2, FAILURE = 3 };

inline const char* trace_level_name(TraceLevel level) {
  switch (level) {
  case TraceLevel::DEBUG:
    return "DEBUG";
  case TraceLevel::INFO:
    return "INFO";
  case TraceLevel::WARNING:
    return "WARN";
  case TraceLevel::FAILURE:
    return "ERROR";
  default:
    return "?";
  }
}

struct TraceConfig {
  bool verbose = false; // Emit DEBUG and INFO lines
  bool timing = false;  // Record phase timings
  TraceLevel min_level = TraceLevel::WARNING;
  FILE* output = nullptr; // nullptr = stderr

  TraceConfig() = default;

  static TraceConfig all() {
    TraceConfig config;
    config.verbose = true;
    config.timing = true;
    config.min_level = TraceLevel::DEBUG;
    return config;
  }

  static TraceConfig silent() {
    TraceConfig config;
    config.min_level = static_cast<TraceLevel>(static_cast<int>(TraceLevel::FAILURE) + 1);
    return config;
  }
};

struct PhaseTime {
  std::string name;
  std::chrono::nanoseconds duration{0};
  size_t bytes_processed = 0;

  double seconds() const { return duration.count() / 1e9; }

  double throughput_mbps() const {
    if (bytes_processed == 0 || duration.count() == 0)
      return 0.0;
    return (bytes_processed / 1e6) / seconds();
  }
};

/**
 * @class Trace
 * @brief Writes "[tabflow] LEVEL message" lines and collects phase timings.
 *
 * @note Thread Safety: log calls and timing calls are serialized with an
 *       internal mutex, so one Trace may be shared by concurrent sessions.
 */
class Trace {
public:
  explicit Trace(const TraceConfig& config = TraceConfig()) : config_(config) {}

  Trace(const Trace&) = delete;
  Trace& operator=(const Trace&) = delete;

  bool verbose() const { return config_.verbose; }
  bool timing() const { return config_.timing; }

  bool should_log(TraceLevel level) const {
    if (config_.verbose && level < TraceLevel::WARNING)
      return true;
    return static_cast<int>(level) >= static_cast<int>(config_.min_level);
  }

  // Note: The format attribute uses index 3 for fmt because 'this' is implicit parameter 1
#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 3, 4)))
#endif
  void log(TraceLevel level, const char* fmt, ...) const;

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  void debug(const char* fmt, ...) const;

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  void info(const char* fmt, ...) const;

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  void warn(const char* fmt, ...) const;

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  void error(const char* fmt, ...) const;

  // Safe string logging without format string interpretation.
  // Use this when logging user-provided or untrusted strings.
  void log_str(TraceLevel level, const std::string& msg) const;

  void log_decision(const char* decision, const char* reason) const;

  // Phases are tracked per thread, one open phase per thread at a time.
  void start_phase(const char* name) const;
  void end_phase(size_t bytes_processed = 0) const;
  void print_timing_summary() const;
  std::vector<PhaseTime> phase_times() const;

private:
  void write_line(TraceLevel level, const char* fmt, va_list args) const;
  FILE* out() const { return config_.output ? config_.output : stderr; }

  TraceConfig config_;
  struct OpenPhase {
    std::string name;
    std::chrono::steady_clock::time_point start;
  };

  mutable std::mutex mutex_;
  mutable std::vector<PhaseTime> phase_times_;
  mutable std::map<std::thread::id, OpenPhase> open_phases_;
};

// Null-safe helpers for components that hold an optional trace pointer.
#define TABFLOW_TRACE(trace, level, ...)                                                          \
  do {                                                                                             \
    if ((trace) != nullptr && (trace)->should_log(level))                                          \
      (trace)->log(level, __VA_ARGS__);                                                            \
  } while (0)

} // namespace tabflow

#endif // TABFLOW_TRACE_H
