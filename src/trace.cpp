#include "tabflow/trace.h"

namespace tabflow {

void Trace::write_line(TraceLevel level, const char* fmt, va_list args) const {
  std::lock_guard<std::mutex> lock(mutex_);
  FILE* o = out();
  fprintf(o, "[tabflow] %s ", trace_level_name(level));
  vfprintf(o, fmt, args);
  fprintf(o, "\n");
  fflush(o);
}

void Trace::log(TraceLevel level, const char* fmt, ...) const {
  if (!should_log(level))
    return;
  va_list args;
  va_start(args, fmt);
  write_line(level, fmt, args);
  va_end(args);
}

void Trace::debug(const char* fmt, ...) const {
  if (!should_log(TraceLevel::DEBUG))
    return;
  va_list args;
  va_start(args, fmt);
  write_line(TraceLevel::DEBUG, fmt, args);
  va_end(args);
}

void Trace::info(const char* fmt, ...) const {
  if (!should_log(TraceLevel::INFO))
    return;
  va_list args;
  va_start(args, fmt);
  write_line(TraceLevel::INFO, fmt, args);
  va_end(args);
}

void Trace::warn(const char* fmt, ...) const {
  if (!should_log(TraceLevel::WARNING))
    return;
  va_list args;
  va_start(args, fmt);
  write_line(TraceLevel::WARNING, fmt, args);
  va_end(args);
}

void Trace::error(const char* fmt, ...) const {
  if (!should_log(TraceLevel::FAILURE))
    return;
  va_list args;
  va_start(args, fmt);
  write_line(TraceLevel::FAILURE, fmt, args);
  va_end(args);
}

void Trace::log_str(TraceLevel level, const std::string& msg) const {
  if (!should_log(level))
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  FILE* o = out();
  fprintf(o, "[tabflow] %s %s\n", trace_level_name(level), msg.c_str());
  fflush(o);
}

void Trace::log_decision(const char* decision, const char* reason) const {
  if (!should_log(TraceLevel::INFO))
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  FILE* o = out();
  fprintf(o, "[tabflow] DECISION: %s | Reason: %s\n", decision, reason);
  fflush(o);
}

void Trace::start_phase(const char* name) const {
  if (!config_.timing)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  open_phases_[std::this_thread::get_id()] = {name, std::chrono::steady_clock::now()};
}

void Trace::end_phase(size_t bytes_processed) const {
  if (!config_.timing)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = open_phases_.find(std::this_thread::get_id());
  if (it == open_phases_.end())
    return;
  PhaseTime pt;
  pt.name = it->second.name;
  pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - it->second.start);
  pt.bytes_processed = bytes_processed;
  phase_times_.push_back(pt);
  open_phases_.erase(it);
}

void Trace::print_timing_summary() const {
  if (!config_.timing)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (phase_times_.empty())
    return;
  FILE* o = out();
  fprintf(o, "\n[tabflow] === Timing Summary ===\n");
  std::chrono::nanoseconds total{0};
  for (const auto& pt : phase_times_) {
    total += pt.duration;
    fprintf(o, "[tabflow]   %-20s: %10.3f ms", pt.name.c_str(), pt.duration.count() / 1e6);
    if (pt.bytes_processed > 0)
      fprintf(o, "  (%8.2f MB/s)", pt.throughput_mbps());
    fprintf(o, "\n");
  }
  fprintf(o, "[tabflow]   %-20s: %10.3f ms\n", "TOTAL", total.count() / 1e6);
  fflush(o);
}

std::vector<PhaseTime> Trace::phase_times() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_times_;
}

} // namespace tabflow
