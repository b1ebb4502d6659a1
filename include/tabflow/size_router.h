#pragma once

#include "options.h"

#include <cstdint>

namespace tabflow {

// How a file is processed after upload
enum class Strategy : uint8_t {
  WHOLE_FILE = 0, // Server parses everything, client loads with one create call
  PROGRESSIVE = 1 // Server streams chunks, client creates then appends
};

inline const char* strategy_name(Strategy s) {
  return s == Strategy::WHOLE_FILE ? "whole_file" : "progressive";
}

// Pure routing decision. Sizes at or below the threshold resolve to WHOLE_FILE.
constexpr Strategy route_by_size(uint64_t size_bytes, uint64_t threshold_bytes) {
  return size_bytes > threshold_bytes ? Strategy::PROGRESSIVE : Strategy::WHOLE_FILE;
}

class Trace;

class SizeRouter {
public:
  explicit SizeRouter(const RoutingOptions& options = RoutingOptions{},
                      const Trace* trace = nullptr)
      : options_(options), trace_(trace) {}

  Strategy route(uint64_t size_bytes) const;

  uint64_t threshold() const { return options_.size_threshold_bytes; }

private:
  RoutingOptions options_;
  const Trace* trace_;
};

} // namespace tabflow
