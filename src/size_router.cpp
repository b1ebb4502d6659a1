#include "tabflow/size_router.h"

#include "tabflow/trace.h"

#include <string>

namespace tabflow {

Strategy SizeRouter::route(uint64_t size_bytes) const {
  Strategy strategy = route_by_size(size_bytes, options_.size_threshold_bytes);
  if (trace_ && trace_->should_log(TraceLevel::INFO)) {
    std::string reason = std::to_string(size_bytes) +
                         (strategy == Strategy::PROGRESSIVE ? " bytes > " : " bytes <= ") +
                         std::to_string(options_.size_threshold_bytes) + " byte threshold";
    trace_->log_decision(strategy_name(strategy), reason.c_str());
  }
  return strategy;
}

} // namespace tabflow
