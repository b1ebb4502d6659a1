#include "tabflow/progress.h"

#include <algorithm>

namespace tabflow {

ProgressTracker::ProgressTracker(const ProgressOptions& options)
    : upload_end_(std::clamp(options.upload_weight, 0, 98)),
      metadata_point_(std::clamp(options.upload_weight + options.metadata_weight, upload_end_, 98)) {}

int ProgressTracker::advance(int candidate) {
  candidate = std::clamp(candidate, 0, 100);
  if (candidate > value_)
    value_ = candidate;
  return value_;
}

int ProgressTracker::on_upload(int percent) {
  percent = std::clamp(percent, 0, 100);
  return advance(upload_end_ * percent / 100);
}

int ProgressTracker::on_metadata() { return advance(metadata_point_); }

int ProgressTracker::on_rows(uint64_t streamed, uint64_t estimate) {
  const int span = 99 - metadata_point_;
  if (estimate == 0 || streamed >= estimate)
    return advance(estimate == 0 ? metadata_point_ : 99);
  auto scaled = static_cast<int>((static_cast<double>(streamed) / estimate) * span);
  return advance(std::min(99, metadata_point_ + scaled));
}

int ProgressTracker::on_complete() { return advance(100); }

} // namespace tabflow
