#pragma once

#include "options.h"

#include <cstdint>

namespace tabflow {

/**
 * @brief Maps stage-local progress onto one 0..100 scale.
 *
 * Upload covers 0..upload_weight, the metadata checkpoint sits at
 * upload_weight + metadata_weight, streamed rows fill the rest up to 99, and
 * 100 is reached only through on_complete(). Every update is clamped so the
 * value never decreases.
 *
 * With the default weights: upload 0..40, metadata 50, rows 50..99.
 */
class ProgressTracker {
public:
  explicit ProgressTracker(const ProgressOptions& options = ProgressOptions());

  // percent of the upload, 0..100
  int on_upload(int percent);
  int on_metadata();
  // Rows beyond the estimate keep the value at 99.
  int on_rows(uint64_t streamed, uint64_t estimate);
  int on_complete();

  int value() const { return value_; }

  int upload_end() const { return upload_end_; }
  int metadata_point() const { return metadata_point_; }

private:
  int advance(int candidate);

  int upload_end_;
  int metadata_point_;
  int value_ = 0;
};

} // namespace tabflow
