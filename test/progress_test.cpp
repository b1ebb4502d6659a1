/**
 * @file progress_test.cpp
 * @brief Tests for the unified 0..100 progress scale.
 */

#include "tabflow/progress.h"

#include <gtest/gtest.h>

using namespace tabflow;

TEST(ProgressTrackerTest, DefaultCheckpoints) {
  ProgressTracker p;
  EXPECT_EQ(p.value(), 0);
  EXPECT_EQ(p.upload_end(), 40);
  EXPECT_EQ(p.metadata_point(), 50);
}

TEST(ProgressTrackerTest, UploadScalesIntoFirstSegment) {
  ProgressTracker p;
  EXPECT_EQ(p.on_upload(0), 0);
  EXPECT_EQ(p.on_upload(50), 20);
  EXPECT_EQ(p.on_upload(100), 40);
  EXPECT_EQ(p.on_upload(250), 40);
}

TEST(ProgressTrackerTest, NeverDecreases) {
  ProgressTracker p;
  p.on_upload(100);
  EXPECT_EQ(p.on_upload(10), 40);
  EXPECT_EQ(p.on_metadata(), 50);
  EXPECT_EQ(p.on_upload(100), 50);
  EXPECT_EQ(p.on_rows(500, 1000), 74);
  EXPECT_EQ(p.on_rows(100, 1000), 74);
}

TEST(ProgressTrackerTest, RowsCappedAt99) {
  ProgressTracker p;
  p.on_metadata();
  EXPECT_EQ(p.on_rows(999, 1000), 98);
  EXPECT_EQ(p.on_rows(1000, 1000), 99);
  // The estimate can be low; extra rows never reach 100
  EXPECT_EQ(p.on_rows(5000, 1000), 99);
  EXPECT_EQ(p.value(), 99);
}

TEST(ProgressTrackerTest, HundredOnlyOnComplete) {
  ProgressTracker p;
  p.on_upload(100);
  p.on_metadata();
  p.on_rows(10, 10);
  EXPECT_EQ(p.value(), 99);
  EXPECT_EQ(p.on_complete(), 100);
}

TEST(ProgressTrackerTest, ZeroEstimateHoldsAtMetadataPoint) {
  ProgressTracker p;
  p.on_metadata();
  EXPECT_EQ(p.on_rows(0, 0), 50);
  EXPECT_EQ(p.on_rows(300, 0), 50);
  EXPECT_EQ(p.on_complete(), 100);
}

TEST(ProgressTrackerTest, MonotonicOverFullRun) {
  ProgressTracker p;
  int last = p.value();
  for (int pct = 0; pct <= 100; pct += 3) {
    int v = p.on_upload(pct);
    EXPECT_GE(v, last);
    last = v;
  }
  EXPECT_GE(p.on_metadata(), last);
  last = p.value();
  for (uint64_t rows = 0; rows <= 12000; rows += 1000) {
    int v = p.on_rows(rows, 10000);
    EXPECT_GE(v, last);
    EXPECT_LE(v, 99);
    last = v;
  }
  EXPECT_EQ(p.on_complete(), 100);
}

TEST(ProgressTrackerTest, CustomWeights) {
  ProgressOptions options;
  options.upload_weight = 20;
  options.metadata_weight = 30;
  ProgressTracker p(options);
  EXPECT_EQ(p.upload_end(), 20);
  EXPECT_EQ(p.metadata_point(), 50);
  EXPECT_EQ(p.on_upload(50), 10);
}

TEST(ProgressTrackerTest, WeightsAreClamped) {
  ProgressOptions options;
  options.upload_weight = 120;
  options.metadata_weight = 50;
  ProgressTracker p(options);
  EXPECT_EQ(p.upload_end(), 98);
  EXPECT_EQ(p.metadata_point(), 98);
  p.on_metadata();
  EXPECT_EQ(p.on_rows(1, 2), 98);
  EXPECT_EQ(p.on_rows(2, 2), 99);
}
