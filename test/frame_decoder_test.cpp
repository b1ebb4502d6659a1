/**
 * @file frame_decoder_test.cpp
 * @brief Tests for the incremental event-stream decoder.
 *
 * The central property: the decoded event sequence does not depend on how the
 * byte stream is split across feed() calls.
 */

#include "test_util.h"

#include <gtest/gtest.h>
#include <random>

using namespace tabflow;

namespace {

std::vector<ColumnSchema> two_columns() {
  ColumnSchema a;
  a.name = "a";
  a.type = DataType::INT64;
  ColumnSchema b;
  b.name = "b";
  b.type = DataType::STRING;
  b.index = 1;
  return {a, b};
}

FileMetadataRecord test_record() {
  FileMetadataRecord record;
  record.id = "abc";
  record.filename = "t.csv";
  record.table_name = "t_1";
  record.schema = two_columns();
  record.total_row_estimate = 5;
  record.estimated_chunk_count = 3;
  return record;
}

ChunkEvent make_chunk(uint64_t index, uint64_t first_row, uint64_t count, uint64_t before) {
  ChunkEvent chunk;
  chunk.index = index;
  for (uint64_t r = 0; r < count; ++r)
    chunk.rows.push_back(
        Row{static_cast<int64_t>(first_row + r), std::string("v, \"" + std::to_string(r) + "\"\n")});
  chunk.row_count = count;
  chunk.cumulative_rows = before + count;
  chunk.total_rows = 5;
  return chunk;
}

// metadata, chunks of 2, 2 and 1 rows, complete
std::string well_formed_stream() {
  std::string s;
  s += encode_frame(MetadataEvent{test_record()});
  s += encode_frame(make_chunk(0, 0, 2, 0));
  s += encode_frame(make_chunk(1, 2, 2, 2));
  s += encode_frame(make_chunk(2, 4, 1, 4));
  s += encode_frame(CompleteEvent{5, 3});
  return s;
}

struct Decoded {
  std::vector<StreamEvent> events;
  bool ok = true;
  Error error;
};

// Feed the stream split at the given offsets.
Decoded decode_split(const std::string& stream, const std::vector<size_t>& cuts,
                     DecoderOptions options = DecoderOptions()) {
  FrameDecoder decoder(options);
  Decoded out;
  size_t prev = 0;
  std::vector<size_t> bounds = cuts;
  bounds.push_back(stream.size());
  for (size_t cut : bounds) {
    auto r = decoder.feed(stream.data() + prev, cut - prev);
    while (auto e = decoder.next_event())
      out.events.push_back(std::move(*e));
    if (!r) {
      out.ok = false;
      out.error = r.error;
      return out;
    }
    prev = cut;
  }
  auto f = decoder.finish();
  while (auto e = decoder.next_event())
    out.events.push_back(std::move(*e));
  if (!f) {
    out.ok = false;
    out.error = f.error;
  }
  return out;
}

Decoded decode_text(const std::string& stream, DecoderOptions options = DecoderOptions()) {
  return decode_split(stream, {}, options);
}

// Compare two event sequences by their JSON payloads.
void expect_same_events(const std::vector<StreamEvent>& a, const std::vector<StreamEvent>& b) {
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(event_type(a[i]), event_type(b[i])) << "event " << i;
    EXPECT_EQ(write_json(event_to_json(a[i])), write_json(event_to_json(b[i]))) << "event " << i;
  }
}

std::string frame(const std::string& event, const std::string& data) {
  return "event: " + event + "\ndata: " + data + "\n\n";
}

} // namespace

// =============================================================================
// Well-formed streams
// =============================================================================

TEST(FrameDecoderTest, DecodesWholeStream) {
  auto out = decode_text(well_formed_stream());
  ASSERT_TRUE(out.ok) << out.error.to_string();
  ASSERT_EQ(out.events.size(), 5u);
  EXPECT_TRUE(std::holds_alternative<MetadataEvent>(out.events[0]));
  const auto& chunk = std::get<ChunkEvent>(out.events[1]);
  EXPECT_EQ(chunk.rows.size(), 2u);
  EXPECT_EQ(std::get<int64_t>(chunk.rows[1][0]), 1);
  EXPECT_EQ(std::get<std::string>(chunk.rows[1][1]), "v, \"1\"\n");
  EXPECT_EQ(std::get<CompleteEvent>(out.events[4]).final_row_count, 5u);
}

TEST(FrameDecoderTest, EncodedFrameLayout) {
  std::string f = encode_frame(CompleteEvent{5, 3});
  EXPECT_EQ(f.rfind("event: complete\ndata: {", 0), 0u);
  EXPECT_EQ(f.substr(f.size() - 2), "\n\n");
  // Exactly one data line
  EXPECT_EQ(std::count(f.begin(), f.end(), '\n'), 3);
}

TEST(FrameDecoderTest, SplitAtEveryPosition) {
  std::string stream = well_formed_stream();
  auto reference = decode_text(stream);
  ASSERT_TRUE(reference.ok);
  for (size_t cut = 0; cut <= stream.size(); ++cut) {
    auto out = decode_split(stream, {cut});
    ASSERT_TRUE(out.ok) << "cut at " << cut << ": " << out.error.to_string();
    expect_same_events(reference.events, out.events);
  }
}

TEST(FrameDecoderTest, ByteByByte) {
  std::string stream = well_formed_stream();
  std::vector<size_t> cuts;
  for (size_t i = 1; i < stream.size(); ++i)
    cuts.push_back(i);
  auto out = decode_split(stream, cuts);
  ASSERT_TRUE(out.ok);
  expect_same_events(decode_text(stream).events, out.events);
}

TEST(FrameDecoderTest, RandomPartitions) {
  std::string stream = well_formed_stream();
  auto reference = decode_text(stream).events;
  std::mt19937 rng(12345);
  for (int trial = 0; trial < 200; ++trial) {
    std::vector<size_t> cuts;
    size_t pos = 0;
    while (true) {
      pos += 1 + rng() % 40;
      if (pos >= stream.size())
        break;
      cuts.push_back(pos);
    }
    auto out = decode_split(stream, cuts);
    ASSERT_TRUE(out.ok) << "trial " << trial;
    expect_same_events(reference, out.events);
  }
}

TEST(FrameDecoderTest, DecodeStreamWithFragmentedReads) {
  std::string stream = well_formed_stream();
  for (size_t max_read : {1u, 3u, 17u, 4096u}) {
    auto events = test_util::decode_all(stream, max_read);
    ASSERT_EQ(events.size(), 5u) << "max_read " << max_read;
  }
}

TEST(FrameDecoderTest, CrlfLineEndings) {
  std::string stream = well_formed_stream();
  std::string crlf;
  for (char c : stream) {
    if (c == '\n')
      crlf += "\r\n";
    else
      crlf += c;
  }
  // The JSON escapes newlines inside strings, so every raw '\n' is a line break
  auto out = decode_text(crlf);
  ASSERT_TRUE(out.ok) << out.error.to_string();
  expect_same_events(decode_text(stream).events, out.events);

  std::vector<size_t> cuts;
  for (size_t i = 1; i < crlf.size(); ++i)
    cuts.push_back(i);
  auto split = decode_split(crlf, cuts);
  ASSERT_TRUE(split.ok);
  expect_same_events(out.events, split.events);
}

TEST(FrameDecoderTest, CommentsAndUnknownFieldsIgnored) {
  std::string stream = ": keep-alive\n\n" + std::string("id: 7\nretry: 1000\n") +
                       frame("complete", "{\"totalRows\":0,\"totalChunks\":0}");
  auto out = decode_text(stream);
  ASSERT_TRUE(out.ok) << out.error.to_string();
  ASSERT_EQ(out.events.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<CompleteEvent>(out.events[0]));
}

TEST(FrameDecoderTest, MultipleDataLinesJoined) {
  std::string stream =
      "event: complete\ndata: {\"totalRows\":0,\ndata: \"totalChunks\":0}\n\n";
  auto out = decode_text(stream);
  ASSERT_TRUE(out.ok) << out.error.to_string();
  ASSERT_EQ(out.events.size(), 1u);
}

TEST(FrameDecoderTest, FieldWithoutSpaceAfterColon) {
  auto out = decode_text("event:complete\ndata:{\"totalRows\":0,\"totalChunks\":0}\n\n");
  ASSERT_TRUE(out.ok);
  EXPECT_EQ(out.events.size(), 1u);
}

TEST(FrameDecoderTest, ExtraBlankLinesBetweenFrames) {
  std::string stream = "\n\n" + encode_frame(MetadataEvent{test_record()}) + "\n\n\r\n" +
                       encode_frame(CompleteEvent{0, 0});
  auto out = decode_text(stream);
  ASSERT_TRUE(out.ok);
  EXPECT_EQ(out.events.size(), 2u);
}

TEST(FrameDecoderTest, EventsAvailableBeforeFinish) {
  FrameDecoder decoder;
  std::string first = encode_frame(MetadataEvent{test_record()});
  ASSERT_TRUE(decoder.feed(first.data(), first.size()));
  auto e = decoder.next_event();
  ASSERT_TRUE(e.has_value());
  EXPECT_TRUE(std::holds_alternative<MetadataEvent>(*e));
  EXPECT_FALSE(decoder.next_event().has_value());
  EXPECT_EQ(decoder.frames_decoded(), 1u);
}

// =============================================================================
// Sequencing
// =============================================================================

TEST(FrameDecoderTest, ChunkIndexGapFails) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(0, 0, 2, 0)) +
                       encode_frame(make_chunk(2, 2, 2, 2));
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.kind, ErrorKind::STREAM);
  EXPECT_EQ(out.error.message, "chunk index 2 out of order, expected 1");
  EXPECT_EQ(out.events.size(), 2u);
}

TEST(FrameDecoderTest, ChunkBeforeZeroFails) {
  auto out = decode_text(encode_frame(make_chunk(1, 0, 1, 0)));
  ASSERT_FALSE(out.ok);
  EXPECT_TRUE(out.events.empty());
}

TEST(FrameDecoderTest, CumulativeMismatchFails) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(0, 0, 2, 0)) +
                       encode_frame(make_chunk(1, 2, 2, 5));
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "chunk 1 reports 7 rows streamed, expected 4");
}

TEST(FrameDecoderTest, CompleteCountMismatchFails) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(0, 0, 2, 0)) + encode_frame(CompleteEvent{3, 1});
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "complete reports 3 rows but 2 were streamed");
}

TEST(FrameDecoderTest, CompleteChunkMismatchFails) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(0, 0, 2, 0)) + encode_frame(CompleteEvent{2, 4});
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "complete reports 4 chunks but 1 were received");
}

TEST(FrameDecoderTest, MetadataAfterChunkFails) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(0, 0, 1, 0)) +
                       encode_frame(MetadataEvent{test_record()});
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "metadata event after chunk events");
}

TEST(FrameDecoderTest, FrameAfterCompleteFails) {
  std::string stream = well_formed_stream() + encode_frame(make_chunk(3, 5, 1, 5));
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "frame received after the terminal event");
  EXPECT_EQ(out.events.size(), 5u);
}

TEST(FrameDecoderTest, FrameAfterErrorFails) {
  ErrorEvent err;
  err.message = "boom";
  std::string stream = encode_frame(err) + encode_frame(CompleteEvent{0, 0});
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  ASSERT_EQ(out.events.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<ErrorEvent>(out.events[0]));
}

TEST(FrameDecoderTest, FailureIsSticky) {
  FrameDecoder decoder;
  std::string bad = encode_frame(make_chunk(5, 0, 1, 0));
  EXPECT_FALSE(decoder.feed(bad.data(), bad.size()));
  EXPECT_TRUE(decoder.failed());
  std::string good = encode_frame(CompleteEvent{0, 0});
  EXPECT_FALSE(decoder.feed(good.data(), good.size()));
  EXPECT_FALSE(decoder.finish());
}

TEST(FrameDecoderTest, TerminalSeen) {
  FrameDecoder decoder;
  std::string stream = well_formed_stream();
  ASSERT_TRUE(decoder.feed(stream.data(), stream.size()));
  EXPECT_TRUE(decoder.terminal_seen());
  EXPECT_EQ(decoder.frames_decoded(), 5u);
}

// =============================================================================
// Malformed frames
// =============================================================================

TEST(FrameDecoderTest, TruncatedFinalFrame) {
  std::string stream = well_formed_stream();
  // Drop the complete frame's final blank line
  std::string truncated = stream.substr(0, stream.size() - 1);
  auto out = decode_text(truncated);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "stream ended inside a frame");
  EXPECT_EQ(out.events.size(), 4u);
}

TEST(FrameDecoderTest, TrailingGarbageAfterTerminalIsIgnored) {
  auto out = decode_text(well_formed_stream() + "   ");
  ASSERT_TRUE(out.ok) << out.error.to_string();
}

TEST(FrameDecoderTest, InvalidJsonFailFast) {
  std::string stream = frame("chunk", "{not json");
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.kind, ErrorKind::STREAM);
  EXPECT_EQ(out.error.context, "chunk frame");
}

TEST(FrameDecoderTest, UnknownEventFailFast) {
  auto out = decode_text(frame("progress", "{}"));
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "unknown event type 'progress'");
}

TEST(FrameDecoderTest, MissingFieldsFailFast) {
  auto no_event = decode_text("data: {}\n\n");
  ASSERT_FALSE(no_event.ok);
  EXPECT_EQ(no_event.error.message, "frame has no event field");
  auto no_data = decode_text("event: complete\n\n");
  ASSERT_FALSE(no_data.ok);
  EXPECT_EQ(no_data.error.message, "complete frame has no data field");
}

TEST(FrameDecoderTest, PermissiveDropsMalformedFrames) {
  DecoderOptions options;
  options.error_mode = ErrorMode::PERMISSIVE;
  std::string stream = encode_frame(MetadataEvent{test_record()}) + frame("chunk", "{oops") +
                       frame("progress", "{}") + encode_frame(make_chunk(0, 0, 2, 0)) +
                       encode_frame(CompleteEvent{2, 1});
  FrameDecoder decoder(options);
  ASSERT_TRUE(decoder.feed(stream.data(), stream.size()));
  ASSERT_TRUE(decoder.finish());
  size_t n = 0;
  while (decoder.next_event())
    ++n;
  EXPECT_EQ(n, 3u);
  EXPECT_EQ(decoder.frames_dropped(), 2u);
  ASSERT_EQ(decoder.warnings().size(), 2u);
  EXPECT_EQ(decoder.warnings()[1].message, "unknown event type 'progress'");
}

TEST(FrameDecoderTest, PermissiveStillEnforcesOrdering) {
  DecoderOptions options;
  options.error_mode = ErrorMode::PERMISSIVE;
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(1, 0, 2, 0));
  auto out = decode_text(stream, options);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "chunk index 1 out of order, expected 0");
}

TEST(FrameDecoderTest, PermissiveTruncatedFrameIsDropped) {
  DecoderOptions options;
  options.error_mode = ErrorMode::PERMISSIVE;
  std::string stream = encode_frame(MetadataEvent{test_record()}) + "event: chunk\ndata: {";
  FrameDecoder decoder(options);
  ASSERT_TRUE(decoder.feed(stream.data(), stream.size()));
  ASSERT_TRUE(decoder.finish());
  EXPECT_EQ(decoder.frames_dropped(), 1u);
  EXPECT_FALSE(decoder.terminal_seen());
}

// Metadata payloads whose members carry the wrong JSON type
std::vector<std::pair<std::string, std::string>> mistyped_metadata() {
  Json::Value base = event_to_json(MetadataEvent{test_record()});
  Json::Value bad_filename = base;
  bad_filename["filename"] = Json::Value(Json::arrayValue);
  bad_filename["filename"].append(1);
  Json::Value bad_nullable = base;
  bad_nullable["schema"][0]["nullable"] = "yes";
  Json::Value bad_exact = base;
  bad_exact["rowCountExact"] = 1;
  Json::Value bad_url = base;
  bad_url["storageUrl"] = Json::Value(Json::objectValue);
  return {{write_json(bad_filename), "field 'filename' must be a string"},
          {write_json(bad_nullable), "field 'nullable' must be a boolean"},
          {write_json(bad_exact), "field 'rowCountExact' must be a boolean"},
          {write_json(bad_url), "field 'storageUrl' must be a string"}};
}

TEST(FrameDecoderTest, MistypedMembersFailFast) {
  for (const auto& [payload, message] : mistyped_metadata()) {
    auto out = decode_text(frame("metadata", payload));
    ASSERT_FALSE(out.ok) << payload;
    EXPECT_EQ(out.error.kind, ErrorKind::STREAM);
    EXPECT_EQ(out.error.message, message);
    EXPECT_EQ(out.error.context, "metadata frame");
  }

  auto error_object = decode_text(frame("error", R"({"error":{"a":1}})"));
  ASSERT_FALSE(error_object.ok);
  EXPECT_EQ(error_object.error.message, "field 'error' must be a string");
  EXPECT_EQ(error_object.error.context, "error frame");

  auto error_number = decode_text(frame("error", R"({"error":42,"chunkIndex":0})"));
  ASSERT_FALSE(error_number.ok);
  EXPECT_EQ(error_number.error.message, "field 'error' must be a string");
}

TEST(FrameDecoderTest, MistypedMembersDroppedWhenPermissive) {
  DecoderOptions options;
  options.error_mode = ErrorMode::PERMISSIVE;
  std::string stream;
  for (const auto& entry : mistyped_metadata())
    stream += frame("metadata", entry.first);
  stream += frame("error", R"({"error":{"a":1}})");
  stream += encode_frame(MetadataEvent{test_record()});
  stream += encode_frame(make_chunk(0, 0, 2, 0));
  stream += encode_frame(CompleteEvent{2, 1});

  FrameDecoder decoder(options);
  ASSERT_TRUE(decoder.feed(stream.data(), stream.size()));
  ASSERT_TRUE(decoder.finish());
  std::vector<StreamEvent> events;
  while (auto e = decoder.next_event())
    events.push_back(std::move(*e));
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(event_type(events[0]), EventType::METADATA);
  EXPECT_EQ(event_type(events[2]), EventType::COMPLETE);
  EXPECT_EQ(decoder.frames_dropped(), 5u);
  ASSERT_EQ(decoder.warnings().size(), 5u);
  EXPECT_EQ(decoder.warnings()[1].message, "field 'nullable' must be a boolean");
  EXPECT_EQ(decoder.warnings()[4].message, "field 'error' must be a string");
}

TEST(FrameDecoderTest, RowWidthCheckedAgainstMetadataSchema) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       frame("chunk", "{\"chunkIndex\":0,\"rowCount\":1,\"totalRowsStreamed\":1,"
                                      "\"data\":[[1]]}");
  auto out = decode_text(stream);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "row has 1 cells, expected 2");
}

TEST(FrameDecoderTest, MaxFrameBytes) {
  DecoderOptions options;
  options.max_frame_bytes = 64;
  std::string stream = encode_frame(MetadataEvent{test_record()});
  ASSERT_GT(stream.size(), 64u);
  auto out = decode_text(stream, options);
  ASSERT_FALSE(out.ok);
  EXPECT_EQ(out.error.message, "frame exceeds 64 bytes");

  // A line that never ends is caught before it is complete
  std::vector<size_t> cuts;
  for (size_t i = 10; i < 200; i += 10)
    cuts.push_back(i);
  auto endless = decode_split("data: " + std::string(200, 'x'), cuts, options);
  ASSERT_FALSE(endless.ok);
  EXPECT_EQ(endless.error.message, "frame exceeds 64 bytes");
}

TEST(FrameDecoderTest, SmallFramesUnderLimitAcrossManyFrames) {
  DecoderOptions options;
  options.max_frame_bytes = 128;
  std::string stream;
  for (int i = 0; i < 50; ++i)
    stream += ": ping\n\n";
  stream += encode_frame(CompleteEvent{0, 0});
  auto out = decode_text(stream, options);
  ASSERT_TRUE(out.ok) << out.error.to_string();
  EXPECT_EQ(out.events.size(), 1u);
}

// =============================================================================
// decode_stream
// =============================================================================

TEST(DecodeStreamTest, HandlerFailureStops) {
  MemoryByteSource source(well_formed_stream());
  FrameDecoder decoder;
  size_t seen = 0;
  auto r = decode_stream(source, decoder, [&](StreamEvent&&) {
    if (++seen == 2)
      return Result<void>::failure(Error::materialization("engine full"));
    return Result<void>::success();
  });
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error.kind, ErrorKind::MATERIALIZATION);
  EXPECT_EQ(seen, 2u);
}

TEST(DecodeStreamTest, EventsBeforeFailureAreDelivered) {
  std::string stream = encode_frame(MetadataEvent{test_record()}) +
                       encode_frame(make_chunk(0, 0, 2, 0)) + frame("chunk", "{bad");
  MemoryByteSource source(stream);
  FrameDecoder decoder;
  size_t seen = 0;
  auto r = decode_stream(source, decoder, [&](StreamEvent&&) {
    ++seen;
    return Result<void>::success();
  });
  ASSERT_FALSE(r);
  EXPECT_EQ(seen, 2u);
}

TEST(DecodeStreamTest, CountsDeliveredEvents) {
  MemoryByteSource source(well_formed_stream(), 7);
  FrameDecoder decoder;
  auto r = decode_stream(
      source, decoder, [](StreamEvent&&) { return Result<void>::success(); }, 5);
  ASSERT_TRUE(r);
  EXPECT_EQ(r.value, 5u);
}
