#include "framer.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <cstdio>
#include <vector>

using fortrec::ByteOrder;
using fortrec::Bytes;
using fortrec::ErrorKind;
using fortrec::FrameConfig;
using fortrec::MarkerWidth;

static FrameConfig little4() {
  FrameConfig c;
  c.marker_width = MarkerWidth::Four;
  c.byte_order = ByteOrder::Little;
  return c;
}

static Bytes contents(FILE* f) {
  std::rewind(f);
  Bytes out;
  int ch;
  while ((ch = std::fgetc(f)) != EOF) out.push_back(static_cast<uint8_t>(ch));
  std::rewind(f);
  return out;
}

static void fill(FILE* f, const Bytes& bytes) {
  std::fwrite(bytes.data(), 1, bytes.size(), f);
  std::rewind(f);
}

// --- FramerTests ---
TEST(FramerTests, MarkerEncoding) {
  EXPECT_EQ(fortrec::encode_marker(8, little4()), (Bytes{8, 0, 0, 0}));
  FrameConfig big8;
  big8.marker_width = MarkerWidth::Eight;
  big8.byte_order = ByteOrder::Big;
  EXPECT_EQ(fortrec::encode_marker(258, big8), (Bytes{0, 0, 0, 0, 0, 0, 1, 2}));
  Bytes negative = {0xFF, 0xFF, 0xFF, 0xFF};
  EXPECT_EQ(fortrec::decode_marker(negative.data(), little4()), -1);
}

TEST(FramerTests, WritesMarkerBodyMarker) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  Bytes body = {1, 0, 0, 0};
  ASSERT_TRUE(fortrec::write_record(f, body, little4()).ok());
  EXPECT_EQ(std::ftell(f), 12);
  EXPECT_EQ(contents(f), (Bytes{4, 0, 0, 0, 1, 0, 0, 0, 4, 0, 0, 0}));
  std::fclose(f);
}

TEST(FramerTests, EightByteMarkers) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  FrameConfig c = little4();
  c.marker_width = MarkerWidth::Eight;
  Bytes body = {9, 9, 9};
  ASSERT_TRUE(fortrec::write_record(f, body, c).ok());
  EXPECT_EQ(std::ftell(f), 19);
  std::rewind(f);
  auto r = fortrec::read_record(f, c);
  ASSERT_TRUE(r.ok()) << r.error.message;
  EXPECT_EQ(r.body, body);
  std::fclose(f);
}

TEST(FramerTests, ReadsBackWhatWasWritten) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  std::vector<Bytes> bodies = {{}, {0}, {1, 2, 3, 4, 5}, Bytes(70000, 0xAB)};
  for (const Bytes& b : bodies) ASSERT_TRUE(fortrec::write_record(f, b, little4()).ok());
  std::rewind(f);
  for (const Bytes& b : bodies) {
    auto r = fortrec::read_record(f, little4());
    ASSERT_TRUE(r.ok()) << r.error.message;
    EXPECT_EQ(r.body, b);
  }
  auto end = fortrec::read_record(f, little4());
  EXPECT_TRUE(end.at_eof());
  EXPECT_EQ(end.error.kind, ErrorKind::EndOfFile);
  std::fclose(f);
}

TEST(FramerTests, FlippedTrailingMarkerBitIsFramingError) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  fill(f, {4, 0, 0, 0, 1, 0, 0, 0, 4 ^ 0x10, 0, 0, 0});
  auto r = fortrec::read_record(f, little4());
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.error.kind, ErrorKind::RecordFraming);
  EXPECT_TRUE(r.body.empty());
  std::fclose(f);
}

TEST(FramerTests, WrongMarkerWidthIsDetected) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  FrameConfig c8 = little4();
  c8.marker_width = MarkerWidth::Eight;
  ASSERT_TRUE(fortrec::write_record(f, Bytes{1, 2, 3, 4}, c8).ok());
  std::rewind(f);
  auto r = fortrec::read_record(f, little4());
  EXPECT_FALSE(r.ok());
  std::fclose(f);
}

TEST(FramerTests, NegativeLeadingMarkerIsMalformed) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  fill(f, {0xFE, 0xFF, 0xFF, 0xFF, 0, 0});
  auto r = fortrec::read_record(f, little4());
  EXPECT_EQ(r.error.kind, ErrorKind::MalformedRecord);
  std::fclose(f);
}

TEST(FramerTests, MarkerPastEndOfStreamIsMalformed) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  fill(f, {0x00, 0x00, 0x00, 0x70, 1, 2, 3});
  auto r = fortrec::read_record(f, little4());
  EXPECT_EQ(r.error.kind, ErrorKind::MalformedRecord);
  std::fclose(f);
}

TEST(FramerTests, TruncatedMarkersAreMalformed) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  fill(f, {4, 0});
  EXPECT_EQ(fortrec::read_record(f, little4()).error.kind, ErrorKind::MalformedRecord);
  std::fclose(f);

  f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  fill(f, {2, 0, 0, 0, 7, 7, 2, 0});
  EXPECT_EQ(fortrec::read_record(f, little4()).error.kind, ErrorKind::MalformedRecord);
  std::fclose(f);
}

TEST(FramerTests, EmptyStreamIsEndOfFile) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  auto r = fortrec::read_record(f, little4());
  EXPECT_TRUE(r.at_eof());
  std::fclose(f);
}

TEST(FramerTests, BigEndianMarkers) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  FrameConfig big;
  big.byte_order = ByteOrder::Big;
  ASSERT_TRUE(fortrec::write_record(f, Bytes{5, 6}, big).ok());
  EXPECT_EQ(contents(f), (Bytes{0, 0, 0, 2, 5, 6, 0, 0, 0, 2}));
  auto little = fortrec::read_record(f, little4());
  EXPECT_EQ(little.error.kind, ErrorKind::MalformedRecord);
  std::rewind(f);
  auto r = fortrec::read_record(f, big);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.body, (Bytes{5, 6}));
  std::fclose(f);
}
