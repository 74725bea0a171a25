// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "dremel/io/memory.h"
#include "dremel/io/test_common.h"
#include "dremel/testing/gtest_util.h"
#include "dremel/util/bit_util.h"
#include "dremel/util/rle_encoding.h"

namespace dremel {
namespace util {

namespace {

std::vector<uint8_t> Encode(const std::vector<uint32_t>& values, int bit_width,
                            int64_t max_literal_run = kDefaultMaxLiteralRunLength) {
  io::BufferOutputStream sink;
  Status st = EncodeRleBitPacked(values.data(), static_cast<int64_t>(values.size()),
                                 bit_width, &sink, max_literal_run);
  EXPECT_TRUE(st.ok()) << st.ToString();
  auto maybe_buffer = sink.Finish();
  EXPECT_TRUE(maybe_buffer.ok());
  return std::move(maybe_buffer).ValueOr({});
}

std::vector<uint32_t> Decode(const std::vector<uint8_t>& buffer, int bit_width,
                             int num_values) {
  RleBitPackedDecoder decoder(buffer.data(), static_cast<int>(buffer.size()), bit_width);
  std::vector<uint32_t> values(num_values);
  EXPECT_EQ(decoder.GetBatch(values.data(), num_values), num_values);
  return values;
}

void CheckRoundTrip(const std::vector<uint32_t>& values, int bit_width,
                    int64_t max_literal_run = kDefaultMaxLiteralRunLength) {
  auto buffer = Encode(values, bit_width, max_literal_run);
  ASSERT_EQ(Decode(buffer, bit_width, static_cast<int>(values.size())), values)
      << "bit_width " << bit_width << " max_literal_run " << max_literal_run;
}

}  // namespace

TEST(RleEncoder, MixedValuesBitPacked) {
  auto buffer = Encode({0, 1, 2, 1, 2, 1, 1, 0, 3}, 2);
  std::vector<uint8_t> expected = {5, 0b01100100, 0b00010110, 0b00000011, 0b00000000};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, LongLiteralRun) {
  std::vector<uint32_t> values;
  for (uint32_t i = 0; i < 128; ++i) {
    values.push_back(i % 4);
  }
  auto buffer = Encode(values, 2);
  std::vector<uint8_t> expected = {(16 << 1) | 1};
  expected.resize(33, 0b11100100);
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, ShortRunsStayLiteral) {
  auto buffer = Encode({3, 3, 0, 3, 2, 3, 3, 3, 3, 1, 3, 3, 3, 0, 3}, 2);
  std::vector<uint8_t> expected = {5, 207, 254, 247, 51};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, EightEqualValuesAreBitPacked) {
  auto buffer = Encode(std::vector<uint32_t>(8, 1), 1);
  std::vector<uint8_t> expected = {3, 0xFF};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, RepeatedRun) {
  // The indicator 100 << 1 = 200 does not fit in seven bits
  auto buffer = Encode(std::vector<uint32_t>(100, 0), 1);
  std::vector<uint8_t> expected = {0xC8, 0x01, 0x00};
  ASSERT_EQ(buffer, expected);

  buffer = Encode(std::vector<uint32_t>(60, 1), 1);
  expected = {60 << 1, 0x01};
  ASSERT_EQ(buffer, expected);

  // 300 copies needs a two byte indicator, the value takes two bytes at width 9
  buffer = Encode(std::vector<uint32_t>(300, 0x1AB), 9);
  expected = {0xD8, 0x04, 0xAB, 0x01};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, LiteralThenRepeatedRun) {
  std::vector<uint32_t> values = {1, 2, 3};
  values.resize(23, 5);
  auto buffer = Encode(values, 3);
  // Five of the repeats pad the literal run to one group of eight
  ASSERT_EQ(buffer.size(), 1 + 3 + 2);
  ASSERT_EQ(buffer[0], 3);
  ASSERT_EQ(buffer[4], 15 << 1);
  ASSERT_EQ(buffer[5], 5);
  CheckRoundTrip(values, 3);
}

TEST(RleEncoder, RepeatedRunThenLiterals) {
  std::vector<uint32_t> values(20, 7);
  values.push_back(1);
  values.push_back(2);
  auto buffer = Encode(values, 3);
  ASSERT_EQ(buffer[0], 20 << 1);
  ASSERT_EQ(buffer[1], 7);
  ASSERT_EQ(buffer[2], 3);
  CheckRoundTrip(values, 3);
}

TEST(RleEncoder, EmptyInput) {
  ASSERT_TRUE(Encode({}, 3).empty());
  ASSERT_TRUE(Encode({}, 0).empty());
}

TEST(RleEncoder, BitmapRuns) {
  const uint8_t bitmap[] = {0b10011101, 0b10011101};
  io::BufferOutputStream sink;
  ASSERT_OK(EncodeBitmapRle(bitmap, 0, 14, &sink));
  ASSERT_OK_AND_ASSIGN(auto buffer, sink.Finish());
  std::vector<uint8_t> expected = {5, 0b10011101, 0b00011101};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, BitmapWithOffset) {
  auto bitmap = BitmapFromVector(std::vector<bool>(8, true), 5);
  io::BufferOutputStream sink;
  ASSERT_OK(EncodeBitmapRle(bitmap.data(), 5, 8, &sink));
  ASSERT_OK_AND_ASSIGN(auto buffer, sink.Finish());
  std::vector<uint8_t> expected = {3, 0xFF};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, LongBitmapRun) {
  auto bitmap = BitmapFromVector(std::vector<bool>(1000, true));
  io::BufferOutputStream sink;
  ASSERT_OK(EncodeBitmapRle(bitmap.data(), 0, 1000, &sink));
  ASSERT_OK_AND_ASSIGN(auto buffer, sink.Finish());
  // varint(2000) followed by the value byte
  std::vector<uint8_t> expected = {0xD0, 0x0F, 1};
  ASSERT_EQ(buffer, expected);
}

TEST(RleEncoder, RoundTripPatterns) {
  for (int bit_width : {0, 1, 2, 5, 8, 13, 16, 31, 32}) {
    const uint64_t max_value =
        bit_width == 32 ? 0xFFFFFFFFULL : (1ULL << bit_width) - 1;
    std::vector<uint32_t> all_equal(1000, static_cast<uint32_t>(max_value));
    CheckRoundTrip(all_equal, bit_width);

    std::vector<uint32_t> alternating;
    for (int i = 0; i < 1001; ++i) {
      alternating.push_back(i % 2 == 0 ? 0 : static_cast<uint32_t>(max_value));
    }
    CheckRoundTrip(alternating, bit_width);

    // Runs of every length from 1 to 20 so that runs start at all group offsets
    std::vector<uint32_t> runs;
    uint32_t value = 0;
    for (int length = 1; length <= 20; ++length) {
      runs.insert(runs.end(), length, value);
      value = static_cast<uint32_t>((value + 1) & max_value);
    }
    CheckRoundTrip(runs, bit_width);
  }
}

TEST(RleEncoder, RoundTripRandomRuns) {
  std::mt19937 rng(1234);
  for (int bit_width : {1, 3, 7, 12, 20}) {
    std::uniform_int_distribution<uint32_t> value_dist(0, (1U << bit_width) - 1);
    std::geometric_distribution<int> length_dist(0.15);
    std::vector<uint32_t> values;
    while (values.size() < 5000) {
      values.insert(values.end(), length_dist(rng) + 1, value_dist(rng));
    }
    CheckRoundTrip(values, bit_width);
  }
}

TEST(RleEncoder, SmallMaxLiteralRun) {
  std::mt19937 rng(99);
  std::uniform_int_distribution<uint32_t> value_dist(0, 3);
  std::vector<uint32_t> values;
  for (int i = 0; i < 500; ++i) {
    values.push_back(value_dist(rng));
  }
  std::vector<uint32_t> with_runs = values;
  with_runs.insert(with_runs.begin() + 100, 40, 2);
  with_runs.insert(with_runs.begin() + 13, 9, 1);

  for (int64_t max_literal_run : {8, 16, 24, 64}) {
    CheckRoundTrip(values, 2, max_literal_run);
    CheckRoundTrip(with_runs, 2, max_literal_run);

    // No literal run may hold more groups than the bound allows
    auto buffer = Encode(values, 2, max_literal_run);
    bit_util::BitReader reader(buffer.data(), static_cast<int>(buffer.size()));
    uint32_t indicator = 0;
    while (reader.GetVlqInt(&indicator)) {
      if (indicator & 1) {
        const uint32_t groups = indicator >> 1;
        ASSERT_LE(groups * 8, max_literal_run);
        // Two bytes per group of eight at width 2
        for (uint32_t g = 0; g < groups * 2; ++g) {
          uint8_t byte = 0;
          ASSERT_TRUE(reader.GetAligned<uint8_t>(1, &byte));
        }
      } else {
        uint8_t byte = 0;
        ASSERT_TRUE(reader.GetAligned<uint8_t>(1, &byte));
      }
    }
  }
}

TEST(RleEncoder, IncrementalPutAndFlush) {
  io::BufferOutputStream sink;
  ASSERT_OK_AND_ASSIGN(auto encoder, RleBitPackedEncoder::Make(&sink, 2));
  ASSERT_EQ(encoder->bit_width(), 2);
  for (uint32_t v : {0, 1, 2, 1, 2, 1, 1, 0, 3}) {
    ASSERT_OK(encoder->Put(v));
  }
  ASSERT_EQ(encoder->num_values(), 9);
  ASSERT_EQ(encoder->bytes_written(), 0);
  ASSERT_OK(encoder->Flush());
  ASSERT_EQ(encoder->bytes_written(), 5);

  // After a flush the encoder starts over, so the same input yields the same bytes
  for (uint32_t v : {0, 1, 2, 1, 2, 1, 1, 0, 3}) {
    ASSERT_OK(encoder->Put(v));
  }
  ASSERT_OK(encoder->Flush());
  ASSERT_EQ(encoder->num_values(), 18);
  ASSERT_OK_AND_ASSIGN(auto buffer, sink.Finish());
  ASSERT_EQ(buffer.size(), 10);
  ASSERT_EQ(std::vector<uint8_t>(buffer.begin(), buffer.begin() + 5),
            std::vector<uint8_t>(buffer.begin() + 5, buffer.end()));
}

TEST(RleEncoder, Int16Levels) {
  std::vector<int16_t> levels = {1, 1, 0, 1, 1, 1, 1, 1, 1, 0, 1, 1, 1, 0, 1};
  io::BufferOutputStream sink;
  ASSERT_OK(EncodeRleBitPacked(levels.data(), static_cast<int64_t>(levels.size()), 1,
                               &sink));
  ASSERT_OK_AND_ASSIGN(auto buffer, sink.Finish());

  RleBitPackedDecoder decoder(buffer.data(), static_cast<int>(buffer.size()), 1);
  std::vector<int16_t> decoded(levels.size());
  ASSERT_EQ(decoder.GetBatch(decoded.data(), static_cast<int>(decoded.size())),
            static_cast<int>(levels.size()));
  ASSERT_EQ(decoded, levels);
}

TEST(RleEncoder, NegativeLevelIsInvalid) {
  std::vector<int16_t> levels = {0, 1, -1};
  io::BufferOutputStream sink;
  ASSERT_RAISES(Invalid, EncodeRleBitPacked(levels.data(), 3, 1, &sink));

  // Rejected before any run is written, even when earlier runs are complete
  levels.assign(40, 0);
  for (size_t i = 0; i < 24; i += 2) {
    levels[i] = 1;
  }
  levels.push_back(-2);
  ASSERT_RAISES(Invalid,
                EncodeRleBitPacked(levels.data(), static_cast<int64_t>(levels.size()), 1,
                                   &sink, /*max_literal_run=*/8));
  ASSERT_OK_AND_ASSIGN(int64_t position, sink.Tell());
  ASSERT_EQ(position, 0);
}

TEST(RleEncoder, InvalidArguments) {
  io::BufferOutputStream sink;
  ASSERT_RAISES(Invalid, RleBitPackedEncoder::Make(&sink, 33));
  ASSERT_RAISES(Invalid, RleBitPackedEncoder::Make(&sink, -1));
  ASSERT_RAISES(Invalid, RleBitPackedEncoder::Make(&sink, 3, 12));
  ASSERT_RAISES(Invalid, RleBitPackedEncoder::Make(&sink, 3, 0));
  ASSERT_RAISES(Invalid, RleBitPackedEncoder::Make(nullptr, 3));
  ASSERT_OK(RleBitPackedEncoder::ValidateBitWidth(0));
  ASSERT_OK(RleBitPackedEncoder::ValidateBitWidth(32));

  std::vector<uint32_t> values = {1, 2};
  ASSERT_RAISES(Invalid, EncodeRleBitPacked(values.data(), 2, 40, &sink));
  ASSERT_OK_AND_ASSIGN(int64_t position, sink.Tell());
  ASSERT_EQ(position, 0);
}

TEST(RleEncoder, SinkErrorPropagates) {
  std::vector<uint32_t> values(64);
  for (size_t i = 0; i < values.size(); ++i) {
    values[i] = static_cast<uint32_t>(i % 3);
  }
  io::FailingOutputStream sink(/*capacity=*/4);
  Status st = EncodeRleBitPacked(values.data(), 64, 2, &sink);
  ASSERT_TRUE(st.IsIOError()) << st.ToString();
  ASSERT_NE(st.message().find("disk full"), std::string::npos);

  // Repeated runs are written during Put once the value changes
  io::FailingOutputStream run_sink(/*capacity=*/0);
  ASSERT_OK_AND_ASSIGN(auto encoder, RleBitPackedEncoder::Make(&run_sink, 1));
  for (int i = 0; i < 20; ++i) {
    ASSERT_OK(encoder->Put(1));
  }
  ASSERT_RAISES(IOError, encoder->Put(0));
}

TEST(RleDecoder, StopsAtEndOfData) {
  auto buffer = Encode({0, 1, 2, 1, 2, 1, 1, 0, 3}, 2);
  RleBitPackedDecoder decoder(buffer.data(), static_cast<int>(buffer.size()), 2);
  std::vector<uint32_t> values(32);
  // The literal run holds two padded groups
  ASSERT_EQ(decoder.GetBatch(values.data(), 32), 16);
  uint32_t extra = 0;
  ASSERT_FALSE(decoder.Get(&extra));
}

TEST(RleDecoder, RejectsZeroLengthRuns) {
  const uint8_t repeated[] = {0, 1};
  RleBitPackedDecoder decoder(repeated, 2, 1);
  uint32_t value = 0;
  ASSERT_FALSE(decoder.Get(&value));

  const uint8_t literal[] = {1, 0xFF};
  decoder.Reset(literal, 2, 1);
  ASSERT_FALSE(decoder.Get(&value));
}

}  // namespace util
}  // namespace dremel
