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

#include "dremel/util/rle_encoding.h"

#include <algorithm>
#include <cstring>

#include "dremel/util/bitmap.h"
#include "dremel/util/bpacking.h"
#include "dremel/util/logging.h"

namespace dremel {
namespace util {

namespace {

// Values per bit-packing block.
constexpr int kPackBlockSize = 32;

// Runs longer than this are split so that the indicator fits a 32-bit varint.
constexpr int64_t kMaxRepeatedRunLength = std::numeric_limits<int32_t>::max();

// A run is RLE encoded only once it is longer than this.
constexpr int64_t kMinRepeatedRunLength = 8;

}  // namespace

Status RleBitPackedEncoder::ValidateBitWidth(int bit_width) {
  if (bit_width < 0 || bit_width > kMaxRleBitWidth) {
    return Status::Invalid("RLE bit width must be between 0 and ", kMaxRleBitWidth,
                           ", got ", bit_width);
  }
  return Status::OK();
}

Result<std::unique_ptr<RleBitPackedEncoder>> RleBitPackedEncoder::Make(
    io::OutputStream* sink, int bit_width, int64_t max_literal_run) {
  RETURN_NOT_OK(ValidateBitWidth(bit_width));
  if (max_literal_run <= 0 || !bit_util::IsMultipleOf8(max_literal_run)) {
    return Status::Invalid("Maximum literal run length must be a positive multiple of 8, got ",
                           max_literal_run);
  }
  if (sink == NULLPTR) {
    return Status::Invalid("RLE encoder requires an output stream");
  }
  return std::unique_ptr<RleBitPackedEncoder>(
      new RleBitPackedEncoder(sink, bit_width, max_literal_run));
}

RleBitPackedEncoder::RleBitPackedEncoder(io::OutputStream* sink, int bit_width,
                                         int64_t max_literal_run)
    : sink_(sink),
      bit_width_(bit_width),
      max_literal_run_(max_literal_run),
      buffered_values_(static_cast<size_t>(max_literal_run)),
      num_values_(0),
      bytes_written_(0) {
  ResetRunState();
}

void RleBitPackedEncoder::ResetRunState() {
  num_buffered_values_ = 0;
  literal_count_ = 0;
  repeat_count_ = 0;
  // A leading zero counts toward a repeated run.
  current_value_ = 0;
}

Status RleBitPackedEncoder::Put(uint32_t value) {
  DREMEL_DCHECK(bit_width_ == 32 || (static_cast<uint64_t>(value) >> bit_width_) == 0)
      << "value " << value << " does not fit in " << bit_width_ << " bits";
  ++num_values_;

  if (value == current_value_) {
    ++repeat_count_;
    if (repeat_count_ > kMinRepeatedRunLength) {
      // Already an RLE run, nothing to buffer
      return Status::OK();
    }
    if (repeat_count_ == kMinRepeatedRunLength) {
      // Move repeats into the literal run so that it ends on a group boundary
      const int64_t padding = (8 - literal_count_ % 8) % 8;
      repeat_count_ -= padding;
      literal_count_ += padding;
    }
  } else if (repeat_count_ > kMinRepeatedRunLength) {
    if (literal_count_ > 0) {
      RETURN_NOT_OK(FlushLiteralRun(literal_count_));
      literal_count_ = 0;
    }
    RETURN_NOT_OK(FlushRepeatedRun(repeat_count_, current_value_));
    repeat_count_ = 1;
    num_buffered_values_ = 0;
  } else {
    // The previous run was too short, so it joins the literal run
    literal_count_ = num_buffered_values_;
    repeat_count_ = 1;
  }

  if (num_buffered_values_ == max_literal_run_) {
    RETURN_NOT_OK(FlushLiteralRun(num_buffered_values_));
    // Repeats written as literals no longer count toward the run
    repeat_count_ -= num_buffered_values_ - literal_count_;
    num_buffered_values_ = 0;
    literal_count_ = 0;
  }
  buffered_values_[num_buffered_values_++] = value;
  current_value_ = value;
  return Status::OK();
}

Status RleBitPackedEncoder::Flush() {
  if (repeat_count_ <= kMinRepeatedRunLength) {
    literal_count_ = num_buffered_values_;
    repeat_count_ = 0;
  }
  if (literal_count_ > 0) {
    RETURN_NOT_OK(FlushLiteralRun(literal_count_));
  }
  if (repeat_count_ > kMinRepeatedRunLength) {
    RETURN_NOT_OK(FlushRepeatedRun(repeat_count_, current_value_));
  }
  ResetRunState();
  return sink_->Flush();
}

Status RleBitPackedEncoder::WriteBytes(const uint8_t* data, int64_t nbytes) {
  RETURN_NOT_OK(sink_->Write(data, nbytes));
  bytes_written_ += nbytes;
  return Status::OK();
}

Status RleBitPackedEncoder::FlushLiteralRun(int64_t count) {
  DREMEL_DCHECK_GT(count, 0);
  DREMEL_DCHECK_LE(count, num_buffered_values_);

  uint8_t header[bit_util::BitWriter::kMaxVlqByteLength];
  bit_util::BitWriter header_writer(header, static_cast<int>(sizeof(header)));
  const uint32_t num_groups = static_cast<uint32_t>(bit_util::CeilDiv(count, 8));
  DREMEL_CHECK(header_writer.PutVlqInt((num_groups << 1) | 1));
  header_writer.Flush();
  RETURN_NOT_OK(WriteBytes(header, header_writer.bytes_written()));

  uint8_t packed[sizeof(uint32_t) * kPackBlockSize];
  const int64_t block_bytes = 4 * bit_width_;
  const uint32_t* values = buffered_values_.data();
  int64_t i = 0;
  for (; i + kPackBlockSize <= count; i += kPackBlockSize) {
    internal::Pack<uint32_t>(values + i, packed, bit_width_);
    RETURN_NOT_OK(WriteBytes(packed, block_bytes));
  }

  const int64_t remainder = count - i;
  if (remainder > 0) {
    // Zero-pad the last block; only its complete groups of 8 are written
    uint32_t block[kPackBlockSize] = {};
    std::copy(values + i, values + count, block);
    internal::Pack<uint32_t>(block, packed, bit_width_);
    RETURN_NOT_OK(WriteBytes(packed, bit_util::CeilDiv(remainder, 8) * bit_width_));
  }
  return Status::OK();
}

Status RleBitPackedEncoder::FlushRepeatedRun(int64_t run_length, uint32_t value) {
  DREMEL_DCHECK_GT(run_length, 0);
  const int value_bytes = static_cast<int>(bit_util::BytesForBits(bit_width_));

  while (run_length > 0) {
    const int64_t chunk = std::min(run_length, kMaxRepeatedRunLength);
    uint8_t buffer[bit_util::BitWriter::kMaxVlqByteLength + sizeof(uint32_t)];
    bit_util::BitWriter writer(buffer, static_cast<int>(sizeof(buffer)));
    DREMEL_CHECK(writer.PutVlqInt(static_cast<uint32_t>(chunk) << 1));
    DREMEL_CHECK(writer.PutAligned(value, value_bytes));
    writer.Flush();
    RETURN_NOT_OK(WriteBytes(buffer, writer.bytes_written()));
    run_length -= chunk;
  }
  return Status::OK();
}

Status EncodeRleBitPacked(const uint32_t* values, int64_t num_values, int bit_width,
                          io::OutputStream* sink, int64_t max_literal_run) {
  DREMEL_ASSIGN_OR_RAISE(auto encoder,
                         RleBitPackedEncoder::Make(sink, bit_width, max_literal_run));
  for (int64_t i = 0; i < num_values; ++i) {
    RETURN_NOT_OK(encoder->Put(values[i]));
  }
  return encoder->Flush();
}

Status EncodeRleBitPacked(const int16_t* values, int64_t num_values, int bit_width,
                          io::OutputStream* sink, int64_t max_literal_run) {
  for (int64_t i = 0; i < num_values; ++i) {
    if (DREMEL_PREDICT_FALSE(values[i] < 0)) {
      return Status::Invalid("Cannot RLE encode negative value ", values[i],
                             " at position ", i);
    }
  }
  DREMEL_ASSIGN_OR_RAISE(auto encoder,
                         RleBitPackedEncoder::Make(sink, bit_width, max_literal_run));
  for (int64_t i = 0; i < num_values; ++i) {
    RETURN_NOT_OK(encoder->Put(static_cast<uint32_t>(values[i])));
  }
  return encoder->Flush();
}

Status EncodeBitmapRle(const uint8_t* bitmap, int64_t offset, int64_t length,
                       io::OutputStream* sink) {
  DREMEL_ASSIGN_OR_RAISE(auto encoder, RleBitPackedEncoder::Make(sink, /*bit_width=*/1));
  internal::BitmapReader reader(bitmap, offset, length);
  for (int64_t i = 0; i < length; ++i) {
    RETURN_NOT_OK(encoder->Put(reader.IsSet() ? 1 : 0));
    reader.Next();
  }
  return encoder->Flush();
}

}  // namespace util
}  // namespace dremel
