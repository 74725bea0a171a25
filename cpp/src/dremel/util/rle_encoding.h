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

// Imported from Apache Impala (incubating) on 2016-01-29 and modified for use
// in parquet-cpp, Arrow

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include "dremel/io/interfaces.h"
#include "dremel/result.h"
#include "dremel/status.h"
#include "dremel/util/bit_stream_utils.h"
#include "dremel/util/bit_util.h"
#include "dremel/util/macros.h"
#include "dremel/util/visibility.h"

namespace dremel {
namespace util {

/// Utility classes to do run length encoding (RLE) for fixed bit width values.  If runs
/// are sufficiently long, RLE is used, otherwise, the values are just bit-packed
/// (literal encoding).
/// For both types of runs, there is a byte-aligned indicator which encodes the length
/// of the run and the type of the run.
/// This encoding has the benefit that when there aren't any long enough runs, values
/// are always decoded at fixed (can be precomputed) bit offsets OR both the value and
/// the run length are byte aligned. This allows for very efficient decoding
/// implementations.
/// The encoding is:
///    encoded-block := run*
///    run := literal-run | repeated-run
///    literal-run := literal-indicator < literal bytes >
///    repeated-run := repeated-indicator < repeated value. padded to byte boundary >
///    literal-indicator := varint_encode( number_of_groups << 1 | 1)
///    repeated-indicator := varint_encode( number_of_repetitions << 1 )
//
/// Each run is preceded by a varint. The varint's least significant bit is
/// used to indicate whether the run is a literal run or a repeated run. The rest
/// of the varint is used to determine the length of the run (eg how many times the
/// value repeats).
//
/// In the case of literal runs, the run length is always a multiple of 8 (i.e. encode
/// in groups of 8), so that no matter the bit-width of the value, the sequence will end
/// on a byte boundary without padding.
/// Given that we know it is a multiple of 8, we store the number of 8-groups rather than
/// the actual number of encoded ints. (This means that the total number of encoded values
/// can not be determined from the encoded data, since the number of values in the last
/// group may not be a multiple of 8). For the last group of literal runs, we pad
/// the group to 8 with zeros. This allows for 8 at a time decoding on the read side
/// without the need for additional checks.
//
/// There is a break-even point when it is more storage efficient to do run length
/// encoding.  For 1 bit-width values, that point is 8 values.  They require 2 bytes
/// for both the repeated encoding or the literal encoding.  This value can always
/// be computed based on the bit-width.
//
/// Examples with bit-width 1 (eg encoding booleans):
/// ----------------------------------------
/// 100 1s followed by 100 0s:
/// <varint(100 << 1)> <1, padded to 1 byte> <varint(100 << 1)> <0, padded to 1 byte>
///  - (total 4 bytes)
//
/// alternating 1s and 0s (200 total):
/// 200 ints = 25 groups of 8
/// <varint((25 << 1) | 1)> <25 bytes of values, bitpacked>
/// (total 26 bytes, 1 byte overhead)
//

/// Bounded number of values buffered for one literal run.
constexpr int64_t kDefaultMaxLiteralRunLength = 8192;

/// Widest value the codec accepts.
constexpr int kMaxRleBitWidth = 32;

/// Decoder class for RLE encoded data.
class RleBitPackedDecoder {
 public:
  /// Create a decoder object. buffer/buffer_len is the decoded data.
  /// bit_width is the width of each value (before encoding).
  RleBitPackedDecoder(const uint8_t* buffer, int buffer_len, int bit_width)
      : bit_reader_(buffer, buffer_len),
        bit_width_(bit_width),
        current_value_(0),
        repeat_count_(0),
        literal_count_(0) {
    DREMEL_DCHECK_GE(bit_width_, 0);
    DREMEL_DCHECK_LE(bit_width_, kMaxRleBitWidth);
  }

  RleBitPackedDecoder()
      : bit_width_(-1), current_value_(0), repeat_count_(0), literal_count_(0) {}

  void Reset(const uint8_t* buffer, int buffer_len, int bit_width) {
    DREMEL_DCHECK_GE(bit_width, 0);
    DREMEL_DCHECK_LE(bit_width, kMaxRleBitWidth);
    bit_reader_.Reset(buffer, buffer_len);
    bit_width_ = bit_width;
    current_value_ = 0;
    repeat_count_ = 0;
    literal_count_ = 0;
  }

  /// Gets the next value.  Returns false if there are no more.
  template <typename T>
  bool Get(T* val);

  /// Gets a batch of values.  Returns the number of decoded elements.
  template <typename T>
  int GetBatch(T* values, int batch_size);

 private:
  /// Fills literal_count_ and repeat_count_ with next values. Returns false if there
  /// are no more.
  bool NextCounts();

  bit_util::BitReader bit_reader_;
  /// Number of bits needed to encode the value. Must be between 0 and 32.
  int bit_width_;
  uint64_t current_value_;
  int32_t repeat_count_;
  int32_t literal_count_;
};

/// Class to incrementally build the rle data.   This class does not allocate any memory
/// per value.
/// The encoding has two modes: encoding repeated runs and literal runs.
/// A run is only RLE encoded once it exceeds 8 repeats; shorter runs stay in
/// the literal buffer because bit-packing them is no larger. When a repeated
/// run reaches 8 values while the pending literal run is not a multiple of 8
/// long, values are moved from the run into the literal run so that the
/// literal run ends on a group boundary.
/// Literal runs are buffered up to max_literal_run values and bit-packed in
/// blocks of 32 values.
class DREMEL_EXPORT RleBitPackedEncoder {
 public:
  /// Create an encoder writing to `sink`, which must outlive the encoder.
  ///
  /// bit_width must lie in [0, 32] and max_literal_run must be a positive
  /// multiple of 8; otherwise Invalid is returned.
  static Result<std::unique_ptr<RleBitPackedEncoder>> Make(
      io::OutputStream* sink, int bit_width,
      int64_t max_literal_run = kDefaultMaxLiteralRunLength);

  static Status ValidateBitWidth(int bit_width);

  /// Encode value.  Returns the sink's error if a completed run could not be
  /// written.  Value must fit in bit_width bits.
  Status Put(uint32_t value);

  /// Writes out all pending runs. The encoder starts a fresh run afterwards,
  /// so the output of the next Put is independent of previous values.
  Status Flush();

  int bit_width() const { return bit_width_; }

  /// Number of values passed to Put() so far.
  int64_t num_values() const { return num_values_; }

  /// Number of bytes handed to the sink so far.
  int64_t bytes_written() const { return bytes_written_; }

 private:
  RleBitPackedEncoder(io::OutputStream* sink, int bit_width, int64_t max_literal_run);

  /// Bit-packs buffered_values_[0, count) as one literal run.
  Status FlushLiteralRun(int64_t count);

  /// Writes a repeated run of `run_length` copies of `value`.
  Status FlushRepeatedRun(int64_t run_length, uint32_t value);

  Status WriteBytes(const uint8_t* data, int64_t nbytes);

  void ResetRunState();

  io::OutputStream* sink_;
  const int bit_width_;
  const int64_t max_literal_run_;

  /// Values not yet written, either pending literals or the first repeats of
  /// a run that is not yet long enough for RLE.
  std::vector<uint32_t> buffered_values_;
  int64_t num_buffered_values_;

  /// Length of the literal run in buffered_values_. Values past it belong to
  /// the current repeated run.
  int64_t literal_count_;

  /// How many times the last value has been seen in a row.
  int64_t repeat_count_;

  uint32_t current_value_;

  int64_t num_values_;
  int64_t bytes_written_;
};

/// \brief Encode `num_values` values as one hybrid RLE/bit-packed stream
DREMEL_EXPORT Status EncodeRleBitPacked(
    const uint32_t* values, int64_t num_values, int bit_width, io::OutputStream* sink,
    int64_t max_literal_run = kDefaultMaxLiteralRunLength);

/// \brief Encode non-negative 16-bit values, such as levels, as one hybrid stream
DREMEL_EXPORT Status EncodeRleBitPacked(
    const int16_t* values, int64_t num_values, int bit_width, io::OutputStream* sink,
    int64_t max_literal_run = kDefaultMaxLiteralRunLength);

/// \brief Encode `length` bits of an LSB-first bitmap at bit width 1
DREMEL_EXPORT Status EncodeBitmapRle(const uint8_t* bitmap, int64_t offset,
                                     int64_t length, io::OutputStream* sink);

template <typename T>
inline bool RleBitPackedDecoder::Get(T* val) {
  return GetBatch(val, 1) == 1;
}

template <typename T>
inline int RleBitPackedDecoder::GetBatch(T* values, int batch_size) {
  DREMEL_DCHECK_GE(bit_width_, 0);
  int values_read = 0;

  while (values_read < batch_size) {
    const int remaining = batch_size - values_read;

    if (repeat_count_ > 0) {  // Repeated value case.
      const int repeat_batch = std::min(remaining, static_cast<int>(repeat_count_));
      std::fill(values + values_read, values + values_read + repeat_batch,
                static_cast<T>(current_value_));

      repeat_count_ -= repeat_batch;
      values_read += repeat_batch;
    } else if (literal_count_ > 0) {
      const int literal_batch = std::min(remaining, static_cast<int>(literal_count_));
      const int actual_read =
          bit_reader_.GetBatch(bit_width_, values + values_read, literal_batch);
      if (actual_read != literal_batch) {
        return values_read + actual_read;
      }

      literal_count_ -= literal_batch;
      values_read += literal_batch;
    } else {
      if (!NextCounts()) return values_read;
    }
  }

  return values_read;
}

inline bool RleBitPackedDecoder::NextCounts() {
  // Read the next run's indicator int, it could be a literal or repeated run.
  // The int is encoded as a vlq-encoded value.
  uint32_t indicator_value = 0;
  if (!bit_reader_.GetVlqInt(&indicator_value)) return false;

  // lsb indicates if it is a literal run or repeated run
  const bool is_literal = indicator_value & 1;
  const uint32_t count = indicator_value >> 1;
  if (is_literal) {
    if (DREMEL_PREDICT_FALSE(count == 0 ||
                             count > static_cast<uint32_t>(
                                         std::numeric_limits<int32_t>::max()) / 8)) {
      return false;
    }
    literal_count_ = static_cast<int32_t>(count) * 8;
  } else {
    if (DREMEL_PREDICT_FALSE(count == 0 ||
                             count > static_cast<uint32_t>(
                                         std::numeric_limits<int32_t>::max()))) {
      return false;
    }
    repeat_count_ = static_cast<int32_t>(count);
    current_value_ = 0;
    if (!bit_reader_.GetAligned<uint64_t>(
            static_cast<int>(bit_util::BytesForBits(bit_width_)), &current_value_)) {
      return false;
    }
  }
  return true;
}

}  // namespace util
}  // namespace dremel
