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

// From Apache Impala (incubating) as of 2016-01-29

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>

#include "dremel/util/bit_util.h"
#include "dremel/util/bpacking.h"
#include "dremel/util/logging.h"
#include "dremel/util/macros.h"

namespace dremel {
namespace bit_util {

/// Utility class to write bit/byte streams.  This class can write data to either be
/// bit packed or byte aligned (and a single stream that has a mix of both).
/// This class does not allocate memory.
class BitWriter {
 public:
  /// buffer: buffer to write bits to.  Buffer should be preallocated with
  /// 'buffer_len' bytes.
  BitWriter(uint8_t* buffer, int buffer_len) : buffer_(buffer), max_bytes_(buffer_len) {
    Clear();
  }

  void Clear() {
    buffered_values_ = 0;
    byte_offset_ = 0;
    bit_offset_ = 0;
  }

  /// The number of current bytes written, including the current byte (i.e. may include a
  /// fraction of a byte). Includes buffered values.
  int bytes_written() const {
    return byte_offset_ + static_cast<int>(BytesForBits(bit_offset_));
  }
  uint8_t* buffer() const { return buffer_; }
  int buffer_len() const { return max_bytes_; }

  /// Writes a value to buffered_values_, flushing to buffer_ if necessary.  This is bit
  /// packed.  Returns false if there was not enough space. num_bits must be <= 64.
  bool PutValue(uint64_t v, int num_bits);

  /// Writes v to the next aligned byte using num_bytes. If T is larger than
  /// num_bytes, the extra high-order bytes will be ignored. Returns false if
  /// there was not enough space.
  /// Assume the v is stored in buffer_ as a little-endian format
  template <typename T>
  bool PutAligned(T v, int num_bytes);

  /// Write a Vlq encoded int to the buffer.  Returns false if there was not enough
  /// room.  The value is written byte aligned.
  /// For more details on vlq:
  /// en.wikipedia.org/wiki/Variable-length_quantity
  bool PutVlqInt(uint32_t v);

  /// Get a pointer to the next aligned byte and advance the underlying buffer
  /// by num_bytes.
  /// Returns NULL if there was not enough space.
  uint8_t* GetNextBytePtr(int num_bytes = 1);

  /// Flushes all buffered values to the buffer. Call this when done writing to
  /// the buffer.  If 'align' is true, buffered_values_ is reset and any future
  /// writes will be written to the next byte boundary.
  void Flush(bool align = false);

  /// Maximum byte length of a vlq encoded int
  static constexpr int kMaxVlqByteLength = 5;

 private:
  uint8_t* buffer_;
  int max_bytes_;

  /// Bit-packed values are initially written to this variable before being memcpy'd to
  /// buffer_. This is faster than writing values byte by byte directly to buffer_.
  uint64_t buffered_values_;

  int byte_offset_;  // Offset in buffer_
  int bit_offset_;   // Offset in buffered_values_
};

/// Utility class to read bit/byte stream.  This class can read bits or bytes
/// that are either byte aligned or not.  It also has utilities to read multiple
/// bytes in one read (e.g. encoded int).
class BitReader {
 public:
  /// 'buffer' is the buffer to read from.  The buffer's length is 'buffer_len'.
  BitReader(const uint8_t* buffer, int buffer_len)
      : buffer_(buffer), max_bytes_(buffer_len), byte_offset_(0), bit_offset_(0) {
    LoadBufferedValues();
  }

  BitReader()
      : buffer_(NULLPTR),
        max_bytes_(0),
        buffered_values_(0),
        byte_offset_(0),
        bit_offset_(0) {}

  void Reset(const uint8_t* buffer, int buffer_len) {
    buffer_ = buffer;
    max_bytes_ = buffer_len;
    byte_offset_ = 0;
    bit_offset_ = 0;
    LoadBufferedValues();
  }

  /// Gets the next value from the buffer.  Returns true if 'v' could be read or false if
  /// there are not enough bytes left. num_bits must be <= 32.
  template <typename T>
  bool GetValue(int num_bits, T* v);

  /// Get a number of values from the buffer. Return the number of values actually read.
  template <typename T>
  int GetBatch(int num_bits, T* v, int batch_size);

  /// Reads a 'num_bytes'-sized value from the buffer and stores it in 'v'. T
  /// needs to be a little-endian native type and big enough to store
  /// 'num_bytes'. The value is assumed to be byte-aligned so the stream will
  /// be advanced to the start of the next byte before 'v' is read. Returns
  /// false if there are not enough bytes left.
  /// Assume the v was stored in buffer_ as a little-endian format
  template <typename T>
  bool GetAligned(int num_bytes, T* v);

  /// Reads a vlq encoded int from the stream.  The encoded int must start at
  /// the beginning of a byte. Return false if there were not enough bytes in
  /// the buffer.
  bool GetVlqInt(uint32_t* v);

  /// Returns the number of bytes left in the stream, not including the current
  /// byte (i.e., there may be an additional fraction of a byte).
  int bytes_left() const {
    return max_bytes_ -
           (byte_offset_ + static_cast<int>(BytesForBits(bit_offset_)));
  }

 private:
  void LoadBufferedValues();

  const uint8_t* buffer_;
  int max_bytes_;

  /// Bytes are memcpy'd from buffer_ and values are read from this variable. This is
  /// faster than reading values byte by byte directly from buffer_.
  uint64_t buffered_values_;

  int byte_offset_;  // Offset in buffer_
  int bit_offset_;   // Offset in buffered_values_
};

inline bool BitWriter::PutValue(uint64_t v, int num_bits) {
  DREMEL_DCHECK_LE(num_bits, 64);
  if (num_bits < 64) {
    DREMEL_DCHECK_EQ(v >> num_bits, 0) << "v = " << v << ", num_bits = " << num_bits;
  }

  if (DREMEL_PREDICT_FALSE(byte_offset_ * 8 + bit_offset_ + num_bits > max_bytes_ * 8)) {
    return false;
  }

  buffered_values_ |= v << bit_offset_;
  bit_offset_ += num_bits;

  if (DREMEL_PREDICT_FALSE(bit_offset_ >= 64)) {
    // Flush buffered_values_ and write out bits of v that did not fit
    uint64_t le = ToLittleEndian(buffered_values_);
    std::memcpy(buffer_ + byte_offset_, &le, 8);
    buffered_values_ = 0;
    byte_offset_ += 8;
    bit_offset_ -= 64;
    const int consumed = num_bits - bit_offset_;
    buffered_values_ = consumed == 64 ? 0 : v >> consumed;
  }
  DREMEL_DCHECK_LT(bit_offset_, 64);
  return true;
}

inline void BitWriter::Flush(bool align) {
  int num_bytes = static_cast<int>(BytesForBits(bit_offset_));
  DREMEL_DCHECK_LE(byte_offset_ + num_bytes, max_bytes_);
  uint64_t le = ToLittleEndian(buffered_values_);
  std::memcpy(buffer_ + byte_offset_, &le, num_bytes);

  if (align) {
    buffered_values_ = 0;
    byte_offset_ += num_bytes;
    bit_offset_ = 0;
  }
}

inline uint8_t* BitWriter::GetNextBytePtr(int num_bytes) {
  Flush(/* align */ true);
  DREMEL_DCHECK_LE(byte_offset_, max_bytes_);
  if (byte_offset_ + num_bytes > max_bytes_) return NULLPTR;
  uint8_t* ptr = buffer_ + byte_offset_;
  byte_offset_ += num_bytes;
  return ptr;
}

template <typename T>
inline bool BitWriter::PutAligned(T val, int num_bytes) {
  DREMEL_DCHECK_LE(num_bytes, static_cast<int>(sizeof(T)));
  uint8_t* ptr = GetNextBytePtr(num_bytes);
  if (ptr == NULLPTR) return false;
  val = ToLittleEndian(val);
  std::memcpy(ptr, &val, num_bytes);
  return true;
}

inline bool BitWriter::PutVlqInt(uint32_t v) {
  bool result = true;
  while ((v & 0xFFFFFF80UL) != 0UL) {
    result &= PutAligned<uint8_t>(static_cast<uint8_t>((v & 0x7F) | 0x80), 1);
    v >>= 7;
  }
  result &= PutAligned<uint8_t>(static_cast<uint8_t>(v & 0x7F), 1);
  return result;
}

inline void BitReader::LoadBufferedValues() {
  buffered_values_ = 0;
  const int bytes_remaining = max_bytes_ - byte_offset_;
  if (DREMEL_PREDICT_TRUE(bytes_remaining >= 8)) {
    std::memcpy(&buffered_values_, buffer_ + byte_offset_, 8);
  } else if (bytes_remaining > 0) {
    std::memcpy(&buffered_values_, buffer_ + byte_offset_, bytes_remaining);
  }
  buffered_values_ = FromLittleEndian(buffered_values_);
}

template <typename T>
inline bool BitReader::GetValue(int num_bits, T* v) {
  DREMEL_DCHECK_LE(num_bits, 32);
  DREMEL_DCHECK_LE(num_bits, static_cast<int>(sizeof(T) * 8));

  if (DREMEL_PREDICT_FALSE(byte_offset_ * 8 + bit_offset_ + num_bits > max_bytes_ * 8)) {
    return false;
  }

  uint64_t value = buffered_values_ >> bit_offset_;
  bit_offset_ += num_bits;
  if (bit_offset_ >= 64) {
    byte_offset_ += 8;
    bit_offset_ -= 64;
    LoadBufferedValues();
    if (bit_offset_ > 0) {
      // Read bits of v that crossed into new buffered_values_
      value |= buffered_values_ << (num_bits - bit_offset_);
    }
  }
  const uint64_t mask = num_bits == 64 ? ~0ULL : ((1ULL << num_bits) - 1);
  *v = static_cast<T>(value & mask);
  return true;
}

template <typename T>
inline int BitReader::GetBatch(int num_bits, T* v, int batch_size) {
  DREMEL_DCHECK(buffer_ != NULLPTR);
  DREMEL_DCHECK_LE(num_bits, 32);

  int i = 0;
  // Read single values until the stream sits on a byte boundary
  while (i < batch_size && (bit_offset_ % 8) != 0) {
    if (!GetValue(num_bits, v + i)) return i;
    ++i;
  }

  // Then unpack whole 32-value blocks directly from the buffer
  int position = byte_offset_ + bit_offset_ / 8;
  const int block_bytes = 4 * num_bits;
  if (num_bits > 0 && batch_size - i >= 32 && position + block_bytes <= max_bytes_) {
    uint32_t unpacked[32];
    while (batch_size - i >= 32 && position + block_bytes <= max_bytes_) {
      internal::Unpack<uint32_t>(buffer_ + position, unpacked, num_bits);
      for (int j = 0; j < 32; ++j) {
        v[i + j] = static_cast<T>(unpacked[j]);
      }
      position += block_bytes;
      i += 32;
    }
    byte_offset_ = position;
    bit_offset_ = 0;
    LoadBufferedValues();
  }

  for (; i < batch_size; ++i) {
    if (!GetValue(num_bits, v + i)) return i;
  }
  return batch_size;
}

template <typename T>
inline bool BitReader::GetAligned(int num_bytes, T* v) {
  if (DREMEL_PREDICT_FALSE(num_bytes > static_cast<int>(sizeof(T)))) {
    return false;
  }

  int bytes_read = static_cast<int>(BytesForBits(bit_offset_));
  if (DREMEL_PREDICT_FALSE(byte_offset_ + bytes_read + num_bytes > max_bytes_)) {
    return false;
  }

  // Advance byte_offset to next unread byte and read num_bytes
  byte_offset_ += bytes_read;
  T raw = 0;
  std::memcpy(&raw, buffer_ + byte_offset_, num_bytes);
  *v = FromLittleEndian(raw);
  byte_offset_ += num_bytes;

  bit_offset_ = 0;
  LoadBufferedValues();
  return true;
}

inline bool BitReader::GetVlqInt(uint32_t* v) {
  uint32_t tmp = 0;

  for (int i = 0; i < BitWriter::kMaxVlqByteLength; i++) {
    uint8_t byte = 0;
    if (DREMEL_PREDICT_FALSE(!GetAligned<uint8_t>(1, &byte))) {
      return false;
    }
    tmp |= static_cast<uint32_t>(byte & 0x7F) << (7 * i);

    if ((byte & 0x80) == 0) {
      *v = tmp;
      return true;
    }
  }

  return false;
}

}  // namespace bit_util
}  // namespace dremel
