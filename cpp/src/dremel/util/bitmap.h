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

#pragma once

#include <cstdint>

#include "dremel/util/bit_util.h"
#include "dremel/util/macros.h"

namespace dremel {
namespace internal {

/// \brief A non-owning view of an LSB-first bitmap
///
/// Bit `i` of the view is bit `offset + i` of `data`. The default-constructed
/// view has no data, which callers interpret as "all bits set".
class Bitmap {
 public:
  Bitmap() = default;

  Bitmap(const uint8_t* data, int64_t offset, int64_t length)
      : data_(data), offset_(offset), length_(length) {}

  const uint8_t* data() const { return data_; }
  int64_t offset() const { return offset_; }
  int64_t length() const { return length_; }

  bool GetBit(int64_t i) const { return bit_util::GetBit(data_, i + offset_); }

  int64_t CountSet() const {
    int64_t count = 0;
    for (int64_t i = 0; i < length_; ++i) {
      count += GetBit(i);
    }
    return count;
  }

  bool Equals(const Bitmap& other) const {
    if (length_ != other.length_) {
      return false;
    }
    for (int64_t i = 0; i < length_; ++i) {
      if (GetBit(i) != other.GetBit(i)) {
        return false;
      }
    }
    return true;
  }

 private:
  const uint8_t* data_ = NULLPTR;
  int64_t offset_ = 0;
  int64_t length_ = 0;
};

/// \brief Sequential reader over a bitmap, one bit per Next()
class BitmapReader {
 public:
  BitmapReader(const uint8_t* bitmap, int64_t start_offset, int64_t length)
      : bitmap_(bitmap), position_(0), length_(length) {
    current_byte_ = 0;
    byte_offset_ = start_offset / 8;
    bit_offset_ = start_offset % 8;
    if (length > 0) {
      current_byte_ = bitmap[byte_offset_];
    }
  }

  explicit BitmapReader(const Bitmap& bitmap)
      : BitmapReader(bitmap.data(), bitmap.offset(), bitmap.length()) {}

  bool IsSet() const { return (current_byte_ & (1 << bit_offset_)) != 0; }

  bool IsNotSet() const { return (current_byte_ & (1 << bit_offset_)) == 0; }

  void Next() {
    ++bit_offset_;
    ++position_;
    if (DREMEL_PREDICT_FALSE(bit_offset_ == 8)) {
      bit_offset_ = 0;
      ++byte_offset_;
      if (DREMEL_PREDICT_TRUE(position_ < length_)) {
        current_byte_ = bitmap_[byte_offset_];
      }
    }
  }

  int64_t position() const { return position_; }

  int64_t length() const { return length_; }

 private:
  const uint8_t* bitmap_;
  int64_t position_;
  int64_t length_;

  uint8_t current_byte_;
  int64_t byte_offset_;
  int64_t bit_offset_;
};

}  // namespace internal
}  // namespace dremel
