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
#include <cstring>
#include <type_traits>

#include "dremel/util/macros.h"

namespace dremel {
namespace bit_util {

//
// Bit-related computations on integer values
//

// Returns the ceil of value/divisor
constexpr int64_t CeilDiv(int64_t value, int64_t divisor) {
  return (value == 0) ? 0 : 1 + (value - 1) / divisor;
}

// Return the number of bytes needed to fit the given number of bits
constexpr int64_t BytesForBits(int64_t bits) {
  // This formula avoids integer overflow on very large `bits`
  return (bits >> 3) + ((bits & 7) != 0);
}

constexpr bool IsPowerOf2(int64_t value) {
  return value > 0 && (value & (value - 1)) == 0;
}

constexpr bool IsPowerOf2(uint64_t value) {
  return value > 0 && (value & (value - 1)) == 0;
}

// Returns 'value' rounded up to the nearest multiple of 'factor'
constexpr int64_t RoundUp(int64_t value, int64_t factor) {
  return CeilDiv(value, factor) * factor;
}

constexpr int64_t RoundUpToMultipleOf8(int64_t num) { return RoundUp(num, 8); }

constexpr bool IsMultipleOf8(int64_t n) { return (n & 7) == 0; }

/// Returns the number of leading zero bits, 64 for zero.
static inline int CountLeadingZeros(uint64_t value) {
#if defined(__GNUC__) || defined(__clang__)
  if (value == 0) return 64;
  return static_cast<int>(__builtin_clzll(value));
#else
  int bitpos = 0;
  while (value != 0) {
    value >>= 1;
    ++bitpos;
  }
  return 64 - bitpos;
#endif
}

/// Returns the minimum number of bits needed to represent an unsigned value
static inline int NumRequiredBits(uint64_t x) { return 64 - CountLeadingZeros(x); }

// Returns ceil(log2(x)).
static inline int Log2(uint64_t x) {
  // DCHECK_GT(x, 0);
  return NumRequiredBits(x - 1);
}

//
// Utilities for reading and writing individual bits by their index
// in a memory area.
//

// Bitmask selecting the k-th bit in a byte
static constexpr uint8_t kBitmask[] = {1, 2, 4, 8, 16, 32, 64, 128};

// the bitwise complement version of kBitmask
static constexpr uint8_t kFlippedBitmask[] = {254, 253, 251, 247, 239, 223, 191, 127};

static inline bool GetBit(const uint8_t* bits, uint64_t i) {
  return (bits[i >> 3] >> (i & 0x07)) & 1;
}

static inline void ClearBit(uint8_t* bits, int64_t i) {
  bits[i / 8] &= kFlippedBitmask[i % 8];
}

static inline void SetBit(uint8_t* bits, int64_t i) { bits[i / 8] |= kBitmask[i % 8]; }

static inline void SetBitTo(uint8_t* bits, int64_t i, bool bit_is_set) {
  // https://graphics.stanford.edu/~seander/bithacks.html
  // "Conditionally set or clear bits without branching"
  // NOTE: this seems to confuse Valgrind as it reads from potentially
  // uninitialized memory
  bits[i / 8] ^= static_cast<uint8_t>(-static_cast<uint8_t>(bit_is_set) ^ bits[i / 8]) &
                 kBitmask[i % 8];
}

//
// Endianness conversions. Values on disk are little-endian.
//

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define DREMEL_BIG_ENDIAN 1
#endif

template <typename T, typename = typename std::enable_if<std::is_integral<T>::value>::type>
static inline T ByteSwap(T value) {
  typename std::make_unsigned<T>::type u;
  std::memcpy(&u, &value, sizeof(T));
  typename std::make_unsigned<T>::type out = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    out = static_cast<decltype(out)>((out << 8) | ((u >> (8 * i)) & 0xFF));
  }
  T result;
  std::memcpy(&result, &out, sizeof(T));
  return result;
}

template <typename T>
static inline T ToLittleEndian(T value) {
#ifdef DREMEL_BIG_ENDIAN
  return ByteSwap(value);
#else
  return value;
#endif
}

template <typename T>
static inline T FromLittleEndian(T value) {
#ifdef DREMEL_BIG_ENDIAN
  return ByteSwap(value);
#else
  return value;
#endif
}

}  // namespace bit_util
}  // namespace dremel
