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

#include "dremel/util/bpacking.h"

#include <array>
#include <cstring>
#include <utility>

#include "dremel/util/logging.h"

namespace dremel {
namespace internal {

namespace {

template <typename T>
inline void StoreWord(T word, uint8_t* out) {
  for (size_t b = 0; b < sizeof(T); ++b) {
    out[b] = static_cast<uint8_t>(word >> (8 * b));
  }
}

template <typename T>
inline T LoadWord(const uint8_t* in) {
  T word = 0;
  for (size_t b = 0; b < sizeof(T); ++b) {
    word = static_cast<T>(word | (static_cast<T>(in[b]) << (8 * b)));
  }
  return word;
}

template <typename T, int kNumBits>
struct BitMask {
  static constexpr int kWordBits = static_cast<int>(8 * sizeof(T));
  static constexpr T value =
      kNumBits == kWordBits ? static_cast<T>(~T(0))
                            : static_cast<T>((T(1) << (kNumBits % kWordBits)) - 1);
};

// Shifts each lane into a rolling word and stores the word whenever it fills.
template <typename T, int kNumBits>
void PackKernel(const T* in, uint8_t* out) {
  constexpr int kWordBits = static_cast<int>(8 * sizeof(T));
  constexpr int kLanes = kWordBits;
  if (kNumBits == 0) {
    return;
  }
  constexpr T kMask = BitMask<T, kNumBits>::value;

  T word = 0;
  int filled = 0;
  for (int lane = 0; lane < kLanes; ++lane) {
    const T value = static_cast<T>(in[lane] & kMask);
    word = static_cast<T>(word | static_cast<T>(value << filled));
    if (filled + kNumBits >= kWordBits) {
      StoreWord(word, out);
      out += sizeof(T);
      const int consumed = kWordBits - filled;
      word = consumed >= kWordBits ? T(0) : static_cast<T>(value >> consumed);
      filled = filled + kNumBits - kWordBits;
    } else {
      filled += kNumBits;
    }
  }
  DREMEL_DCHECK_EQ(filled, 0);
}

template <typename T, int kNumBits>
void UnpackKernel(const uint8_t* in, T* out) {
  constexpr int kWordBits = static_cast<int>(8 * sizeof(T));
  constexpr int kLanes = kWordBits;
  if (kNumBits == 0) {
    std::memset(out, 0, sizeof(T) * kLanes);
    return;
  }
  constexpr T kMask = BitMask<T, kNumBits>::value;

  T word = 0;
  int position = kWordBits;
  for (int lane = 0; lane < kLanes; ++lane) {
    if (position == kWordBits) {
      word = LoadWord<T>(in);
      in += sizeof(T);
      position = 0;
    }
    if (position + kNumBits <= kWordBits) {
      out[lane] = static_cast<T>(static_cast<T>(word >> position) & kMask);
      position += kNumBits;
    } else {
      const T low = static_cast<T>(word >> position);
      const int taken = kWordBits - position;
      word = LoadWord<T>(in);
      in += sizeof(T);
      out[lane] = static_cast<T>(static_cast<T>(low | static_cast<T>(word << taken)) & kMask);
      position = kNumBits - taken;
    }
  }
}

template <typename T>
using PackFunc = void (*)(const T*, uint8_t*);

template <typename T>
using UnpackFunc = void (*)(const uint8_t*, T*);

template <typename T, int... kBits>
constexpr std::array<PackFunc<T>, sizeof...(kBits)> MakePackTable(
    std::integer_sequence<int, kBits...>) {
  return {{&PackKernel<T, kBits>...}};
}

template <typename T, int... kBits>
constexpr std::array<UnpackFunc<T>, sizeof...(kBits)> MakeUnpackTable(
    std::integer_sequence<int, kBits...>) {
  return {{&UnpackKernel<T, kBits>...}};
}

// One kernel per bit width, 0 through the lane width inclusive.
template <typename T>
using WidthSequence = std::make_integer_sequence<int, 8 * sizeof(T) + 1>;

}  // namespace

template <typename T>
void Pack(const T* in, uint8_t* out, int num_bits) {
  static constexpr auto kTable = MakePackTable<T>(WidthSequence<T>{});
  DREMEL_DCHECK_GE(num_bits, 0);
  DREMEL_DCHECK_LE(num_bits, static_cast<int>(8 * sizeof(T)));
  kTable[num_bits](in, out);
}

template <typename T>
void Unpack(const uint8_t* in, T* out, int num_bits) {
  static constexpr auto kTable = MakeUnpackTable<T>(WidthSequence<T>{});
  DREMEL_DCHECK_GE(num_bits, 0);
  DREMEL_DCHECK_LE(num_bits, static_cast<int>(8 * sizeof(T)));
  kTable[num_bits](in, out);
}

template void Pack<uint8_t>(const uint8_t*, uint8_t*, int);
template void Pack<uint16_t>(const uint16_t*, uint8_t*, int);
template void Pack<uint32_t>(const uint32_t*, uint8_t*, int);
template void Pack<uint64_t>(const uint64_t*, uint8_t*, int);

template void Unpack<uint8_t>(const uint8_t*, uint8_t*, int);
template void Unpack<uint16_t>(const uint8_t*, uint16_t*, int);
template void Unpack<uint32_t>(const uint8_t*, uint32_t*, int);
template void Unpack<uint64_t>(const uint8_t*, uint64_t*, int);

}  // namespace internal
}  // namespace dremel
