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

#include "dremel/util/visibility.h"

namespace dremel {
namespace internal {

/// \brief Pack one block of 8 * sizeof(T) values, `num_bits` bits each
///
/// Values are laid out LSB-first and written as little-endian words of T, so
/// the block occupies exactly `sizeof(T) * num_bits` bytes of `out`. Bits of
/// an input value above `num_bits` are ignored. `num_bits` must lie in
/// [0, 8 * sizeof(T)]; zero writes nothing.
template <typename T>
DREMEL_EXPORT void Pack(const T* in, uint8_t* out, int num_bits);

/// \brief Unpack one block of 8 * sizeof(T) values written by Pack
///
/// Reads `sizeof(T) * num_bits` bytes from `in`. A `num_bits` of zero
/// produces all-zero output.
template <typename T>
DREMEL_EXPORT void Unpack(const uint8_t* in, T* out, int num_bits);

extern template void Pack<uint8_t>(const uint8_t*, uint8_t*, int);
extern template void Pack<uint16_t>(const uint16_t*, uint8_t*, int);
extern template void Pack<uint32_t>(const uint32_t*, uint8_t*, int);
extern template void Pack<uint64_t>(const uint64_t*, uint8_t*, int);

extern template void Unpack<uint8_t>(const uint8_t*, uint8_t*, int);
extern template void Unpack<uint16_t>(const uint8_t*, uint16_t*, int);
extern template void Unpack<uint32_t>(const uint8_t*, uint32_t*, int);
extern template void Unpack<uint64_t>(const uint8_t*, uint64_t*, int);

}  // namespace internal
}  // namespace dremel
