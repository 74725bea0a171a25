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
#include <string>
#include <vector>

#include "dremel/status.h"
#include "dremel/util/bitmap.h"
#include "dremel/util/macros.h"
#include "dremel/util/visibility.h"

namespace dremel {

/// \brief One node of the path from a column's outermost container to its leaf
///
/// A Nested borrows its validity bitmap and offsets from the source array; it
/// owns no data and must not outlive the buffers it was built from. Positions
/// of a child node are numbered from zero: list slot `i` covers child
/// positions [offsets[i], offsets[i + 1]), fixed-size list slot `i` covers
/// [i * width, (i + 1) * width) and struct slot `i` covers child position `i`.
class DREMEL_EXPORT Nested {
 public:
  enum class Kind { kPrimitive, kList, kLargeList, kFixedSizeList, kStruct };

  /// \brief Leaf values. An absent validity bitmap means all values are present.
  static Nested Primitive(internal::Bitmap validity, bool is_optional, int64_t length);

  /// \brief Variable-length list with `length + 1` 32-bit offsets
  static Nested List(const int32_t* offsets, internal::Bitmap validity, bool is_optional,
                     int64_t length);

  /// \brief Variable-length list with `length + 1` 64-bit offsets
  static Nested LargeList(const int64_t* offsets, internal::Bitmap validity,
                          bool is_optional, int64_t length);

  /// \brief List whose slots all hold `width` child positions
  static Nested FixedSizeList(internal::Bitmap validity, bool is_optional, int32_t width,
                              int64_t length);

  static Nested Struct(internal::Bitmap validity, bool is_optional, int64_t length);

  Kind kind() const { return kind_; }
  bool is_optional() const { return is_optional_; }
  int64_t length() const { return length_; }
  int32_t width() const { return width_; }

  const internal::Bitmap& validity() const { return validity_; }
  bool has_validity() const { return validity_.data() != NULLPTR; }

  bool IsValid(int64_t i) const { return !has_validity() || validity_.GetBit(i); }

  /// \brief Whether this node repeats (List, LargeList or FixedSizeList)
  bool is_repeated() const {
    return kind_ == Kind::kList || kind_ == Kind::kLargeList ||
           kind_ == Kind::kFixedSizeList;
  }

  /// \brief First child position covered by slot `i` of a repeated node
  int64_t run_start(int64_t i) const {
    switch (kind_) {
      case Kind::kList:
        return offsets32_[i];
      case Kind::kLargeList:
        return offsets64_[i];
      case Kind::kFixedSizeList:
        return i * width_;
      default:
        return i;
    }
  }

  /// \brief Number of child positions covered by slot `i` of a repeated node
  int64_t run_length(int64_t i) const { return run_start(i + 1) - run_start(i); }

  /// \brief Number of child positions this node spans
  int64_t child_length() const {
    if (is_repeated()) {
      return run_start(length_);
    }
    return kind_ == Kind::kStruct ? length_ : 0;
  }

  /// \brief Definition level units this node adds when present
  ///
  /// Repeated nodes add one unit for "present, possibly empty" on top of their
  /// optionality.
  int16_t definition_level_contribution() const {
    return static_cast<int16_t>(is_optional_ + (is_repeated() ? 1 : 0));
  }

  const int32_t* offsets32() const { return offsets32_; }
  const int64_t* offsets64() const { return offsets64_; }

  std::string ToString() const;

 private:
  Nested(Kind kind, internal::Bitmap validity, bool is_optional, int64_t length)
      : kind_(kind), validity_(validity), is_optional_(is_optional), length_(length) {}

  Kind kind_;
  internal::Bitmap validity_;
  bool is_optional_;
  int64_t length_;
  int32_t width_ = 0;
  const int32_t* offsets32_ = NULLPTR;
  const int64_t* offsets64_ = NULLPTR;
};

/// \brief Nodes from the outermost container to the leaf primitive
using NestedPath = std::vector<Nested>;

DREMEL_EXPORT const char* KindToString(Nested::Kind kind);

/// \brief Number of (definition, repetition) level pairs the path produces
///
/// This is the leaf length plus one placeholder per empty run of every
/// repeated node. The path must be non-empty and end in its only primitive
/// node; anything else is a programming error and aborts.
DREMEL_EXPORT int64_t NumValues(const NestedPath& path);

/// \brief Definition level of a present leaf value
DREMEL_EXPORT int16_t MaxDefinitionLevel(const NestedPath& path);

/// \brief Number of repeated nodes in the path
DREMEL_EXPORT int16_t MaxRepetitionLevel(const NestedPath& path);

/// \brief Check that the buffers of every node are consistent
///
/// Returns Invalid when offsets decrease or do not start at zero, when a
/// validity bitmap is shorter than its node, when a child's length does not
/// match its parent's runs, when a fixed-size list width is negative, when a
/// level would not fit in int16_t. After a successful validation every level
/// algorithm emits exactly NumValues(path) entries; positions beneath a null
/// slot are still emitted, at the definition level of the null.
DREMEL_EXPORT Status ValidateNestedPath(const NestedPath& path);

namespace internal {

/// \brief Aborts unless the path is non-empty and only its last node is a primitive
DREMEL_EXPORT void CheckPathShape(const NestedPath& path);

/// \brief Definition level accumulated by the ancestors of each node
///
/// Entry k is the sum of the contributions of nodes [0, k).
DREMEL_EXPORT std::vector<int16_t> DefinitionLevelsBefore(const NestedPath& path);

/// \brief Number of repeated ancestors of each node
DREMEL_EXPORT std::vector<int16_t> RepeatedAncestorCounts(const NestedPath& path);

}  // namespace internal

}  // namespace dremel
