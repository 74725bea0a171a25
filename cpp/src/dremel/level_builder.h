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
#include <vector>

#include "dremel/nested.h"
#include "dremel/result.h"
#include "dremel/status.h"
#include "dremel/util/visibility.h"

namespace dremel {

/// \brief Pull-based generator of (definition, repetition) level pairs
///
/// Walks the path with one frame per node, so its state is bounded by the path
/// depth rather than the number of rows. Every slot is visited, including the
/// slots beneath nulls; those only report the level of their last present
/// ancestor. Instances share no mutable state, so separate leaf columns can be
/// processed on separate threads. The iterator borrows the buffers of the
/// path's nodes and must not outlive them.
class DREMEL_EXPORT NestedLevelIterator {
 public:
  /// \brief Validate the path and create an iterator positioned at its first entry
  static Result<NestedLevelIterator> Make(const NestedPath& path);

  /// \brief Produce the next level pair
  ///
  /// \return false once all NumValues(path) entries have been produced
  bool Next(int16_t* def_level, int16_t* rep_level);

  /// \brief Exact number of entries left
  int64_t remaining() const { return remaining_values_; }

  int16_t max_definition_level() const { return max_def_level_; }
  int16_t max_repetition_level() const { return max_rep_level_; }

 private:
  explicit NestedLevelIterator(const NestedPath& path);

  struct Frame {
    // Next position of the node
    int64_t position;
    // Positions left in the run being walked
    int64_t run_remaining;
  };

  NestedPath path_;
  std::vector<int16_t> def_before_;
  std::vector<int16_t> rep_depth_;
  std::vector<Frame> frames_;
  int depth_;
  // Outermost node whose current slot is null, or -1
  int null_depth_;
  int64_t remaining_values_;
  int16_t max_def_level_;
  int16_t max_rep_level_;
};

/// \brief Compute levels with the streaming iterator
///
/// Output vectors are replaced. On error they are left empty.
DREMEL_EXPORT Status ComputeLevels(const NestedPath& path, std::vector<int16_t>* def_levels,
                                   std::vector<int16_t>* rep_levels);

/// \brief Compute levels with a recursive walk of the path
///
/// The recursion is bounded by the depth of the path. Produces the same
/// sequences as ComputeLevels.
DREMEL_EXPORT Status ComputeLevelsRecursive(const NestedPath& path,
                                            std::vector<int16_t>* def_levels,
                                            std::vector<int16_t>* rep_levels);

}  // namespace dremel
