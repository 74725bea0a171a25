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

#include "dremel/level_builder.h"

#include <utility>

#include "dremel/util/logging.h"

namespace dremel {

// ----------------------------------------------------------------------
// NestedLevelIterator

NestedLevelIterator::NestedLevelIterator(const NestedPath& path)
    : path_(path),
      def_before_(internal::DefinitionLevelsBefore(path)),
      rep_depth_(internal::RepeatedAncestorCounts(path)),
      frames_(path.size(), Frame{0, 0}),
      depth_(0),
      null_depth_(-1),
      remaining_values_(NumValues(path)),
      max_def_level_(MaxDefinitionLevel(path)),
      max_rep_level_(MaxRepetitionLevel(path)) {
  frames_[0].run_remaining = path_[0].length();
}

Result<NestedLevelIterator> NestedLevelIterator::Make(const NestedPath& path) {
  RETURN_NOT_OK(ValidateNestedPath(path));
  return NestedLevelIterator(path);
}

bool NestedLevelIterator::Next(int16_t* def_level, int16_t* rep_level) {
  if (remaining_values_ == 0) {
    return false;
  }

  // Return to the innermost node whose run continues
  while (frames_[depth_].run_remaining == 0) {
    --depth_;
    DREMEL_DCHECK_GE(depth_, 0);
  }
  if (null_depth_ >= depth_) {
    null_depth_ = -1;
  }
  const int16_t rep = rep_depth_[depth_];

  // Descend to the leaf, or to an empty run
  while (true) {
    const Nested& node = path_[depth_];
    Frame& frame = frames_[depth_];
    const int64_t i = frame.position++;
    --frame.run_remaining;
    if (null_depth_ < 0 && !node.IsValid(i)) {
      null_depth_ = depth_;
    }

    if (node.kind() == Nested::Kind::kStruct) {
      frames_[depth_ + 1] = Frame{i, 1};
      ++depth_;
      continue;
    }
    if (node.is_repeated()) {
      const int64_t run = node.run_length(i);
      if (run > 0) {
        frames_[depth_ + 1] = Frame{node.run_start(i), run};
        ++depth_;
        continue;
      }
    }
    // A leaf value or an empty run
    *def_level = null_depth_ >= 0
                     ? def_before_[null_depth_]
                     : static_cast<int16_t>(def_before_[depth_] + node.is_optional());
    break;
  }

  *rep_level = rep;
  --remaining_values_;
  return true;
}

Status ComputeLevels(const NestedPath& path, std::vector<int16_t>* def_levels,
                     std::vector<int16_t>* rep_levels) {
  def_levels->clear();
  rep_levels->clear();
  DREMEL_ASSIGN_OR_RAISE(auto it, NestedLevelIterator::Make(path));

  def_levels->reserve(static_cast<size_t>(it.remaining()));
  rep_levels->reserve(static_cast<size_t>(it.remaining()));
  int16_t def = 0;
  int16_t rep = 0;
  while (it.Next(&def, &rep)) {
    def_levels->push_back(def);
    rep_levels->push_back(rep);
  }
  return Status::OK();
}

// ----------------------------------------------------------------------
// Recursive walk

namespace {

constexpr int16_t kNotNull = -1;

class RecursiveLevelBuilder {
 public:
  RecursiveLevelBuilder(const NestedPath& path, std::vector<int16_t>* def_levels,
                        std::vector<int16_t>* rep_levels)
      : path_(path),
        def_before_(internal::DefinitionLevelsBefore(path)),
        rep_depth_(internal::RepeatedAncestorCounts(path)),
        def_levels_(def_levels),
        rep_levels_(rep_levels) {}

  void Build() { Visit(0, 0, path_[0].length(), 0, kNotNull); }

 private:
  // Emits the entries of positions [start, end) of node k. The first entry
  // repeats at `first_rep`; `null_def` is the level of the outermost null
  // ancestor, or kNotNull.
  void Visit(size_t k, int64_t start, int64_t end, int16_t first_rep, int16_t null_def) {
    const Nested& node = path_[k];
    for (int64_t i = start; i < end; ++i) {
      const int16_t rep = i == start ? first_rep : rep_depth_[k];
      int16_t slot_null_def = null_def;
      if (slot_null_def == kNotNull && !node.IsValid(i)) {
        slot_null_def = def_before_[k];
      }
      const int16_t present_def =
          static_cast<int16_t>(def_before_[k] + node.is_optional());

      switch (node.kind()) {
        case Nested::Kind::kPrimitive:
          Emit(slot_null_def == kNotNull ? present_def : slot_null_def, rep);
          break;
        case Nested::Kind::kStruct:
          Visit(k + 1, i, i + 1, rep, slot_null_def);
          break;
        default: {
          const int64_t run_start = node.run_start(i);
          const int64_t run_end = node.run_start(i + 1);
          if (run_start == run_end) {
            Emit(slot_null_def == kNotNull ? present_def : slot_null_def, rep);
          } else {
            Visit(k + 1, run_start, run_end, rep, slot_null_def);
          }
          break;
        }
      }
    }
  }

  void Emit(int16_t def, int16_t rep) {
    def_levels_->push_back(def);
    rep_levels_->push_back(rep);
  }

  const NestedPath& path_;
  const std::vector<int16_t> def_before_;
  const std::vector<int16_t> rep_depth_;
  std::vector<int16_t>* def_levels_;
  std::vector<int16_t>* rep_levels_;
};

}  // namespace

Status ComputeLevelsRecursive(const NestedPath& path, std::vector<int16_t>* def_levels,
                              std::vector<int16_t>* rep_levels) {
  def_levels->clear();
  rep_levels->clear();
  RETURN_NOT_OK(ValidateNestedPath(path));

  const int64_t num_values = NumValues(path);
  def_levels->reserve(static_cast<size_t>(num_values));
  rep_levels->reserve(static_cast<size_t>(num_values));
  RecursiveLevelBuilder(path, def_levels, rep_levels).Build();
  DREMEL_DCHECK_EQ(static_cast<int64_t>(def_levels->size()), num_values);
  return Status::OK();
}

}  // namespace dremel
