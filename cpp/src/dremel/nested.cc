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

#include "dremel/nested.h"

#include <limits>
#include <sstream>

#include "dremel/util/logging.h"

namespace dremel {

Nested Nested::Primitive(internal::Bitmap validity, bool is_optional, int64_t length) {
  return Nested(Kind::kPrimitive, validity, is_optional, length);
}

Nested Nested::List(const int32_t* offsets, internal::Bitmap validity, bool is_optional,
                    int64_t length) {
  Nested node(Kind::kList, validity, is_optional, length);
  node.offsets32_ = offsets;
  return node;
}

Nested Nested::LargeList(const int64_t* offsets, internal::Bitmap validity,
                         bool is_optional, int64_t length) {
  Nested node(Kind::kLargeList, validity, is_optional, length);
  node.offsets64_ = offsets;
  return node;
}

Nested Nested::FixedSizeList(internal::Bitmap validity, bool is_optional, int32_t width,
                             int64_t length) {
  Nested node(Kind::kFixedSizeList, validity, is_optional, length);
  node.width_ = width;
  return node;
}

Nested Nested::Struct(internal::Bitmap validity, bool is_optional, int64_t length) {
  return Nested(Kind::kStruct, validity, is_optional, length);
}

const char* KindToString(Nested::Kind kind) {
  switch (kind) {
    case Nested::Kind::kPrimitive:
      return "primitive";
    case Nested::Kind::kList:
      return "list";
    case Nested::Kind::kLargeList:
      return "large_list";
    case Nested::Kind::kFixedSizeList:
      return "fixed_size_list";
    case Nested::Kind::kStruct:
      return "struct";
  }
  return "unknown";
}

std::string Nested::ToString() const {
  std::stringstream ss;
  ss << KindToString(kind_) << "(length=" << length_;
  if (kind_ == Kind::kFixedSizeList) {
    ss << ", width=" << width_;
  }
  ss << ", " << (is_optional_ ? "optional" : "required");
  if (has_validity()) {
    ss << ", nulls=" << (validity_.length() - validity_.CountSet());
  }
  ss << ")";
  return ss.str();
}

namespace internal {

void CheckPathShape(const NestedPath& path) {
  DREMEL_CHECK(!path.empty()) << "nested path must not be empty";
  for (size_t k = 0; k + 1 < path.size(); ++k) {
    DREMEL_CHECK(path[k].kind() != Nested::Kind::kPrimitive)
        << "primitive node " << k << " is not the last node of the path";
  }
  DREMEL_CHECK(path.back().kind() == Nested::Kind::kPrimitive)
      << "nested path must end in a primitive node, got " << path.back().ToString();
}

std::vector<int16_t> DefinitionLevelsBefore(const NestedPath& path) {
  std::vector<int16_t> levels(path.size());
  int16_t level = 0;
  for (size_t k = 0; k < path.size(); ++k) {
    levels[k] = level;
    level = static_cast<int16_t>(level + path[k].definition_level_contribution());
  }
  return levels;
}

std::vector<int16_t> RepeatedAncestorCounts(const NestedPath& path) {
  std::vector<int16_t> counts(path.size());
  int16_t count = 0;
  for (size_t k = 0; k < path.size(); ++k) {
    counts[k] = count;
    count = static_cast<int16_t>(count + (path[k].is_repeated() ? 1 : 0));
  }
  return counts;
}

}  // namespace internal

int64_t NumValues(const NestedPath& path) {
  internal::CheckPathShape(path);
  int64_t num_values = path.back().length();
  for (size_t k = 0; k + 1 < path.size(); ++k) {
    const Nested& node = path[k];
    if (!node.is_repeated()) {
      continue;
    }
    for (int64_t i = 0; i < node.length(); ++i) {
      num_values += node.run_length(i) == 0;
    }
  }
  return num_values;
}

int16_t MaxDefinitionLevel(const NestedPath& path) {
  int16_t level = 0;
  for (const Nested& node : path) {
    level = static_cast<int16_t>(level + node.definition_level_contribution());
  }
  return level;
}

int16_t MaxRepetitionLevel(const NestedPath& path) {
  int16_t level = 0;
  for (const Nested& node : path) {
    level = static_cast<int16_t>(level + (node.is_repeated() ? 1 : 0));
  }
  return level;
}

namespace {

Status ValidateNode(const NestedPath& path, size_t k) {
  const Nested& node = path[k];
  if (node.length() < 0) {
    return Status::Invalid("Node ", k, " (", KindToString(node.kind()),
                           ") has negative length ", node.length());
  }
  if (node.has_validity() && node.validity().length() < node.length()) {
    return Status::Invalid("Node ", k, " (", KindToString(node.kind()),
                           ") has a validity bitmap of ", node.validity().length(),
                           " bits for ", node.length(), " slots");
  }

  switch (node.kind()) {
    case Nested::Kind::kList:
    case Nested::Kind::kLargeList: {
      if (node.offsets32() == NULLPTR && node.offsets64() == NULLPTR) {
        return Status::Invalid("Node ", k, " (", KindToString(node.kind()),
                               ") has no offsets");
      }
      if (node.run_start(0) != 0) {
        return Status::Invalid("Node ", k, " (", KindToString(node.kind()),
                               ") offsets start at ", node.run_start(0),
                               ", expected 0");
      }
      for (int64_t i = 0; i < node.length(); ++i) {
        if (node.run_length(i) < 0) {
          return Status::Invalid("Node ", k, " (", KindToString(node.kind()),
                                 ") offsets decrease at position ", i, ": ",
                                 node.run_start(i), " > ", node.run_start(i + 1));
        }
      }
      break;
    }
    case Nested::Kind::kFixedSizeList:
      if (node.width() < 0) {
        return Status::Invalid("Node ", k, " (fixed_size_list) has negative width ",
                               node.width());
      }
      break;
    default:
      break;
  }

  if (k + 1 < path.size()) {
    const Nested& child = path[k + 1];
    if (child.length() != node.child_length()) {
      return Status::Invalid("Node ", k + 1, " (", KindToString(child.kind()),
                             ") has length ", child.length(), " but its parent ",
                             KindToString(node.kind()), " spans ", node.child_length(),
                             " positions");
    }
  }
  return Status::OK();
}

}  // namespace

Status ValidateNestedPath(const NestedPath& path) {
  internal::CheckPathShape(path);

  int64_t def_level = 0;
  for (size_t k = 0; k < path.size(); ++k) {
    RETURN_NOT_OK(ValidateNode(path, k));
    def_level += path[k].definition_level_contribution();
  }
  if (def_level > std::numeric_limits<int16_t>::max()) {
    return Status::Invalid("Nested path of ", path.size(),
                           " nodes has maximum definition level ", def_level,
                           ", which does not fit in int16_t");
  }
  return Status::OK();
}

}  // namespace dremel
