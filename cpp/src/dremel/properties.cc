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

#include "dremel/properties.h"

#include <sstream>

#include "dremel/util/bit_util.h"
#include "dremel/util/logging.h"

namespace dremel {

const char* DataPageVersionToString(DataPageVersion version) {
  switch (version) {
    case DataPageVersion::V1:
      return "V1";
    case DataPageVersion::V2:
      return "V2";
  }
  return "unknown";
}

const char* LevelAlgorithmToString(LevelAlgorithm algorithm) {
  switch (algorithm) {
    case LevelAlgorithm::kStreaming:
      return "streaming";
    case LevelAlgorithm::kRecursive:
      return "recursive";
  }
  return "unknown";
}

Result<std::shared_ptr<WriterProperties>> WriterProperties::Builder::Build() {
  if (max_literal_run_length_ <= 0 ||
      !bit_util::IsMultipleOf8(max_literal_run_length_)) {
    return Status::Invalid(
        "max_literal_run_length must be a positive multiple of 8, got ",
        max_literal_run_length_);
  }
  return std::shared_ptr<WriterProperties>(new WriterProperties(
      data_page_version_, level_algorithm_, max_literal_run_length_));
}

std::string WriterProperties::ToString() const {
  std::stringstream ss;
  ss << "WriterProperties(data_page_version=" << DataPageVersionToString(data_page_version_)
     << ", level_algorithm=" << LevelAlgorithmToString(level_algorithm_)
     << ", max_literal_run_length=" << max_literal_run_length_ << ")";
  return ss.str();
}

const std::shared_ptr<WriterProperties>& default_writer_properties() {
  static std::shared_ptr<WriterProperties> default_writer_properties = [] {
    auto maybe_properties = WriterProperties::Builder().Build();
    DREMEL_CHECK_OK(maybe_properties.status());
    return maybe_properties.MoveValueUnsafe();
  }();
  return default_writer_properties;
}

}  // namespace dremel
