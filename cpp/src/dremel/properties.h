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
#include <memory>
#include <string>

#include "dremel/result.h"
#include "dremel/util/rle_encoding.h"
#include "dremel/util/visibility.h"

namespace dremel {

/// Controls how the level section of a data page is framed.
///
/// V1 pages prefix each hybrid RLE stream with its 4-byte little-endian byte
/// length. V2 pages store the streams raw and carry their lengths in the page
/// header instead.
enum class DataPageVersion { V1, V2 };

/// Selects the level computation used by NestedLevelWriter.
enum class LevelAlgorithm {
  /// The pull-based iterator, with state bounded by the path depth
  kStreaming,
  /// The recursive reference walk
  kRecursive
};

DREMEL_EXPORT const char* DataPageVersionToString(DataPageVersion version);
DREMEL_EXPORT const char* LevelAlgorithmToString(LevelAlgorithm algorithm);

class DREMEL_EXPORT WriterProperties {
 public:
  class Builder {
   public:
    Builder()
        : data_page_version_(DataPageVersion::V1),
          level_algorithm_(LevelAlgorithm::kStreaming),
          max_literal_run_length_(util::kDefaultMaxLiteralRunLength) {}
    virtual ~Builder() {}

    /// Specify the data page version.
    /// Default V1.
    Builder* data_page_version(DataPageVersion data_page_version) {
      data_page_version_ = data_page_version;
      return this;
    }

    /// Specify how levels are computed.
    /// Default kStreaming.
    Builder* level_algorithm(LevelAlgorithm level_algorithm) {
      level_algorithm_ = level_algorithm;
      return this;
    }

    /// Specify how many values a bit-packed literal run may buffer before it is
    /// written. Must be a positive multiple of 8.
    /// Default 8192.
    Builder* max_literal_run_length(int64_t max_literal_run_length) {
      max_literal_run_length_ = max_literal_run_length;
      return this;
    }

    Result<std::shared_ptr<WriterProperties>> Build();

   private:
    DataPageVersion data_page_version_;
    LevelAlgorithm level_algorithm_;
    int64_t max_literal_run_length_;
  };

  DataPageVersion data_page_version() const { return data_page_version_; }

  LevelAlgorithm level_algorithm() const { return level_algorithm_; }

  int64_t max_literal_run_length() const { return max_literal_run_length_; }

  std::string ToString() const;

 private:
  WriterProperties(DataPageVersion data_page_version, LevelAlgorithm level_algorithm,
                   int64_t max_literal_run_length)
      : data_page_version_(data_page_version),
        level_algorithm_(level_algorithm),
        max_literal_run_length_(max_literal_run_length) {}

  DataPageVersion data_page_version_;
  LevelAlgorithm level_algorithm_;
  int64_t max_literal_run_length_;
};

DREMEL_EXPORT const std::shared_ptr<WriterProperties>& default_writer_properties();

}  // namespace dremel
