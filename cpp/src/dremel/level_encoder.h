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
#include <vector>

#include "dremel/io/interfaces.h"
#include "dremel/nested.h"
#include "dremel/properties.h"
#include "dremel/result.h"
#include "dremel/status.h"
#include "dremel/util/rle_encoding.h"
#include "dremel/util/visibility.h"

namespace dremel {

/// \brief Hybrid RLE encoder for one stream of definition or repetition levels
class DREMEL_EXPORT LevelEncoder {
 public:
  LevelEncoder();
  ~LevelEncoder();

  /// Initialize the encoder for levels in [0, max_level], writing to `sink`.
  Status Init(int16_t max_level, io::OutputStream* sink,
              int64_t max_literal_run = util::kDefaultMaxLiteralRunLength);

  /// Encode a batch of levels. Returns Invalid if a level is out of range.
  Status Encode(const int16_t* levels, int64_t num_levels);

  /// Write out pending runs.
  Status Flush();

  int bit_width() const { return bit_width_; }

  /// Encoded bytes handed to the sink so far.
  int64_t len() const { return rle_encoder_ ? rle_encoder_->bytes_written() : 0; }

  /// Bits needed for every level in [0, max_level].
  static int BitWidth(int16_t max_level);

 private:
  int bit_width_;
  int16_t max_level_;
  std::unique_ptr<util::RleBitPackedEncoder> rle_encoder_;
};

/// \brief Outcome of writing the level section of one data page
struct LevelWriteResult {
  /// Number of level entries in each stream
  int64_t num_values = 0;
  int16_t max_def_level = 0;
  int16_t max_rep_level = 0;
  /// Bytes each stream occupies in the section, including the V1 length prefix
  int64_t def_levels_byte_length = 0;
  int64_t rep_levels_byte_length = 0;
};

/// \brief Write the repetition then the definition level stream of a page
///
/// A stream whose maximum level is 0 carries no information and is omitted;
/// its level pointer may then be null. Both streams are encoded before any
/// byte reaches `sink`.
DREMEL_EXPORT Result<LevelWriteResult> WriteRepDefLevels(
    const int16_t* def_levels, const int16_t* rep_levels, int64_t num_levels,
    int16_t max_def_level, int16_t max_rep_level, DataPageVersion version,
    io::OutputStream* sink, int64_t max_literal_run = util::kDefaultMaxLiteralRunLength);

/// \brief Computes and writes the level section of one leaf column
///
/// One writer serves one column at a time; use one writer per thread.
class DREMEL_EXPORT NestedLevelWriter {
 public:
  explicit NestedLevelWriter(
      std::shared_ptr<WriterProperties> properties = default_writer_properties());

  /// \brief Validate `path`, compute its levels and write the level section
  ///
  /// Nothing is written if the path is invalid.
  Result<LevelWriteResult> Write(const NestedPath& path, io::OutputStream* sink);

  /// Definition levels computed by the last Write, empty if the path was invalid
  const std::vector<int16_t>& def_levels() const { return def_levels_; }

  /// Repetition levels computed by the last Write, empty if the path was invalid
  const std::vector<int16_t>& rep_levels() const { return rep_levels_; }

  const std::shared_ptr<WriterProperties>& properties() const { return properties_; }

 private:
  std::shared_ptr<WriterProperties> properties_;
  std::vector<int16_t> def_levels_;
  std::vector<int16_t> rep_levels_;
};

}  // namespace dremel
