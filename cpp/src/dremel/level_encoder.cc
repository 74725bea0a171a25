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

#include "dremel/level_encoder.h"

#include <limits>
#include <utility>

#include "dremel/io/memory.h"
#include "dremel/level_builder.h"
#include "dremel/util/bit_util.h"
#include "dremel/util/logging.h"

namespace dremel {

// ----------------------------------------------------------------------
// LevelEncoder

LevelEncoder::LevelEncoder() : bit_width_(0), max_level_(0) {}
LevelEncoder::~LevelEncoder() {}

int LevelEncoder::BitWidth(int16_t max_level) {
  return bit_util::Log2(static_cast<uint64_t>(max_level) + 1);
}

Status LevelEncoder::Init(int16_t max_level, io::OutputStream* sink,
                          int64_t max_literal_run) {
  if (max_level < 0) {
    return Status::Invalid("Maximum level must not be negative, got ", max_level);
  }
  max_level_ = max_level;
  bit_width_ = BitWidth(max_level);
  DREMEL_ASSIGN_OR_RAISE(rle_encoder_,
                         util::RleBitPackedEncoder::Make(sink, bit_width_, max_literal_run));
  return Status::OK();
}

Status LevelEncoder::Encode(const int16_t* levels, int64_t num_levels) {
  if (!rle_encoder_) {
    return Status::Invalid("Level encoder is not initialized");
  }
  for (int64_t i = 0; i < num_levels; ++i) {
    const int16_t level = levels[i];
    if (DREMEL_PREDICT_FALSE(level < 0 || level > max_level_)) {
      return Status::Invalid("Level ", level, " at position ", i,
                             " is outside [0, ", max_level_, "]");
    }
    RETURN_NOT_OK(rle_encoder_->Put(static_cast<uint32_t>(level)));
  }
  return Status::OK();
}

Status LevelEncoder::Flush() {
  if (!rle_encoder_) {
    return Status::Invalid("Level encoder is not initialized");
  }
  return rle_encoder_->Flush();
}

// ----------------------------------------------------------------------
// Level section framing

namespace {

Result<std::vector<uint8_t>> EncodeLevelStream(const int16_t* levels, int64_t num_levels,
                                               int16_t max_level, int64_t max_literal_run) {
  io::BufferOutputStream stream;
  LevelEncoder encoder;
  RETURN_NOT_OK(encoder.Init(max_level, &stream, max_literal_run));
  RETURN_NOT_OK(encoder.Encode(levels, num_levels));
  RETURN_NOT_OK(encoder.Flush());
  DREMEL_LOG(DEBUG) << "Encoded " << num_levels << " levels up to " << max_level << " at "
                    << encoder.bit_width() << " bits into " << encoder.len() << " bytes";
  return stream.Finish();
}

Status WriteLevelStream(const std::vector<uint8_t>& encoded, DataPageVersion version,
                        io::OutputStream* sink, int64_t* byte_length) {
  *byte_length = static_cast<int64_t>(encoded.size());
  if (version == DataPageVersion::V1) {
    if (encoded.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
      return Status::CapacityError("Level stream of ", encoded.size(),
                                   " bytes does not fit a V1 length prefix");
    }
    const int32_t length =
        bit_util::ToLittleEndian(static_cast<int32_t>(encoded.size()));
    RETURN_NOT_OK(sink->Write(&length, sizeof(int32_t)));
    *byte_length += static_cast<int64_t>(sizeof(int32_t));
  }
  return sink->Write(encoded.data(), static_cast<int64_t>(encoded.size()));
}

}  // namespace

Result<LevelWriteResult> WriteRepDefLevels(const int16_t* def_levels,
                                           const int16_t* rep_levels, int64_t num_levels,
                                           int16_t max_def_level, int16_t max_rep_level,
                                           DataPageVersion version, io::OutputStream* sink,
                                           int64_t max_literal_run) {
  if (sink == NULLPTR) {
    return Status::Invalid("Level section requires an output stream");
  }
  if (num_levels < 0) {
    return Status::Invalid("Negative number of levels: ", num_levels);
  }

  LevelWriteResult result;
  result.num_values = num_levels;
  result.max_def_level = max_def_level;
  result.max_rep_level = max_rep_level;

  std::vector<uint8_t> rep_stream;
  std::vector<uint8_t> def_stream;
  if (max_rep_level > 0) {
    DREMEL_ASSIGN_OR_RAISE(rep_stream, EncodeLevelStream(rep_levels, num_levels,
                                                         max_rep_level, max_literal_run));
  }
  if (max_def_level > 0) {
    DREMEL_ASSIGN_OR_RAISE(def_stream, EncodeLevelStream(def_levels, num_levels,
                                                         max_def_level, max_literal_run));
  }

  if (max_rep_level > 0) {
    RETURN_NOT_OK(
        WriteLevelStream(rep_stream, version, sink, &result.rep_levels_byte_length));
  }
  if (max_def_level > 0) {
    RETURN_NOT_OK(
        WriteLevelStream(def_stream, version, sink, &result.def_levels_byte_length));
  }
  return result;
}

// ----------------------------------------------------------------------
// NestedLevelWriter

NestedLevelWriter::NestedLevelWriter(std::shared_ptr<WriterProperties> properties)
    : properties_(std::move(properties)) {
  DREMEL_CHECK(properties_ != NULLPTR) << "NestedLevelWriter requires properties";
}

Result<LevelWriteResult> NestedLevelWriter::Write(const NestedPath& path,
                                                  io::OutputStream* sink) {
  switch (properties_->level_algorithm()) {
    case LevelAlgorithm::kStreaming:
      RETURN_NOT_OK(ComputeLevels(path, &def_levels_, &rep_levels_));
      break;
    case LevelAlgorithm::kRecursive:
      RETURN_NOT_OK(ComputeLevelsRecursive(path, &def_levels_, &rep_levels_));
      break;
  }

  const int16_t max_def_level = MaxDefinitionLevel(path);
  const int16_t max_rep_level = MaxRepetitionLevel(path);
  DREMEL_LOG(DEBUG) << "Computed " << def_levels_.size() << " levels for "
                    << path.back().ToString() << " with "
                    << LevelAlgorithmToString(properties_->level_algorithm())
                    << " algorithm, max definition level " << max_def_level
                    << ", max repetition level " << max_rep_level;

  DREMEL_ASSIGN_OR_RAISE(
      auto result,
      WriteRepDefLevels(def_levels_.data(), rep_levels_.data(),
                        static_cast<int64_t>(def_levels_.size()), max_def_level,
                        max_rep_level, properties_->data_page_version(), sink,
                        properties_->max_literal_run_length()));
  DREMEL_LOG(DEBUG) << "Wrote " << DataPageVersionToString(properties_->data_page_version())
                    << " level section: " << result.rep_levels_byte_length
                    << " repetition bytes, " << result.def_levels_byte_length
                    << " definition bytes";
  return result;
}

}  // namespace dremel
