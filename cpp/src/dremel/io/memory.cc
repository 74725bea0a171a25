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

#include "dremel/io/memory.h"

#include <utility>

#include "dremel/util/logging.h"

namespace dremel {
namespace io {

// ----------------------------------------------------------------------
// OutputStream that writes to resizable buffer

BufferOutputStream::BufferOutputStream(int64_t initial_capacity) : is_open_(true) {
  buffer_.reserve(static_cast<size_t>(initial_capacity));
}

Result<std::shared_ptr<BufferOutputStream>> BufferOutputStream::Create(
    int64_t initial_capacity) {
  if (initial_capacity < 0) {
    return Status::Invalid("Negative buffer capacity: ", initial_capacity);
  }
  return std::make_shared<BufferOutputStream>(initial_capacity);
}

BufferOutputStream::~BufferOutputStream() {
  if (is_open_) {
    Status st = Close();
    if (!st.ok()) {
      st.Warn("Failed to close BufferOutputStream");
    }
  }
}

Status BufferOutputStream::Reset(int64_t initial_capacity) {
  if (initial_capacity < 0) {
    return Status::Invalid("Negative buffer capacity: ", initial_capacity);
  }
  buffer_.clear();
  buffer_.shrink_to_fit();
  buffer_.reserve(static_cast<size_t>(initial_capacity));
  is_open_ = true;
  return Status::OK();
}

Status BufferOutputStream::Close() {
  is_open_ = false;
  return Status::OK();
}

bool BufferOutputStream::closed() const { return !is_open_; }

Result<std::vector<uint8_t>> BufferOutputStream::Finish() {
  RETURN_NOT_OK(Close());
  std::vector<uint8_t> result = std::move(buffer_);
  buffer_.clear();
  return result;
}

Result<int64_t> BufferOutputStream::Tell() const {
  return static_cast<int64_t>(buffer_.size());
}

Status BufferOutputStream::Write(const void* data, int64_t nbytes) {
  if (DREMEL_PREDICT_FALSE(!is_open_)) {
    return Status::IOError("OutputStream is closed");
  }
  DREMEL_DCHECK_GE(nbytes, 0);
  if (DREMEL_PREDICT_TRUE(nbytes > 0)) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(data);
    buffer_.insert(buffer_.end(), bytes, bytes + nbytes);
  }
  return Status::OK();
}

}  // namespace io
}  // namespace dremel
