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

// In-memory output stream implementations

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "dremel/io/interfaces.h"
#include "dremel/result.h"
#include "dremel/status.h"
#include "dremel/util/visibility.h"

namespace dremel {
namespace io {

/// \brief An output stream that writes to a growable in-memory buffer
class DREMEL_EXPORT BufferOutputStream : public OutputStream {
 public:
  explicit BufferOutputStream(int64_t initial_capacity = kBufferMinimumSize);

  ~BufferOutputStream() override;

  /// \brief Create in-memory output stream with indicated capacity
  /// \param[in] initial_capacity the initial allocated internal capacity of
  /// the OutputStream
  /// \return the created stream
  static Result<std::shared_ptr<BufferOutputStream>> Create(
      int64_t initial_capacity = kBufferMinimumSize);

  // Implement the OutputStream interface

  /// Close the stream, preserving the buffer (retrieve it with Finish()).
  Status Close() override;
  bool closed() const override;
  Result<int64_t> Tell() const override;
  Status Write(const void* data, int64_t nbytes) override;

  /// \brief Close the stream and return the buffer
  Result<std::vector<uint8_t>> Finish();

  /// \brief Initialize state of OutputStream with newly allocated memory and
  /// set position to 0
  /// \param[in] initial_capacity the starting allocated capacity
  /// \return Status
  Status Reset(int64_t initial_capacity = kBufferMinimumSize);

  int64_t capacity() const { return static_cast<int64_t>(buffer_.capacity()); }

  /// Bytes written so far, valid until the next Write or Reset.
  const uint8_t* data() const { return buffer_.data(); }

 private:
  static constexpr int64_t kBufferMinimumSize = 256;

  std::vector<uint8_t> buffer_;
  bool is_open_;
};

}  // namespace io
}  // namespace dremel
