/**
 * Licensed to the Apache Software Foundation (ASF) under one or more
 * contributor license agreements.  See the NOTICE file distributed with
 * this work for additional information regarding copyright ownership.
 * The ASF licenses this file to You under the Apache License, Version 2.0
 * (the "License"); you may not use this file except in compliance with
 * the License.  You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "io/BufferStream.h"

#include <algorithm>
#include <cstddef>

#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::io {

size_t BufferStream::write(const uint8_t *value, size_t size) {
  if (size > 0) {
    const auto* bytes = reinterpret_cast<const std::byte*>(value);
    buffer_.insert(buffer_.end(), bytes, bytes + size);
  }
  return size;
}

size_t BufferStream::read(std::span<std::byte> buf) {
  read_offset_ = std::min(read_offset_, buffer_.size());
  const auto available = buffer_.size() - read_offset_;
  const auto length = std::min(buf.size(), available);
  std::copy_n(buffer_.begin() + gsl::narrow<std::ptrdiff_t>(read_offset_), length, buf.begin());
  read_offset_ += length;
  return length;
}

}  // namespace org::apache::nifi::flowstore::io
