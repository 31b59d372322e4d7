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
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "BaseStream.h"

namespace org::apache::nifi::flowstore::io {

/**
 * In-memory stream: writes append to the buffer, reads consume it from the read offset.
 */
class BufferStream : public BaseStream {
 public:
  BufferStream() = default;

  explicit BufferStream(std::span<const std::byte> buf) {
    write(buf);
  }

  explicit BufferStream(const std::string& data) {
    write(reinterpret_cast<const uint8_t*>(data.c_str()), data.length());
  }

  using BaseStream::read;
  using BaseStream::write;

  size_t write(const uint8_t* value, size_t size) final;

  size_t read(std::span<std::byte> buffer) override;

  void seek(size_t offset) override {
    read_offset_ = offset;
  }

  [[nodiscard]] size_t tell() const override {
    return read_offset_;
  }

  [[nodiscard]] std::span<const std::byte> getBuffer() const override {
    return buffer_;
  }

  std::vector<std::byte> moveBuffer() {
    return std::exchange(buffer_, {});
  }

  [[nodiscard]] size_t size() const override {
    return buffer_.size();
  }

 private:
  std::vector<std::byte> buffer_;
  size_t read_offset_ = 0;
};

}  // namespace org::apache::nifi::flowstore::io
