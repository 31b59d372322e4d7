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

#include <filesystem>
#include <fstream>
#include <memory>

#include "BaseStream.h"
#include "core/logging/LoggerFactory.h"

namespace org::apache::nifi::flowstore::io {

/**
 * Stream over a file of the content or swap directories. A stream opened for
 * reading starts at the beginning of the file and can seek, a stream opened for
 * writing only moves forward.
 */
class FileStream : public io::BaseStream {
 public:
  enum class Mode {
    Read,
    Overwrite,
    Append
  };

  FileStream(std::filesystem::path path, Mode mode);

  ~FileStream() override {
    close();
  }

  void close() final;

  void seek(size_t offset) override;

  [[nodiscard]] size_t tell() const override {
    return offset_;
  }

  [[nodiscard]] size_t size() const override {
    return length_;
  }

  [[nodiscard]] bool isOpen() const {
    return file_stream_ && file_stream_->is_open();
  }

  using BaseStream::read;
  using BaseStream::write;

  size_t read(std::span<std::byte> buf) override;

  size_t write(const uint8_t *value, size_t size) override;

  bool flush() override;

  /**
   * Flushes the stream and forces the data of the file to the storage device.
   */
  bool sync();

 private:
  const std::filesystem::path path_;
  const Mode mode_;
  std::unique_ptr<std::fstream> file_stream_;
  size_t offset_{0};
  size_t length_{0};

  std::shared_ptr<core::logging::Logger> logger_ = core::logging::LoggerFactory<FileStream>::getLogger();
};

}  // namespace org::apache::nifi::flowstore::io
