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
#include "io/FileStream.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "magic_enum.hpp"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::io {

namespace {

std::ios_base::openmode toOpenMode(FileStream::Mode mode) {
  switch (mode) {
    case FileStream::Mode::Read: return std::fstream::in | std::fstream::binary;
    case FileStream::Mode::Overwrite: return std::fstream::out | std::fstream::trunc | std::fstream::binary;
    case FileStream::Mode::Append: return std::fstream::out | std::fstream::app | std::fstream::binary;
  }
  return std::fstream::in | std::fstream::binary;
}

}  // namespace

FileStream::FileStream(std::filesystem::path path, Mode mode)
    : path_(std::move(path)),
      mode_(mode),
      file_stream_(std::make_unique<std::fstream>(path_, toOpenMode(mode))) {
  if (!file_stream_->is_open()) {
    // a missing file is an expected outcome for readers, they report it themselves
    logger_->log_with_level(mode_ == Mode::Read ? core::logging::LOG_LEVEL::debug : core::logging::LOG_LEVEL::err,
        "Could not open {} in {} mode: {}", path_, magic_enum::enum_name(mode_), strerror(errno));
    return;
  }
  if (mode_ != Mode::Overwrite) {
    std::error_code error;
    const auto file_size = std::filesystem::file_size(path_, error);
    if (error) {
      logger_->log_error("Could not determine the size of {}: {}", path_, error.message());
      file_stream_.reset();
      return;
    }
    length_ = gsl::narrow<size_t>(file_size);
  }
  if (mode_ == Mode::Append) {
    offset_ = length_;
  }
}

void FileStream::close() {
  file_stream_.reset();
}

void FileStream::seek(size_t offset) {
  if (mode_ != Mode::Read) {
    throw std::runtime_error("Seek is not supported in " + std::string(magic_enum::enum_name(mode_)) + " mode");
  }
  if (!isOpen()) {
    logger_->log_error("Cannot seek in {}, it is not open", path_);
    return;
  }
  file_stream_->clear();
  if (!file_stream_->seekg(gsl::narrow<std::streamoff>(offset))) {
    logger_->log_error("Could not seek to {} in {}", offset, path_);
    return;
  }
  offset_ = offset;
}

size_t FileStream::read(std::span<std::byte> buf) {
  if (buf.empty()) {
    return 0;
  }
  if (mode_ != Mode::Read || !isOpen()) {
    logger_->log_error("Cannot read from {}, it is not open for reading", path_);
    return STREAM_ERROR;
  }
  file_stream_->read(reinterpret_cast<char*>(buf.data()), gsl::narrow<std::streamsize>(buf.size()));
  if (file_stream_->bad()) {
    logger_->log_error("Error reading from {}", path_);
    return STREAM_ERROR;
  }
  const auto count = gsl::narrow<size_t>(file_stream_->gcount());
  // a short read at the end of the file is not an error
  file_stream_->clear();
  offset_ += count;
  return count;
}

size_t FileStream::write(const uint8_t *value, size_t size) {
  if (size == 0) {
    return 0;
  }
  if (mode_ == Mode::Read || !isOpen()) {
    logger_->log_error("Cannot write to {}, it is not open for writing", path_);
    return STREAM_ERROR;
  }
  if (!file_stream_->write(reinterpret_cast<const char*>(value), gsl::narrow<std::streamsize>(size))) {
    logger_->log_error("Error writing to {}", path_);
    return STREAM_ERROR;
  }
  offset_ += size;
  length_ = std::max(length_, offset_);
  return size;
}

bool FileStream::flush() {
  if (!isOpen()) {
    return false;
  }
  if (!file_stream_->flush()) {
    logger_->log_error("Error flushing {}", path_);
    return false;
  }
  return true;
}

bool FileStream::sync() {
  if (!flush()) {
    return false;
  }
  // fsync through a separate descriptor: the data of the file is synced, not the descriptor's
  const int fd = ::open(path_.c_str(), O_RDONLY);
  if (fd < 0) {
    logger_->log_error("Error syncing {}: {}", path_, strerror(errno));
    return false;
  }
  const bool synced = ::fsync(fd) == 0;
  if (!synced) {
    logger_->log_error("Error syncing {}: {}", path_, strerror(errno));
  }
  ::close(fd);
  return synced;
}

}  // namespace org::apache::nifi::flowstore::io
