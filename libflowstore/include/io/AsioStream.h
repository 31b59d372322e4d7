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

#include <sys/socket.h>
#include <sys/time.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "BaseStream.h"
#include "core/logging/LoggerFactory.h"
#include "asio/ts/internet.hpp"
#include "asio/read.hpp"
#include "asio/write.hpp"

namespace org::apache::nifi::flowstore::io {

/**
 * Blocking stream over a connected asio socket.
 */
template<typename AsioSocketStreamType>
class AsioStream : public io::BaseStream {
 public:
  explicit AsioStream(AsioSocketStreamType&& stream) : stream_(std::move(stream)) {}

  ~AsioStream() override {
    close();
  }

  using BaseStream::read;
  using BaseStream::write;

  size_t read(std::span<std::byte> target_buffer) override;
  size_t write(const uint8_t *source_buffer, size_t size) override;

  void close() override;

  [[nodiscard]] bool isOpen() const {
    return stream_.is_open();
  }

  /**
   * Sets the receive and send timeout of the underlying socket, a blocked read or write fails after this period
   */
  bool setTimeout(std::chrono::milliseconds timeout);

 private:
  AsioSocketStreamType stream_;

  std::shared_ptr<core::logging::Logger> logger_ = core::logging::LoggerFactory<AsioStream<AsioSocketStreamType>>::getLogger();
};

template<typename AsioSocketStreamType>
size_t AsioStream<AsioSocketStreamType>::read(std::span<std::byte> target_buffer) {
  if (target_buffer.empty()) {
    return 0;
  }

  asio::error_code err;
  auto read_bytes = stream_.read_some(asio::buffer(target_buffer.data(), target_buffer.size()), err);
  if (err) {
    logger_->log_debug("Reading from socket failed: {}", err.message());
    return STREAM_ERROR;
  }

  return read_bytes;
}

template<typename AsioSocketStreamType>
size_t AsioStream<AsioSocketStreamType>::write(const uint8_t *source_buffer, size_t size) {
  if (size == 0) {
    return 0;
  }

  if (source_buffer == nullptr) {
    return STREAM_ERROR;
  }

  asio::error_code err;
  auto bytes_written = asio::write(stream_, asio::buffer(source_buffer, size), asio::transfer_exactly(size), err);
  if (err || bytes_written != size) {
    logger_->log_debug("Writing to socket failed: {}", err.message());
    return STREAM_ERROR;
  }

  return bytes_written;
}

template<typename AsioSocketStreamType>
void AsioStream<AsioSocketStreamType>::close() {
  if (!stream_.is_open()) {
    return;
  }
  asio::error_code err;
  stream_.shutdown(asio::socket_base::shutdown_both, err);
  stream_.close(err);
  if (err) {
    logger_->log_debug("Closing socket failed: {}", err.message());
  }
}

template<typename AsioSocketStreamType>
bool AsioStream<AsioSocketStreamType>::setTimeout(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  const auto handle = stream_.native_handle();
  if (setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 || setsockopt(handle, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
    logger_->log_warn("Could not set socket timeout to {}", timeout);
    return false;
  }
  return true;
}

}  // namespace org::apache::nifi::flowstore::io
