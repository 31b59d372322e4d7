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
#include "io/Gzip.h"

#include <zlib.h>

#include <array>
#include <memory>

#include "core/logging/LoggerFactory.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::io::gzip {

namespace {

// 15 bits of window, +16 selects the gzip wrapper instead of the zlib one
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr size_t CHUNK_SIZE = 16 * 1024;

std::shared_ptr<core::logging::Logger> logger() {
  static const auto logger = core::logging::getLoggerByName("org::apache::nifi::flowstore::io::gzip");
  return logger;
}

void setInput(z_stream& stream, std::span<const std::byte> input) {
  stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
  stream.avail_in = gsl::narrow<uInt>(input.size());
}

}  // namespace

std::optional<std::vector<std::byte>> compress(std::span<const std::byte> input) {
  z_stream stream{};
  if (const int ret = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY); ret != Z_OK) {
    logger()->log_error("Failed to initialize compression: {}", ret);
    return std::nullopt;
  }
  const auto end = gsl::finally([&stream] { deflateEnd(&stream); });
  setInput(stream, input);

  std::vector<std::byte> output;
  std::array<std::byte, CHUNK_SIZE> chunk{};
  int ret = Z_OK;
  do {
    stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
    stream.avail_out = gsl::narrow<uInt>(chunk.size());
    ret = deflate(&stream, Z_FINISH);
    if (ret == Z_STREAM_ERROR) {
      logger()->log_error("Compression failed: {}", stream.msg ? stream.msg : "stream error");
      return std::nullopt;
    }
    output.insert(output.end(), chunk.begin(), chunk.begin() + (chunk.size() - stream.avail_out));
  } while (ret != Z_STREAM_END);
  return output;
}

std::optional<std::vector<std::byte>> decompress(std::span<const std::byte> input) {
  z_stream stream{};
  if (const int ret = inflateInit2(&stream, GZIP_WINDOW_BITS); ret != Z_OK) {
    logger()->log_error("Failed to initialize decompression: {}", ret);
    return std::nullopt;
  }
  const auto end = gsl::finally([&stream] { inflateEnd(&stream); });
  setInput(stream, input);

  std::vector<std::byte> output;
  std::array<std::byte, CHUNK_SIZE> chunk{};
  int ret = Z_OK;
  do {
    stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
    stream.avail_out = gsl::narrow<uInt>(chunk.size());
    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      // Z_BUF_ERROR here means the input ended before the gzip trailer
      logger()->log_error("Decompression failed: {}", stream.msg ? stream.msg : "truncated input");
      return std::nullopt;
    }
    output.insert(output.end(), chunk.begin(), chunk.begin() + (chunk.size() - stream.avail_out));
  } while (ret != Z_STREAM_END);
  return output;
}

}  // namespace org::apache::nifi::flowstore::io::gzip
