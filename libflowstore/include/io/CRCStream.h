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

#include <zlib.h>

#include <cstdint>

#include "BaseStream.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::io {

/**
 * Passes reads and writes through to a stream and keeps the CRC-32 of the
 * bytes that went by in either direction. The wrapped stream must outlive it.
 */
class CRCStream : public BaseStream {
 public:
  explicit CRCStream(gsl::not_null<BaseStream*> stream, uint64_t initial_crc = 0)
      : stream_(stream),
        crc_(gsl::narrow<uLong>(initial_crc)) {
  }

  using BaseStream::read;
  using BaseStream::write;

  size_t read(std::span<std::byte> buf) override {
    const auto ret = stream_->read(buf);
    if (ret > 0 && !isError(ret)) {
      crc_ = crc32(crc_, reinterpret_cast<const Bytef*>(buf.data()), gsl::narrow<uInt>(ret));
    }
    return ret;
  }

  size_t write(const uint8_t* value, size_t size) override {
    const auto ret = stream_->write(value, size);
    if (ret > 0 && !isError(ret)) {
      crc_ = crc32(crc_, value, gsl::narrow<uInt>(ret));
    }
    return ret;
  }

  bool flush() override {
    return stream_->flush();
  }

  [[nodiscard]] size_t size() const override {
    return stream_->size();
  }

  [[nodiscard]] uint64_t getCRC() const {
    return crc_;
  }

  void reset() {
    crc_ = 0;
  }

 private:
  gsl::not_null<BaseStream*> stream_;
  uLong crc_;
};

}  // namespace org::apache::nifi::flowstore::io
