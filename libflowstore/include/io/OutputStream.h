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
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "Stream.h"
#include "utils/Id.h"

namespace org::apache::nifi::flowstore::io {

/**
 * Serializable instances provide base functionality to
 * write certain objects/primitives to a data stream.
 */
class OutputStream : public virtual Stream {
 public:
  /**
   * write value to stream
   * @return resulting write size or STREAM_ERROR
   **/
  virtual size_t write(const uint8_t *value, size_t len) = 0;

  size_t write(std::span<const std::byte> buffer) {
    return write(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());
  }

  size_t write(const std::vector<uint8_t>& buffer, size_t len);

  size_t write(bool value);

  size_t write(const utils::Identifier& value);

  /**
   * write string to stream, prefixed by its uint16 (or uint32 if widened) length
   * @return resulting write size or STREAM_ERROR
   **/
  size_t write(const std::string& str, bool widen = false);

  size_t write(const char* str, bool widen = false);

  /**
  * writes sizeof(Integral) bytes to the stream
  * @param value to write
  * @return resulting write size
  **/
  template<typename Integral, typename = std::enable_if_t<std::is_unsigned<Integral>::value && !std::is_same<Integral, bool>::value>>
  size_t write(Integral value) {
    uint8_t buffer[sizeof(Integral)]{};

    for (std::size_t byteIdx = 0; byteIdx < sizeof(Integral); ++byteIdx) {
      buffer[byteIdx] = static_cast<uint8_t>(value >> (8*(sizeof(Integral) - 1) - 8*byteIdx));
    }

    return write(buffer, sizeof(Integral));
  }

  /**
   * Flushes buffered data to the underlying resource
   * @return false on failure
   */
  virtual bool flush() {
    return true;
  }

 private:
  size_t write_str(const char* str, uint32_t len, bool widen);
};

}  // namespace org::apache::nifi::flowstore::io
