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

#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore {
class Properties;
}  // namespace org::apache::nifi::flowstore

namespace org::apache::nifi::flowstore::utils {

class Identifier {
  friend struct ::std::hash<Identifier>;

 public:
  using Data = std::array<uint8_t, 16>;

  Identifier() = default;
  explicit Identifier(const Data& data);
  Identifier& operator=(const Data& data);

  Identifier& operator=(const std::string& idStr);

  explicit operator bool() const {
    return !isNil();
  }

  bool isNil() const;

  bool operator!=(const Identifier& other) const;
  bool operator==(const Identifier& other) const;
  bool operator<(const Identifier& other) const;

  std::string to_string() const;

  static std::optional<Identifier> parse(std::string_view str);

 private:
  static bool parseByte(Data& data, const char* input, int& charIdx, int& byteIdx);

  Data data_{};
};

class IdGenerator {
 public:
  Identifier generate();
  void initialize(const std::shared_ptr<Properties>& properties);

  static std::shared_ptr<IdGenerator> getIdGenerator() {
    static std::shared_ptr<IdGenerator> generator = std::shared_ptr<IdGenerator>(new IdGenerator());
    return generator;
  }

 private:
  enum class Implementation {
    Time,
    Random
  };

  IdGenerator();

  Implementation implementation_;
  std::mutex uuid_mutex_;
  std::shared_ptr<core::logging::Logger> logger_;
};

/**
 * Generates "<millis>-<counter>" strings, unique within the process
 */
class NonRepeatingStringGenerator {
 public:
  NonRepeatingStringGenerator();

  std::string generate() {
    return prefix_ + std::to_string(incrementor_++);
  }

 private:
  std::atomic<uint64_t> incrementor_{0};
  std::string prefix_;
};

}  // namespace org::apache::nifi::flowstore::utils

namespace std {
template<>
struct hash<org::apache::nifi::flowstore::utils::Identifier> {
  size_t operator()(const org::apache::nifi::flowstore::utils::Identifier& id) const noexcept {
    size_t first{};
    size_t second{};
    static_assert(sizeof(id.data_) == 2 * sizeof(size_t));
    memcpy(&first, id.data_.data(), sizeof(size_t));
    memcpy(&second, id.data_.data() + sizeof(size_t), sizeof(size_t));
    return first ^ (second + 0x9e3779b9 + (first << 6) + (first >> 2));
  }
};
}  // namespace std
