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
#include "utils/Id.h"

#include <uuid/uuid.h>

#include <chrono>
#include <stdexcept>

#include "core/logging/LoggerFactory.h"
#include "properties/Properties.h"
#include "utils/StringUtils.h"

namespace org::apache::nifi::flowstore::utils {

namespace {
constexpr std::string_view hex_lut = "0123456789abcdef";

bool from_hex(char c, uint8_t& out) {
  if (c >= '0' && c <= '9') {
    out = static_cast<uint8_t>(c - '0');
  } else if (c >= 'a' && c <= 'f') {
    out = static_cast<uint8_t>(c - 'a' + 10);
  } else if (c >= 'A' && c <= 'F') {
    out = static_cast<uint8_t>(c - 'A' + 10);
  } else {
    return false;
  }
  return true;
}
}  // namespace

Identifier::Identifier(const Data& data) : data_(data) {}

Identifier& Identifier::operator=(const Data& data) {
  data_ = data;
  return *this;
}

Identifier& Identifier::operator=(const std::string& idStr) {
  const auto id = Identifier::parse(idStr);
  if (!id) {
    throw std::runtime_error("Couldn't parse UUID");
  }
  *this = id.value();
  return *this;
}

bool Identifier::isNil() const {
  return *this == Identifier{};
}

bool Identifier::operator!=(const Identifier& other) const {
  return !(*this == other);
}

bool Identifier::operator==(const Identifier& other) const {
  return data_ == other.data_;
}

bool Identifier::operator<(const Identifier& other) const {
  return data_ < other.data_;
}

std::string Identifier::to_string() const {
  // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx is 36 long: 16 bytes * 2 hex digits / byte + 4 hyphens
  std::string uuidStr;
  uuidStr.reserve(36);
  for (size_t byteIdx = 0; byteIdx < data_.size(); ++byteIdx) {
    if (byteIdx == 4 || byteIdx == 6 || byteIdx == 8 || byteIdx == 10) {
      uuidStr.push_back('-');
    }
    uuidStr.push_back(hex_lut[data_[byteIdx] >> 4]);
    uuidStr.push_back(hex_lut[data_[byteIdx] & 0xf]);
  }
  return uuidStr;
}

std::optional<Identifier> Identifier::parse(std::string_view str) {
  Identifier id;
  if (str.length() != 36) return {};
  int charIdx = 0;
  int byteIdx = 0;
  const char* input = str.data();

  // [xxxxxxxx]-xxxx-xxxx-xxxx-xxxxxxxxxxxx
  while (byteIdx < 4) {
    if (!parseByte(id.data_, input, charIdx, byteIdx)) return {};
  }
  if (input[charIdx++] != '-') return {};

  // xxxxxxxx-[xxxx-xxxx-xxxx-]xxxxxxxxxxxx - 3x 2 bytes and a hyphen
  for (size_t idx = 0; idx < 3; ++idx) {
    if (!parseByte(id.data_, input, charIdx, byteIdx)) return {};
    if (!parseByte(id.data_, input, charIdx, byteIdx)) return {};
    if (input[charIdx++] != '-') return {};
  }

  while (byteIdx < 16) {
    if (!parseByte(id.data_, input, charIdx, byteIdx)) return {};
  }
  return id;
}

bool Identifier::parseByte(Data& data, const char* input, int& charIdx, int& byteIdx) {
  uint8_t upper = 0;
  uint8_t lower = 0;
  if (!from_hex(input[charIdx++], upper)
      || !from_hex(input[charIdx++], lower)) {
    return false;
  }
  data[byteIdx++] = static_cast<uint8_t>((upper << 4) | lower);
  return true;
}

IdGenerator::IdGenerator()
    : implementation_(Implementation::Random),
      logger_(core::logging::LoggerFactory<IdGenerator>::getLogger()) {
}

void IdGenerator::initialize(const std::shared_ptr<Properties>& properties) {
  std::string implementation_str;
  implementation_ = Implementation::Random;
  if (properties->getString("flowstore.uid.implementation", implementation_str)) {
    implementation_str = string::toLower(implementation_str);
    if (implementation_str == "time") {
      logger_->log_debug("Using uuid_generate_time for uids.");
      implementation_ = Implementation::Time;
    } else if (implementation_str == "random") {
      logger_->log_debug("Using uuid_generate_random for uids.");
    } else {
      logger_->log_warn("Unknown uid implementation {}, falling back to random uids", implementation_str);
    }
  }
}

Identifier IdGenerator::generate() {
  Identifier::Data output{};
  uuid_t raw{};
  {
    std::lock_guard<std::mutex> lock(uuid_mutex_);
    switch (implementation_) {
      case Implementation::Random:
        uuid_generate_random(raw);
        break;
      case Implementation::Time:
        uuid_generate_time(raw);
        break;
    }
  }
  memcpy(output.data(), raw, output.size());
  return Identifier{output};
}

NonRepeatingStringGenerator::NonRepeatingStringGenerator()
    : prefix_(std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch()).count()) + "-") {
}

}  // namespace org::apache::nifi::flowstore::utils
