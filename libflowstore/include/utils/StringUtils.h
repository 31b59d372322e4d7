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
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace org::apache::nifi::flowstore::utils::string {

std::string trim(std::string_view input);
std::string toLower(std::string_view input);
std::optional<bool> toBool(std::string_view input);
std::vector<std::string> split(std::string_view input, std::string_view delimiter);
std::vector<std::string> splitAndTrim(std::string_view input, std::string_view delimiter);

/**
 * Parses "<number> [unit]" data sizes, unit being one of B, KB, MB, GB, TB (binary multiples, case insensitive)
 */
std::optional<uint64_t> toDataSize(std::string_view input);

/**
 * Concatenates the string representations of the arguments
 */
template<typename... Args>
std::string join_pack(const Args&... args) {
  std::ostringstream stream;
  (stream << ... << args);
  return stream.str();
}

template<typename Container>
std::string join(std::string_view separator, const Container& items) {
  std::string result;
  bool first = true;
  for (const auto& item : items) {
    if (!first) {
      result.append(separator);
    }
    first = false;
    result.append(item);
  }
  return result;
}

}  // namespace org::apache::nifi::flowstore::utils::string
