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
#include "utils/StringUtils.h"

#include <algorithm>
#include <cctype>

#include "utils/Literals.h"

namespace org::apache::nifi::flowstore::utils::string {

std::string trim(std::string_view input) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), std::string_view::const_reverse_iterator(begin), is_space).base();
  return {begin, end};
}

std::string toLower(std::string_view input) {
  std::string result{input};
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::optional<bool> toBool(std::string_view input) {
  const auto value = toLower(trim(input));
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return std::nullopt;
}

std::vector<std::string> split(std::string_view input, std::string_view delimiter) {
  std::vector<std::string> result;
  if (delimiter.empty()) {
    result.emplace_back(input);
    return result;
  }
  size_t begin = 0;
  while (true) {
    const auto end = input.find(delimiter, begin);
    if (end == std::string_view::npos) {
      result.emplace_back(input.substr(begin));
      break;
    }
    result.emplace_back(input.substr(begin, end - begin));
    begin = end + delimiter.size();
  }
  return result;
}

std::vector<std::string> splitAndTrim(std::string_view input, std::string_view delimiter) {
  auto parts = split(input, delimiter);
  for (auto& part : parts) {
    part = trim(part);
  }
  parts.erase(std::remove(parts.begin(), parts.end(), std::string{}), parts.end());
  return parts;
}

std::optional<uint64_t> toDataSize(std::string_view input) {
  const auto trimmed = trim(input);
  size_t idx = 0;
  while (idx < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[idx]))) {
    ++idx;
  }
  if (idx == 0) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (size_t i = 0; i < idx; ++i) {
    value = value * 10 + static_cast<uint64_t>(trimmed[i] - '0');
  }
  const auto unit = toLower(trim(std::string_view{trimmed}.substr(idx)));
  if (unit.empty() || unit == "b") return value;
  if (unit == "kb" || unit == "k" || unit == "kib") return value * 1_KiB;
  if (unit == "mb" || unit == "m" || unit == "mib") return value * 1_MiB;
  if (unit == "gb" || unit == "g" || unit == "gib") return value * 1_GiB;
  if (unit == "tb" || unit == "t" || unit == "tib") return value * 1024 * 1_GiB;
  return std::nullopt;
}

}  // namespace org::apache::nifi::flowstore::utils::string
