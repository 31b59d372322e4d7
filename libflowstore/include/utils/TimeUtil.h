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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "StringUtils.h"

namespace org::apache::nifi::flowstore::utils::timeutils {

/**
 * Gets the current time in milliseconds
 * @returns milliseconds since epoch
 */
inline uint64_t getTimeMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace details {
std::optional<std::chrono::nanoseconds> parseDuration(std::string_view input);
}  // namespace details

/**
 * Parses "<number> <unit>" where unit is one of ns, us, ms, s/sec/secs, m/min/mins, h/hour/hours.
 * A bare number is taken as milliseconds.
 */
template<class TargetDuration>
std::optional<TargetDuration> StringToDuration(std::string_view input) {
  if (auto parsed = details::parseDuration(input)) {
    return std::chrono::duration_cast<TargetDuration>(*parsed);
  }
  return std::nullopt;
}

}  // namespace org::apache::nifi::flowstore::utils::timeutils
