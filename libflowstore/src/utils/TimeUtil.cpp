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
#include "utils/TimeUtil.h"

#include <cctype>
#include <string>

namespace org::apache::nifi::flowstore::utils::timeutils::details {

std::optional<std::chrono::nanoseconds> parseDuration(std::string_view input) {
  const auto trimmed = string::trim(input);
  size_t idx = 0;
  while (idx < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[idx]))) {
    ++idx;
  }
  if (idx == 0) {
    return std::nullopt;
  }
  int64_t value = 0;
  try {
    value = std::stoll(trimmed.substr(0, idx));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  const auto unit = string::toLower(string::trim(std::string_view{trimmed}.substr(idx)));
  using namespace std::chrono;  // NOLINT
  if (unit == "ns" || unit == "nanos" || unit == "nanoseconds") return nanoseconds(value);
  if (unit == "us" || unit == "micros" || unit == "microseconds") return duration_cast<nanoseconds>(microseconds(value));
  if (unit.empty() || unit == "ms" || unit == "msec" || unit == "millis" || unit == "milliseconds") return duration_cast<nanoseconds>(milliseconds(value));
  if (unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") return duration_cast<nanoseconds>(seconds(value));
  if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") return duration_cast<nanoseconds>(minutes(value));
  if (unit == "h" || unit == "hr" || unit == "hour" || unit == "hours") return duration_cast<nanoseconds>(hours(value));
  return std::nullopt;
}

}  // namespace org::apache::nifi::flowstore::utils::timeutils::details
