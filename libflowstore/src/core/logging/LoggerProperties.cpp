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
#include "core/logging/LoggerProperties.h"

namespace org::apache::nifi::flowstore::core::logging {

std::vector<std::string> LoggerProperties::get_keys_of_type(const std::string &type) const {
  std::vector<std::string> appenders;
  std::string prefix = type + ".";
  for (const auto& key : getConfiguredKeys()) {
    if (key.starts_with(prefix) && key.find('.', prefix.length()) == std::string::npos) {
      appenders.push_back(key);
    }
  }
  return appenders;
}

}  // namespace org::apache::nifi::flowstore::core::logging
