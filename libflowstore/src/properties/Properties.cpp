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
#include "properties/Properties.h"

#include <fstream>
#include <string>

#include "core/logging/LoggerFactory.h"
#include "properties/PropertiesFile.h"

namespace org::apache::nifi::flowstore {

Properties::Properties(std::string name)
    : name_(std::move(name)),
      logger_(core::logging::LoggerFactory<Properties>::getLogger()) {
}

bool Properties::getString(const std::string& key, std::string& value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = properties_.find(key);

  if (it != properties_.end()) {
    value = it->second;
    return true;
  } else {
    return false;
  }
}

std::optional<std::string> Properties::getString(const std::string& key) const {
  if (std::string result; getString(key, result)) {
    return result;
  }
  return std::nullopt;
}

int Properties::getInt(const std::string& key, int default_value) const {
  std::string value;
  if (!getString(key, value)) {
    return default_value;
  }
  try {
    return std::stoi(value);
  } catch (const std::exception&) {
    logger_->log_warn("Property {} of {} is not an integer ({}), using {}", key, name_, value, default_value);
    return default_value;
  }
}

bool Properties::loadConfigureFile(const std::filesystem::path& configuration_file) {
  if (configuration_file.empty()) {
    logger_->log_error("Configuration file path for {} is empty!", getName());
    return false;
  }

  std::ifstream file(configuration_file, std::ifstream::in);
  if (!file.good()) {
    logger_->log_error("load configure file failed {}", configuration_file);
    return false;
  }

  logger_->log_info("Using configuration file to load configuration for {} from {}", getName(), configuration_file);

  std::lock_guard<std::mutex> lock(mutex_);
  properties_file_ = configuration_file;
  properties_.clear();
  for (const auto& line : PropertiesFile{file}) {
    if (line.hasKey()) {
      properties_[line.getKey()] = line.getValue();
    }
  }
  return true;
}

}  // namespace org::apache::nifi::flowstore
