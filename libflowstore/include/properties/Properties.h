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

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore {

class Properties {
 public:
  explicit Properties(std::string name = "");

  virtual ~Properties() = default;

  const std::string& getName() const {
    return name_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    properties_.clear();
  }

  void set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    properties_[key] = value;
  }

  bool has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return properties_.count(key) > 0;
  }

  /**
   * Returns the config value by placing it into the referenced param value
   * @param key key to look up
   * @param value value in which to place the map's stored property value
   * @returns true if found, false otherwise.
   */
  bool getString(const std::string& key, std::string& value) const;

  /**
   * Returns the config value.
   *
   * @param key key to look up
   * @returns the value if found, nullopt otherwise.
   */
  std::optional<std::string> getString(const std::string& key) const;

  /**
   * Returns the configured integer or default_value when the key is absent or not a number.
   */
  int getInt(const std::string& key, int default_value) const;

  /**
   * Loads the key=value pairs of the given file, replacing the current content.
   * @return false if the file cannot be read
   */
  bool loadConfigureFile(const std::filesystem::path& configuration_file);

  std::vector<std::string> getConfiguredKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto& property : properties_) {
      keys.push_back(property.first);
    }
    return keys;
  }

  std::filesystem::path getFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return properties_file_;
  }

  std::map<std::string, std::string> getProperties() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return properties_;
  }

 private:
  std::map<std::string, std::string> properties_;
  std::filesystem::path properties_file_;
  mutable std::mutex mutex_;
  std::string name_;
  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore
