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
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore::utils::file {

/**
 * Creates the directory (and its parents when recursive is set).
 * @return 0 on success, -1 otherwise
 */
inline int create_dir(const std::filesystem::path& path, bool recursive = true) {
  std::error_code error;
  if (std::filesystem::is_directory(path, error)) {
    return 0;
  }
  if (recursive) {
    std::filesystem::create_directories(path, error);
  } else {
    std::filesystem::create_directory(path, error);
  }
  return error ? -1 : 0;
}

inline int delete_dir(const std::filesystem::path& path, bool delete_files_recursively = true) {
  std::error_code error;
  if (!std::filesystem::exists(path, error)) {
    return 0;
  }
  if (delete_files_recursively) {
    std::filesystem::remove_all(path, error);
  } else {
    std::filesystem::remove(path, error);
  }
  return error ? -1 : 0;
}

inline std::filesystem::path create_temp_directory(char* format) {
  if (auto* dir = mkdtemp(format)) {
    return dir;
  }
  return {};
}

/**
 * Lists the regular files under dir as (directory, filename) pairs.
 */
inline std::vector<std::pair<std::filesystem::path, std::filesystem::path>> list_dir_all(const std::filesystem::path& dir, const std::shared_ptr<core::logging::Logger>& logger,
    bool recursive = true) {
  std::vector<std::pair<std::filesystem::path, std::filesystem::path>> entries;
  std::error_code error;
  if (!std::filesystem::is_directory(dir, error)) {
    logger->log_warn("Failed to list directory {}: not a directory", dir);
    return entries;
  }
  for (std::filesystem::directory_iterator it(dir, error), end; !error && it != end; it.increment(error)) {
    const auto& entry = *it;
    if (entry.is_directory()) {
      if (recursive) {
        auto sub_entries = list_dir_all(entry.path(), logger, recursive);
        entries.insert(entries.end(), sub_entries.begin(), sub_entries.end());
      }
    } else if (entry.is_regular_file()) {
      entries.emplace_back(dir, entry.path().filename());
    }
  }
  if (error) {
    logger->log_error("Failed to list directory {}: {}", dir, error.message());
  }
  return entries;
}

inline std::optional<std::filesystem::space_info> space(const std::filesystem::path& path) {
  std::error_code error;
  auto info = std::filesystem::space(path, error);
  if (error) {
    return std::nullopt;
  }
  return info;
}

}  // namespace org::apache::nifi::flowstore::utils::file
