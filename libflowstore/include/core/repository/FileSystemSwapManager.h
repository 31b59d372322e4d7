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
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/FlowFileRepository.h"
#include "core/SwapManager.h"
#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore::core::repository {

/**
 * Keeps swap files in a single directory, named <millis>-<queue id>-<uuid>.swap.
 * A swap file is written under a .part name and renamed once it is synced, then the
 * swap-out is recorded in the FlowFile repository.
 */
class FileSystemSwapManager : public SwapManager {
 public:
  static constexpr const char* SWAP_FILE_EXTENSION = ".swap";
  static constexpr const char* PARTIAL_SWAP_FILE_EXTENSION = ".part";
  static constexpr std::string_view SWAP_MAGIC = "SWAP";
  static constexpr uint32_t SWAP_FORMAT_VERSION = 1;

  FileSystemSwapManager(std::filesystem::path swap_directory, std::shared_ptr<FlowFileRepository> flow_file_repository);

  bool initialize();

  std::string swapOut(const std::vector<std::shared_ptr<FlowFile>>& flow_files, const std::string& queue_id) override;
  std::vector<std::shared_ptr<FlowFile>> swapIn(const std::string& swap_location, const std::string& queue_id) override;
  std::optional<SwapSummary> peek(const std::string& swap_location, const std::string& queue_id) override;
  std::vector<std::string> recoverSwapLocations(const std::string& queue_id) override;
  void purge() override;

  const std::filesystem::path& getSwapDirectory() const {
    return swap_directory_;
  }

  /**
   * @return the queue id carried by the name of a swap file, std::nullopt if the name is not a swap file name
   */
  static std::optional<std::string> getOwnerQueueIdentifier(const std::filesystem::path& swap_location);

 private:
  std::optional<std::pair<SwapSummary, std::vector<std::shared_ptr<FlowFile>>>> readSwapFile(const std::filesystem::path& swap_file, ClaimTracking tracking) const;

  std::filesystem::path swap_directory_;
  std::shared_ptr<FlowFileRepository> flow_file_repository_;
  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core::repository
