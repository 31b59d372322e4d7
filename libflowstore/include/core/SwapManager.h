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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/FlowFile.h"

namespace org::apache::nifi::flowstore::core {

/**
 * Describes the content of a swap file without swapping it in.
 */
struct SwapSummary {
  std::string queue_id;
  uint64_t flow_file_count{0};
  uint64_t content_size{0};
  uint64_t max_flow_file_id{0};
  std::vector<std::shared_ptr<ResourceClaim>> resource_claims;
  std::vector<std::string> flow_file_uuids;
};

/**
 * Moves batches of FlowFiles of a queue to secondary storage and back. Only the
 * FlowFile records are swapped, the content stays in the content repository.
 */
class SwapManager {
 public:
  virtual ~SwapManager() = default;

  /**
   * Writes the FlowFiles to a new swap location and records the move in the FlowFile repository.
   * @return the swap location
   * @throws Exception (SWAP_EXCEPTION) if the swap file could not be written
   */
  virtual std::string swapOut(const std::vector<std::shared_ptr<FlowFile>>& flow_files, const std::string& queue_id) = 0;

  /**
   * Reads back the FlowFiles of a swap location, records the move in the FlowFile repository
   * and deletes the swap file.
   */
  virtual std::vector<std::shared_ptr<FlowFile>> swapIn(const std::string& swap_location, const std::string& queue_id) = 0;

  virtual std::optional<SwapSummary> peek(const std::string& swap_location, const std::string& queue_id) = 0;

  /**
   * @return the swap locations of the queue, oldest first
   */
  virtual std::vector<std::string> recoverSwapLocations(const std::string& queue_id) = 0;

  virtual void purge() = 0;
};

}  // namespace org::apache::nifi::flowstore::core
