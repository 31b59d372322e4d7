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
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/FlowFile.h"
#include "core/SwapManager.h"
#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore::core {

constexpr size_t DEFAULT_SWAP_THRESHOLD = 20000;
constexpr size_t DEFAULT_SWAP_BATCH_SIZE = 10000;

/**
 * FIFO queue of a connection. Once the active list reaches the swap threshold, newly
 * arriving FlowFiles are collected and swapped out in batches; they are swapped back in,
 * oldest batch first, as the active list drains.
 */
class FlowFileQueue {
 public:
  explicit FlowFileQueue(std::string identifier, std::shared_ptr<SwapManager> swap_manager = nullptr);

  FlowFileQueue(const FlowFileQueue&) = delete;
  FlowFileQueue& operator=(const FlowFileQueue&) = delete;

  const std::string& getIdentifier() const {
    return identifier_;
  }

  void setSwapThreshold(size_t swap_threshold);
  void setSwapBatchSize(size_t swap_batch_size);

  /**
   * A threshold of zero disables the corresponding limit.
   */
  void setBackpressureThresholds(uint64_t max_object_count, uint64_t max_data_size);

  void put(const std::shared_ptr<FlowFile>& flow_file);
  void putAll(const std::vector<std::shared_ptr<FlowFile>>& flow_files);

  /**
   * @return the oldest FlowFile, or nullptr if the queue is empty
   */
  std::shared_ptr<FlowFile> poll();
  std::vector<std::shared_ptr<FlowFile>> poll(size_t max_count);

  /**
   * Appends FlowFiles found during repository replay to the active list, ignoring the swap threshold.
   */
  void restore(const std::vector<std::shared_ptr<FlowFile>>& flow_files);

  /**
   * Registers a swap file found during repository replay; the FlowFiles are its recorded content.
   */
  void addSwapLocation(const std::string& swap_location, const std::vector<std::shared_ptr<FlowFile>>& swapped_flow_files);

  bool contains(const std::string& flow_file_uuid) const;

  bool isEmpty() const;

  /**
   * @return the number of FlowFiles including the swapped out ones
   */
  uint64_t size() const;
  uint64_t getDataSize() const;
  size_t getActiveCount() const;
  size_t getSwapLocationCount() const;
  std::vector<std::string> getSwapLocations() const;

  bool isFull() const;

 private:
  struct SwapLocation {
    std::string location;
    std::vector<std::string> flow_file_uuids;
    uint64_t content_size{0};
  };

  void addLocked(const std::shared_ptr<FlowFile>& flow_file);
  void swapOutLocked();
  void migrateSwapToActiveLocked();

  const std::string identifier_;
  std::shared_ptr<SwapManager> swap_manager_;

  size_t swap_threshold_{DEFAULT_SWAP_THRESHOLD};
  size_t swap_batch_size_{DEFAULT_SWAP_BATCH_SIZE};
  uint64_t max_object_count_{0};
  uint64_t max_data_size_{0};

  mutable std::mutex mutex_;
  std::deque<std::shared_ptr<FlowFile>> active_;
  std::vector<std::shared_ptr<FlowFile>> swap_queue_;
  std::deque<SwapLocation> swap_locations_;
  bool swap_mode_{false};
  std::unordered_set<std::string> flow_file_uuids_;
  uint64_t total_count_{0};
  uint64_t total_size_{0};

  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core
