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
#include "core/FlowFileQueue.h"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "Exception.h"
#include "core/logging/LoggerFactory.h"

namespace org::apache::nifi::flowstore::core {

FlowFileQueue::FlowFileQueue(std::string identifier, std::shared_ptr<SwapManager> swap_manager)
    : identifier_(std::move(identifier)),
      swap_manager_(std::move(swap_manager)),
      logger_(logging::LoggerFactory<FlowFileQueue>::getLogger()) {
}

void FlowFileQueue::setSwapThreshold(size_t swap_threshold) {
  std::lock_guard<std::mutex> lock(mutex_);
  swap_threshold_ = swap_threshold;
}

void FlowFileQueue::setSwapBatchSize(size_t swap_batch_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  swap_batch_size_ = std::max<size_t>(swap_batch_size, 1);
}

void FlowFileQueue::setBackpressureThresholds(uint64_t max_object_count, uint64_t max_data_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_object_count_ = max_object_count;
  max_data_size_ = max_data_size;
}

void FlowFileQueue::put(const std::shared_ptr<FlowFile>& flow_file) {
  std::lock_guard<std::mutex> lock(mutex_);
  addLocked(flow_file);
}

void FlowFileQueue::putAll(const std::vector<std::shared_ptr<FlowFile>>& flow_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& flow_file : flow_files) {
    addLocked(flow_file);
  }
}

void FlowFileQueue::restore(const std::vector<std::shared_ptr<FlowFile>>& flow_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& flow_file : flow_files) {
    ++total_count_;
    total_size_ += flow_file->getSize();
    flow_file_uuids_.insert(flow_file->getUUIDStr());
    active_.push_back(flow_file);
  }
}

void FlowFileQueue::addLocked(const std::shared_ptr<FlowFile>& flow_file) {
  ++total_count_;
  total_size_ += flow_file->getSize();
  flow_file_uuids_.insert(flow_file->getUUIDStr());
  if (!swap_manager_ || (!swap_mode_ && active_.size() < swap_threshold_)) {
    active_.push_back(flow_file);
    return;
  }
  swap_mode_ = true;
  swap_queue_.push_back(flow_file);
  if (swap_queue_.size() >= swap_batch_size_) {
    swapOutLocked();
  }
}

void FlowFileQueue::swapOutLocked() {
  std::vector<std::shared_ptr<FlowFile>> batch(swap_queue_.begin(), swap_queue_.begin() + static_cast<std::ptrdiff_t>(swap_batch_size_));
  try {
    auto location = swap_manager_->swapOut(batch, identifier_);
    SwapLocation swap_location{std::move(location), {}, 0};
    for (const auto& flow_file : batch) {
      swap_location.flow_file_uuids.push_back(flow_file->getUUIDStr());
      swap_location.content_size += flow_file->getSize();
    }
    logger_->log_debug("Swapped out {} FlowFiles of queue {} to {}", batch.size(), identifier_, swap_location.location);
    swap_locations_.push_back(std::move(swap_location));
    swap_queue_.erase(swap_queue_.begin(), swap_queue_.begin() + static_cast<std::ptrdiff_t>(batch.size()));
  } catch (const Exception& exception) {
    logger_->log_error("Failed to swap out {} FlowFiles of queue {}, keeping them in memory: {}", batch.size(), identifier_, exception.what());
  }
}

void FlowFileQueue::migrateSwapToActiveLocked() {
  if (!swap_mode_ || !swap_manager_ || active_.size() >= swap_threshold_) {
    return;
  }
  if (!swap_locations_.empty()) {
    auto& oldest = swap_locations_.front();
    std::vector<std::shared_ptr<FlowFile>> swapped_in;
    try {
      swapped_in = swap_manager_->swapIn(oldest.location, identifier_);
    } catch (const Exception& exception) {
      logger_->log_error("Failed to swap in {} for queue {}: {}", oldest.location, identifier_, exception.what());
      return;
    }
    if (swapped_in.size() != oldest.flow_file_uuids.size()) {
      logger_->log_error("Swap location {} of queue {} held {} FlowFiles instead of {}", oldest.location, identifier_, swapped_in.size(), oldest.flow_file_uuids.size());
      for (const auto& uuid : oldest.flow_file_uuids) {
        flow_file_uuids_.erase(uuid);
      }
      total_count_ -= std::min<uint64_t>(total_count_, oldest.flow_file_uuids.size());
      total_size_ -= std::min(total_size_, oldest.content_size);
      for (const auto& flow_file : swapped_in) {
        ++total_count_;
        total_size_ += flow_file->getSize();
        flow_file_uuids_.insert(flow_file->getUUIDStr());
      }
    }
    logger_->log_debug("Swapped in {} FlowFiles of queue {} from {}", swapped_in.size(), identifier_, oldest.location);
    swap_locations_.pop_front();
    active_.insert(active_.end(), swapped_in.begin(), swapped_in.end());
    return;
  }
  active_.insert(active_.end(), swap_queue_.begin(), swap_queue_.end());
  swap_queue_.clear();
  swap_mode_ = false;
}

std::shared_ptr<FlowFile> FlowFileQueue::poll() {
  std::lock_guard<std::mutex> lock(mutex_);
  migrateSwapToActiveLocked();
  if (active_.empty()) {
    return nullptr;
  }
  auto flow_file = active_.front();
  active_.pop_front();
  --total_count_;
  total_size_ -= std::min(total_size_, flow_file->getSize());
  flow_file_uuids_.erase(flow_file->getUUIDStr());
  return flow_file;
}

std::vector<std::shared_ptr<FlowFile>> FlowFileQueue::poll(size_t max_count) {
  std::vector<std::shared_ptr<FlowFile>> flow_files;
  while (flow_files.size() < max_count) {
    auto flow_file = poll();
    if (!flow_file) {
      break;
    }
    flow_files.push_back(std::move(flow_file));
  }
  return flow_files;
}

void FlowFileQueue::addSwapLocation(const std::string& swap_location, const std::vector<std::shared_ptr<FlowFile>>& swapped_flow_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!swap_manager_) {
    logger_->log_warn("Queue {} cannot swap in {} without a swap manager", identifier_, swap_location);
  }
  SwapLocation location{swap_location, {}, 0};
  for (const auto& flow_file : swapped_flow_files) {
    location.flow_file_uuids.push_back(flow_file->getUUIDStr());
    location.content_size += flow_file->getSize();
    flow_file_uuids_.insert(flow_file->getUUIDStr());
  }
  total_count_ += swapped_flow_files.size();
  total_size_ += location.content_size;
  swap_locations_.push_back(std::move(location));
  swap_mode_ = true;
}

bool FlowFileQueue::contains(const std::string& flow_file_uuid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return flow_file_uuids_.contains(flow_file_uuid);
}

bool FlowFileQueue::isEmpty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_count_ == 0;
}

uint64_t FlowFileQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_count_;
}

uint64_t FlowFileQueue::getDataSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_size_;
}

size_t FlowFileQueue::getActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

size_t FlowFileQueue::getSwapLocationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return swap_locations_.size();
}

std::vector<std::string> FlowFileQueue::getSwapLocations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> locations;
  locations.reserve(swap_locations_.size());
  for (const auto& location : swap_locations_) {
    locations.push_back(location.location);
  }
  return locations;
}

bool FlowFileQueue::isFull() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return (max_object_count_ > 0 && total_count_ >= max_object_count_) || (max_data_size_ > 0 && total_size_ >= max_data_size_);
}

}  // namespace org::apache::nifi::flowstore::core
