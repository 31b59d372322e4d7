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
#include "MainHelper.h"

#include <algorithm>

#include "FlowFileRepository.h"
#include "core/FlowFileQueue.h"
#include "core/repository/FileSystemRepository.h"
#include "core/repository/FileSystemSwapManager.h"
#include "core/repository/VolatileContentRepository.h"
#include "core/repository/VolatileFlowFileRepository.h"
#include "utils/StringUtils.h"

namespace org::apache::nifi::flowstore {

std::shared_ptr<core::FlowFileRepository> createFlowFileRepository(const std::string& class_name) {
  const auto name = utils::string::toLower(class_name);
  if (name == "flowfilerepository") {
    return std::make_shared<core::repository::FlowFileRepository>();
  }
  if (name == "volatileflowfilerepository") {
    return std::make_shared<core::repository::VolatileFlowFileRepository>();
  }
  return nullptr;
}

std::shared_ptr<core::ContentRepository> createContentRepository(const std::string& class_name) {
  const auto name = utils::string::toLower(class_name);
  if (name == "filesystemrepository") {
    return std::make_shared<core::repository::FileSystemRepository>();
  }
  if (name == "volatilecontentrepository") {
    return std::make_shared<core::repository::VolatileContentRepository>();
  }
  return nullptr;
}

std::shared_ptr<core::SwapManager> createSwapManager(const std::shared_ptr<core::FlowFileRepository>& flow_file_repository, core::logging::Logger& logger) {
  auto persistent_repository = std::dynamic_pointer_cast<core::repository::FlowFileRepository>(flow_file_repository);
  if (!persistent_repository) {
    logger.log_info("FlowFile repository {} is volatile, queues will not swap", flow_file_repository->getName());
    return nullptr;
  }
  auto swap_manager = std::make_shared<core::repository::FileSystemSwapManager>(std::filesystem::path(persistent_repository->getDirectory()) / "swap", flow_file_repository);
  if (!swap_manager->initialize()) {
    return nullptr;
  }
  return swap_manager;
}

std::shared_ptr<core::StandardQueueProvider> createQueues(const Configure& configure, const std::shared_ptr<core::SwapManager>& swap_manager, core::logging::Logger& logger) {
  auto queue_provider = std::make_shared<core::StandardQueueProvider>();
  const auto swap_threshold = configure.getInt(Configure::flowstore_queue_swap_threshold, static_cast<int>(core::DEFAULT_SWAP_THRESHOLD));
  const auto max_object_count = configure.getInt(Configure::flowstore_queue_backpressure_object_count, 0);
  const auto max_data_size = configure.getDataSize(Configure::flowstore_queue_backpressure_data_size).value_or(0);

  for (const auto& queue_id : utils::string::splitAndTrim(configure.getString(Configure::flowstore_queues).value_or(""), ",")) {
    if (queue_id.empty()) {
      continue;
    }
    auto queue = std::make_shared<core::FlowFileQueue>(queue_id, swap_manager);
    if (swap_threshold > 0) {
      queue->setSwapThreshold(static_cast<size_t>(swap_threshold));
      queue->setSwapBatchSize(std::min(static_cast<size_t>(swap_threshold), core::DEFAULT_SWAP_BATCH_SIZE));
    }
    queue->setBackpressureThresholds(static_cast<uint64_t>(std::max(max_object_count, 0)), max_data_size);
    queue_provider->addQueue(std::move(queue));
    logger.log_debug("Configured queue {}", queue_id);
  }
  return queue_provider;
}

}  // namespace org::apache::nifi::flowstore
