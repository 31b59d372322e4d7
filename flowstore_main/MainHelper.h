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

#include <memory>
#include <string>

#include "core/ContentRepository.h"
#include "core/FlowFileRepository.h"
#include "core/QueueProvider.h"
#include "core/SwapManager.h"
#include "core/logging/Logger.h"
#include "properties/Configure.h"

namespace org::apache::nifi::flowstore {

constexpr const char* DEFAULT_FLOWFILE_REPOSITORY_CLASS = "FlowFileRepository";
constexpr const char* DEFAULT_CONTENT_REPOSITORY_CLASS = "FileSystemRepository";
constexpr uint16_t DEFAULT_LOAD_BALANCE_PORT = 6342;

/**
 * @return the repository named by the class name, nullptr for unknown class names
 */
std::shared_ptr<core::FlowFileRepository> createFlowFileRepository(const std::string& class_name);
std::shared_ptr<core::ContentRepository> createContentRepository(const std::string& class_name);

/**
 * Creates a swap manager in the swap directory of a persistent FlowFile repository.
 * @return nullptr for volatile repositories, which do not swap
 */
std::shared_ptr<core::SwapManager> createSwapManager(const std::shared_ptr<core::FlowFileRepository>& flow_file_repository, core::logging::Logger& logger);

/**
 * Adds a queue for every identifier listed in flowstore.queues, configured with the swap
 * and backpressure thresholds.
 */
std::shared_ptr<core::StandardQueueProvider> createQueues(const Configure& configure, const std::shared_ptr<core::SwapManager>& swap_manager, core::logging::Logger& logger);

}  // namespace org::apache::nifi::flowstore
