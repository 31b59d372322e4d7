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
#include "core/RepositoryDiagnostics.h"

#include <utility>

#include "utils/StringUtils.h"

namespace org::apache::nifi::flowstore::core {

RepositoryDiagnostics RepositoryDiagnostics::gather(const ContentRepository& content_repository, const FlowFileRepository& flow_file_repository,
    const utils::PlatformCapabilities& platform) {
  RepositoryDiagnostics diagnostics;
  const auto& claim_manager = content_repository.getResourceClaimManager();
  for (const auto& container_name : content_repository.getContainerNames()) {
    ContainerDiagnostics container{container_name, content_repository.getContainerCapacity(container_name),
        content_repository.getContainerUsableSpace(container_name), 0};
    for (const auto& claim : content_repository.getActiveResourceClaims(container_name)) {
      ++container.active_claims;
      diagnostics.claimant_counts[claim->getKey()] = claim_manager->getClaimantCount(claim);
    }
    diagnostics.containers.push_back(std::move(container));
  }
  diagnostics.flow_file_repository_capacity = flow_file_repository.getStorageCapacity();
  diagnostics.flow_file_repository_usable_space = flow_file_repository.getUsableStorageSpace();
  diagnostics.volatile_repositories = content_repository.isVolatile() || flow_file_repository.isVolatile();
  diagnostics.queues_with_flow_files = flow_file_repository.findQueuesWithFlowFiles();
  for (const auto& claim : flow_file_repository.findOrphanedResourceClaims()) {
    diagnostics.orphaned_claims.insert(claim->getKey());
  }
  diagnostics.open_file_descriptors = platform.getOpenFileDescriptorCount();
  diagnostics.max_file_descriptors = platform.getMaxFileDescriptorCount();
  return diagnostics;
}

void RepositoryDiagnostics::log(logging::Logger& logger) const {
  for (const auto& container : containers) {
    logger.log_info("Content container {}: {} of {} bytes usable, {} active resource claims", container.name, container.usable_space, container.capacity, container.active_claims);
  }
  logger.log_info("FlowFile repository: {} of {} bytes usable{}", flow_file_repository_usable_space, flow_file_repository_capacity, volatile_repositories ? " (volatile)" : "");
  logger.log_info("Queues with FlowFiles: [{}]", utils::string::join(", ", queues_with_flow_files));
  for (const auto& [key, count] : claimant_counts) {
    logger.log_debug("Resource claim {} has {} claimants", key, count);
  }
  if (!orphaned_claims.empty()) {
    logger.log_warn("Orphaned resource claims: [{}]", utils::string::join(", ", orphaned_claims));
  }
  if (open_file_descriptors && max_file_descriptors) {
    logger.log_info("Open file descriptors: {} of {}", *open_file_descriptors, *max_file_descriptors);
  } else {
    logger.log_debug("File descriptor counts are not available on this platform");
  }
}

}  // namespace org::apache::nifi::flowstore::core
