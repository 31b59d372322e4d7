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
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/ContentRepository.h"
#include "core/FlowFileRepository.h"
#include "core/logging/Logger.h"
#include "utils/PlatformCapabilities.h"

namespace org::apache::nifi::flowstore::core {

struct ContainerDiagnostics {
  std::string name;
  uint64_t capacity{0};
  uint64_t usable_space{0};
  size_t active_claims{0};
};

/**
 * Snapshot of the repositories, used for logging and for operators reconciling claims by hand.
 */
struct RepositoryDiagnostics {
  std::vector<ContainerDiagnostics> containers;
  uint64_t flow_file_repository_capacity{0};
  uint64_t flow_file_repository_usable_space{0};
  bool volatile_repositories{false};
  // claim key -> claimant count
  std::map<std::string, int> claimant_counts;
  std::set<std::string> queues_with_flow_files;
  std::set<std::string> orphaned_claims;
  std::optional<uint64_t> open_file_descriptors;
  std::optional<uint64_t> max_file_descriptors;

  static RepositoryDiagnostics gather(const ContentRepository& content_repository, const FlowFileRepository& flow_file_repository,
      const utils::PlatformCapabilities& platform = utils::PlatformCapabilities::get());

  void log(logging::Logger& logger) const;
};

}  // namespace org::apache::nifi::flowstore::core
