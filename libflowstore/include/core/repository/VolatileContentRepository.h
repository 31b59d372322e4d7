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

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ClassName.h"
#include "core/ContentRepository.h"
#include "core/logging/LoggerFactory.h"
#include "utils/Id.h"
#include "utils/Literals.h"

namespace org::apache::nifi::flowstore::core::repository {

constexpr const char* VOLATILE_CONTAINER_NAME = "volatile";
constexpr uint64_t DEFAULT_VOLATILE_CONTENT_CAPACITY = 512_MiB;

/**
 * Content repository keeping every resource claim in memory. Resource claims are
 * never shared between content claims, so each one is frozen as soon as its writer closes.
 */
class VolatileContentRepository : public ContentRepository {
 public:
  explicit VolatileContentRepository(std::string name = std::string(core::className<VolatileContentRepository>()));

  bool initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) override;

  std::shared_ptr<ContentClaim> create(bool loss_tolerant) override;
  std::unique_ptr<io::OutputStream> write(const std::shared_ptr<ContentClaim>& claim) override;
  std::shared_ptr<io::InputStream> read(const ContentClaim& claim) override;
  bool remove(const std::shared_ptr<ResourceClaim>& claim) override;
  bool exists(const ResourceClaim& claim) const override;
  uint64_t size(const ResourceClaim& claim) const override;

  std::vector<std::string> getContainerNames() const override;
  uint64_t getContainerCapacity(const std::string& container_name) const override;
  uint64_t getContainerUsableSpace(const std::string& container_name) const override;
  std::set<std::shared_ptr<ResourceClaim>> getActiveResourceClaims(const std::string& container_name) const override;

  void purge() override;

  bool isVolatile() const override {
    return true;
  }

  /**
   * Removes the resources of every destructable claim.
   * @return the number of resources removed
   */
  size_t reclaim();

 private:
  class BufferWriter;

  void store(const std::shared_ptr<ResourceClaim>& claim, std::vector<std::byte> content);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const std::vector<std::byte>>> resources_;
  uint64_t used_bytes_{0};
  uint64_t capacity_{DEFAULT_VOLATILE_CONTENT_CAPACITY};

  utils::NonRepeatingStringGenerator id_generator_;
  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core::repository
