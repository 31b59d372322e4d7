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
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "concurrentqueue.h"
#include "core/ResourceClaim.h"
#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore::core {

/**
 * Tracks the claimant count of every known ResourceClaim and decides when a claim
 * can be physically destroyed. One instance is shared by the content repository,
 * the FlowFile repository and the swap manager.
 */
class ResourceClaimManager {
 public:
  ResourceClaimManager();

  ResourceClaimManager(const ResourceClaimManager&) = delete;
  ResourceClaimManager& operator=(const ResourceClaimManager&) = delete;

  /**
   * Returns the claim identified by container/section/id. If the manager already
   * tracks such a claim the existing instance is returned, so that every reference
   * to the same backing object shares one claim.
   */
  std::shared_ptr<ResourceClaim> newResourceClaim(const std::string& container, const std::string& section, const std::string& id, bool loss_tolerant, bool in_use);

  std::shared_ptr<ResourceClaim> getResourceClaim(const std::string& container, const std::string& section, const std::string& id) const;

  int getClaimantCount(const std::shared_ptr<ResourceClaim>& claim) const;

  /**
   * @return the claimant count after the increment
   */
  int incrementClaimantCount(const std::shared_ptr<ResourceClaim>& claim);

  /**
   * @return the claimant count after the decrement
   * @throws Exception (REPOSITORY_EXCEPTION) if the count would drop below zero
   */
  int decrementClaimantCount(const std::shared_ptr<ResourceClaim>& claim);

  /**
   * Queues the claim for destruction if it has no claimants and is not in use.
   * @return true if the claim was queued
   */
  bool markDestructable(const std::shared_ptr<ResourceClaim>& claim);

  bool isDestructable(const std::shared_ptr<ResourceClaim>& claim) const;

  /**
   * Marks the claim as no longer appendable; from now on it becomes destructable
   * as soon as its claimant count is zero.
   */
  void freeze(const std::shared_ptr<ResourceClaim>& claim);

  /**
   * Moves at most max_elements destructable claims into destination.
   * @return the number of claims drained
   */
  size_t drainDestructableClaims(std::vector<std::shared_ptr<ResourceClaim>>& destination, size_t max_elements);

  std::vector<std::shared_ptr<ResourceClaim>> getTrackedClaims() const;

  void purge();

 private:
  struct ClaimCount {
    std::shared_ptr<ResourceClaim> claim;
    int count{0};
  };

  bool queueIfDestructable(std::unordered_map<std::string, ClaimCount>::iterator it);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, ClaimCount> claimant_counts_;
  moodycamel::ConcurrentQueue<std::shared_ptr<ResourceClaim>> destructable_claims_;

  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core
