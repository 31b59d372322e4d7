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
#include "core/ResourceClaimManager.h"

#include <utility>

#include "Exception.h"
#include "core/logging/LoggerFactory.h"

namespace org::apache::nifi::flowstore::core {

ResourceClaimManager::ResourceClaimManager()
    : logger_(logging::LoggerFactory<ResourceClaimManager>::getLogger()) {
}

std::shared_ptr<ResourceClaim> ResourceClaimManager::newResourceClaim(const std::string& container, const std::string& section, const std::string& id, bool loss_tolerant, bool in_use) {
  auto claim = std::make_shared<ResourceClaim>(container, section, id, loss_tolerant, in_use);
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = claimant_counts_.try_emplace(claim->getKey(), ClaimCount{claim, 0});
  if (!inserted) {
    return it->second.claim;
  }
  logger_->log_trace("Tracking new {}", claim->getKey());
  return claim;
}

std::shared_ptr<ResourceClaim> ResourceClaimManager::getResourceClaim(const std::string& container, const std::string& section, const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claimant_counts_.find(container + "/" + section + "/" + id);
  if (it == claimant_counts_.end()) {
    return nullptr;
  }
  return it->second.claim;
}

int ResourceClaimManager::getClaimantCount(const std::shared_ptr<ResourceClaim>& claim) const {
  if (!claim) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claimant_counts_.find(claim->getKey());
  return it == claimant_counts_.end() ? 0 : it->second.count;
}

int ResourceClaimManager::incrementClaimantCount(const std::shared_ptr<ResourceClaim>& claim) {
  if (!claim) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = claimant_counts_.try_emplace(claim->getKey(), ClaimCount{claim, 0});
  const int new_count = ++it->second.count;
  logger_->log_trace("Incrementing claimant count for {} to {}", claim->getKey(), new_count);
  return new_count;
}

int ResourceClaimManager::decrementClaimantCount(const std::shared_ptr<ResourceClaim>& claim) {
  if (!claim) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claimant_counts_.find(claim->getKey());
  if (it == claimant_counts_.end() || it->second.count <= 0) {
    logger_->log_critical("Decrementing claimant count for {} below zero", claim->getKey());
    throw Exception(REPOSITORY_EXCEPTION, "Claimant count of " + claim->getKey() + " would become negative");
  }
  const int new_count = --it->second.count;
  logger_->log_trace("Decrementing claimant count for {} to {}", claim->getKey(), new_count);
  if (new_count == 0) {
    queueIfDestructable(it);
  }
  return new_count;
}

bool ResourceClaimManager::markDestructable(const std::shared_ptr<ResourceClaim>& claim) {
  if (!claim) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claimant_counts_.find(claim->getKey());
  if (it == claimant_counts_.end()) {
    if (claim->isInUse()) {
      return false;
    }
    destructable_claims_.enqueue(claim);
    return true;
  }
  return queueIfDestructable(it);
}

bool ResourceClaimManager::isDestructable(const std::shared_ptr<ResourceClaim>& claim) const {
  if (!claim || claim->isInUse()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = claimant_counts_.find(claim->getKey());
  return it == claimant_counts_.end() || it->second.count == 0;
}

void ResourceClaimManager::freeze(const std::shared_ptr<ResourceClaim>& claim) {
  if (!claim) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  claim->markNotInUse();
  auto it = claimant_counts_.find(claim->getKey());
  if (it == claimant_counts_.end()) {
    destructable_claims_.enqueue(claim);
    return;
  }
  if (it->second.count == 0) {
    queueIfDestructable(it);
  }
}

size_t ResourceClaimManager::drainDestructableClaims(std::vector<std::shared_ptr<ResourceClaim>>& destination, size_t max_elements) {
  size_t drained = 0;
  std::shared_ptr<ResourceClaim> claim;
  while (drained < max_elements && destructable_claims_.try_dequeue(claim)) {
    // the claim might have been revived (e.g. by a replayed record) since it was queued
    if (getClaimantCount(claim) > 0) {
      continue;
    }
    destination.push_back(std::move(claim));
    ++drained;
  }
  return drained;
}

std::vector<std::shared_ptr<ResourceClaim>> ResourceClaimManager::getTrackedClaims() const {
  std::vector<std::shared_ptr<ResourceClaim>> claims;
  std::lock_guard<std::mutex> lock(mutex_);
  claims.reserve(claimant_counts_.size());
  for (const auto& [key, claim_count] : claimant_counts_) {
    claims.push_back(claim_count.claim);
  }
  return claims;
}

void ResourceClaimManager::purge() {
  std::lock_guard<std::mutex> lock(mutex_);
  claimant_counts_.clear();
  std::shared_ptr<ResourceClaim> claim;
  while (destructable_claims_.try_dequeue(claim)) {}
}

bool ResourceClaimManager::queueIfDestructable(std::unordered_map<std::string, ClaimCount>::iterator it) {
  auto& claim_count = it->second;
  if (claim_count.count > 0 || claim_count.claim->isInUse()) {
    return false;
  }
  logger_->log_debug("{} is destructable", claim_count.claim->getKey());
  destructable_claims_.enqueue(claim_count.claim);
  claimant_counts_.erase(it);
  return true;
}

}  // namespace org::apache::nifi::flowstore::core
