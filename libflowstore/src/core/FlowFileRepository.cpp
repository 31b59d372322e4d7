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
#include "core/FlowFileRepository.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <limits>
#include <utility>

#include "Exception.h"
#include "core/FlowFileQueue.h"
#include "core/logging/LoggerFactory.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::core {

FlowFileRepository::FlowFileRepository(std::string name)
    : name_(std::move(name)),
      logger_(logging::LoggerFactory<FlowFileRepository>::getLogger()) {
}

bool FlowFileRepository::initialize(const std::shared_ptr<Configure>& /*configure*/, std::shared_ptr<ResourceClaimManager> claim_manager) {
  if (!claim_manager) {
    logger_->log_error("FlowFile repository {} requires a resource claim manager", name_);
    return false;
  }
  claim_manager_ = std::move(claim_manager);
  return true;
}

std::string FlowFileRepository::normalizeSwapLocation(const std::string& swap_location) {
  auto filename = std::filesystem::path(swap_location).filename().string();
  const auto dot = filename.find('.');
  if (dot != std::string::npos) {
    filename.erase(dot);
  }
  return filename;
}

FlowFileRecord FlowFileRepository::toFlowFileRecord(const RepositoryRecord& record) {
  auto flow_file = record.current;
  if (flow_file->getQueueId() != record.queue_id) {
    flow_file = std::make_shared<FlowFile>(*record.current);
    flow_file->setQueueId(record.queue_id);
  }
  return FlowFileRecord{std::move(flow_file), record.type == RepositoryRecordType::SWAP_OUT ? record.swap_location : std::string{}};
}

void FlowFileRepository::validate(const RepositoryRecord& record) const {
  if (!record.current) {
    throw Exception(REPOSITORY_EXCEPTION, std::string("Repository record of type ") + toString(record.type) + " has no FlowFile");
  }
  switch (record.type) {
    case RepositoryRecordType::CREATE:
    case RepositoryRecordType::UPDATE:
      if (record.queue_id.empty()) {
        throw Exception(REPOSITORY_EXCEPTION, std::string("Repository record of type ") + toString(record.type) + " for FlowFile "
            + record.current->getUUIDStr() + " has no destination queue");
      }
      break;
    case RepositoryRecordType::SWAP_OUT:
    case RepositoryRecordType::SWAP_IN:
      if (record.swap_location.empty()) {
        throw Exception(REPOSITORY_EXCEPTION, std::string("Repository record of type ") + toString(record.type) + " for FlowFile "
            + record.current->getUUIDStr() + " has no swap location");
      }
      break;
    case RepositoryRecordType::DELETE:
      break;
  }
}

void FlowFileRepository::updateRepository(const std::vector<RepositoryRecord>& records) {
  if (records.empty()) {
    return;
  }
  gsl_Expects(claim_manager_);
  for (const auto& record : records) {
    validate(record);
  }
  if (!persist(records)) {
    throw Exception(REPOSITORY_EXCEPTION, "Failed to persist a batch of " + std::to_string(records.size()) + " repository records");
  }
  logger_->log_debug("Persisted a batch of {} repository records", records.size());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records) {
      if (record.type == RepositoryRecordType::SWAP_OUT) {
        swap_location_suffixes_.insert(normalizeSwapLocation(record.swap_location));
      } else if (record.type == RepositoryRecordType::SWAP_IN) {
        swap_location_suffixes_.erase(normalizeSwapLocation(record.swap_location));
      }
    }
  }
  // the batch is durable, a claim that cannot be released is not a reason to undo it
  for (const auto& record : records) {
    updateMaxFlowFileIdentifier(record.current->getId());
    try {
      releaseClaims(record);
    } catch (const Exception& exception) {
      logger_->log_error("Failed to release the content of {} record of FlowFile {}: {}", toString(record.type), record.current->getUUIDStr(), exception.what());
    }
  }
}

void FlowFileRepository::releaseClaims(const RepositoryRecord& record) {
  const auto original_claim = record.getOriginalClaim();
  const bool original_replaced = record.content_modified && original_claim && !record.current->hasSameContent(*record.original);
  switch (record.type) {
    case RepositoryRecordType::DELETE:
      if (auto current_claim = record.current->getResourceClaim()) {
        claim_manager_->decrementClaimantCount(current_claim);
      }
      if (original_replaced) {
        claim_manager_->decrementClaimantCount(original_claim->getResourceClaim());
      }
      break;
    case RepositoryRecordType::UPDATE:
      if (original_replaced) {
        claim_manager_->decrementClaimantCount(original_claim->getResourceClaim());
      }
      break;
    case RepositoryRecordType::CREATE:
    case RepositoryRecordType::SWAP_OUT:
    case RepositoryRecordType::SWAP_IN:
      break;
  }
}

uint64_t FlowFileRepository::loadFlowFiles(const std::shared_ptr<QueueProvider>& queue_provider) {
  gsl_Expects(claim_manager_ && queue_provider);
  uint64_t max_id = 0;
  uint64_t num_records = 0;
  uint64_t num_orphaned = 0;
  std::map<std::string, std::vector<std::shared_ptr<FlowFile>>> queued;
  std::map<std::string, std::map<std::string, std::vector<std::shared_ptr<FlowFile>>>> swapped;
  std::unordered_set<std::string> swap_location_suffixes;

  forEachRecord([&](FlowFileRecord&& record) {
    const auto& flow_file = record.flow_file;
    ++num_records;
    max_id = std::max(max_id, flow_file->getId());
    if (auto claim = flow_file->getResourceClaim()) {
      claim_manager_->incrementClaimantCount(claim);
    }
    if (!record.swap_location.empty()) {
      swap_location_suffixes.insert(normalizeSwapLocation(record.swap_location));
      swapped[flow_file->getQueueId()][record.swap_location].push_back(flow_file);
      return;
    }
    if (!queue_provider->getQueue(flow_file->getQueueId())) {
      ++num_orphaned;
      logger_->log_warn("FlowFile {} belongs to queue {} which is not part of the flow", flow_file->getUUIDStr(), flow_file->getQueueId());
      return;
    }
    queued[flow_file->getQueueId()].push_back(flow_file);
  }, ClaimTracking::Register);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    swap_location_suffixes_ = std::move(swap_location_suffixes);
    queue_provider_ = queue_provider;
  }

  const auto by_sequence = [](const std::shared_ptr<FlowFile>& lhs, const std::shared_ptr<FlowFile>& rhs) { return lhs->getId() < rhs->getId(); };
  for (auto& [queue_id, locations] : swapped) {
    if (!queue_provider->getQueue(queue_id)) {
      logger_->log_warn("{} swap locations belong to queue {} which is not part of the flow", locations.size(), queue_id);
    }
  }
  for (auto& [queue_id, flow_files] : queued) {
    auto queue = queue_provider->getQueue(queue_id);
    std::sort(flow_files.begin(), flow_files.end(), by_sequence);
    auto swapped_it = swapped.find(queue_id);
    if (swapped_it == swapped.end()) {
      queue->putAll(flow_files);
      logger_->log_info("Restored {} FlowFiles of queue {}", flow_files.size(), queue_id);
      continue;
    }
    // FlowFiles older than the swapped out ones stay ahead of the swap files regardless of the swap threshold
    uint64_t first_swapped_id = std::numeric_limits<uint64_t>::max();
    for (const auto& [location, swapped_flow_files] : swapped_it->second) {
      for (const auto& flow_file : swapped_flow_files) {
        first_swapped_id = std::min(first_swapped_id, flow_file->getId());
      }
    }
    const auto first_newer = std::partition_point(flow_files.begin(), flow_files.end(), [first_swapped_id](const std::shared_ptr<FlowFile>& flow_file) {
      return flow_file->getId() < first_swapped_id;
    });
    queue->restore(std::vector<std::shared_ptr<FlowFile>>(flow_files.begin(), first_newer));
    restoreSwapLocations(*queue, swapped_it->second);
    queue->putAll(std::vector<std::shared_ptr<FlowFile>>(first_newer, flow_files.end()));
    logger_->log_info("Restored {} FlowFiles and {} swap locations of queue {}", flow_files.size(), swapped_it->second.size(), queue_id);
    swapped.erase(swapped_it);
  }
  for (auto& [queue_id, locations] : swapped) {
    if (auto queue = queue_provider->getQueue(queue_id)) {
      restoreSwapLocations(*queue, locations);
      logger_->log_info("Restored {} swap locations of queue {}", locations.size(), queue_id);
    }
  }

  updateMaxFlowFileIdentifier(max_id);
  logger_->log_info("Replayed {} FlowFile records of {} ({} orphaned), max FlowFile id is {}", num_records, name_, num_orphaned, max_id);
  return max_id;
}

void FlowFileRepository::restoreSwapLocations(FlowFileQueue& queue, std::map<std::string, std::vector<std::shared_ptr<FlowFile>>>& locations) {
  std::vector<std::pair<std::string, std::vector<std::shared_ptr<FlowFile>>>> ordered(std::make_move_iterator(locations.begin()), std::make_move_iterator(locations.end()));
  // swap file names start with the swap-out timestamp
  std::sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
    return normalizeSwapLocation(lhs.first) < normalizeSwapLocation(rhs.first);
  });
  for (auto& [location, flow_files] : ordered) {
    std::sort(flow_files.begin(), flow_files.end(), [](const std::shared_ptr<FlowFile>& lhs, const std::shared_ptr<FlowFile>& rhs) { return lhs->getId() < rhs->getId(); });
    queue.addSwapLocation(location, flow_files);
  }
}

void FlowFileRepository::swapFlowFilesOut(const std::vector<std::shared_ptr<FlowFile>>& swapped_out, const std::string& queue_id, const std::string& swap_location) {
  std::vector<RepositoryRecord> records;
  records.reserve(swapped_out.size());
  for (const auto& flow_file : swapped_out) {
    RepositoryRecord record;
    record.type = RepositoryRecordType::SWAP_OUT;
    record.original = flow_file;
    record.current = flow_file;
    record.queue_id = queue_id;
    record.original_queue_id = queue_id;
    record.swap_location = swap_location;
    records.push_back(std::move(record));
  }
  if (records.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    swap_location_suffixes_.insert(normalizeSwapLocation(swap_location));
    return;
  }
  updateRepository(records);
  logger_->log_debug("Recorded swap out of {} FlowFiles of queue {} to {}", swapped_out.size(), queue_id, swap_location);
}

void FlowFileRepository::swapFlowFilesIn(const std::string& swap_location, const std::vector<std::shared_ptr<FlowFile>>& swapped_in, const std::string& queue_id) {
  std::vector<RepositoryRecord> records;
  records.reserve(swapped_in.size());
  for (const auto& flow_file : swapped_in) {
    RepositoryRecord record;
    record.type = RepositoryRecordType::SWAP_IN;
    record.original = flow_file;
    record.current = flow_file;
    record.queue_id = queue_id;
    record.original_queue_id = queue_id;
    record.swap_location = swap_location;
    records.push_back(std::move(record));
  }
  if (records.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    swap_location_suffixes_.erase(normalizeSwapLocation(swap_location));
    return;
  }
  updateRepository(records);
  logger_->log_debug("Recorded swap in of {} FlowFiles of queue {} from {}", swapped_in.size(), queue_id, swap_location);
}

bool FlowFileRepository::isValidSwapLocationSuffix(const std::string& swap_location) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return swap_location_suffixes_.contains(normalizeSwapLocation(swap_location));
}

std::set<std::string> FlowFileRepository::findQueuesWithFlowFiles() const {
  std::set<std::string> queue_ids;
  forEachRecord([&](FlowFileRecord&& record) {
    if (!record.flow_file->getQueueId().empty()) {
      queue_ids.insert(record.flow_file->getQueueId());
    }
  }, ClaimTracking::LookupOnly);
  return queue_ids;
}

std::map<std::shared_ptr<ResourceClaim>, std::set<ResourceClaimReference>> FlowFileRepository::findResourceClaimReferences(const std::set<std::shared_ptr<ResourceClaim>>& claims) const {
  std::map<std::string, std::shared_ptr<ResourceClaim>> claims_by_key;
  for (const auto& claim : claims) {
    claims_by_key.emplace(claim->getKey(), claim);
  }
  std::map<std::shared_ptr<ResourceClaim>, std::set<ResourceClaimReference>> references;
  forEachRecord([&](FlowFileRecord&& record) {
    const auto resource_claim = record.flow_file->getResourceClaim();
    if (!resource_claim) {
      return;
    }
    auto it = claims_by_key.find(resource_claim->getKey());
    if (it == claims_by_key.end()) {
      return;
    }
    references[it->second].insert(ResourceClaimReference{record.flow_file->getQueueId(), record.flow_file->getUUIDStr()});
  }, ClaimTracking::LookupOnly);
  return references;
}

std::set<std::shared_ptr<ResourceClaim>> FlowFileRepository::findOrphanedResourceClaims() const {
  std::shared_ptr<QueueProvider> queue_provider;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_provider = queue_provider_;
  }
  std::map<std::string, std::shared_ptr<ResourceClaim>> orphan_candidates;
  std::set<std::string> referenced_by_active_queue;
  forEachRecord([&](FlowFileRecord&& record) {
    const auto resource_claim = record.flow_file->getResourceClaim();
    if (!resource_claim) {
      return;
    }
    const auto& queue_id = record.flow_file->getQueueId();
    if (queue_provider && queue_provider->getQueue(queue_id)) {
      referenced_by_active_queue.insert(resource_claim->getKey());
    } else {
      orphan_candidates.emplace(resource_claim->getKey(), resource_claim);
    }
  }, ClaimTracking::LookupOnly);
  std::set<std::shared_ptr<ResourceClaim>> orphaned;
  for (const auto& [key, claim] : orphan_candidates) {
    if (!referenced_by_active_queue.contains(key)) {
      orphaned.insert(claim);
    }
  }
  if (!orphaned.empty()) {
    logger_->log_warn("Found {} orphaned resource claims in {}", orphaned.size(), name_);
  }
  return orphaned;
}

void FlowFileRepository::updateMaxFlowFileIdentifier(uint64_t max_id) {
  uint64_t next = next_flow_file_sequence_.load();
  while (next <= max_id && !next_flow_file_sequence_.compare_exchange_weak(next, max_id + 1)) {
  }
}

}  // namespace org::apache::nifi::flowstore::core
