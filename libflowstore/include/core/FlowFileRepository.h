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
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "core/FlowFileRecord.h"
#include "core/QueueProvider.h"
#include "core/RepositoryRecord.h"
#include "core/ResourceClaimManager.h"
#include "core/logging/Logger.h"
#include "properties/Configure.h"

namespace org::apache::nifi::flowstore::core {

class FlowFileQueue;

/**
 * Identifies a FlowFile holding a claimant of a resource claim.
 */
struct ResourceClaimReference {
  std::string queue_id;
  std::string flow_file_uuid;

  bool operator<(const ResourceClaimReference& other) const {
    return std::tie(queue_id, flow_file_uuid) < std::tie(other.queue_id, other.flow_file_uuid);
  }

  bool operator==(const ResourceClaimReference& other) const = default;
};

/**
 * System of record of every FlowFile in the flow. Batches of repository records are
 * applied atomically; claimant counts of content dropped by a batch are released only
 * after the batch is durable.
 */
class FlowFileRepository {
 public:
  explicit FlowFileRepository(std::string name);
  virtual ~FlowFileRepository() = default;

  FlowFileRepository(const FlowFileRepository&) = delete;
  FlowFileRepository& operator=(const FlowFileRepository&) = delete;

  const std::string& getName() const {
    return name_;
  }

  virtual bool initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager);

  virtual void start() {}
  virtual void stop() {}

  /**
   * Durably applies the batch, all or nothing. Content claims dropped by the batch are released
   * after it was persisted; a failure to release one is logged and does not fail the batch.
   * @throws Exception (REPOSITORY_EXCEPTION) if a record is malformed or the batch could not be persisted,
   * nothing of the batch was applied in that case
   */
  void updateRepository(const std::vector<RepositoryRecord>& records);

  /**
   * Replays the stored records into the queues of the provider. The provider is kept
   * to tell orphaned FlowFiles apart later on. Every queue gets its FlowFiles back in
   * sequence order, swapped out ones included.
   * @return the largest FlowFile sequence id found
   * @throws Exception (REPOSITORY_EXCEPTION) if a stored record cannot be read
   */
  uint64_t loadFlowFiles(const std::shared_ptr<QueueProvider>& queue_provider);

  void swapFlowFilesOut(const std::vector<std::shared_ptr<FlowFile>>& swapped_out, const std::string& queue_id, const std::string& swap_location);
  void swapFlowFilesIn(const std::string& swap_location, const std::vector<std::shared_ptr<FlowFile>>& swapped_in, const std::string& queue_id);

  /**
   * @return true if the repository knows about a swap file with the same name, regardless of its directory
   */
  bool isValidSwapLocationSuffix(const std::string& swap_location) const;

  std::set<std::string> findQueuesWithFlowFiles() const;

  std::map<std::shared_ptr<ResourceClaim>, std::set<ResourceClaimReference>> findResourceClaimReferences(const std::set<std::shared_ptr<ResourceClaim>>& claims) const;

  /**
   * @return the resource claims held only by FlowFiles of queues that are no longer part of the flow
   */
  std::set<std::shared_ptr<ResourceClaim>> findOrphanedResourceClaims() const;

  uint64_t getNextFlowFileSequence() {
    return next_flow_file_sequence_++;
  }

  uint64_t getMaxFlowFileIdentifier() const {
    const uint64_t next = next_flow_file_sequence_;
    return next == 0 ? 0 : next - 1;
  }

  void updateMaxFlowFileIdentifier(uint64_t max_id);

  virtual uint64_t getStorageCapacity() const = 0;
  virtual uint64_t getUsableStorageSpace() const = 0;
  virtual bool isVolatile() const = 0;

  /**
   * Removes every stored record.
   */
  virtual void purge() = 0;

  const std::shared_ptr<ResourceClaimManager>& getResourceClaimManager() const {
    return claim_manager_;
  }

  static std::string normalizeSwapLocation(const std::string& swap_location);

 protected:
  /**
   * Writes the whole batch as a single atomic unit.
   * @return false if nothing of the batch was persisted
   */
  virtual bool persist(const std::vector<RepositoryRecord>& records) = 0;

  /**
   * Visits every stored record, in no particular order.
   * @throws Exception (REPOSITORY_EXCEPTION) if a stored record cannot be read
   */
  virtual void forEachRecord(const std::function<void(FlowFileRecord&&)>& visitor, ClaimTracking tracking) const = 0;

  /**
   * @return the record to store for a CREATE, UPDATE or swap record, placed on the destination queue
   */
  static FlowFileRecord toFlowFileRecord(const RepositoryRecord& record);

  std::string name_;
  std::shared_ptr<ResourceClaimManager> claim_manager_;

 private:
  void validate(const RepositoryRecord& record) const;
  static void restoreSwapLocations(FlowFileQueue& queue, std::map<std::string, std::vector<std::shared_ptr<FlowFile>>>& locations);
  void releaseClaims(const RepositoryRecord& record);

  std::atomic<uint64_t> next_flow_file_sequence_{1};

  mutable std::mutex mutex_;
  std::unordered_set<std::string> swap_location_suffixes_;

  std::shared_ptr<QueueProvider> queue_provider_;

  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core
