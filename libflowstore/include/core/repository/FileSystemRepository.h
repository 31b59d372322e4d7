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
#include <chrono>
#include <filesystem>
#include <list>
#include <map>
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
#include "utils/ConcurrentQueue.h"
#include "utils/StoppableThread.h"

namespace org::apache::nifi::flowstore::core::repository {

constexpr const char* CONTENT_REPOSITORY_DIRECTORY = "./content_repository";
constexpr const char* DEFAULT_CONTAINER_NAME = "default";
constexpr uint32_t DEFAULT_CONTENT_REPOSITORY_SECTIONS = 1024;
constexpr uint64_t DEFAULT_MAX_APPENDABLE_CLAIM_SIZE = 1_MiB;
constexpr uint64_t MAX_APPENDABLE_CLAIM_SIZE_LIMIT = 100_MiB;
constexpr std::chrono::milliseconds DEFAULT_CONTENT_PURGE_PERIOD = std::chrono::seconds(1);

/**
 * Content repository storing each resource claim as a file at <container>/<section>/<id>.
 * Small contents are appended to the same resource claim until it reaches the configured
 * maximum appendable size, at which point the claim is frozen. A content claim released
 * without its writer having been closed freezes its resource claim as well.
 */
class FileSystemRepository : public ContentRepository {
 public:
  explicit FileSystemRepository(std::string name = std::string(core::className<FileSystemRepository>()));

  ~FileSystemRepository() override {
    stop();
  }

  bool initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) override;

  void start() override;
  void stop() override;

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
    return false;
  }

  std::filesystem::path getPath(const ResourceClaim& claim) const;

  /**
   * Deletes the resources of destructable claims, retrying the ones whose
   * removal failed in a previous cycle.
   * @return the number of resources removed
   */
  size_t reclaim();

  /**
   * Deletes every file in the containers that is not backing one of the given resource claims.
   */
  void clearOrphans(const std::set<std::string>& referenced_claim_keys);

  uint64_t getMaxAppendableClaimSize() const {
    return max_appendable_claim_size_;
  }

 protected:
  std::list<std::shared_ptr<ResourceClaim>> purge_list_;

 private:
  class ClaimWriter;

  struct WritableClaim {
    std::shared_ptr<ResourceClaim> claim;
    uint64_t length{0};
  };

  void writerClosed(const std::shared_ptr<ResourceClaim>& claim, uint64_t resource_length, bool failed);
  std::shared_ptr<ResourceClaim> createResourceClaim(bool loss_tolerant);

  std::map<std::string, std::filesystem::path> containers_;
  std::vector<std::string> container_names_;
  std::atomic<uint64_t> container_index_{0};
  std::atomic<uint64_t> section_index_{0};
  uint32_t sections_{DEFAULT_CONTENT_REPOSITORY_SECTIONS};
  uint64_t max_appendable_claim_size_{DEFAULT_MAX_APPENDABLE_CLAIM_SIZE};
  bool always_sync_{false};
  std::chrono::milliseconds purge_period_{DEFAULT_CONTENT_PURGE_PERIOD};

  utils::NonRepeatingStringGenerator id_generator_;
  utils::ConcurrentQueue<WritableClaim> writable_claims_;

  std::mutex purge_list_mutex_;
  std::unique_ptr<utils::StoppableThread> reclamation_thread_;

  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core::repository
