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

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/ClassName.h"
#include "core/FlowFileRepository.h"
#include "core/logging/Logger.h"
#include "database/RocksDatabase.h"
#include "utils/StoppableThread.h"

namespace org::apache::nifi::flowstore::core::repository {

#ifdef WIN32
constexpr auto FLOWFILE_REPOSITORY_DIRECTORY = ".\\flowfile_repository";
#else
constexpr auto FLOWFILE_REPOSITORY_DIRECTORY = "./flowfile_repository";
#endif

constexpr auto FLOWFILE_REPOSITORY_RETRY_INTERVAL_INCREMENTS = std::chrono::milliseconds(500);

/**
 * Flow File repository
 * Stores the FlowFile records in RocksDB keyed by FlowFile uuid. Every batch of
 * repository records is written as one rocksdb::WriteBatch.
 */
class FlowFileRepository : public core::FlowFileRepository {
  static constexpr std::chrono::milliseconds DEFAULT_COMPACTION_PERIOD = std::chrono::minutes{2};

 public:
  explicit FlowFileRepository(std::string name = std::string(core::className<FlowFileRepository>()), std::string directory = FLOWFILE_REPOSITORY_DIRECTORY);

  ~FlowFileRepository() override;

  bool initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) override;

  void start() override;
  void stop() override;

  uint64_t getStorageCapacity() const override;
  uint64_t getUsableStorageSpace() const override;

  bool isVolatile() const override {
    return false;
  }

  void purge() override;

  /**
   * @return the number of records stored, found by walking the whole database
   */
  uint64_t getRecordCount() const;

  const std::string& getDirectory() const {
    return directory_;
  }

  std::chrono::milliseconds getCompactionPeriod() const {
    return compaction_period_;
  }

 protected:
  bool persist(const std::vector<RepositoryRecord>& records) override;
  void forEachRecord(const std::function<void(FlowFileRecord&&)>& visitor, ClaimTracking tracking) const override;

 private:
  bool ExecuteWithRetry(const std::function<rocksdb::Status()>& operation);
  void setCompactionPeriod(const std::shared_ptr<Configure>& configure);
  void runCompaction();

  std::string directory_;
  bool sync_writes_{false};
  std::chrono::milliseconds compaction_period_{DEFAULT_COMPACTION_PERIOD};
  std::unique_ptr<internal::RocksDatabase> db_;
  std::unique_ptr<utils::StoppableThread> compaction_thread_;
  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core::repository
