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

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/ClassName.h"
#include "core/FlowFileRepository.h"

namespace org::apache::nifi::flowstore::core::repository {

/**
 * FlowFile repository holding its records in memory; nothing survives a restart.
 */
class VolatileFlowFileRepository : public FlowFileRepository {
 public:
  explicit VolatileFlowFileRepository(std::string name = std::string(core::className<VolatileFlowFileRepository>()))
      : FlowFileRepository(std::move(name)) {
  }

  uint64_t getStorageCapacity() const override {
    return 0;
  }

  uint64_t getUsableStorageSpace() const override {
    return 0;
  }

  bool isVolatile() const override {
    return true;
  }

  void purge() override {
    std::lock_guard<std::mutex> lock(records_mutex_);
    records_.clear();
  }

  size_t getRecordCount() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return records_.size();
  }

 protected:
  bool persist(const std::vector<RepositoryRecord>& records) override {
    std::lock_guard<std::mutex> lock(records_mutex_);
    for (const auto& record : records) {
      if (record.type == RepositoryRecordType::DELETE) {
        records_.erase(record.current->getUUIDStr());
        continue;
      }
      auto flow_file_record = toFlowFileRecord(record);
      flow_file_record.flow_file = std::make_shared<FlowFile>(*flow_file_record.flow_file);
      records_[record.current->getUUIDStr()] = std::move(flow_file_record);
    }
    return true;
  }

  // the visited FlowFiles share the resource claims of the stored ones
  void forEachRecord(const std::function<void(FlowFileRecord&&)>& visitor, ClaimTracking /*tracking*/) const override {
    std::vector<FlowFileRecord> records;
    {
      std::lock_guard<std::mutex> lock(records_mutex_);
      records.reserve(records_.size());
      for (const auto& [uuid, record] : records_) {
        records.push_back(FlowFileRecord{std::make_shared<FlowFile>(*record.flow_file), record.swap_location});
      }
    }
    for (auto& record : records) {
      visitor(std::move(record));
    }
  }

 private:
  mutable std::mutex records_mutex_;
  std::map<std::string, FlowFileRecord> records_;
};

}  // namespace org::apache::nifi::flowstore::core::repository
