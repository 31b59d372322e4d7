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
#include <memory>
#include <string>
#include <utility>

#include "core/FlowFile.h"

namespace org::apache::nifi::flowstore::core {

enum class RepositoryRecordType : uint8_t {
  CREATE,
  UPDATE,
  DELETE,
  SWAP_OUT,
  SWAP_IN
};

constexpr const char* toString(RepositoryRecordType type) {
  switch (type) {
    case RepositoryRecordType::CREATE: return "CREATE";
    case RepositoryRecordType::UPDATE: return "UPDATE";
    case RepositoryRecordType::DELETE: return "DELETE";
    case RepositoryRecordType::SWAP_OUT: return "SWAP_OUT";
    case RepositoryRecordType::SWAP_IN: return "SWAP_IN";
  }
  return "UNKNOWN";
}

/**
 * A pending change to a single FlowFile, submitted to the FlowFile repository as part of a batch.
 */
struct RepositoryRecord {
  RepositoryRecordType type{RepositoryRecordType::UPDATE};
  // absent for CREATE
  std::shared_ptr<FlowFile> original;
  std::shared_ptr<FlowFile> current;
  // the queue the FlowFile is destined to (empty once it leaves the flow)
  std::string queue_id;
  std::string original_queue_id;
  std::string swap_location;
  bool content_modified{false};

  static RepositoryRecord create(std::shared_ptr<FlowFile> flow_file, std::string queue_id) {
    RepositoryRecord record;
    record.type = RepositoryRecordType::CREATE;
    record.current = std::move(flow_file);
    record.queue_id = std::move(queue_id);
    record.content_modified = true;
    return record;
  }

  static RepositoryRecord forExisting(std::shared_ptr<FlowFile> flow_file) {
    RepositoryRecord record;
    record.type = RepositoryRecordType::UPDATE;
    record.original = flow_file;
    record.current = std::move(flow_file);
    record.queue_id = record.original->getQueueId();
    record.original_queue_id = record.queue_id;
    return record;
  }

  /**
   * Installs a new working version. Once the content was modified within the
   * session the record stays content modified.
   */
  void setWorking(std::shared_ptr<FlowFile> flow_file, bool modifies_content) {
    current = std::move(flow_file);
    content_modified = content_modified || modifies_content;
  }

  void markForDelete() {
    type = RepositoryRecordType::DELETE;
  }

  void setDestination(std::string destination_queue_id) {
    queue_id = std::move(destination_queue_id);
  }

  bool isMarkedForDelete() const {
    return type == RepositoryRecordType::DELETE;
  }

  /**
   * @return the content claim the FlowFile had before this change, if it was replaced or dropped
   */
  std::shared_ptr<ContentClaim> getOriginalClaim() const {
    return original ? original->getContentClaim() : nullptr;
  }

  std::shared_ptr<ContentClaim> getCurrentClaim() const {
    return current ? current->getContentClaim() : nullptr;
  }
};

}  // namespace org::apache::nifi::flowstore::core
