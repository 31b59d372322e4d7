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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "core/ContentClaim.h"
#include "utils/Id.h"

namespace org::apache::nifi::flowstore::core {

namespace SpecialFlowAttribute {
constexpr const char* UUID = "uuid";
constexpr const char* FILENAME = "filename";
}  // namespace SpecialFlowAttribute

/**
 * A unit of data flowing through the system: attributes plus an optional content claim.
 *
 * FlowFiles are snapshots. A session changes a FlowFile by creating a modified copy
 * (the working version) and committing it; the original is left untouched.
 */
class FlowFile {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  FlowFile(uint64_t id, const utils::Identifier& uuid);

  FlowFile(const FlowFile&) = default;
  FlowFile& operator=(const FlowFile&) = default;

  uint64_t getId() const {
    return id_;
  }

  const utils::Identifier& getUUID() const {
    return uuid_;
  }

  std::string getUUIDStr() const {
    return uuid_.to_string();
  }

  std::optional<std::string> getAttribute(const std::string& key) const;

  /**
   * Sets the attribute. The uuid attribute cannot be changed.
   * @return false if the key is the uuid attribute
   */
  bool setAttribute(const std::string& key, std::string value);

  bool removeAttribute(const std::string& key);

  const std::map<std::string, std::string>& getAttributes() const {
    return attributes_;
  }

  uint64_t getSize() const {
    return size_;
  }

  void setSize(uint64_t size) {
    size_ = size;
  }

  const std::shared_ptr<ContentClaim>& getContentClaim() const {
    return claim_;
  }

  std::shared_ptr<ResourceClaim> getResourceClaim() const {
    return claim_ ? claim_->getResourceClaim() : nullptr;
  }

  /**
   * Replaces the content of this FlowFile; the size follows the length of the claim.
   */
  void setContentClaim(std::shared_ptr<ContentClaim> claim);

  TimePoint getEntryDate() const {
    return entry_date_;
  }

  void setEntryDate(TimePoint entry_date) {
    entry_date_ = entry_date;
  }

  TimePoint getLineageStartDate() const {
    return lineage_start_date_;
  }

  void setLineageStartDate(TimePoint lineage_start_date) {
    lineage_start_date_ = lineage_start_date;
  }

  TimePoint getPenaltyExpiration() const {
    return penalty_expiration_;
  }

  void setPenaltyExpiration(TimePoint penalty_expiration) {
    penalty_expiration_ = penalty_expiration;
  }

  bool isPenalized() const {
    return penalty_expiration_ > std::chrono::system_clock::now();
  }

  /**
   * @return the identifier of the queue (connection) owning this FlowFile, empty if not queued
   */
  const std::string& getQueueId() const {
    return queue_id_;
  }

  void setQueueId(std::string queue_id) {
    queue_id_ = std::move(queue_id);
  }

  bool hasSameContent(const FlowFile& other) const;

  static uint64_t toMillis(TimePoint time_point) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count());
  }

  static TimePoint fromMillis(uint64_t millis) {
    return TimePoint{std::chrono::milliseconds(millis)};
  }

 private:
  uint64_t id_;
  utils::Identifier uuid_;
  std::map<std::string, std::string> attributes_;
  uint64_t size_{0};
  std::shared_ptr<ContentClaim> claim_;
  TimePoint entry_date_;
  TimePoint lineage_start_date_;
  TimePoint penalty_expiration_{};
  std::string queue_id_;
};

}  // namespace org::apache::nifi::flowstore::core
