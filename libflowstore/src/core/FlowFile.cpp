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
#include "core/FlowFile.h"

namespace org::apache::nifi::flowstore::core {

FlowFile::FlowFile(uint64_t id, const utils::Identifier& uuid)
    : id_(id),
      uuid_(uuid),
      entry_date_(std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now())),
      lineage_start_date_(entry_date_) {
  attributes_[SpecialFlowAttribute::UUID] = uuid_.to_string();
}

std::optional<std::string> FlowFile::getAttribute(const std::string& key) const {
  auto it = attributes_.find(key);
  if (it == attributes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool FlowFile::setAttribute(const std::string& key, std::string value) {
  if (key == SpecialFlowAttribute::UUID) {
    return false;
  }
  attributes_[key] = std::move(value);
  return true;
}

bool FlowFile::removeAttribute(const std::string& key) {
  if (key == SpecialFlowAttribute::UUID) {
    return false;
  }
  return attributes_.erase(key) > 0;
}

void FlowFile::setContentClaim(std::shared_ptr<ContentClaim> claim) {
  claim_ = std::move(claim);
  size_ = claim_ && claim_->getLength() > 0 ? static_cast<uint64_t>(claim_->getLength()) : 0;
}

bool FlowFile::hasSameContent(const FlowFile& other) const {
  if (!claim_ || !other.claim_) {
    return !claim_ && !other.claim_;
  }
  return *claim_ == *other.claim_;
}

}  // namespace org::apache::nifi::flowstore::core
