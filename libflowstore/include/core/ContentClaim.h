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
#include <ostream>
#include <string>
#include <utility>

#include "core/ResourceClaim.h"

namespace org::apache::nifi::flowstore::core {

/**
 * The content of one FlowFile: the byte range [offset, offset + length) of a ResourceClaim.
 * The length is unknown (-1) until the writer of the claim is closed.
 */
class ContentClaim {
 public:
  ContentClaim(std::shared_ptr<ResourceClaim> resource_claim, uint64_t offset, int64_t length = -1)
      : resource_claim_(std::move(resource_claim)),
        offset_(offset),
        length_(length) {
  }

  const std::shared_ptr<ResourceClaim>& getResourceClaim() const {
    return resource_claim_;
  }

  uint64_t getOffset() const {
    return offset_;
  }

  int64_t getLength() const {
    return length_;
  }

  void setLength(int64_t length) {
    length_ = length;
  }

  bool operator==(const ContentClaim& other) const {
    return *resource_claim_ == *other.resource_claim_ && offset_ == other.offset_ && length_ == other.length_;
  }

  std::string to_string() const {
    return resource_claim_->getKey() + "@" + std::to_string(offset_) + "+" + std::to_string(length_);
  }

  friend std::ostream& operator<<(std::ostream& stream, const ContentClaim& claim) {
    return stream << "ContentClaim[" << claim.to_string() << "]";
  }

 private:
  std::shared_ptr<ResourceClaim> resource_claim_;
  uint64_t offset_;
  int64_t length_;
};

}  // namespace org::apache::nifi::flowstore::core
