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
#include <memory>
#include <ostream>
#include <string>

namespace org::apache::nifi::flowstore::core {

class ResourceClaimManager;

/**
 * A physical, append-only backing object (e.g. a file in a content container) that
 * may hold the content of many FlowFiles back-to-back.
 *
 * Instances are shared: every ContentClaim pointing into the same backing object
 * holds the same ResourceClaim, which the ResourceClaimManager hands out.
 */
class ResourceClaim {
 public:
  ResourceClaim(std::string container, std::string section, std::string id, bool loss_tolerant, bool in_use);

  ResourceClaim(const ResourceClaim&) = delete;
  ResourceClaim& operator=(const ResourceClaim&) = delete;
  ResourceClaim(ResourceClaim&&) = delete;
  ResourceClaim& operator=(ResourceClaim&&) = delete;

  const std::string& getContainer() const {
    return container_;
  }

  const std::string& getSection() const {
    return section_;
  }

  const std::string& getId() const {
    return id_;
  }

  bool isLossTolerant() const {
    return loss_tolerant_;
  }

  /**
   * A claim is in use while a writer may still append to it, i.e. while it is the
   * current (or a queued) append target of its content repository.
   */
  bool isInUse() const {
    return in_use_;
  }

  /**
   * @return container/section/id, unique for the lifetime of the repository
   */
  const std::string& getKey() const {
    return key_;
  }

  bool operator==(const ResourceClaim& other) const {
    return key_ == other.key_;
  }

  friend std::ostream& operator<<(std::ostream& stream, const ResourceClaim& claim) {
    return stream << "ResourceClaim[" << claim.key_ << "]";
  }

 private:
  friend class ResourceClaimManager;

  void markNotInUse() {
    in_use_ = false;
  }

  const std::string container_;
  const std::string section_;
  const std::string id_;
  const std::string key_;
  const bool loss_tolerant_;
  std::atomic<bool> in_use_;
};

}  // namespace org::apache::nifi::flowstore::core
