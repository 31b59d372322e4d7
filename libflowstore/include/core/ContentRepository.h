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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "core/ContentClaim.h"
#include "core/ResourceClaimManager.h"
#include "io/InputStream.h"
#include "io/OutputStream.h"
#include "properties/Configure.h"

namespace org::apache::nifi::flowstore::core {

/**
 * Owns the storage containers holding FlowFile content. Content is addressed by
 * ContentClaims: byte ranges of shared, append-only ResourceClaims.
 */
class ContentRepository {
 public:
  explicit ContentRepository(std::string name) : name_(std::move(name)) {}
  virtual ~ContentRepository() = default;

  ContentRepository(const ContentRepository&) = delete;
  ContentRepository& operator=(const ContentRepository&) = delete;

  const std::string& getName() const {
    return name_;
  }

  virtual bool initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) = 0;

  virtual void start() {}
  virtual void stop() {}

  /**
   * Allocates a new content claim, which may share its resource claim with earlier claims.
   * The caller owns one claimant of the returned claim.
   */
  virtual std::shared_ptr<ContentClaim> create(bool loss_tolerant) = 0;

  /**
   * Opens the writer of a claim returned by create(). Closing (or destroying) the writer
   * sets the length of the claim. A claim must be written at most once.
   * @throws Exception (FILE_OPERATION_EXCEPTION) if the backing resource cannot be opened
   */
  virtual std::unique_ptr<io::OutputStream> write(const std::shared_ptr<ContentClaim>& claim) = 0;

  /**
   * @return a stream over exactly [offset, offset + length) of the resource
   * @throws ContentNotFoundException if the backing resource does not exist or is too short
   */
  virtual std::shared_ptr<io::InputStream> read(const ContentClaim& claim) = 0;

  /**
   * Physically removes a resource claim that the claim manager reports destructable.
   * @return true if nothing remains of the resource
   */
  virtual bool remove(const std::shared_ptr<ResourceClaim>& claim) = 0;

  virtual bool exists(const ResourceClaim& claim) const = 0;

  /**
   * @return true if the whole range of the content claim can be read
   */
  bool isAccessible(const ContentClaim& claim) const {
    return exists(*claim.getResourceClaim()) && size(*claim.getResourceClaim()) >= claim.getOffset() + static_cast<uint64_t>(std::max<int64_t>(claim.getLength(), 0));
  }

  /**
   * @return the number of bytes written to the resource so far
   */
  virtual uint64_t size(const ResourceClaim& claim) const = 0;

  virtual std::vector<std::string> getContainerNames() const = 0;
  virtual uint64_t getContainerCapacity(const std::string& container_name) const = 0;
  virtual uint64_t getContainerUsableSpace(const std::string& container_name) const = 0;

  virtual std::set<std::shared_ptr<ResourceClaim>> getActiveResourceClaims(const std::string& container_name) const = 0;

  /**
   * Deletes all content of all containers.
   */
  virtual void purge() = 0;

  virtual bool isVolatile() const = 0;

  /**
   * Creates a claim holding the given bytes.
   */
  std::shared_ptr<ContentClaim> importFrom(std::span<const std::byte> data, bool loss_tolerant = false);

  std::vector<std::byte> readAll(const ContentClaim& claim);

  const std::shared_ptr<ResourceClaimManager>& getResourceClaimManager() const {
    return claim_manager_;
  }

 protected:
  std::string name_;
  std::shared_ptr<ResourceClaimManager> claim_manager_;
};

}  // namespace org::apache::nifi::flowstore::core
