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
#include "core/repository/VolatileContentRepository.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "Exception.h"
#include "io/BufferStream.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::core::repository {

class VolatileContentRepository::BufferWriter final : public io::OutputStream {
 public:
  BufferWriter(VolatileContentRepository& repository, std::shared_ptr<ContentClaim> claim)
      : repository_(repository),
        claim_(std::move(claim)) {
  }

  ~BufferWriter() override {
    close();
  }

  using OutputStream::write;

  size_t write(const uint8_t* value, size_t len) override {
    if (closed_) {
      return io::STREAM_ERROR;
    }
    return buffer_.write(value, len);
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    claim_->setLength(gsl::narrow<int64_t>(buffer_.size()));
    repository_.store(claim_->getResourceClaim(), buffer_.moveBuffer());
  }

 private:
  VolatileContentRepository& repository_;
  std::shared_ptr<ContentClaim> claim_;
  io::BufferStream buffer_;
  bool closed_{false};
};

VolatileContentRepository::VolatileContentRepository(std::string name)
    : ContentRepository(std::move(name)),
      logger_(logging::LoggerFactory<VolatileContentRepository>::getLogger()) {
}

bool VolatileContentRepository::initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) {
  claim_manager_ = std::move(claim_manager);
  if (auto capacity = configure->getDataSize(Configure::flowstore_volatile_content_repository_max_bytes)) {
    capacity_ = *capacity;
  }
  logger_->log_info("Volatile content repository can hold {} bytes", capacity_);
  return true;
}

std::shared_ptr<ContentClaim> VolatileContentRepository::create(bool loss_tolerant) {
  gsl_Expects(claim_manager_);
  auto resource_claim = claim_manager_->newResourceClaim(VOLATILE_CONTAINER_NAME, "0", id_generator_.generate(), loss_tolerant, true);
  claim_manager_->incrementClaimantCount(resource_claim);
  return std::make_shared<ContentClaim>(std::move(resource_claim), 0);
}

std::unique_ptr<io::OutputStream> VolatileContentRepository::write(const std::shared_ptr<ContentClaim>& claim) {
  if (exists(*claim->getResourceClaim())) {
    throw Exception(FILE_OPERATION_EXCEPTION, "Content of " + claim->to_string() + " has already been written");
  }
  return std::make_unique<BufferWriter>(*this, claim);
}

void VolatileContentRepository::store(const std::shared_ptr<ResourceClaim>& claim, std::vector<std::byte> content) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    used_bytes_ += content.size();
    if (used_bytes_ > capacity_) {
      logger_->log_warn("Volatile content repository holds {} bytes, exceeding its capacity of {} bytes", used_bytes_, capacity_);
    }
    resources_[claim->getKey()] = std::make_shared<const std::vector<std::byte>>(std::move(content));
  }
  claim_manager_->freeze(claim);
}

std::shared_ptr<io::InputStream> VolatileContentRepository::read(const ContentClaim& claim) {
  std::shared_ptr<const std::vector<std::byte>> content;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(claim.getResourceClaim()->getKey());
    if (it == resources_.end()) {
      throw ContentNotFoundException(claim.to_string());
    }
    content = it->second;
  }
  const auto length = claim.getLength() < 0 ? content->size() - std::min<size_t>(claim.getOffset(), content->size()) : static_cast<size_t>(claim.getLength());
  if (claim.getOffset() + length > content->size()) {
    throw ContentNotFoundException(claim.to_string());
  }
  return std::make_shared<io::BufferStream>(std::span<const std::byte>(*content).subspan(claim.getOffset(), length));
}

bool VolatileContentRepository::remove(const std::shared_ptr<ResourceClaim>& claim) {
  if (!claim_manager_->isDestructable(claim)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(claim->getKey());
  if (it != resources_.end()) {
    used_bytes_ -= it->second->size();
    resources_.erase(it);
  }
  return true;
}

size_t VolatileContentRepository::reclaim() {
  std::vector<std::shared_ptr<ResourceClaim>> claims;
  claim_manager_->drainDestructableClaims(claims, std::numeric_limits<size_t>::max());
  size_t removed = 0;
  for (const auto& claim : claims) {
    if (remove(claim)) {
      ++removed;
    }
  }
  return removed;
}

bool VolatileContentRepository::exists(const ResourceClaim& claim) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resources_.contains(claim.getKey());
}

uint64_t VolatileContentRepository::size(const ResourceClaim& claim) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(claim.getKey());
  return it == resources_.end() ? 0 : it->second->size();
}

std::vector<std::string> VolatileContentRepository::getContainerNames() const {
  return {VOLATILE_CONTAINER_NAME};
}

uint64_t VolatileContentRepository::getContainerCapacity(const std::string& container_name) const {
  if (container_name != VOLATILE_CONTAINER_NAME) {
    throw Exception(REPOSITORY_EXCEPTION, "Unknown content container " + container_name);
  }
  return capacity_;
}

uint64_t VolatileContentRepository::getContainerUsableSpace(const std::string& container_name) const {
  if (container_name != VOLATILE_CONTAINER_NAME) {
    throw Exception(REPOSITORY_EXCEPTION, "Unknown content container " + container_name);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return used_bytes_ >= capacity_ ? 0 : capacity_ - used_bytes_;
}

std::set<std::shared_ptr<ResourceClaim>> VolatileContentRepository::getActiveResourceClaims(const std::string& container_name) const {
  std::set<std::shared_ptr<ResourceClaim>> active_claims;
  for (const auto& claim : claim_manager_->getTrackedClaims()) {
    if (claim->getContainer() == container_name && (claim->isInUse() || claim_manager_->getClaimantCount(claim) > 0)) {
      active_claims.insert(claim);
    }
  }
  return active_claims;
}

void VolatileContentRepository::purge() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    resources_.clear();
    used_bytes_ = 0;
  }
  claim_manager_->purge();
}

}  // namespace org::apache::nifi::flowstore::core::repository
