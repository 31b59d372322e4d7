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
#include "core/repository/FileSystemRepository.h"

#include <string_view>
#include <utility>

#include "Exception.h"
#include "io/FileStream.h"
#include "io/StreamSlice.h"
#include "utils/StringUtils.h"
#include "utils/file/FileUtils.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::core::repository {

namespace {
constexpr size_t MAX_CLAIMS_PER_RECLAMATION = 10000;
}  // namespace

/**
 * Appends to the resource of a single content claim. Closing the writer finalizes
 * the length of the content claim and hands the resource claim back to the repository.
 */
class FileSystemRepository::ClaimWriter final : public io::OutputStream {
 public:
  ClaimWriter(FileSystemRepository& repository, std::shared_ptr<ContentClaim> claim, std::unique_ptr<io::FileStream> stream)
      : repository_(repository),
        claim_(std::move(claim)),
        stream_(std::move(stream)) {
  }

  ~ClaimWriter() override {
    close();
  }

  using OutputStream::write;

  size_t write(const uint8_t* value, size_t len) override {
    if (closed_) {
      return io::STREAM_ERROR;
    }
    const auto ret = stream_->write(value, len);
    if (io::isError(ret)) {
      failed_ = true;
      return ret;
    }
    written_ += ret;
    return ret;
  }

  bool flush() override {
    return !closed_ && stream_->flush();
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    const bool persisted = repository_.always_sync_ ? stream_->sync() : stream_->flush();
    if (!persisted) {
      repository_.logger_->log_error("Failed to persist content of {}", claim_->to_string());
      failed_ = true;
    }
    stream_->close();
    claim_->setLength(gsl::narrow<int64_t>(written_));
    repository_.writerClosed(claim_->getResourceClaim(), claim_->getOffset() + written_, failed_);
  }

 private:
  FileSystemRepository& repository_;
  std::shared_ptr<ContentClaim> claim_;
  std::unique_ptr<io::FileStream> stream_;
  uint64_t written_{0};
  bool closed_{false};
  bool failed_{false};
};

FileSystemRepository::FileSystemRepository(std::string name)
    : ContentRepository(std::move(name)),
      logger_(logging::LoggerFactory<FileSystemRepository>::getLogger()) {
}

bool FileSystemRepository::initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) {
  claim_manager_ = std::move(claim_manager);
  containers_.clear();
  const std::string_view prefix = Configure::flowstore_content_repository_directory_prefix;
  for (const auto& [key, value] : configure->getProperties()) {
    if (key.size() > prefix.size() && key.starts_with(prefix)) {
      containers_[key.substr(prefix.size())] = utils::string::trim(value);
    }
  }
  if (containers_.empty()) {
    containers_[DEFAULT_CONTAINER_NAME] = CONTENT_REPOSITORY_DIRECTORY;
  }
  container_names_.clear();
  for (const auto& [container_name, path] : containers_) {
    if (utils::file::create_dir(path) != 0) {
      logger_->log_error("Could not create directory {} of content container {}", path, container_name);
      return false;
    }
    container_names_.push_back(container_name);
    logger_->log_info("Content container {} is located at {}", container_name, path);
  }

  const auto sections = configure->getInt(Configure::flowstore_content_repository_sections, static_cast<int>(DEFAULT_CONTENT_REPOSITORY_SECTIONS));
  if (sections <= 0) {
    logger_->log_error("Invalid number of content repository sections: {}", sections);
    return false;
  }
  sections_ = static_cast<uint32_t>(sections);

  if (auto max_appendable_size = configure->getDataSize(Configure::flowstore_content_repository_max_appendable_claim_size)) {
    if (*max_appendable_size > MAX_APPENDABLE_CLAIM_SIZE_LIMIT) {
      logger_->log_warn("Maximum appendable claim size {} exceeds the limit, using {} bytes", *max_appendable_size, MAX_APPENDABLE_CLAIM_SIZE_LIMIT);
      max_appendable_claim_size_ = MAX_APPENDABLE_CLAIM_SIZE_LIMIT;
    } else {
      max_appendable_claim_size_ = *max_appendable_size;
    }
  }
  always_sync_ = configure->getBool(Configure::flowstore_content_repository_always_sync).value_or(false);
  purge_period_ = configure->getDuration(Configure::flowstore_content_repository_purge_period).value_or(DEFAULT_CONTENT_PURGE_PERIOD);
  return true;
}

void FileSystemRepository::start() {
  if (reclamation_thread_) {
    return;
  }
  logger_->log_debug("Starting content reclamation with a period of {}", purge_period_);
  reclamation_thread_ = std::make_unique<utils::StoppableThread>([this] {
    do {
      reclaim();
    } while (!utils::StoppableThread::waitForStopRequest(purge_period_));
  });
}

void FileSystemRepository::stop() {
  if (reclamation_thread_) {
    reclamation_thread_->stopAndJoin();
    reclamation_thread_.reset();
  }
  if (!claim_manager_) {
    return;
  }
  WritableClaim writable;
  while (writable_claims_.tryDequeue(writable)) {
    claim_manager_->freeze(writable.claim);
  }
}

std::shared_ptr<ResourceClaim> FileSystemRepository::createResourceClaim(bool loss_tolerant) {
  const auto& container = container_names_[container_index_++ % container_names_.size()];
  auto section = std::to_string(section_index_++ % sections_);
  auto section_path = containers_.at(container) / section;
  if (utils::file::create_dir(section_path) != 0) {
    throw Exception(FILE_OPERATION_EXCEPTION, "Could not create content section directory " + section_path.string());
  }
  return claim_manager_->newResourceClaim(container, section, id_generator_.generate(), loss_tolerant, true);
}

std::shared_ptr<ContentClaim> FileSystemRepository::create(bool loss_tolerant) {
  gsl_Expects(claim_manager_ && !container_names_.empty());
  std::vector<WritableClaim> skipped;
  WritableClaim writable;
  bool found = false;
  while (writable_claims_.tryDequeue(writable)) {
    if (writable.claim->isLossTolerant() == loss_tolerant) {
      found = true;
      break;
    }
    skipped.push_back(std::move(writable));
  }
  for (auto& claim : skipped) {
    writable_claims_.enqueue(std::move(claim));
  }
  if (!found) {
    writable = WritableClaim{createResourceClaim(loss_tolerant), 0};
  }
  claim_manager_->incrementClaimantCount(writable.claim);
  // a claim dropped before its writer was closed leaves a gap at the end of the resource, which must not be appended to
  std::weak_ptr<ResourceClaimManager> weak_claim_manager = claim_manager_;
  return std::shared_ptr<ContentClaim>(new ContentClaim(writable.claim, writable.length), [weak_claim_manager](ContentClaim* claim) {
    if (claim->getLength() < 0 && claim->getResourceClaim()->isInUse()) {
      if (auto claim_manager = weak_claim_manager.lock()) {
        claim_manager->freeze(claim->getResourceClaim());
      }
    }
    delete claim;
  });
}

std::unique_ptr<io::OutputStream> FileSystemRepository::write(const std::shared_ptr<ContentClaim>& claim) {
  const auto path = getPath(*claim->getResourceClaim());
  auto stream = std::make_unique<io::FileStream>(path, io::FileStream::Mode::Append);
  if (!stream->isOpen()) {
    claim_manager_->freeze(claim->getResourceClaim());
    throw Exception(FILE_OPERATION_EXCEPTION, "Could not open " + path.string() + " for writing");
  }
  if (stream->size() != claim->getOffset()) {
    claim_manager_->freeze(claim->getResourceClaim());
    throw Exception(FILE_OPERATION_EXCEPTION, "Resource " + path.string() + " has " + std::to_string(stream->size())
        + " bytes, expected " + std::to_string(claim->getOffset()) + " to append " + claim->to_string());
  }
  return std::make_unique<ClaimWriter>(*this, claim, std::move(stream));
}

void FileSystemRepository::writerClosed(const std::shared_ptr<ResourceClaim>& claim, uint64_t resource_length, bool failed) {
  if (!failed && resource_length < max_appendable_claim_size_) {
    writable_claims_.enqueue(WritableClaim{claim, resource_length});
    return;
  }
  logger_->log_debug("Resource claim {} is no longer appendable at {} bytes", claim->getKey(), resource_length);
  claim_manager_->freeze(claim);
}

std::shared_ptr<io::InputStream> FileSystemRepository::read(const ContentClaim& claim) {
  const auto path = getPath(*claim.getResourceClaim());
  std::error_code error;
  if (!std::filesystem::exists(path, error)) {
    throw ContentNotFoundException(claim.to_string());
  }
  auto stream = std::make_shared<io::FileStream>(path, io::FileStream::Mode::Read);
  if (!stream->isOpen() || stream->size() < claim.getOffset()) {
    throw ContentNotFoundException(claim.to_string());
  }
  const auto length = claim.getLength() < 0 ? stream->size() - claim.getOffset() : static_cast<uint64_t>(claim.getLength());
  try {
    return std::make_shared<io::StreamSlice>(stream, claim.getOffset(), length);
  } catch (const std::invalid_argument&) {
    throw ContentNotFoundException(claim.to_string());
  }
}

bool FileSystemRepository::remove(const std::shared_ptr<ResourceClaim>& claim) {
  if (!claim_manager_->isDestructable(claim)) {
    logger_->log_debug("Not removing {}, it is still claimed", claim->getKey());
    return false;
  }
  const auto path = getPath(*claim);
  std::error_code error;
  std::filesystem::remove(path, error);
  if (error && std::filesystem::exists(path)) {
    logger_->log_warn("Failed to remove resource {}: {}", path, error.message());
    return false;
  }
  logger_->log_debug("Removed resource {}", path);
  return true;
}

size_t FileSystemRepository::reclaim() {
  std::vector<std::shared_ptr<ResourceClaim>> claims;
  claim_manager_->drainDestructableClaims(claims, MAX_CLAIMS_PER_RECLAMATION);
  std::lock_guard<std::mutex> lock(purge_list_mutex_);
  claims.insert(claims.end(), purge_list_.begin(), purge_list_.end());
  purge_list_.clear();
  size_t removed = 0;
  for (const auto& claim : claims) {
    if (!claim_manager_->isDestructable(claim)) {
      continue;
    }
    if (remove(claim)) {
      ++removed;
    } else {
      purge_list_.push_back(claim);
    }
  }
  if (removed > 0) {
    logger_->log_debug("Reclaimed {} resources, {} are pending removal", removed, purge_list_.size());
  }
  return removed;
}

void FileSystemRepository::clearOrphans(const std::set<std::string>& referenced_claim_keys) {
  for (const auto& [container_name, container_path] : containers_) {
    for (const auto& [directory, filename] : utils::file::list_dir_all(container_path, logger_)) {
      const auto section = directory.filename().string();
      const auto key = container_name + "/" + section + "/" + filename.string();
      if (referenced_claim_keys.contains(key)) {
        continue;
      }
      if (auto claim = claim_manager_->getResourceClaim(container_name, section, filename.string()); claim && !claim_manager_->isDestructable(claim)) {
        continue;
      }
      std::error_code error;
      if (!std::filesystem::remove(directory / filename, error)) {
        logger_->log_warn("Failed to remove orphaned resource {}: {}", directory / filename, error.message());
      } else {
        logger_->log_info("Removed orphaned resource {}", directory / filename);
      }
    }
  }
}

bool FileSystemRepository::exists(const ResourceClaim& claim) const {
  std::error_code error;
  return std::filesystem::exists(getPath(claim), error);
}

uint64_t FileSystemRepository::size(const ResourceClaim& claim) const {
  std::error_code error;
  const auto size = std::filesystem::file_size(getPath(claim), error);
  return error ? 0 : size;
}

std::filesystem::path FileSystemRepository::getPath(const ResourceClaim& claim) const {
  const auto it = containers_.find(claim.getContainer());
  if (it == containers_.end()) {
    throw ContentNotFoundException(claim.getKey());
  }
  return it->second / claim.getSection() / claim.getId();
}

std::vector<std::string> FileSystemRepository::getContainerNames() const {
  return container_names_;
}

uint64_t FileSystemRepository::getContainerCapacity(const std::string& container_name) const {
  const auto it = containers_.find(container_name);
  if (it == containers_.end()) {
    throw Exception(REPOSITORY_EXCEPTION, "Unknown content container " + container_name);
  }
  const auto space = utils::file::space(it->second);
  return space ? space->capacity : 0;
}

uint64_t FileSystemRepository::getContainerUsableSpace(const std::string& container_name) const {
  const auto it = containers_.find(container_name);
  if (it == containers_.end()) {
    throw Exception(REPOSITORY_EXCEPTION, "Unknown content container " + container_name);
  }
  const auto space = utils::file::space(it->second);
  return space ? space->available : 0;
}

std::set<std::shared_ptr<ResourceClaim>> FileSystemRepository::getActiveResourceClaims(const std::string& container_name) const {
  std::set<std::shared_ptr<ResourceClaim>> active_claims;
  for (const auto& claim : claim_manager_->getTrackedClaims()) {
    if (claim->getContainer() == container_name && (claim->isInUse() || claim_manager_->getClaimantCount(claim) > 0)) {
      active_claims.insert(claim);
    }
  }
  return active_claims;
}

void FileSystemRepository::purge() {
  writable_claims_.clear();
  {
    std::lock_guard<std::mutex> lock(purge_list_mutex_);
    purge_list_.clear();
  }
  for (const auto& [container_name, path] : containers_) {
    if (utils::file::delete_dir(path) != 0 || utils::file::create_dir(path) != 0) {
      throw Exception(FILE_OPERATION_EXCEPTION, "Failed to purge content container " + container_name);
    }
    logger_->log_info("Purged content container {}", container_name);
  }
  claim_manager_->purge();
}

}  // namespace org::apache::nifi::flowstore::core::repository
