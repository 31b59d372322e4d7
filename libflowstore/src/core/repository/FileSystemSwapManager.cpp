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
#include "core/repository/FileSystemSwapManager.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <system_error>

#include "Exception.h"
#include "core/FlowFileRecord.h"
#include "core/logging/LoggerFactory.h"
#include "io/FileStream.h"
#include "range/v3/range/conversion.hpp"
#include "range/v3/view/transform.hpp"
#include "utils/Id.h"
#include "utils/TimeUtil.h"
#include "utils/file/FileUtils.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::core::repository {

namespace {
constexpr size_t UUID_LENGTH = 36;

bool hasExtension(const std::filesystem::path& path, std::string_view extension) {
  return path.filename().string().ends_with(extension);
}

uint64_t getSwapTimestamp(const std::filesystem::path& swap_location) {
  const auto filename = swap_location.filename().string();
  uint64_t timestamp = 0;
  for (char c : filename) {
    if (c < '0' || c > '9') {
      break;
    }
    timestamp = timestamp * 10 + static_cast<uint64_t>(c - '0');
  }
  return timestamp;
}
}  // namespace

FileSystemSwapManager::FileSystemSwapManager(std::filesystem::path swap_directory, std::shared_ptr<FlowFileRepository> flow_file_repository)
    : swap_directory_(std::move(swap_directory)),
      flow_file_repository_(std::move(flow_file_repository)),
      logger_(logging::LoggerFactory<FileSystemSwapManager>::getLogger()) {
}

bool FileSystemSwapManager::initialize() {
  if (utils::file::create_dir(swap_directory_) != 0) {
    logger_->log_error("Could not create swap directory {}", swap_directory_);
    return false;
  }
  return true;
}

std::optional<std::string> FileSystemSwapManager::getOwnerQueueIdentifier(const std::filesystem::path& swap_location) {
  auto name = swap_location.filename().string();
  if (!name.ends_with(SWAP_FILE_EXTENSION)) {
    return std::nullopt;
  }
  name.resize(name.size() - std::strlen(SWAP_FILE_EXTENSION));
  const auto first_dash = name.find('-');
  // <millis>-<queue id>-<uuid>
  if (first_dash == std::string::npos || name.size() < first_dash + 1 + 1 + 1 + UUID_LENGTH) {
    return std::nullopt;
  }
  const auto uuid_start = name.size() - UUID_LENGTH;
  if (name[uuid_start - 1] != '-') {
    return std::nullopt;
  }
  return name.substr(first_dash + 1, uuid_start - 1 - (first_dash + 1));
}

std::string FileSystemSwapManager::swapOut(const std::vector<std::shared_ptr<FlowFile>>& flow_files, const std::string& queue_id) {
  if (queue_id.empty() || queue_id.find_first_of("/.") != std::string::npos) {
    throw Exception(SWAP_EXCEPTION, "Cannot swap out FlowFiles of queue '" + queue_id + "': the queue id is not usable in a file name");
  }
  const auto swap_file = swap_directory_ / (std::to_string(utils::timeutils::getTimeMillis()) + "-" + queue_id + "-"
      + utils::IdGenerator::getIdGenerator()->generate().to_string() + SWAP_FILE_EXTENSION);
  auto partial_file = swap_file;
  partial_file += PARTIAL_SWAP_FILE_EXTENSION;

  uint64_t content_size = 0;
  uint64_t max_id = 0;
  for (const auto& flow_file : flow_files) {
    content_size += flow_file->getSize();
    max_id = std::max(max_id, flow_file->getId());
  }

  {
    io::FileStream stream(partial_file, io::FileStream::Mode::Overwrite);
    if (!stream.isOpen()) {
      throw Exception(SWAP_EXCEPTION, "Could not create swap file " + partial_file.string());
    }
    bool written = stream.write(reinterpret_cast<const uint8_t*>(SWAP_MAGIC.data()), SWAP_MAGIC.size()) == SWAP_MAGIC.size()
        && stream.write(SWAP_FORMAT_VERSION) == 4
        && !io::isError(stream.write(queue_id))
        && stream.write(static_cast<uint64_t>(flow_files.size())) == 8
        && stream.write(content_size) == 8
        && stream.write(max_id) == 8;
    for (auto it = flow_files.begin(); written && it != flow_files.end(); ++it) {
      written = FlowFileRecord{*it, {}}.Serialize(stream);
    }
    if (!written || !stream.sync()) {
      stream.close();
      std::error_code error;
      std::filesystem::remove(partial_file, error);
      throw Exception(SWAP_EXCEPTION, "Failed to write swap file " + partial_file.string());
    }
  }

  std::error_code error;
  std::filesystem::rename(partial_file, swap_file, error);
  if (error) {
    std::filesystem::remove(partial_file, error);
    throw Exception(SWAP_EXCEPTION, "Failed to rename " + partial_file.string() + " to " + swap_file.string());
  }

  try {
    flow_file_repository_->swapFlowFilesOut(flow_files, queue_id, swap_file.string());
  } catch (const Exception&) {
    std::filesystem::remove(swap_file, error);
    throw;
  }
  logger_->log_info("Swapped out {} FlowFiles of queue {} to {}", flow_files.size(), queue_id, swap_file);
  return swap_file.string();
}

std::optional<std::pair<SwapSummary, std::vector<std::shared_ptr<FlowFile>>>> FileSystemSwapManager::readSwapFile(const std::filesystem::path& swap_file, ClaimTracking tracking) const {
  std::error_code error;
  if (!std::filesystem::exists(swap_file, error)) {
    logger_->log_error("Swap file {} does not exist", swap_file);
    return std::nullopt;
  }
  io::FileStream stream(swap_file, io::FileStream::Mode::Read);
  if (!stream.isOpen()) {
    logger_->log_error("Could not open swap file {}", swap_file);
    return std::nullopt;
  }
  std::array<std::byte, SWAP_MAGIC.size()> magic{};
  if (stream.read(magic) != magic.size() || std::memcmp(magic.data(), SWAP_MAGIC.data(), magic.size()) != 0) {
    logger_->log_error("{} is not a swap file", swap_file);
    return std::nullopt;
  }
  uint32_t version = 0;
  SwapSummary summary;
  if (stream.read(version) != 4 || version != SWAP_FORMAT_VERSION) {
    logger_->log_error("Unsupported version {} of swap file {}", version, swap_file);
    return std::nullopt;
  }
  if (io::isError(stream.read(summary.queue_id)) || stream.read(summary.flow_file_count) != 8
      || stream.read(summary.content_size) != 8 || stream.read(summary.max_flow_file_id) != 8) {
    logger_->log_error("Failed to read the header of swap file {}", swap_file);
    return std::nullopt;
  }

  std::vector<std::shared_ptr<FlowFile>> flow_files;
  flow_files.reserve(gsl::narrow<size_t>(summary.flow_file_count));
  auto& claim_manager = *flow_file_repository_->getResourceClaimManager();
  for (uint64_t i = 0; i < summary.flow_file_count; ++i) {
    auto record = FlowFileRecord::DeSerialize(stream, claim_manager, tracking);
    if (!record) {
      logger_->log_error("Swap file {} is truncated after {} of {} FlowFiles", swap_file, i, summary.flow_file_count);
      return std::nullopt;
    }
    record->flow_file->setQueueId(summary.queue_id);
    if (auto claim = record->flow_file->getResourceClaim()) {
      summary.resource_claims.push_back(claim);
    }
    summary.flow_file_uuids.push_back(record->flow_file->getUUIDStr());
    flow_files.push_back(std::move(record->flow_file));
  }
  return std::make_pair(std::move(summary), std::move(flow_files));
}

std::vector<std::shared_ptr<FlowFile>> FileSystemSwapManager::swapIn(const std::string& swap_location, const std::string& queue_id) {
  if (!flow_file_repository_->isValidSwapLocationSuffix(swap_location)) {
    logger_->log_warn("Cannot swap in FlowFiles from {}: the location is unknown to the FlowFile repository", swap_location);
    return {};
  }
  auto contents = readSwapFile(swap_location, ClaimTracking::Register);
  if (!contents) {
    throw Exception(SWAP_EXCEPTION, "Swap file " + swap_location + " of queue " + queue_id + " is missing or corrupt");
  }
  auto& [summary, flow_files] = *contents;
  if (summary.queue_id != queue_id) {
    throw Exception(SWAP_EXCEPTION, "Swap file " + swap_location + " belongs to queue " + summary.queue_id + ", not to " + queue_id);
  }
  flow_file_repository_->swapFlowFilesIn(swap_location, flow_files, queue_id);

  std::error_code error;
  if (!std::filesystem::remove(swap_location, error)) {
    logger_->log_warn("Swapped in FlowFiles from {} but failed to delete the swap file: {}", swap_location, error.message());
  }
  logger_->log_info("Swapped in {} FlowFiles of queue {} from {}", flow_files.size(), queue_id, swap_location);
  return std::move(flow_files);
}

std::optional<SwapSummary> FileSystemSwapManager::peek(const std::string& swap_location, const std::string& queue_id) {
  auto contents = readSwapFile(swap_location, ClaimTracking::LookupOnly);
  if (!contents) {
    return std::nullopt;
  }
  if (contents->first.queue_id != queue_id) {
    logger_->log_warn("Swap file {} belongs to queue {}, not to {}", swap_location, contents->first.queue_id, queue_id);
    return std::nullopt;
  }
  return std::move(contents->first);
}

std::vector<std::string> FileSystemSwapManager::recoverSwapLocations(const std::string& queue_id) {
  std::vector<std::filesystem::path> swap_files;
  std::error_code error;
  for (std::filesystem::directory_iterator it(swap_directory_, error), end; !error && it != end; it.increment(error)) {
    const auto& path = it->path();
    if (!it->is_regular_file()) {
      continue;
    }
    if (hasExtension(path, PARTIAL_SWAP_FILE_EXTENSION)) {
      std::error_code remove_error;
      if (std::filesystem::remove(path, remove_error)) {
        logger_->log_info("Removed incomplete swap file {}", path);
      } else {
        logger_->log_warn("Failed to remove incomplete swap file {}: {}", path, remove_error.message());
      }
      continue;
    }
    if (getOwnerQueueIdentifier(path) != queue_id) {
      continue;
    }
    if (!flow_file_repository_->isValidSwapLocationSuffix(path.string())) {
      logger_->log_warn("Ignoring swap file {} of queue {}: it is unknown to the FlowFile repository", path, queue_id);
      continue;
    }
    swap_files.push_back(path);
  }
  if (error) {
    logger_->log_error("Failed to list swap directory {}: {}", swap_directory_, error.message());
  }
  std::sort(swap_files.begin(), swap_files.end(), [](const auto& lhs, const auto& rhs) {
    return getSwapTimestamp(lhs) < getSwapTimestamp(rhs);
  });
  return swap_files
      | ranges::views::transform([](const auto& swap_file) { return swap_file.string(); })
      | ranges::to<std::vector>();
}

void FileSystemSwapManager::purge() {
  std::error_code error;
  for (std::filesystem::directory_iterator it(swap_directory_, error), end; !error && it != end; it.increment(error)) {
    const auto& path = it->path();
    if (hasExtension(path, SWAP_FILE_EXTENSION) || hasExtension(path, PARTIAL_SWAP_FILE_EXTENSION)) {
      std::error_code remove_error;
      if (!std::filesystem::remove(path, remove_error)) {
        logger_->log_warn("Failed to remove swap file {}: {}", path, remove_error.message());
      }
    }
  }
  if (error) {
    logger_->log_error("Failed to list swap directory {}: {}", swap_directory_, error.message());
  }
}

}  // namespace org::apache::nifi::flowstore::core::repository
