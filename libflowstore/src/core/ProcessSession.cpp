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
#include "core/ProcessSession.h"

#include <utility>

#include "Exception.h"
#include "core/logging/LoggerFactory.h"
#include "utils/Id.h"

namespace org::apache::nifi::flowstore::core {

ProcessSession::ProcessSession(std::shared_ptr<FlowFileRepository> flow_file_repository, std::shared_ptr<ContentRepository> content_repository)
    : flow_file_repository_(std::move(flow_file_repository)),
      content_repository_(std::move(content_repository)),
      logger_(logging::LoggerFactory<ProcessSession>::getLogger()) {
}

ProcessSession::~ProcessSession() {
  if (staged_.empty()) {
    return;
  }
  try {
    rollback();
  } catch (const std::exception& exception) {
    logger_->log_error("Failed to roll back session of {} FlowFiles: {}", staged_.size(), exception.what());
  }
}

std::shared_ptr<FlowFile> ProcessSession::create() {
  auto flow_file = std::make_shared<FlowFile>(flow_file_repository_->getNextFlowFileSequence(), utils::IdGenerator::getIdGenerator()->generate());
  const auto uuid = flow_file->getUUIDStr();
  staged_.emplace(uuid, StagedFlowFile{RepositoryRecord::create(flow_file, {}), nullptr, nullptr, nullptr});
  order_.push_back(uuid);
  logger_->log_trace("Created FlowFile {}", uuid);
  return flow_file;
}

std::shared_ptr<FlowFile> ProcessSession::get(const std::shared_ptr<FlowFileQueue>& queue) {
  auto flow_file = queue->poll();
  if (!flow_file) {
    return nullptr;
  }
  const auto uuid = flow_file->getUUIDStr();
  staged_.emplace(uuid, StagedFlowFile{RepositoryRecord::forExisting(flow_file), queue, nullptr, nullptr});
  order_.push_back(uuid);
  return flow_file;
}

ProcessSession::StagedFlowFile& ProcessSession::getStaged(const std::shared_ptr<FlowFile>& flow_file) {
  auto it = staged_.find(flow_file->getUUIDStr());
  if (it == staged_.end()) {
    throw Exception(FLOWFILE_EXCEPTION, "FlowFile " + flow_file->getUUIDStr() + " is not part of this session");
  }
  if (it->second.record.isMarkedForDelete()) {
    throw Exception(FLOWFILE_EXCEPTION, "FlowFile " + flow_file->getUUIDStr() + " has already been removed");
  }
  return it->second;
}

std::shared_ptr<FlowFile> ProcessSession::makeWorkingCopy(StagedFlowFile& staged) {
  return std::make_shared<FlowFile>(*staged.record.current);
}

std::shared_ptr<FlowFile> ProcessSession::putAttribute(const std::shared_ptr<FlowFile>& flow_file, const std::string& key, const std::string& value) {
  auto& staged = getStaged(flow_file);
  auto working = makeWorkingCopy(staged);
  if (!working->setAttribute(key, value)) {
    logger_->log_warn("Attribute {} of FlowFile {} cannot be changed", key, flow_file->getUUIDStr());
    return staged.record.current;
  }
  staged.record.setWorking(working, false);
  return working;
}

std::shared_ptr<FlowFile> ProcessSession::write(const std::shared_ptr<FlowFile>& flow_file, std::span<const std::byte> content) {
  auto& staged = getStaged(flow_file);
  auto claim = content_repository_->importFrom(content);
  auto working = makeWorkingCopy(staged);
  working->setContentClaim(claim);
  if (staged.session_claim) {
    // replaced before anyone else could see it
    content_repository_->getResourceClaimManager()->decrementClaimantCount(staged.session_claim->getResourceClaim());
  }
  staged.session_claim = std::move(claim);
  staged.record.setWorking(working, true);
  return working;
}

std::vector<std::byte> ProcessSession::read(const std::shared_ptr<FlowFile>& flow_file) {
  auto it = staged_.find(flow_file->getUUIDStr());
  const auto& current = it == staged_.end() ? flow_file : it->second.record.current;
  if (!current->getContentClaim()) {
    return {};
  }
  return content_repository_->readAll(*current->getContentClaim());
}

void ProcessSession::transfer(const std::shared_ptr<FlowFile>& flow_file, const std::shared_ptr<FlowFileQueue>& queue) {
  auto& staged = getStaged(flow_file);
  staged.destination_queue = queue;
  staged.record.setDestination(queue->getIdentifier());
}

void ProcessSession::remove(const std::shared_ptr<FlowFile>& flow_file) {
  auto& staged = getStaged(flow_file);
  staged.record.markForDelete();
  staged.record.setDestination({});
  staged.destination_queue = nullptr;
}

void ProcessSession::commit() {
  std::vector<RepositoryRecord> records;
  records.reserve(order_.size());
  for (const auto& uuid : order_) {
    auto& staged = staged_.at(uuid);
    if (!staged.record.isMarkedForDelete()) {
      if (!staged.destination_queue) {
        if (!staged.source_queue) {
          rollback();
          throw Exception(FLOWFILE_EXCEPTION, "FlowFile " + uuid + " was created but never transferred");
        }
        staged.destination_queue = staged.source_queue;
        staged.record.setDestination(staged.source_queue->getIdentifier());
      }
      if (staged.record.current->getQueueId() != staged.record.queue_id) {
        auto working = makeWorkingCopy(staged);
        working->setQueueId(staged.record.queue_id);
        staged.record.setWorking(working, false);
      }
    }
    records.push_back(staged.record);
  }

  try {
    flow_file_repository_->updateRepository(records);
  } catch (const Exception& exception) {
    logger_->log_error("Failed to commit session of {} FlowFiles: {}", records.size(), exception.what());
    rollback();
    throw;
  }

  for (const auto& uuid : order_) {
    auto& staged = staged_.at(uuid);
    if (staged.destination_queue) {
      staged.destination_queue->put(staged.record.current);
    }
  }
  logger_->log_debug("Committed session of {} FlowFiles", records.size());
  staged_.clear();
  order_.clear();
}

void ProcessSession::rollback() {
  auto claim_manager = content_repository_->getResourceClaimManager();
  for (const auto& uuid : order_) {
    auto& staged = staged_.at(uuid);
    if (staged.session_claim) {
      claim_manager->decrementClaimantCount(staged.session_claim->getResourceClaim());
    }
    if (staged.source_queue && staged.record.original) {
      staged.source_queue->put(staged.record.original);
    }
  }
  if (!order_.empty()) {
    logger_->log_debug("Rolled back session of {} FlowFiles", order_.size());
  }
  staged_.clear();
  order_.clear();
}

}  // namespace org::apache::nifi::flowstore::core
