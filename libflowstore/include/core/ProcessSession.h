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

#include <cstddef>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "core/ContentRepository.h"
#include "core/FlowFile.h"
#include "core/FlowFileQueue.h"
#include "core/FlowFileRepository.h"
#include "core/RepositoryRecord.h"
#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore::core {

/**
 * Stages changes to FlowFiles and commits them to the FlowFile repository as one batch.
 * FlowFiles handed out by the session are snapshots; every modification produces a new
 * working version which is returned to the caller.
 */
class ProcessSession {
 public:
  ProcessSession(std::shared_ptr<FlowFileRepository> flow_file_repository, std::shared_ptr<ContentRepository> content_repository);

  ProcessSession(const ProcessSession&) = delete;
  ProcessSession& operator=(const ProcessSession&) = delete;

  /**
   * Rolls back whatever was not committed.
   */
  ~ProcessSession();

  std::shared_ptr<FlowFile> create();

  /**
   * @return the oldest FlowFile of the queue, or nullptr if it is empty
   */
  std::shared_ptr<FlowFile> get(const std::shared_ptr<FlowFileQueue>& queue);

  std::shared_ptr<FlowFile> putAttribute(const std::shared_ptr<FlowFile>& flow_file, const std::string& key, const std::string& value);

  /**
   * Replaces the content of the FlowFile.
   * @throws Exception (FILE_OPERATION_EXCEPTION) if the content could not be written
   */
  std::shared_ptr<FlowFile> write(const std::shared_ptr<FlowFile>& flow_file, std::span<const std::byte> content);

  std::vector<std::byte> read(const std::shared_ptr<FlowFile>& flow_file);

  void transfer(const std::shared_ptr<FlowFile>& flow_file, const std::shared_ptr<FlowFileQueue>& queue);

  void remove(const std::shared_ptr<FlowFile>& flow_file);

  /**
   * Persists all staged changes, then makes them visible in the destination queues.
   * If the changes could not be persisted the session is rolled back and the exception is rethrown.
   */
  void commit();

  /**
   * Discards all staged changes, releasing content written in this session and returning
   * FlowFiles taken from queues to the tail of their queues, in the order they were taken.
   */
  void rollback();

 private:
  struct StagedFlowFile {
    RepositoryRecord record;
    std::shared_ptr<FlowFileQueue> source_queue;
    std::shared_ptr<FlowFileQueue> destination_queue;
    // content written in this session, owned by the session until commit
    std::shared_ptr<ContentClaim> session_claim;
  };

  StagedFlowFile& getStaged(const std::shared_ptr<FlowFile>& flow_file);
  std::shared_ptr<FlowFile> makeWorkingCopy(StagedFlowFile& staged);

  std::shared_ptr<FlowFileRepository> flow_file_repository_;
  std::shared_ptr<ContentRepository> content_repository_;

  std::map<std::string, StagedFlowFile> staged_;
  // uuids in the order the session touched them
  std::vector<std::string> order_;

  std::shared_ptr<logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core
