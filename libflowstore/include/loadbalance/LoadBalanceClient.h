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

#include <memory>
#include <string>
#include <vector>

#include "core/ContentRepository.h"
#include "core/FlowFile.h"
#include "core/logging/Logger.h"
#include "io/BaseStream.h"

namespace org::apache::nifi::flowstore::loadbalance {

enum class TransactionResult {
  // the peer durably committed the FlowFiles
  COMPLETE,
  // the destination queue is full, nothing was sent
  QUEUE_FULL
};

/**
 * Sending side of a load-balance transaction. The FlowFiles stay owned by the caller until
 * sendFlowFiles() returns TransactionResult::COMPLETE.
 */
class LoadBalanceClient {
 public:
  LoadBalanceClient(std::string local_node_id, std::shared_ptr<core::ContentRepository> content_repository);

  /**
   * Runs one transaction over an open connection.
   * @throws TransactionAbortedException if the transaction was aborted, the connection stays usable
   * @throws Exception (LOAD_BALANCE_EXCEPTION or PROTOCOL_EXCEPTION) on communication failures, the connection must not be reused
   */
  TransactionResult sendFlowFiles(io::BaseStream& stream, const std::string& connection_id, const std::vector<std::shared_ptr<core::FlowFile>>& flow_files,
      bool compress, bool honor_backpressure);

 private:
  void negotiateVersion(io::BaseStream& stream);
  void sendFlowFile(io::OutputStream& stream, const core::FlowFile& flow_file, bool compress);
  void sendContent(io::OutputStream& stream, const core::FlowFile& flow_file, bool compress);

  const std::string local_node_id_;
  std::shared_ptr<core::ContentRepository> content_repository_;
  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::loadbalance
