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
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/ContentRepository.h"
#include "core/FlowFile.h"
#include "core/FlowFileQueue.h"
#include "core/FlowFileRepository.h"
#include "core/QueueProvider.h"
#include "core/logging/Logger.h"
#include "io/BaseStream.h"

namespace org::apache::nifi::flowstore::loadbalance {

constexpr size_t DEFAULT_MAX_REMEMBERED_TRANSFERS = 100000;

/**
 * Receiving side of the load-balance protocol. Received FlowFiles get their content in the
 * local content repository and are committed to the FlowFile repository in one batch before
 * the transaction is confirmed.
 *
 * Transfers are applied idempotently: a FlowFile whose uuid is already on the destination queue,
 * or was committed by one of the recent transactions, is skipped.
 */
class LoadBalanceProtocol {
 public:
  LoadBalanceProtocol(std::shared_ptr<core::FlowFileRepository> flow_file_repository, std::shared_ptr<core::ContentRepository> content_repository,
      std::shared_ptr<core::QueueProvider> queue_provider, size_t max_remembered_transfers = DEFAULT_MAX_REMEMBERED_TRANSFERS);

  /**
   * Serves one transaction of the peer.
   * @return false if the peer closed the connection instead of starting a transaction
   * @throws TransactionAbortedException if the peer aborted the transaction, nothing was committed
   * @throws Exception (LOAD_BALANCE_EXCEPTION or PROTOCOL_EXCEPTION) if the transaction failed, nothing was committed
   */
  bool receiveFlowFiles(io::BaseStream& stream, const std::string& peer_description);

  /**
   * @return the number of FlowFiles skipped as already received
   */
  uint64_t getDuplicateCount() const {
    return duplicate_count_.load();
  }

 private:
  struct ReceivedFlowFiles {
    explicit ReceivedFlowFiles(std::shared_ptr<core::ResourceClaimManager> claim_manager) : claim_manager_(std::move(claim_manager)) {}
    ReceivedFlowFiles(const ReceivedFlowFiles&) = delete;
    ReceivedFlowFiles& operator=(const ReceivedFlowFiles&) = delete;
    // releases the content of an uncommitted transaction
    ~ReceivedFlowFiles();

    std::vector<std::shared_ptr<core::FlowFile>> flow_files;
    std::unordered_set<std::string> uuids;
    bool committed{false};

   private:
    std::shared_ptr<core::ResourceClaimManager> claim_manager_;
  };

  bool negotiateVersion(io::BaseStream& stream, const std::string& peer_description);
  void receiveFlowFile(io::InputStream& stream, bool compressed, const core::FlowFileQueue& queue, ReceivedFlowFiles& received);
  std::shared_ptr<core::ContentClaim> receiveContent(io::InputStream& stream, bool compressed, bool discard);
  bool isDuplicate(const std::string& uuid, const core::FlowFileQueue& queue, const ReceivedFlowFiles& received) const;
  void rememberTransfers(const std::vector<std::shared_ptr<core::FlowFile>>& flow_files);

  std::shared_ptr<core::FlowFileRepository> flow_file_repository_;
  std::shared_ptr<core::ContentRepository> content_repository_;
  std::shared_ptr<core::QueueProvider> queue_provider_;

  const size_t max_remembered_transfers_;
  mutable std::mutex transfers_mutex_;
  std::unordered_set<std::string> transferred_uuids_;
  std::deque<std::string> transfer_order_;
  std::atomic<uint64_t> duplicate_count_{0};

  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::loadbalance
