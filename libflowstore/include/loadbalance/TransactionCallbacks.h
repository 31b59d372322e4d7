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

#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "core/FlowFile.h"

namespace org::apache::nifi::flowstore::loadbalance {

class TransactionFailureCallback {
 public:
  virtual ~TransactionFailureCallback() = default;

  /**
   * Called with the FlowFiles of a transaction the peer did not confirm.
   */
  virtual void onTransactionFailed(const std::vector<std::shared_ptr<core::FlowFile>>& flow_files, const std::exception& exception) = 0;

  /**
   * @return true if the FlowFiles of a failed transaction are handed over to the callback to be
   * redistributed, false if the client keeps them and retries the same batch
   */
  virtual bool isRebalanceOnFailure() const = 0;

  /**
   * Called with the FlowFiles whose content can no longer be read. They are removed from the
   * batch and never sent, the callback owns them from now on.
   */
  virtual void onContentNotFound(const std::vector<std::shared_ptr<core::FlowFile>>& /*flow_files*/) {}
};

class TransactionCompleteCallback {
 public:
  virtual ~TransactionCompleteCallback() = default;

  /**
   * Called once the peer has durably committed the FlowFiles.
   */
  virtual void onTransactionComplete(const std::vector<std::shared_ptr<core::FlowFile>>& flow_files, const std::string& node_id) = 0;
};

}  // namespace org::apache::nifi::flowstore::loadbalance
