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
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/ContentRepository.h"
#include "core/FlowFile.h"
#include "core/logging/Logger.h"
#include "loadbalance/LoadBalanceClient.h"
#include "loadbalance/NodeConnectionPool.h"
#include "loadbalance/TransactionCallbacks.h"
#include "properties/Configure.h"
#include "utils/ThreadPool.h"

namespace org::apache::nifi::flowstore::loadbalance {

struct LoadBalanceClientSettings {
  size_t connections_per_node{1};
  int max_threads{8};
  std::chrono::milliseconds comms_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds poll_period{std::chrono::milliseconds(100)};
  std::chrono::milliseconds initial_backoff{std::chrono::seconds(1)};
  std::chrono::milliseconds max_backoff{std::chrono::seconds(30)};

  static LoadBalanceClientSettings fromConfiguration(const Configure& configure);
};

/**
 * Runs the transfers of the registered (connection, node) partitions. Every registration is a
 * worker task of the registry's thread pool which pulls FlowFiles whenever its partition is not
 * empty and sends them in one transaction. A batch the peer did not confirm is kept and resent
 * after a back-off, unless the failure callback takes it over for rebalancing. FlowFiles whose
 * content is gone are taken out of the batch before every attempt.
 *
 * Node identifiers are the host:port of the load-balance server of the node.
 */
class AsyncLoadBalanceClientRegistry {
 public:
  using EmptySupplier = std::function<bool()>;
  using FlowFileSupplier = std::function<std::vector<std::shared_ptr<core::FlowFile>>()>;
  using CompressionSupplier = std::function<bool()>;
  using BackpressureSupplier = std::function<bool()>;

  AsyncLoadBalanceClientRegistry(std::string local_node_id, std::shared_ptr<core::ContentRepository> content_repository, LoadBalanceClientSettings settings);
  ~AsyncLoadBalanceClientRegistry();

  AsyncLoadBalanceClientRegistry(const AsyncLoadBalanceClientRegistry&) = delete;
  AsyncLoadBalanceClientRegistry& operator=(const AsyncLoadBalanceClientRegistry&) = delete;

  void start();
  void stop();

  /**
   * @throws Exception (LOAD_BALANCE_EXCEPTION) if the node identifier is not a host:port pair or the pair is already registered
   */
  void registerClient(const std::string& connection_id, const std::string& node_id, EmptySupplier empty_supplier, FlowFileSupplier flow_file_supplier,
      std::shared_ptr<TransactionFailureCallback> on_failure, std::shared_ptr<TransactionCompleteCallback> on_success,
      CompressionSupplier compression_supplier, BackpressureSupplier honor_backpressure_supplier);

  /**
   * Stops scheduling transfers of the pair and waits for its in-flight transaction to finish.
   * @return false if the pair was not registered
   */
  bool unregister(const std::string& connection_id, const std::string& node_id);

  bool isRegistered(const std::string& connection_id, const std::string& node_id) const;

  std::shared_ptr<NodeConnectionPool> getConnectionPool(const std::string& node_id) const;

 private:
  struct Registration {
    std::string connection_id;
    std::string node_id;
    EmptySupplier empty_supplier;
    FlowFileSupplier flow_file_supplier;
    std::shared_ptr<TransactionFailureCallback> on_failure;
    std::shared_ptr<TransactionCompleteCallback> on_success;
    CompressionSupplier compression_supplier;
    BackpressureSupplier honor_backpressure_supplier;
    std::shared_ptr<NodeConnectionPool> connection_pool;

    // sent but not yet confirmed by the peer
    std::vector<std::shared_ptr<core::FlowFile>> pending;
    std::chrono::milliseconds backoff{0};
    std::atomic<bool> active{true};
  };

  static std::string getTaskId(const std::string& connection_id, const std::string& node_id) {
    return connection_id + "@" + node_id;
  }

  static std::pair<std::string, uint16_t> parseNodeAddress(const std::string& node_id);

  std::shared_ptr<NodeConnectionPool> getOrCreateConnectionPool(const std::string& node_id);
  utils::TaskRescheduleInfo transfer(Registration& registration);
  utils::TaskRescheduleInfo onFailure(Registration& registration, const std::exception& exception);
  void dropFlowFilesWithoutContent(Registration& registration);

  const std::string local_node_id_;
  const LoadBalanceClientSettings settings_;
  std::shared_ptr<core::ContentRepository> content_repository_;
  LoadBalanceClient client_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Registration>> registrations_;
  std::map<std::string, std::shared_ptr<NodeConnectionPool>> connection_pools_;

  utils::ThreadPool thread_pool_;
  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::loadbalance
