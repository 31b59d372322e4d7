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
#include "loadbalance/AsyncLoadBalanceClientRegistry.h"

#include <algorithm>
#include <charconv>

#include "Exception.h"
#include "core/logging/LoggerFactory.h"

namespace org::apache::nifi::flowstore::loadbalance {

namespace {
// how long a task waits for a free connection before yielding its thread
constexpr std::chrono::milliseconds CONNECTION_WAIT{500};
}  // namespace

LoadBalanceClientSettings LoadBalanceClientSettings::fromConfiguration(const Configure& configure) {
  LoadBalanceClientSettings settings;
  settings.connections_per_node = static_cast<size_t>(std::max(1, configure.getInt(Configure::flowstore_load_balance_connections_per_node, 1)));
  settings.max_threads = std::max(1, configure.getInt(Configure::flowstore_load_balance_client_max_thread_count, settings.max_threads));
  settings.comms_timeout = configure.getDuration(Configure::flowstore_load_balance_comms_timeout).value_or(settings.comms_timeout);
  settings.poll_period = configure.getDuration(Configure::flowstore_load_balance_poll_period).value_or(settings.poll_period);
  settings.initial_backoff = configure.getDuration(Configure::flowstore_load_balance_retry_backoff_initial).value_or(settings.initial_backoff);
  settings.max_backoff = std::max(settings.initial_backoff, configure.getDuration(Configure::flowstore_load_balance_retry_backoff_max).value_or(settings.max_backoff));
  return settings;
}

AsyncLoadBalanceClientRegistry::AsyncLoadBalanceClientRegistry(std::string local_node_id, std::shared_ptr<core::ContentRepository> content_repository,
    LoadBalanceClientSettings settings)
    : local_node_id_(std::move(local_node_id)),
      settings_(settings),
      content_repository_(std::move(content_repository)),
      client_(local_node_id_, content_repository_),
      thread_pool_(settings.max_threads, "LoadBalanceClients"),
      logger_(core::logging::LoggerFactory<AsyncLoadBalanceClientRegistry>::getLogger()) {
}

AsyncLoadBalanceClientRegistry::~AsyncLoadBalanceClientRegistry() {
  stop();
}

void AsyncLoadBalanceClientRegistry::start() {
  thread_pool_.start();
}

void AsyncLoadBalanceClientRegistry::stop() {
  std::vector<std::pair<std::string, std::string>> registered;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [task_id, registration] : registrations_) {
      registered.emplace_back(registration->connection_id, registration->node_id);
    }
  }
  for (const auto& [connection_id, node_id] : registered) {
    unregister(connection_id, node_id);
  }
  thread_pool_.shutdown();

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [node_id, pool] : connection_pools_) {
    pool->close();
  }
  connection_pools_.clear();
}

std::pair<std::string, uint16_t> AsyncLoadBalanceClientRegistry::parseNodeAddress(const std::string& node_id) {
  const auto separator = node_id.rfind(':');
  if (separator == std::string::npos || separator == 0 || separator + 1 == node_id.size()) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Node identifier '" + node_id + "' is not a host:port pair");
  }
  uint16_t port = 0;
  const auto* begin = node_id.data() + separator + 1;
  const auto* end = node_id.data() + node_id.size();
  const auto [ptr, error] = std::from_chars(begin, end, port);
  if (error != std::errc() || ptr != end || port == 0) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Node identifier '" + node_id + "' has an invalid port");
  }
  return {node_id.substr(0, separator), port};
}

std::shared_ptr<NodeConnectionPool> AsyncLoadBalanceClientRegistry::getOrCreateConnectionPool(const std::string& node_id) {
  auto it = connection_pools_.find(node_id);
  if (it != connection_pools_.end()) {
    return it->second;
  }
  auto [host, port] = parseNodeAddress(node_id);
  auto pool = std::make_shared<NodeConnectionPool>(std::move(host), port, settings_.connections_per_node, settings_.comms_timeout);
  connection_pools_.emplace(node_id, pool);
  return pool;
}

std::shared_ptr<NodeConnectionPool> AsyncLoadBalanceClientRegistry::getConnectionPool(const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_pools_.find(node_id);
  return it == connection_pools_.end() ? nullptr : it->second;
}

void AsyncLoadBalanceClientRegistry::registerClient(const std::string& connection_id, const std::string& node_id, EmptySupplier empty_supplier,
    FlowFileSupplier flow_file_supplier, std::shared_ptr<TransactionFailureCallback> on_failure, std::shared_ptr<TransactionCompleteCallback> on_success,
    CompressionSupplier compression_supplier, BackpressureSupplier honor_backpressure_supplier) {
  const auto task_id = getTaskId(connection_id, node_id);
  auto registration = std::make_shared<Registration>();
  registration->connection_id = connection_id;
  registration->node_id = node_id;
  registration->empty_supplier = std::move(empty_supplier);
  registration->flow_file_supplier = std::move(flow_file_supplier);
  registration->on_failure = std::move(on_failure);
  registration->on_success = std::move(on_success);
  registration->compression_supplier = std::move(compression_supplier);
  registration->honor_backpressure_supplier = std::move(honor_backpressure_supplier);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (registrations_.contains(task_id)) {
      throw Exception(LOAD_BALANCE_EXCEPTION, "Queue " + connection_id + " is already registered for node " + node_id);
    }
    registration->connection_pool = getOrCreateConnectionPool(node_id);
    registrations_.emplace(task_id, registration);
  }

  thread_pool_.execute(task_id, [this, registration] {
    if (!registration->active) {
      return utils::TaskRescheduleInfo::Done();
    }
    return transfer(*registration);
  });
  logger_->log_info("Registered load balancing of queue {} to node {}", connection_id, node_id);
}

bool AsyncLoadBalanceClientRegistry::unregister(const std::string& connection_id, const std::string& node_id) {
  const auto task_id = getTaskId(connection_id, node_id);
  std::shared_ptr<Registration> registration;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(task_id);
    if (it == registrations_.end()) {
      return false;
    }
    registration = it->second;
    registrations_.erase(it);
  }
  registration->active = false;
  thread_pool_.stopTasks(task_id);
  if (!registration->pending.empty()) {
    logger_->log_warn("Unregistered load balancing of queue {} to node {} with {} unconfirmed FlowFiles", connection_id, node_id, registration->pending.size());
    if (registration->on_failure) {
      registration->on_failure->onTransactionFailed(registration->pending,
          Exception(LOAD_BALANCE_EXCEPTION, "Load balancing of queue " + connection_id + " to node " + node_id + " was stopped"));
    }
    registration->pending.clear();
  } else {
    logger_->log_info("Unregistered load balancing of queue {} to node {}", connection_id, node_id);
  }
  return true;
}

bool AsyncLoadBalanceClientRegistry::isRegistered(const std::string& connection_id, const std::string& node_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registrations_.contains(getTaskId(connection_id, node_id));
}

utils::TaskRescheduleInfo AsyncLoadBalanceClientRegistry::transfer(Registration& registration) {
  if (registration.pending.empty()) {
    if (registration.empty_supplier()) {
      return utils::TaskRescheduleInfo::RetryIn(settings_.poll_period);
    }
    registration.pending = registration.flow_file_supplier();
    if (registration.pending.empty()) {
      return utils::TaskRescheduleInfo::RetryIn(settings_.poll_period);
    }
  }

  dropFlowFilesWithoutContent(registration);
  if (registration.pending.empty()) {
    registration.backoff = std::chrono::milliseconds(0);
    return utils::TaskRescheduleInfo::RetryImmediately();
  }

  std::unique_ptr<LoadBalanceConnection> connection;
  try {
    connection = registration.connection_pool->acquire(CONNECTION_WAIT);
  } catch (const Exception& exception) {
    return onFailure(registration, exception);
  }
  if (!connection) {
    // every connection to the node is busy
    return utils::TaskRescheduleInfo::RetryImmediately();
  }

  const bool compress = registration.compression_supplier && registration.compression_supplier();
  const bool honor_backpressure = registration.honor_backpressure_supplier && registration.honor_backpressure_supplier();
  try {
    const auto result = client_.sendFlowFiles(*connection, registration.connection_id, registration.pending, compress, honor_backpressure);
    registration.connection_pool->release(std::move(connection), true);
    if (result == TransactionResult::QUEUE_FULL) {
      return utils::TaskRescheduleInfo::RetryIn(std::max(settings_.poll_period, settings_.initial_backoff));
    }
  } catch (const TransactionAbortedException& exception) {
    registration.connection_pool->release(std::move(connection), true);
    return onFailure(registration, exception);
  } catch (const Exception& exception) {
    registration.connection_pool->release(std::move(connection), false);
    return onFailure(registration, exception);
  }

  logger_->log_debug("Transferred {} FlowFiles of queue {} to node {}", registration.pending.size(), registration.connection_id, registration.node_id);
  if (registration.on_success) {
    registration.on_success->onTransactionComplete(registration.pending, registration.node_id);
  }
  registration.pending.clear();
  registration.backoff = std::chrono::milliseconds(0);
  return utils::TaskRescheduleInfo::RetryImmediately();
}

void AsyncLoadBalanceClientRegistry::dropFlowFilesWithoutContent(Registration& registration) {
  std::vector<std::shared_ptr<core::FlowFile>> missing;
  std::erase_if(registration.pending, [this, &missing](const std::shared_ptr<core::FlowFile>& flow_file) {
    const auto& claim = flow_file->getContentClaim();
    if (!claim || claim->getLength() <= 0 || content_repository_->isAccessible(*claim)) {
      return false;
    }
    missing.push_back(flow_file);
    return true;
  });
  if (missing.empty()) {
    return;
  }
  for (const auto& flow_file : missing) {
    logger_->log_error("Content of FlowFile {} in queue {} is missing, it is not transferred to node {}",
        flow_file->getUUIDStr(), registration.connection_id, registration.node_id);
  }
  if (registration.on_failure) {
    registration.on_failure->onContentNotFound(missing);
  }
}

utils::TaskRescheduleInfo AsyncLoadBalanceClientRegistry::onFailure(Registration& registration, const std::exception& exception) {
  registration.backoff = registration.backoff.count() == 0 ? settings_.initial_backoff : std::min(registration.backoff * 2, settings_.max_backoff);
  logger_->log_warn("Failed to transfer {} FlowFiles of queue {} to node {}, retrying in {}: {}",
      registration.pending.size(), registration.connection_id, registration.node_id, registration.backoff, exception.what());
  if (registration.on_failure) {
    registration.on_failure->onTransactionFailed(registration.pending, exception);
    if (registration.on_failure->isRebalanceOnFailure()) {
      registration.pending.clear();
    }
  }
  return utils::TaskRescheduleInfo::RetryIn(registration.backoff);
}

}  // namespace org::apache::nifi::flowstore::loadbalance
