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
#include "loadbalance/NodeConnectionPool.h"

#include <algorithm>
#include <iterator>
#include <utility>

#include "Exception.h"
#include "asio/connect.hpp"
#include "core/logging/LoggerFactory.h"

namespace org::apache::nifi::flowstore::loadbalance {

NodeConnectionPool::NodeConnectionPool(std::string host, uint16_t port, size_t max_connections, std::chrono::milliseconds comms_timeout)
    : host_(std::move(host)),
      port_(port),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      comms_timeout_(comms_timeout),
      max_idle_time_(comms_timeout / 2),
      logger_(core::logging::LoggerFactory<NodeConnectionPool>::getLogger()) {
}

NodeConnectionPool::~NodeConnectionPool() {
  close();
}

std::unique_ptr<LoadBalanceConnection> NodeConnectionPool::acquire(std::chrono::milliseconds max_wait) {
  std::vector<IdleConnection> expired;
  std::unique_ptr<LoadBalanceConnection> connection;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool available = connection_released_.wait_for(lock, max_wait, [this] {
      return closed_ || !idle_connections_.empty() || active_connections_ < max_connections_;
    });
    if (!available || closed_) {
      return nullptr;
    }
    ++active_connections_;
    // idle_connections_ is ordered by release time
    const auto idle_since = std::chrono::steady_clock::now() - max_idle_time_;
    const auto first_fresh = std::find_if(idle_connections_.begin(), idle_connections_.end(), [idle_since](const IdleConnection& idle) {
      return idle.released_at > idle_since;
    });
    expired.insert(expired.end(), std::make_move_iterator(idle_connections_.begin()), std::make_move_iterator(first_fresh));
    idle_connections_.erase(idle_connections_.begin(), first_fresh);
    if (!idle_connections_.empty()) {
      connection = std::move(idle_connections_.back().connection);
      idle_connections_.pop_back();
    }
  }

  for (auto& idle : expired) {
    idle.connection->close();
  }
  if (!expired.empty()) {
    logger_->log_debug("Closed {} expired idle load-balance connections to {}:{}", expired.size(), host_, port_);
  }
  if (connection) {
    return connection;
  }

  try {
    return connect();
  } catch (const Exception&) {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_connections_;
    connection_released_.notify_one();
    throw;
  }
}

std::unique_ptr<LoadBalanceConnection> NodeConnectionPool::connect() {
  asio::ip::tcp::resolver resolver(io_context_);
  asio::error_code error;
  const auto endpoints = resolver.resolve(host_, std::to_string(port_), error);
  if (error) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Could not resolve " + host_ + ": " + error.message());
  }
  asio::ip::tcp::socket socket(io_context_);
  asio::connect(socket, endpoints, error);
  if (error) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Could not connect to " + host_ + ":" + std::to_string(port_) + ": " + error.message());
  }
  socket.set_option(asio::ip::tcp::no_delay(true), error);
  auto connection = std::make_unique<LoadBalanceConnection>(std::move(socket));
  connection->setTimeout(comms_timeout_);
  logger_->log_debug("Opened load-balance connection to {}:{}", host_, port_);
  return connection;
}

void NodeConnectionPool::release(std::unique_ptr<LoadBalanceConnection> connection, bool reusable) {
  std::unique_ptr<LoadBalanceConnection> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_connections_ > 0) {
      --active_connections_;
    }
    if (reusable && !closed_ && connection && connection->isOpen()) {
      idle_connections_.push_back(IdleConnection{std::move(connection), std::chrono::steady_clock::now()});
    } else {
      to_close = std::move(connection);
    }
  }
  connection_released_.notify_one();
  if (to_close) {
    to_close->close();
    logger_->log_debug("Closed load-balance connection to {}:{}", host_, port_);
  }
}

void NodeConnectionPool::close() {
  std::vector<IdleConnection> idle_connections;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle_connections.swap(idle_connections_);
  }
  connection_released_.notify_all();
  for (auto& idle : idle_connections) {
    idle.connection->close();
  }
}

size_t NodeConnectionPool::getActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_connections_;
}

size_t NodeConnectionPool::getIdleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_connections_.size();
}

}  // namespace org::apache::nifi::flowstore::loadbalance
