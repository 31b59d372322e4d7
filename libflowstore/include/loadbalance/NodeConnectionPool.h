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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "asio/io_context.hpp"
#include "asio/ip/tcp.hpp"
#include "core/logging/Logger.h"
#include "io/AsioStream.h"

namespace org::apache::nifi::flowstore::loadbalance {

using LoadBalanceConnection = io::AsioStream<asio::ip::tcp::socket>;

/**
 * Bounds the number of sockets open towards one peer node. Idle sockets are reused by the
 * next transaction, a socket released after a failed transaction is closed.
 *
 * The peer closes a connection that stays silent for its comms timeout, so a socket idle for
 * half of the comms timeout is closed instead of being handed out.
 */
class NodeConnectionPool {
 public:
  NodeConnectionPool(std::string host, uint16_t port, size_t max_connections, std::chrono::milliseconds comms_timeout);
  ~NodeConnectionPool();

  NodeConnectionPool(const NodeConnectionPool&) = delete;
  NodeConnectionPool& operator=(const NodeConnectionPool&) = delete;

  /**
   * Takes a recently used idle connection or opens a new one. Blocks while all connections are in use.
   * @return nullptr if no connection became available within the wait time or the pool is closed
   * @throws Exception (LOAD_BALANCE_EXCEPTION) if the peer cannot be connected
   */
  std::unique_ptr<LoadBalanceConnection> acquire(std::chrono::milliseconds max_wait);

  /**
   * Returns a connection taken by acquire().
   * @param reusable false if the connection failed and has to be closed
   */
  void release(std::unique_ptr<LoadBalanceConnection> connection, bool reusable);

  /**
   * Closes the idle connections and makes further acquire() calls fail.
   */
  void close();

  size_t getActiveCount() const;
  size_t getIdleCount() const;

  const std::string& getHost() const {
    return host_;
  }

  uint16_t getPort() const {
    return port_;
  }

 private:
  struct IdleConnection {
    std::unique_ptr<LoadBalanceConnection> connection;
    std::chrono::steady_clock::time_point released_at;
  };

  std::unique_ptr<LoadBalanceConnection> connect();

  const std::string host_;
  const uint16_t port_;
  const size_t max_connections_;
  const std::chrono::milliseconds comms_timeout_;
  const std::chrono::milliseconds max_idle_time_;

  asio::io_context io_context_;
  mutable std::mutex mutex_;
  std::condition_variable connection_released_;
  std::vector<IdleConnection> idle_connections_;
  size_t active_connections_{0};
  bool closed_{false};

  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::loadbalance
