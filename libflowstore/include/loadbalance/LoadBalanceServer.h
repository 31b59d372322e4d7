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
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "asio/io_context.hpp"
#include "asio/ip/tcp.hpp"
#include "core/logging/Logger.h"
#include "loadbalance/LoadBalanceProtocol.h"
#include "utils/ThreadPool.h"

namespace org::apache::nifi::flowstore::loadbalance {

/**
 * Accepts load-balance connections of the peer nodes. Every connection is served on the
 * server's thread pool, one transaction after the other, until the peer closes it.
 */
class LoadBalanceServer {
 public:
  LoadBalanceServer(std::shared_ptr<LoadBalanceProtocol> protocol, std::string address, uint16_t port, int max_threads, std::chrono::milliseconds comms_timeout);
  ~LoadBalanceServer();

  LoadBalanceServer(const LoadBalanceServer&) = delete;
  LoadBalanceServer& operator=(const LoadBalanceServer&) = delete;

  /**
   * @throws Exception (LOAD_BALANCE_EXCEPTION) if the address cannot be bound
   */
  void start();
  void stop();

  /**
   * @return the bound port, useful when the server was configured with port 0
   */
  uint16_t getPort() const {
    return port_.load();
  }

  bool isRunning() const {
    return running_.load();
  }

 private:
  void startAccept();
  void serve(asio::ip::tcp::socket socket);
  void communicate(asio::ip::tcp::socket socket, const std::string& peer_description);

  std::shared_ptr<LoadBalanceProtocol> protocol_;
  const std::string address_;
  std::atomic<uint16_t> port_;
  const std::chrono::milliseconds comms_timeout_;

  asio::io_context io_context_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> connection_counter_{0};

  std::mutex connections_mutex_;
  // native handles of the connections being served, shut down on stop
  std::set<int> connections_;

  utils::ThreadPool thread_pool_;
  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::loadbalance
