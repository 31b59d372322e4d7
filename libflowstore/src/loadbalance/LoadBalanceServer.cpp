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
#include "loadbalance/LoadBalanceServer.h"

#include <sys/socket.h>

#include <utility>

#include "Exception.h"
#include "asio/post.hpp"
#include "core/logging/LoggerFactory.h"
#include "loadbalance/LoadBalanceProtocolConstants.h"
#include "loadbalance/NodeConnectionPool.h"

namespace org::apache::nifi::flowstore::loadbalance {

LoadBalanceServer::LoadBalanceServer(std::shared_ptr<LoadBalanceProtocol> protocol, std::string address, uint16_t port, int max_threads,
    std::chrono::milliseconds comms_timeout)
    : protocol_(std::move(protocol)),
      address_(std::move(address)),
      port_(port),
      comms_timeout_(comms_timeout),
      thread_pool_(max_threads, "LoadBalanceServer"),
      logger_(core::logging::LoggerFactory<LoadBalanceServer>::getLogger()) {
}

LoadBalanceServer::~LoadBalanceServer() {
  stop();
}

void LoadBalanceServer::start() {
  if (running_) {
    return;
  }
  asio::error_code error;
  const auto address = asio::ip::make_address(address_, error);
  if (error) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Invalid load-balance address " + address_ + ": " + error.message());
  }
  try {
    acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_, asio::ip::tcp::endpoint(address, port_.load()));
  } catch (const asio::system_error& bind_error) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Could not listen on " + address_ + ":" + std::to_string(port_.load()) + ": " + bind_error.what());
  }
  port_ = acceptor_->local_endpoint().port();

  running_ = true;
  thread_pool_.start();
  startAccept();
  server_thread_ = std::thread([this] {
    io_context_.run();
  });
  logger_->log_info("Load-balance server listening on {}:{}", address_, port_.load());
}

void LoadBalanceServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (acceptor_) {
    asio::post(io_context_, [this] {
      acceptor_->close();
    });
  }
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (const auto handle : connections_) {
      ::shutdown(handle, SHUT_RDWR);
    }
  }
  thread_pool_.shutdown();
  acceptor_.reset();
  io_context_.restart();
  logger_->log_info("Load-balance server stopped");
}

void LoadBalanceServer::startAccept() {
  acceptor_->async_accept([this](const asio::error_code& error, asio::ip::tcp::socket socket) {
    if (error) {
      if (error == asio::error::operation_aborted || error == asio::error::bad_descriptor) {
        logger_->log_debug("Load-balance server stopped accepting connections");
        return;
      }
      logger_->log_error("Accepting a load-balance connection failed: {}", error.message());
    } else {
      serve(std::move(socket));
    }
    if (running_) {
      startAccept();
    }
  });
}

void LoadBalanceServer::serve(asio::ip::tcp::socket socket) {
  asio::error_code error;
  const auto remote = socket.remote_endpoint(error);
  const auto peer_description = error ? std::string("unknown peer") : remote.address().to_string() + ":" + std::to_string(remote.port());
  logger_->log_debug("Accepted load-balance connection from {}", peer_description);

  const auto task_id = "LoadBalanceConnection-" + std::to_string(++connection_counter_);
  // std::function needs a copyable callable
  auto shared_socket = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
  thread_pool_.execute(task_id, [this, shared_socket, peer_description] {
    communicate(std::move(*shared_socket), peer_description);
    return utils::TaskRescheduleInfo::Done();
  });
}

void LoadBalanceServer::communicate(asio::ip::tcp::socket socket, const std::string& peer_description) {
  const auto handle = socket.native_handle();
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(handle);
  }
  LoadBalanceConnection connection(std::move(socket));
  connection.setTimeout(comms_timeout_);

  while (running_) {
    try {
      if (!protocol_->receiveFlowFiles(connection, peer_description)) {
        break;
      }
    } catch (const TransactionAbortedException& exception) {
      logger_->log_warn("Transaction of {} was aborted: {}", peer_description, exception.what());
    } catch (const Exception& exception) {
      logger_->log_error("Failed to receive FlowFiles from {}: {}", peer_description, exception.what());
      // the peer may be waiting for a response, the connection is closed either way
      if (io::isError(connection.write(protocol::ABORT_TRANSACTION))) {
        logger_->log_debug("Could not send the abort of the transaction to {}", peer_description);
      }
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(handle);
  }
  connection.close();
  logger_->log_debug("Closed load-balance connection from {}", peer_description);
}

}  // namespace org::apache::nifi::flowstore::loadbalance
