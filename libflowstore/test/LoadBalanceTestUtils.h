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
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "core/FlowFileQueue.h"
#include "core/QueueProvider.h"
#include "core/ResourceClaimManager.h"
#include "core/repository/VolatileContentRepository.h"
#include "core/repository/VolatileFlowFileRepository.h"
#include "loadbalance/LoadBalanceProtocol.h"
#include "loadbalance/LoadBalanceServer.h"
#include "properties/Configure.h"
#include "utils/Id.h"

namespace org::apache::nifi::flowstore::test {

/**
 * A node listening for load-balanced FlowFiles of queue "q1" on an ephemeral local port.
 */
struct ReceivingNode {
  explicit ReceivingNode(std::chrono::milliseconds comms_timeout = std::chrono::seconds(5))
      : server{protocol, "127.0.0.1", 0, 2, comms_timeout} {
    REQUIRE(content_repository->initialize(configuration, claim_manager));
    REQUIRE(flow_file_repository->initialize(configuration, claim_manager));
    queue_provider->addQueue(queue);
    server.start();
  }

  ~ReceivingNode() {
    server.stop();
  }

  std::string getNodeId() const {
    return "127.0.0.1:" + std::to_string(server.getPort());
  }

  std::shared_ptr<Configure> configuration = std::make_shared<Configure>();
  std::shared_ptr<core::ResourceClaimManager> claim_manager = std::make_shared<core::ResourceClaimManager>();
  std::shared_ptr<core::repository::VolatileContentRepository> content_repository = std::make_shared<core::repository::VolatileContentRepository>();
  std::shared_ptr<core::repository::VolatileFlowFileRepository> flow_file_repository = std::make_shared<core::repository::VolatileFlowFileRepository>();
  std::shared_ptr<core::FlowFileQueue> queue = std::make_shared<core::FlowFileQueue>("q1");
  std::shared_ptr<core::StandardQueueProvider> queue_provider = std::make_shared<core::StandardQueueProvider>();
  std::shared_ptr<loadbalance::LoadBalanceProtocol> protocol = std::make_shared<loadbalance::LoadBalanceProtocol>(flow_file_repository, content_repository, queue_provider);
  loadbalance::LoadBalanceServer server;
};

/**
 * Source of FlowFiles with content, as kept by the sending node.
 */
struct SendingNode {
  SendingNode() {
    REQUIRE(content_repository->initialize(configuration, claim_manager));
  }

  std::shared_ptr<core::FlowFile> createFlowFile(const std::string& content) {
    auto flow_file = std::make_shared<core::FlowFile>(++sequence, utils::IdGenerator::getIdGenerator()->generate());
    flow_file->setAttribute(core::SpecialFlowAttribute::FILENAME, "file-" + std::to_string(sequence));
    flow_file->setContentClaim(content_repository->importFrom(std::as_bytes(std::span<const char>(content))));
    return flow_file;
  }

  std::vector<std::shared_ptr<core::FlowFile>> createFlowFiles(size_t count) {
    std::vector<std::shared_ptr<core::FlowFile>> flow_files;
    for (size_t i = 0; i < count; ++i) {
      flow_files.push_back(createFlowFile("content of FlowFile " + std::to_string(i)));
    }
    return flow_files;
  }

  uint64_t sequence{0};
  std::shared_ptr<Configure> configuration = std::make_shared<Configure>();
  std::shared_ptr<core::ResourceClaimManager> claim_manager = std::make_shared<core::ResourceClaimManager>();
  std::shared_ptr<core::repository::VolatileContentRepository> content_repository = std::make_shared<core::repository::VolatileContentRepository>();
};

/**
 * @return the port of a local address nobody listens on
 */
inline uint16_t getClosedPort() {
  auto protocol = std::make_shared<loadbalance::LoadBalanceProtocol>(nullptr, nullptr, nullptr);
  loadbalance::LoadBalanceServer server(protocol, "127.0.0.1", 0, 1, std::chrono::seconds(1));
  server.start();
  const auto port = server.getPort();
  server.stop();
  return port;
}

}  // namespace org::apache::nifi::flowstore::test
