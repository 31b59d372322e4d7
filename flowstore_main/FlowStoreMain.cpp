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
#include <csignal>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <set>
#include <string>

#include "Exception.h"
#include "MainHelper.h"
#include "core/RepositoryDiagnostics.h"
#include "core/ResourceClaimManager.h"
#include "core/logging/LoggerConfiguration.h"
#include "core/logging/LoggerProperties.h"
#include "core/repository/FileSystemRepository.h"
#include "loadbalance/LoadBalanceProtocol.h"
#include "loadbalance/LoadBalanceServer.h"
#include "properties/Configure.h"
#include "utils/Id.h"
#include "utils/gsl.h"

namespace flowstore = org::apache::nifi::flowstore;
namespace core = flowstore::core;

static std::atomic_flag running;

void sigHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    running.clear();
    running.notify_all();
  }
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::fprintf(stderr, "Usage: %s <flowstore.properties>\n", argv[0]);
    return EXIT_FAILURE;
  }
  const std::filesystem::path properties_path = argv[1];

  auto log_properties = std::make_shared<core::logging::LoggerProperties>();
  if (!log_properties->loadConfigureFile(properties_path)) {
    std::fprintf(stderr, "Could not read %s\n", properties_path.c_str());
    return EXIT_FAILURE;
  }
  core::logging::LoggerConfiguration::getConfiguration().initialize(log_properties);
  auto logger = core::logging::LoggerConfiguration::getConfiguration().getLogger("FlowStoreMain");
  const auto startup_timepoint = std::chrono::system_clock::now();
  auto log_runtime = gsl::finally([&] { logger->log_info("Runtime was {}", std::chrono::system_clock::now() - startup_timepoint); });

  if (signal(SIGINT, sigHandler) == SIG_ERR || signal(SIGTERM, sigHandler) == SIG_ERR || signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
    logger->log_error("Cannot install signal handler");
    return EXIT_FAILURE;
  }

  auto configure = std::make_shared<flowstore::Configure>();
  if (!configure->loadConfigureFile(properties_path)) {
    logger->log_error("Could not load configuration from {}", properties_path);
    return EXIT_FAILURE;
  }
  flowstore::utils::IdGenerator::getIdGenerator()->initialize(configure);

  auto claim_manager = std::make_shared<core::ResourceClaimManager>();

  const auto flow_file_repository_class = configure->getString(flowstore::Configure::flowstore_flowfile_repository_class_name).value_or(flowstore::DEFAULT_FLOWFILE_REPOSITORY_CLASS);
  auto flow_file_repository = flowstore::createFlowFileRepository(flow_file_repository_class);
  if (!flow_file_repository || !flow_file_repository->initialize(configure, claim_manager)) {
    logger->log_error("FlowFile repository {} failed to initialize, exiting..", flow_file_repository_class);
    return EXIT_FAILURE;
  }

  const auto content_repository_class = configure->getString(flowstore::Configure::flowstore_content_repository_class_name).value_or(flowstore::DEFAULT_CONTENT_REPOSITORY_CLASS);
  auto content_repository = flowstore::createContentRepository(content_repository_class);
  if (!content_repository || !content_repository->initialize(configure, claim_manager)) {
    logger->log_error("Content repository {} failed to initialize, exiting..", content_repository_class);
    return EXIT_FAILURE;
  }
  if (flow_file_repository->isVolatile() != content_repository->isVolatile()) {
    logger->log_error("Both or neither of flowfile and content repositories must be persistent! Exiting..");
    return EXIT_FAILURE;
  }

  auto swap_manager = flowstore::createSwapManager(flow_file_repository, *logger);
  auto queue_provider = flowstore::createQueues(*configure, swap_manager, *logger);
  try {
    const auto restored = flow_file_repository->loadFlowFiles(queue_provider);
    logger->log_info("Restored {} FlowFiles into {} queues", restored, queue_provider->getAllQueues().size());
  } catch (const flowstore::Exception& exception) {
    logger->log_error("Failed to restore the FlowFile repository: {}", exception.what());
    return EXIT_FAILURE;
  }

  if (auto file_system_repository = std::dynamic_pointer_cast<core::repository::FileSystemRepository>(content_repository)) {
    std::set<std::string> referenced_claims;
    for (const auto& claim : claim_manager->getTrackedClaims()) {
      if (claim_manager->getClaimantCount(claim) > 0) {
        referenced_claims.insert(claim->getKey());
      }
    }
    file_system_repository->clearOrphans(referenced_claims);
  }

  core::RepositoryDiagnostics::gather(*content_repository, *flow_file_repository).log(*logger);

  flow_file_repository->start();
  content_repository->start();

  std::unique_ptr<flowstore::loadbalance::LoadBalanceServer> load_balance_server;
  if (configure->has(flowstore::Configure::flowstore_load_balance_port)) {
    const auto port = configure->getInt(flowstore::Configure::flowstore_load_balance_port, flowstore::DEFAULT_LOAD_BALANCE_PORT);
    if (port < 0 || port > 65535) {
      logger->log_error("Invalid load-balance port {}", port);
      return EXIT_FAILURE;
    }
    auto protocol = std::make_shared<flowstore::loadbalance::LoadBalanceProtocol>(flow_file_repository, content_repository, queue_provider);
    load_balance_server = std::make_unique<flowstore::loadbalance::LoadBalanceServer>(protocol,
        configure->getString(flowstore::Configure::flowstore_load_balance_address).value_or("0.0.0.0"),
        static_cast<uint16_t>(port),
        configure->getInt(flowstore::Configure::flowstore_load_balance_max_thread_count, 8),
        configure->getDuration(flowstore::Configure::flowstore_load_balance_comms_timeout).value_or(std::chrono::seconds(30)));
    try {
      load_balance_server->start();
    } catch (const flowstore::Exception& exception) {
      logger->log_error("{}", exception.what());
      content_repository->stop();
      flow_file_repository->stop();
      return EXIT_FAILURE;
    }
  }

  logger->log_info("FlowStore started");
  running.test_and_set();
  running.wait(true);
  logger->log_info("Shutting down FlowStore");

  if (load_balance_server) {
    load_balance_server->stop();
  }
  content_repository->stop();
  flow_file_repository->stop();
  logger->log_info("FlowStore exit");
  return EXIT_SUCCESS;
}
