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
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "Catch.h"
#include "TestBase.h"
#include "core/RepositoryDiagnostics.h"
#include "core/QueueProvider.h"
#include "core/ResourceClaimManager.h"
#include "core/repository/VolatileContentRepository.h"
#include "core/repository/VolatileFlowFileRepository.h"
#include "utils/Id.h"

namespace {

class FixedPlatformCapabilities : public utils::PlatformCapabilities {
 public:
  FixedPlatformCapabilities(std::optional<uint64_t> open_file_descriptors, std::optional<uint64_t> max_file_descriptors)
      : open_file_descriptors_(open_file_descriptors),
        max_file_descriptors_(max_file_descriptors) {
  }

  [[nodiscard]] std::optional<uint64_t> getOpenFileDescriptorCount() const override {
    return open_file_descriptors_;
  }

  [[nodiscard]] std::optional<uint64_t> getMaxFileDescriptorCount() const override {
    return max_file_descriptors_;
  }

 private:
  std::optional<uint64_t> open_file_descriptors_;
  std::optional<uint64_t> max_file_descriptors_;
};

}  // namespace

TEST_CASE("RepositoryDiagnostics reports claims, queues and orphans", "[RepositoryDiagnostics]") {
  TestController testController;
  auto claim_manager = std::make_shared<core::ResourceClaimManager>();
  auto configuration = std::make_shared<flowstore::Configure>();
  configuration->set(flowstore::Configure::flowstore_volatile_content_repository_max_bytes, "1 KB");
  core::repository::VolatileContentRepository content_repo;
  core::repository::VolatileFlowFileRepository flow_file_repo;
  REQUIRE(content_repo.initialize(configuration, claim_manager));
  REQUIRE(flow_file_repo.initialize(configuration, claim_manager));

  const std::string content = "0123456789";
  auto kept_claim = content_repo.importFrom(std::as_bytes(std::span<const char>(content)));
  auto orphaned_claim = content_repo.importFrom(std::as_bytes(std::span<const char>(content)));

  auto kept = std::make_shared<core::FlowFile>(1, utils::IdGenerator::getIdGenerator()->generate());
  kept->setContentClaim(kept_claim);
  auto orphaned = std::make_shared<core::FlowFile>(2, utils::IdGenerator::getIdGenerator()->generate());
  orphaned->setContentClaim(orphaned_claim);
  flow_file_repo.updateRepository({core::RepositoryRecord::create(kept, "q1"), core::RepositoryRecord::create(orphaned, "removed")});

  auto queue_provider = std::make_shared<core::StandardQueueProvider>();
  queue_provider->addQueue(std::make_shared<core::FlowFileQueue>("q1"));
  flow_file_repo.loadFlowFiles(queue_provider);

  const FixedPlatformCapabilities platform{17, 1024};
  const auto diagnostics = core::RepositoryDiagnostics::gather(content_repo, flow_file_repo, platform);

  REQUIRE(diagnostics.containers.size() == 1);
  CHECK(diagnostics.containers[0].name == core::repository::VOLATILE_CONTAINER_NAME);
  CHECK(diagnostics.containers[0].capacity == 1024);
  CHECK(diagnostics.containers[0].usable_space == 1004);
  CHECK(diagnostics.containers[0].active_claims == 2);
  // claimed once by the writer and once more by the replay
  CHECK(diagnostics.claimant_counts.at(kept_claim->getResourceClaim()->getKey()) == 2);
  CHECK(diagnostics.volatile_repositories);
  CHECK(diagnostics.queues_with_flow_files == std::set<std::string>{"q1", "removed"});
  CHECK(diagnostics.orphaned_claims == std::set<std::string>{orphaned_claim->getResourceClaim()->getKey()});
  CHECK(diagnostics.open_file_descriptors == 17);
  CHECK(diagnostics.max_file_descriptors == 1024);

  LogTestController::getInstance().setDebug<core::RepositoryDiagnostics>();
  auto logger = logging::LoggerFactory<core::RepositoryDiagnostics>::getLogger();
  diagnostics.log(*logger);
  CHECK(LogTestController::getInstance().contains("Queues with FlowFiles: [q1, removed]"));
  CHECK(LogTestController::getInstance().contains("Orphaned resource claims: [" + orphaned_claim->getResourceClaim()->getKey() + "]"));
  CHECK(LogTestController::getInstance().contains("Open file descriptors: 17 of 1024"));
}

TEST_CASE("RepositoryDiagnostics tolerates platforms without file descriptor counts", "[RepositoryDiagnostics]") {
  TestController testController;
  auto claim_manager = std::make_shared<core::ResourceClaimManager>();
  auto configuration = std::make_shared<flowstore::Configure>();
  core::repository::VolatileContentRepository content_repo;
  core::repository::VolatileFlowFileRepository flow_file_repo;
  REQUIRE(content_repo.initialize(configuration, claim_manager));
  REQUIRE(flow_file_repo.initialize(configuration, claim_manager));

  const FixedPlatformCapabilities platform{std::nullopt, std::nullopt};
  const auto diagnostics = core::RepositoryDiagnostics::gather(content_repo, flow_file_repo, platform);
  CHECK_FALSE(diagnostics.open_file_descriptors);
  CHECK(diagnostics.orphaned_claims.empty());
  CHECK(diagnostics.claimant_counts.empty());

  LogTestController::getInstance().setDebug<core::RepositoryDiagnostics>();
  diagnostics.log(*logging::LoggerFactory<core::RepositoryDiagnostics>::getLogger());
  CHECK(LogTestController::getInstance().contains("File descriptor counts are not available on this platform"));
}
