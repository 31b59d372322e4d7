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
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "FlowFileRepository.h"
#include "core/FlowFileQueue.h"
#include "core/ProcessSession.h"
#include "core/QueueProvider.h"
#include "core/ResourceClaimManager.h"
#include "core/repository/FileSystemRepository.h"
#include "core/repository/FileSystemSwapManager.h"

namespace {

constexpr size_t SWAP_THRESHOLD = 5;
constexpr size_t FLOW_FILE_COUNT = 12;

struct Flow {
  Flow(const std::shared_ptr<flowstore::Configure>& configuration, const std::filesystem::path& swap_dir, size_t swap_threshold = SWAP_THRESHOLD) {
    REQUIRE(content_repo->initialize(configuration, claim_manager));
    REQUIRE(flow_file_repo->initialize(configuration, claim_manager));
    swap_manager = std::make_shared<core::repository::FileSystemSwapManager>(swap_dir, flow_file_repo);
    REQUIRE(swap_manager->initialize());
    queue = std::make_shared<core::FlowFileQueue>("q1", swap_manager);
    queue->setSwapThreshold(swap_threshold);
    queue->setSwapBatchSize(swap_threshold);
    queue_provider->addQueue(queue);
  }

  std::shared_ptr<core::ResourceClaimManager> claim_manager = std::make_shared<core::ResourceClaimManager>();
  std::shared_ptr<core::repository::FileSystemRepository> content_repo = std::make_shared<core::repository::FileSystemRepository>();
  std::shared_ptr<core::repository::FlowFileRepository> flow_file_repo = std::make_shared<core::repository::FlowFileRepository>("ff");
  std::shared_ptr<core::repository::FileSystemSwapManager> swap_manager;
  std::shared_ptr<core::FlowFileQueue> queue;
  std::shared_ptr<core::StandardQueueProvider> queue_provider = std::make_shared<core::StandardQueueProvider>();
};

std::shared_ptr<flowstore::Configure> createConfiguration(const std::filesystem::path& dir) {
  auto configuration = std::make_shared<flowstore::Configure>();
  configuration->set(flowstore::Configure::flowstore_flowfile_repository_directory_default, (dir / "flowfile_repository").string());
  configuration->set(std::string(flowstore::Configure::flowstore_content_repository_directory_prefix) + "default", (dir / "content_repository").string());
  configuration->set(flowstore::Configure::flowstore_content_repository_sections, "4");
  configuration->set(flowstore::Configure::flowstore_flowfile_repository_rocksdb_compaction_period, "0 ms");
  return configuration;
}

size_t countSwapFiles(const std::filesystem::path& swap_dir) {
  size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(swap_dir)) {
    if (entry.path().extension() == core::repository::FileSystemSwapManager::SWAP_FILE_EXTENSION) {
      ++count;
    }
  }
  return count;
}

void commitFlowFiles(Flow& flow, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    core::ProcessSession session(flow.flow_file_repo, flow.content_repo);
    auto flow_file = session.create();
    const auto content = "content-" + std::to_string(i);
    flow_file = session.write(flow_file, std::as_bytes(std::span(content)));
    flow_file = session.putAttribute(flow_file, "index", std::to_string(i));
    session.transfer(flow_file, flow.queue);
    session.commit();
  }
}

std::string readContent(core::ContentRepository& content_repo, const core::FlowFile& flow_file) {
  const auto bytes = content_repo.readAll(*flow_file.getContentClaim());
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace

TEST_CASE("Swapped out FlowFiles come back in order after a restart", "[Swap]") {
  TestController testController;
  LogTestController::getInstance().setDebug<core::FlowFileQueue>();
  LogTestController::getInstance().setDebug<core::repository::FileSystemSwapManager>();
  const auto dir = testController.createTempDirectory();
  const auto swap_dir = dir / "flowfile_repository" / "swap";
  const auto configuration = createConfiguration(dir);

  {
    Flow flow(configuration, swap_dir);
    commitFlowFiles(flow, FLOW_FILE_COUNT);
    REQUIRE(flow.queue->size() == FLOW_FILE_COUNT);
    REQUIRE(flow.queue->getActiveCount() == SWAP_THRESHOLD);
    REQUIRE(flow.queue->getSwapLocationCount() == 1);
    REQUIRE(countSwapFiles(swap_dir) == 1);
    REQUIRE(flow.flow_file_repo->isValidSwapLocationSuffix(flow.queue->getSwapLocations().front()));
  }

  Flow flow(configuration, swap_dir);
  flow.flow_file_repo->loadFlowFiles(flow.queue_provider);
  REQUIRE(flow.queue->size() == FLOW_FILE_COUNT);
  REQUIRE(flow.queue->getSwapLocationCount() == 1);

  const auto recovered = flow.swap_manager->recoverSwapLocations("q1");
  REQUIRE(recovered.size() == 1);
  CHECK(recovered == flow.queue->getSwapLocations());

  const auto summary = flow.swap_manager->peek(recovered.front(), "q1");
  REQUIRE(summary);
  CHECK(summary->flow_file_count == SWAP_THRESHOLD);
  CHECK(summary->flow_file_uuids.size() == SWAP_THRESHOLD);

  for (size_t i = 0; i < FLOW_FILE_COUNT; ++i) {
    auto flow_file = flow.queue->poll();
    REQUIRE(flow_file);
    CHECK(flow_file->getAttribute("index") == std::to_string(i));
    CHECK(readContent(*flow.content_repo, *flow_file) == "content-" + std::to_string(i));
  }
  CHECK(flow.queue->isEmpty());
  CHECK(countSwapFiles(swap_dir) == 0);
  CHECK(flow.flow_file_repo->findQueuesWithFlowFiles() == std::set<std::string>{"q1"});
}

TEST_CASE("FlowFile order survives a restart with a lower swap threshold", "[Swap]") {
  TestController testController;
  const auto dir = testController.createTempDirectory();
  const auto swap_dir = dir / "flowfile_repository" / "swap";
  const auto configuration = createConfiguration(dir);

  {
    Flow flow(configuration, swap_dir);
    commitFlowFiles(flow, FLOW_FILE_COUNT);
    // 5 active, 5 in a swap file, 2 waiting for the next swap batch
    REQUIRE(flow.queue->getActiveCount() == SWAP_THRESHOLD);
    REQUIRE(flow.queue->getSwapLocationCount() == 1);
  }

  Flow flow(configuration, swap_dir, 2);
  flow.flow_file_repo->loadFlowFiles(flow.queue_provider);
  REQUIRE(flow.queue->size() == FLOW_FILE_COUNT);
  CHECK(flow.queue->getActiveCount() == SWAP_THRESHOLD);

  for (size_t i = 0; i < FLOW_FILE_COUNT; ++i) {
    auto flow_file = flow.queue->poll();
    REQUIRE(flow_file);
    CHECK(flow_file->getAttribute("index") == std::to_string(i));
    CHECK(readContent(*flow.content_repo, *flow_file) == "content-" + std::to_string(i));
  }
  CHECK(flow.queue->isEmpty());
  CHECK(countSwapFiles(swap_dir) == 0);
}

TEST_CASE("Swap files of other queues are left alone during recovery", "[Swap]") {
  TestController testController;
  const auto dir = testController.createTempDirectory();
  const auto swap_dir = dir / "flowfile_repository" / "swap";
  const auto configuration = createConfiguration(dir);
  Flow flow(configuration, swap_dir);

  std::vector<std::shared_ptr<core::FlowFile>> flow_files;
  for (uint64_t id = 1; id <= 3; ++id) {
    auto flow_file = std::make_shared<core::FlowFile>(id, utils::IdGenerator::getIdGenerator()->generate());
    flow_file->setQueueId("q2");
    flow_files.push_back(flow_file);
  }
  flow.flow_file_repo->updateRepository({
    core::RepositoryRecord::create(flow_files[0], "q2"),
    core::RepositoryRecord::create(flow_files[1], "q2"),
    core::RepositoryRecord::create(flow_files[2], "q2")});
  const auto location = flow.swap_manager->swapOut(flow_files, "q2");

  // a leftover of a swap out interrupted before the rename
  const auto partial = swap_dir / "1-q1-00000000-0000-0000-0000-000000000000.swap.part";
  std::ofstream{partial} << "partial";

  CHECK(flow.swap_manager->recoverSwapLocations("q1").empty());
  CHECK_FALSE(std::filesystem::exists(partial));
  CHECK(flow.swap_manager->recoverSwapLocations("q2") == std::vector<std::string>{location});
  CHECK(core::repository::FileSystemSwapManager::getOwnerQueueIdentifier(location) == "q2");
}
