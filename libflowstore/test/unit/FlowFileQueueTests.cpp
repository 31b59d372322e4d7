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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "Exception.h"
#include "core/FlowFile.h"
#include "core/FlowFileQueue.h"
#include "core/SwapManager.h"
#include "utils/Id.h"

namespace {

class InMemorySwapManager : public core::SwapManager {
 public:
  std::string swapOut(const std::vector<std::shared_ptr<core::FlowFile>>& flow_files, const std::string& queue_id) override {
    if (fail_swap_out) {
      throw flowstore::Exception(flowstore::SWAP_EXCEPTION, "swap storage is unavailable");
    }
    auto location = queue_id + "-" + std::to_string(next_location_++);
    swapped[location] = flow_files;
    return location;
  }

  std::vector<std::shared_ptr<core::FlowFile>> swapIn(const std::string& swap_location, const std::string& /*queue_id*/) override {
    auto it = swapped.find(swap_location);
    if (it == swapped.end()) {
      throw flowstore::Exception(flowstore::SWAP_EXCEPTION, "unknown swap location " + swap_location);
    }
    auto flow_files = std::move(it->second);
    swapped.erase(it);
    return flow_files;
  }

  std::optional<core::SwapSummary> peek(const std::string& swap_location, const std::string& queue_id) override {
    auto it = swapped.find(swap_location);
    if (it == swapped.end()) {
      return std::nullopt;
    }
    core::SwapSummary summary;
    summary.queue_id = queue_id;
    summary.flow_file_count = it->second.size();
    return summary;
  }

  std::vector<std::string> recoverSwapLocations(const std::string& /*queue_id*/) override {
    return {};
  }

  void purge() override {
    swapped.clear();
  }

  bool fail_swap_out{false};
  std::map<std::string, std::vector<std::shared_ptr<core::FlowFile>>> swapped;

 private:
  int next_location_{0};
};

std::shared_ptr<core::FlowFile> createFlowFile(uint64_t id, uint64_t size = 0) {
  auto flow_file = std::make_shared<core::FlowFile>(id, utils::IdGenerator::getIdGenerator()->generate());
  flow_file->setSize(size);
  return flow_file;
}

std::vector<uint64_t> pollAllIds(core::FlowFileQueue& queue) {
  std::vector<uint64_t> ids;
  while (auto flow_file = queue.poll()) {
    ids.push_back(flow_file->getId());
  }
  return ids;
}

}  // namespace

TEST_CASE("FlowFileQueue without a swap manager keeps every FlowFile in memory", "[FlowFileQueue]") {
  TestController testController;
  core::FlowFileQueue queue("q1");
  queue.setSwapThreshold(2);
  for (uint64_t id = 1; id <= 5; ++id) {
    queue.put(createFlowFile(id, 10));
  }
  CHECK(queue.size() == 5);
  CHECK(queue.getActiveCount() == 5);
  CHECK(queue.getDataSize() == 50);
  CHECK(queue.getSwapLocationCount() == 0);
  CHECK(pollAllIds(queue) == std::vector<uint64_t>{1, 2, 3, 4, 5});
  CHECK(queue.isEmpty());
  CHECK(queue.getDataSize() == 0);
}

TEST_CASE("FlowFileQueue swaps out in batches and keeps the FIFO order", "[FlowFileQueue]") {
  TestController testController;
  LogTestController::getInstance().setDebug<core::FlowFileQueue>();
  auto swap_manager = std::make_shared<InMemorySwapManager>();
  core::FlowFileQueue queue("q1", swap_manager);
  queue.setSwapThreshold(3);
  queue.setSwapBatchSize(2);

  std::vector<std::shared_ptr<core::FlowFile>> flow_files;
  for (uint64_t id = 1; id <= 8; ++id) {
    flow_files.push_back(createFlowFile(id, 1));
  }
  queue.putAll(flow_files);

  CHECK(queue.size() == 8);
  CHECK(queue.getDataSize() == 8);
  CHECK(queue.getActiveCount() == 3);
  CHECK(queue.getSwapLocationCount() == 2);
  CHECK(swap_manager->swapped.size() == 2);
  for (const auto& flow_file : flow_files) {
    CHECK(queue.contains(flow_file->getUUIDStr()));
  }

  CHECK(pollAllIds(queue) == std::vector<uint64_t>{1, 2, 3, 4, 5, 6, 7, 8});
  CHECK(swap_manager->swapped.empty());
  CHECK(queue.getSwapLocationCount() == 0);
  CHECK(queue.isEmpty());
  CHECK_FALSE(queue.contains(flow_files.front()->getUUIDStr()));
}

TEST_CASE("FlowFileQueue keeps FlowFiles in memory if they cannot be swapped out", "[FlowFileQueue]") {
  TestController testController;
  auto swap_manager = std::make_shared<InMemorySwapManager>();
  swap_manager->fail_swap_out = true;
  core::FlowFileQueue queue("q1", swap_manager);
  queue.setSwapThreshold(2);
  queue.setSwapBatchSize(2);

  for (uint64_t id = 1; id <= 6; ++id) {
    queue.put(createFlowFile(id));
  }
  CHECK(queue.size() == 6);
  CHECK(queue.getSwapLocationCount() == 0);
  CHECK(LogTestController::getInstance().contains("Failed to swap out"));
  CHECK(pollAllIds(queue) == std::vector<uint64_t>{1, 2, 3, 4, 5, 6});
}

TEST_CASE("FlowFileQueue swaps in replayed swap locations", "[FlowFileQueue]") {
  TestController testController;
  auto swap_manager = std::make_shared<InMemorySwapManager>();
  core::FlowFileQueue queue("q1", swap_manager);

  const std::vector<std::shared_ptr<core::FlowFile>> swapped{createFlowFile(1, 5), createFlowFile(2, 5)};
  swap_manager->swapped["recovered"] = swapped;
  queue.addSwapLocation("recovered", swapped);
  queue.put(createFlowFile(3, 5));

  CHECK(queue.size() == 3);
  CHECK(queue.getDataSize() == 15);
  CHECK(queue.getActiveCount() == 0);
  CHECK(queue.getSwapLocations() == std::vector<std::string>{"recovered"});
  CHECK(queue.contains(swapped[1]->getUUIDStr()));

  CHECK(pollAllIds(queue) == std::vector<uint64_t>{1, 2, 3});
  CHECK(queue.isEmpty());
}

TEST_CASE("FlowFileQueue corrects its counts if a swap location holds fewer FlowFiles than recorded", "[FlowFileQueue]") {
  TestController testController;
  auto swap_manager = std::make_shared<InMemorySwapManager>();
  core::FlowFileQueue queue("q1", swap_manager);

  const std::vector<std::shared_ptr<core::FlowFile>> recorded{createFlowFile(1, 5), createFlowFile(2, 5)};
  swap_manager->swapped["truncated"] = {recorded[0]};
  queue.addSwapLocation("truncated", recorded);
  REQUIRE(queue.size() == 2);

  auto flow_file = queue.poll();
  REQUIRE(flow_file);
  CHECK(flow_file->getId() == 1);
  CHECK(queue.size() == 0);
  CHECK(queue.getDataSize() == 0);
  CHECK_FALSE(queue.contains(recorded[1]->getUUIDStr()));
  CHECK(queue.poll() == nullptr);
}

TEST_CASE("FlowFileQueue reports backpressure", "[FlowFileQueue]") {
  TestController testController;
  core::FlowFileQueue queue("q1");

  SECTION("No thresholds") {
    for (uint64_t id = 1; id <= 100; ++id) {
      queue.put(createFlowFile(id, 1024));
    }
    CHECK_FALSE(queue.isFull());
  }

  SECTION("Object count threshold") {
    queue.setBackpressureThresholds(2, 0);
    queue.put(createFlowFile(1));
    CHECK_FALSE(queue.isFull());
    queue.put(createFlowFile(2));
    CHECK(queue.isFull());
    queue.poll();
    CHECK_FALSE(queue.isFull());
  }

  SECTION("Data size threshold") {
    queue.setBackpressureThresholds(0, 100);
    queue.put(createFlowFile(1, 60));
    CHECK_FALSE(queue.isFull());
    queue.put(createFlowFile(2, 40));
    CHECK(queue.isFull());
  }
}

TEST_CASE("FlowFileQueue polls a limited number of FlowFiles", "[FlowFileQueue]") {
  TestController testController;
  core::FlowFileQueue queue("q1");
  for (uint64_t id = 1; id <= 5; ++id) {
    queue.put(createFlowFile(id));
  }
  CHECK(queue.poll(3).size() == 3);
  CHECK(queue.poll(3).size() == 2);
  CHECK(queue.poll(3).empty());
}
