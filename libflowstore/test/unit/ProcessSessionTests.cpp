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
#include <span>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "Exception.h"
#include "core/FlowFileQueue.h"
#include "core/ProcessSession.h"
#include "core/ResourceClaimManager.h"
#include "core/repository/VolatileContentRepository.h"
#include "core/repository/VolatileFlowFileRepository.h"

namespace {

std::span<const std::byte> asBytes(const std::string& str) {
  return std::as_bytes(std::span<const char>(str));
}

std::string asString(const std::vector<std::byte>& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

struct SessionFixture {
  SessionFixture() {
    REQUIRE(content_repo->initialize(configuration, claim_manager));
    REQUIRE(flow_file_repo->initialize(configuration, claim_manager));
  }

  std::shared_ptr<core::FlowFile> commitNew(const std::string& content) {
    core::ProcessSession session(flow_file_repo, content_repo);
    auto flow_file = session.create();
    flow_file = session.write(flow_file, asBytes(content));
    session.transfer(flow_file, queue);
    session.commit();
    return flow_file;
  }

  int claimantCount(const std::shared_ptr<core::FlowFile>& flow_file) const {
    return claim_manager->getClaimantCount(flow_file->getResourceClaim());
  }

  TestController test_controller;
  std::shared_ptr<flowstore::Configure> configuration = std::make_shared<flowstore::Configure>();
  std::shared_ptr<core::ResourceClaimManager> claim_manager = std::make_shared<core::ResourceClaimManager>();
  std::shared_ptr<core::repository::VolatileContentRepository> content_repo = std::make_shared<core::repository::VolatileContentRepository>();
  std::shared_ptr<core::repository::VolatileFlowFileRepository> flow_file_repo = std::make_shared<core::repository::VolatileFlowFileRepository>();
  std::shared_ptr<core::FlowFileQueue> queue = std::make_shared<core::FlowFileQueue>("q1");
  std::shared_ptr<core::FlowFileQueue> other_queue = std::make_shared<core::FlowFileQueue>("q2");
};

}  // namespace

TEST_CASE("A committed FlowFile is persisted and queued", "[ProcessSession]") {
  SessionFixture fixture;
  auto flow_file = fixture.commitNew("payload");

  CHECK(fixture.flow_file_repo->getRecordCount() == 1);
  CHECK(fixture.claimantCount(flow_file) == 1);
  REQUIRE(fixture.queue->size() == 1);
  auto queued = fixture.queue->poll();
  CHECK(queued->getUUIDStr() == flow_file->getUUIDStr());
  CHECK(queued->getQueueId() == "q1");
  CHECK(queued->getSize() == 7);
  CHECK(asString(fixture.content_repo->readAll(*queued->getContentClaim())) == "payload");
}

TEST_CASE("Rolling back a session releases the content written in it", "[ProcessSession]") {
  SessionFixture fixture;
  std::shared_ptr<core::FlowFile> flow_file;

  SECTION("Explicit rollback") {
    core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
    flow_file = session.write(session.create(), asBytes("discarded"));
    session.transfer(flow_file, fixture.queue);
    session.rollback();
  }

  SECTION("Session destroyed without commit") {
    core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
    flow_file = session.write(session.create(), asBytes("discarded"));
  }

  CHECK(fixture.claimantCount(flow_file) == 0);
  CHECK(fixture.flow_file_repo->getRecordCount() == 0);
  CHECK(fixture.queue->isEmpty());
  CHECK(fixture.content_repo->reclaim() == 1);
  CHECK_FALSE(fixture.content_repo->exists(*flow_file->getResourceClaim()));
}

TEST_CASE("Content replaced within the same session is released right away", "[ProcessSession]") {
  SessionFixture fixture;
  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  auto first = session.write(session.create(), asBytes("first"));
  auto second = session.write(first, asBytes("second"));
  CHECK(fixture.claimantCount(first) == 0);
  CHECK(fixture.claimantCount(second) == 1);
  session.transfer(second, fixture.queue);
  session.commit();

  CHECK(fixture.claimantCount(second) == 1);
  CHECK(asString(fixture.content_repo->readAll(*fixture.queue->poll()->getContentClaim())) == "second");
}

TEST_CASE("Modifying the content of a FlowFile releases the original content on commit", "[ProcessSession]") {
  SessionFixture fixture;
  auto original = fixture.commitNew("original");

  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  auto flow_file = session.get(fixture.queue);
  REQUIRE(flow_file);
  flow_file = session.write(flow_file, asBytes("modified"));
  session.transfer(flow_file, fixture.other_queue);
  CHECK(fixture.claimantCount(original) == 1);
  session.commit();

  CHECK(fixture.claimantCount(original) == 0);
  CHECK(fixture.claimantCount(flow_file) == 1);
  CHECK(fixture.flow_file_repo->getRecordCount() == 1);
  CHECK(fixture.queue->isEmpty());
  auto moved = fixture.other_queue->poll();
  REQUIRE(moved);
  CHECK(moved->getQueueId() == "q2");
  CHECK(asString(fixture.content_repo->readAll(*moved->getContentClaim())) == "modified");
  CHECK(fixture.content_repo->reclaim() == 1);
}

TEST_CASE("Changing only attributes keeps the content claimed once", "[ProcessSession]") {
  SessionFixture fixture;
  auto original = fixture.commitNew("unchanged");

  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  auto flow_file = session.putAttribute(session.get(fixture.queue), "key", "value");
  session.commit();

  CHECK(fixture.claimantCount(original) == 1);
  auto queued = fixture.queue->poll();
  REQUIRE(queued);
  CHECK(queued->getAttribute("key") == "value");
  CHECK(queued->getContentClaim() == original->getContentClaim());
}

TEST_CASE("Removing a FlowFile releases its content on commit", "[ProcessSession]") {
  SessionFixture fixture;
  auto original = fixture.commitNew("to be removed");

  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  auto flow_file = session.get(fixture.queue);
  session.remove(flow_file);
  CHECK_THROWS_AS(session.putAttribute(flow_file, "key", "value"), flowstore::Exception);
  session.commit();

  CHECK(fixture.claimantCount(original) == 0);
  CHECK(fixture.flow_file_repo->getRecordCount() == 0);
  CHECK(fixture.queue->isEmpty());
}

TEST_CASE("Rolling back returns FlowFiles to their queue unchanged", "[ProcessSession]") {
  SessionFixture fixture;
  auto original = fixture.commitNew("content");

  {
    core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
    auto flow_file = session.get(fixture.queue);
    flow_file = session.putAttribute(flow_file, "key", "value");
    flow_file = session.write(flow_file, asBytes("new content"));
    session.transfer(flow_file, fixture.other_queue);
    session.rollback();
  }

  CHECK(fixture.other_queue->isEmpty());
  auto queued = fixture.queue->poll();
  REQUIRE(queued);
  CHECK_FALSE(queued->getAttribute("key"));
  CHECK(asString(fixture.content_repo->readAll(*queued->getContentClaim())) == "content");
  CHECK(fixture.claimantCount(original) == 1);
}

TEST_CASE("Rolled back FlowFiles go to the tail of their queue", "[ProcessSession]") {
  SessionFixture fixture;
  const auto first = fixture.commitNew("first");
  const auto second = fixture.commitNew("second");
  const auto third = fixture.commitNew("third");

  {
    core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
    REQUIRE(session.get(fixture.queue)->getUUIDStr() == first->getUUIDStr());
    REQUIRE(session.get(fixture.queue)->getUUIDStr() == second->getUUIDStr());
    session.rollback();
  }

  std::vector<std::string> order;
  while (auto flow_file = fixture.queue->poll()) {
    order.push_back(flow_file->getUUIDStr());
  }
  CHECK(order == std::vector<std::string>{third->getUUIDStr(), first->getUUIDStr(), second->getUUIDStr()});
  CHECK(fixture.claimantCount(first) == 1);
  CHECK(fixture.claimantCount(second) == 1);
}

TEST_CASE("A persisted session is not rolled back when releasing content fails", "[ProcessSession]") {
  SessionFixture fixture;
  LogTestController::getInstance().setDebug<core::FlowFileRepository>();
  const auto original = fixture.commitNew("content");
  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  auto flow_file = session.get(fixture.queue);
  session.remove(flow_file);
  auto created = session.write(session.create(), asBytes("created"));
  session.transfer(created, fixture.other_queue);

  // someone else already released the claimant of the removed FlowFile
  REQUIRE(fixture.claim_manager->decrementClaimantCount(original->getResourceClaim()) == 0);
  session.commit();

  CHECK(LogTestController::getInstance().contains("Failed to release the content of DELETE record"));
  CHECK(fixture.queue->isEmpty());
  CHECK(fixture.flow_file_repo->getRecordCount() == 1);
  REQUIRE(fixture.other_queue->size() == 1);
  CHECK(fixture.claimantCount(created) == 1);
}

TEST_CASE("A FlowFile taken from a queue without a destination goes back to it", "[ProcessSession]") {
  SessionFixture fixture;
  fixture.commitNew("content");

  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  session.putAttribute(session.get(fixture.queue), "seen", "true");
  session.commit();

  auto queued = fixture.queue->poll();
  REQUIRE(queued);
  CHECK(queued->getAttribute("seen") == "true");
}

TEST_CASE("Committing a created FlowFile without a destination fails", "[ProcessSession]") {
  SessionFixture fixture;
  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  auto flow_file = session.write(session.create(), asBytes("lost"));

  CHECK_THROWS_AS(session.commit(), flowstore::Exception);
  CHECK(fixture.claimantCount(flow_file) == 0);
  CHECK(fixture.flow_file_repo->getRecordCount() == 0);
}

TEST_CASE("FlowFiles of other sessions are rejected", "[ProcessSession]") {
  SessionFixture fixture;
  core::ProcessSession session(fixture.flow_file_repo, fixture.content_repo);
  core::ProcessSession other_session(fixture.flow_file_repo, fixture.content_repo);
  auto flow_file = other_session.create();
  CHECK_THROWS_AS(session.transfer(flow_file, fixture.queue), flowstore::Exception);
  CHECK(session.read(flow_file).empty());
  other_session.remove(flow_file);
  other_session.commit();
}
