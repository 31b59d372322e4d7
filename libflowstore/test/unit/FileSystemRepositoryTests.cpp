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
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "Exception.h"
#include "IntegrationTestUtils.h"
#include "core/ResourceClaimManager.h"
#include "core/repository/FileSystemRepository.h"

namespace {

std::span<const std::byte> asBytes(const std::string& str) {
  return std::as_bytes(std::span<const char>(str));
}

std::string asString(const std::vector<std::byte>& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

struct ContentRepositoryFixture {
  explicit ContentRepositoryFixture(const std::string& max_appendable_claim_size = "1 MB") {
    LogTestController::getInstance().setDebug<core::repository::FileSystemRepository>();
    content_dir = test_controller.createTempDirectory();
    configuration = std::make_shared<flowstore::Configure>();
    configuration->set(std::string(flowstore::Configure::flowstore_content_repository_directory_prefix) + "default", content_dir.string());
    configuration->set(flowstore::Configure::flowstore_content_repository_sections, "4");
    configuration->set(flowstore::Configure::flowstore_content_repository_max_appendable_claim_size, max_appendable_claim_size);
    claim_manager = std::make_shared<core::ResourceClaimManager>();
    content_repository = std::make_shared<core::repository::FileSystemRepository>();
    REQUIRE(content_repository->initialize(configuration, claim_manager));
  }

  TestController test_controller;
  std::filesystem::path content_dir;
  std::shared_ptr<flowstore::Configure> configuration;
  std::shared_ptr<core::ResourceClaimManager> claim_manager;
  std::shared_ptr<core::repository::FileSystemRepository> content_repository;
};

}  // namespace

TEST_CASE("Content written to a claim can be read back", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto claim = repository.importFrom(asBytes("hello world"));
  CHECK(claim->getOffset() == 0);
  CHECK(claim->getLength() == 11);
  CHECK(asString(repository.readAll(*claim)) == "hello world");
  CHECK(repository.exists(*claim->getResourceClaim()));
  CHECK(fixture.claim_manager->getClaimantCount(claim->getResourceClaim()) == 1);

  const auto path = repository.getPath(*claim->getResourceClaim());
  CHECK(path.parent_path().parent_path() == fixture.content_dir);
  CHECK(claim->getResourceClaim()->getKey() == "default/" + path.parent_path().filename().string() + "/" + path.filename().string());
}

TEST_CASE("Small contents are appended to the same resource claim", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto first = repository.importFrom(asBytes("hello"));
  auto second = repository.importFrom(asBytes("world!"));
  REQUIRE(first->getResourceClaim() == second->getResourceClaim());
  CHECK(first->getOffset() == 0);
  CHECK(second->getOffset() == 5);
  CHECK(repository.size(*first->getResourceClaim()) == 11);
  CHECK(fixture.claim_manager->getClaimantCount(first->getResourceClaim()) == 2);

  CHECK(asString(repository.readAll(*first)) == "hello");
  CHECK(asString(repository.readAll(*second)) == "world!");
}

TEST_CASE("A claim released without being written does not keep its resource in use", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto written = repository.importFrom(asBytes("hello"));
  auto resource_claim = written->getResourceClaim();
  auto unwritten = repository.create(false);
  REQUIRE(unwritten->getResourceClaim() == resource_claim);
  CHECK(fixture.claim_manager->getClaimantCount(resource_claim) == 2);

  SECTION("The resource becomes destructable once its claimants are gone") {
    CHECK(fixture.claim_manager->decrementClaimantCount(resource_claim) == 1);
    unwritten.reset();
    CHECK_FALSE(resource_claim->isInUse());
    CHECK(fixture.claim_manager->decrementClaimantCount(resource_claim) == 0);
    written.reset();
    CHECK(repository.reclaim() == 1);
    CHECK_FALSE(repository.exists(*resource_claim));
  }
  SECTION("New content goes to another resource") {
    CHECK(fixture.claim_manager->decrementClaimantCount(resource_claim) == 1);
    unwritten.reset();
    auto next = repository.importFrom(asBytes("world"));
    CHECK(next->getResourceClaim() != resource_claim);
    CHECK(next->getOffset() == 0);
    CHECK(asString(repository.readAll(*written)) == "hello");
  }
  SECTION("A written claim keeps its resource appendable") {
    auto stream = repository.write(unwritten);
    REQUIRE(stream->write(asBytes("world")) == 5);
    stream->close();
    unwritten.reset();
    CHECK(resource_claim->isInUse());
    CHECK(repository.importFrom(asBytes("!"))->getResourceClaim() == resource_claim);
  }
}

TEST_CASE("Loss tolerant and durable contents never share a resource claim", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto durable = repository.importFrom(asBytes("durable"), false);
  auto loss_tolerant = repository.importFrom(asBytes("loss tolerant"), true);
  CHECK(durable->getResourceClaim() != loss_tolerant->getResourceClaim());
  CHECK_FALSE(durable->getResourceClaim()->isLossTolerant());
  CHECK(loss_tolerant->getResourceClaim()->isLossTolerant());

  auto other_durable = repository.importFrom(asBytes("more"), false);
  CHECK(other_durable->getResourceClaim() == durable->getResourceClaim());
  CHECK(asString(repository.readAll(*other_durable)) == "more");
}

TEST_CASE("A resource claim is frozen once it reaches the maximum appendable size", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture("10 B");
  auto& repository = *fixture.content_repository;
  CHECK(repository.getMaxAppendableClaimSize() == 10);

  auto first = repository.importFrom(asBytes("12345678"));
  CHECK(first->getResourceClaim()->isInUse());
  auto second = repository.importFrom(asBytes("abcde"));
  REQUIRE(second->getResourceClaim() == first->getResourceClaim());
  CHECK(second->getOffset() == 8);
  CHECK_FALSE(first->getResourceClaim()->isInUse());

  auto third = repository.importFrom(asBytes("xyz"));
  CHECK(third->getResourceClaim() != first->getResourceClaim());
  CHECK(third->getOffset() == 0);

  CHECK(asString(repository.readAll(*first)) == "12345678");
  CHECK(asString(repository.readAll(*second)) == "abcde");
  CHECK(asString(repository.readAll(*third)) == "xyz");
}

TEST_CASE("The maximum appendable size is capped", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture("1 GB");
  CHECK(fixture.content_repository->getMaxAppendableClaimSize() == core::repository::MAX_APPENDABLE_CLAIM_SIZE_LIMIT);
}

TEST_CASE("The number of sections must be positive", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  fixture.configuration->set(flowstore::Configure::flowstore_content_repository_sections, "0");
  core::repository::FileSystemRepository repository;
  CHECK_FALSE(repository.initialize(fixture.configuration, fixture.claim_manager));
}

TEST_CASE("Reclamation removes resources without claimants", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture("1 B");
  auto& repository = *fixture.content_repository;

  auto claim = repository.importFrom(asBytes("to be removed"));
  auto kept = repository.importFrom(asBytes("to be kept"));
  const auto resource_claim = claim->getResourceClaim();
  REQUIRE(resource_claim != kept->getResourceClaim());
  REQUIRE_FALSE(resource_claim->isInUse());

  CHECK(repository.reclaim() == 0);
  CHECK(repository.exists(*resource_claim));

  CHECK(fixture.claim_manager->decrementClaimantCount(resource_claim) == 0);
  CHECK(repository.reclaim() == 1);
  CHECK_FALSE(repository.exists(*resource_claim));
  CHECK(repository.exists(*kept->getResourceClaim()));
  CHECK(asString(repository.readAll(*kept)) == "to be kept");
}

TEST_CASE("A writable resource claim is only reclaimed after the repository stops writing to it", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto claim = repository.importFrom(asBytes("appendable"));
  const auto resource_claim = claim->getResourceClaim();
  CHECK(fixture.claim_manager->decrementClaimantCount(resource_claim) == 0);
  CHECK_FALSE(fixture.claim_manager->isDestructable(resource_claim));
  CHECK(repository.reclaim() == 0);
  CHECK(repository.exists(*resource_claim));

  repository.stop();
  CHECK(fixture.claim_manager->isDestructable(resource_claim));
  CHECK(repository.reclaim() == 1);
  CHECK_FALSE(repository.exists(*resource_claim));
}

TEST_CASE("Resources are removed in the background once the repository is started", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture("1 B");
  fixture.configuration->set(flowstore::Configure::flowstore_content_repository_purge_period, "10 ms");
  auto& repository = *fixture.content_repository;
  REQUIRE(repository.initialize(fixture.configuration, fixture.claim_manager));
  repository.start();

  auto claim = repository.importFrom(asBytes("short lived"));
  fixture.claim_manager->decrementClaimantCount(claim->getResourceClaim());
  CHECK(utils::verifyEventHappenedInPollTime(std::chrono::seconds(3), [&] { return !repository.exists(*claim->getResourceClaim()); }));
  repository.stop();
}

TEST_CASE("Orphaned resources are removed on request", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto referenced = repository.importFrom(asBytes("referenced"));
  const auto orphan = fixture.content_dir / "2" / "orphan";
  std::filesystem::create_directories(orphan.parent_path());
  std::ofstream{orphan} << "nobody knows about me";

  repository.clearOrphans({referenced->getResourceClaim()->getKey()});
  CHECK_FALSE(std::filesystem::exists(orphan));
  CHECK(repository.exists(*referenced->getResourceClaim()));
  CHECK(LogTestController::getInstance().contains("Removed orphaned resource"));
}

TEST_CASE("Reading missing content throws", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto missing_resource = fixture.claim_manager->newResourceClaim("default", "1", "missing", false, false);
  core::ContentClaim missing_claim{missing_resource, 0, 10};
  CHECK_THROWS_AS(repository.read(missing_claim), flowstore::ContentNotFoundException);

  auto claim = repository.importFrom(asBytes("short"));
  core::ContentClaim too_long{claim->getResourceClaim(), 2, 100};
  CHECK_THROWS_AS(repository.readAll(too_long), flowstore::ContentNotFoundException);

  core::ContentClaim unknown_container{fixture.claim_manager->newResourceClaim("elsewhere", "1", "1", false, false), 0, 1};
  CHECK_THROWS_AS(repository.read(unknown_container), flowstore::ContentNotFoundException);
}

TEST_CASE("Purging empties the containers", "[FileSystemRepository]") {
  ContentRepositoryFixture fixture;
  auto& repository = *fixture.content_repository;

  auto claim = repository.importFrom(asBytes("purged"));
  repository.purge();
  CHECK_FALSE(repository.exists(*claim->getResourceClaim()));
  CHECK(std::filesystem::is_directory(fixture.content_dir));
  CHECK(fixture.claim_manager->getTrackedClaims().empty());
  CHECK(repository.getActiveResourceClaims("default").empty());
}
