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
#include <chrono>
#include <memory>
#include <string>

#include "Catch.h"
#include "TestBase.h"
#include "core/FlowFile.h"
#include "io/BufferStream.h"
#include "loadbalance/LoadBalanceFlowFileCodec.h"
#include "utils/Id.h"

namespace io = flowstore::io;
namespace loadbalance = flowstore::loadbalance;

namespace {

std::shared_ptr<core::FlowFile> createFlowFile() {
  auto flow_file = std::make_shared<core::FlowFile>(1, utils::IdGenerator::getIdGenerator()->generate());
  flow_file->setAttribute(core::SpecialFlowAttribute::FILENAME, "data.csv");
  flow_file->setAttribute("path", "/var/incoming/");
  flow_file->setLineageStartDate(core::FlowFile::fromMillis(1600000000000));
  flow_file->setEntryDate(core::FlowFile::fromMillis(1600000001000));
  flow_file->setPenaltyExpiration(core::FlowFile::fromMillis(1600000002000));
  return flow_file;
}

}  // namespace

TEST_CASE("The attribute block starts with the attribute count followed by wide strings", "[LoadBalanceFlowFileCodec]") {
  TestController test_controller;
  auto flow_file = createFlowFile();
  io::BufferStream stream;
  REQUIRE(loadbalance::LoadBalanceFlowFileCodec::encode(*flow_file, stream));

  uint32_t attribute_count = 0;
  REQUIRE(stream.read(attribute_count) == 4);
  CHECK(attribute_count == 3);
  std::string key;
  std::string value;
  REQUIRE_FALSE(io::isError(stream.read(key, true)));
  REQUIRE_FALSE(io::isError(stream.read(value, true)));
  CHECK(key == "filename");
  CHECK(value == "data.csv");
}

TEST_CASE("Attributes and dates survive the attribute block", "[LoadBalanceFlowFileCodec]") {
  TestController test_controller;
  auto flow_file = createFlowFile();
  io::BufferStream stream;
  REQUIRE(loadbalance::LoadBalanceFlowFileCodec::encode(*flow_file, stream));

  auto decoded = loadbalance::LoadBalanceFlowFileCodec::decode(stream);
  REQUIRE(decoded);
  CHECK(decoded->attributes == flow_file->getAttributes());
  CHECK(decoded->attributes.at(core::SpecialFlowAttribute::UUID) == flow_file->getUUIDStr());
  CHECK(decoded->lineage_start_date == flow_file->getLineageStartDate());
  CHECK(decoded->entry_date == flow_file->getEntryDate());
  CHECK(decoded->penalty_expiration == flow_file->getPenaltyExpiration());
}

TEST_CASE("A truncated attribute block cannot be decoded", "[LoadBalanceFlowFileCodec]") {
  TestController test_controller;
  auto flow_file = createFlowFile();
  io::BufferStream stream;
  REQUIRE(loadbalance::LoadBalanceFlowFileCodec::encode(*flow_file, stream));
  const auto encoded = stream.getBuffer();

  SECTION("Missing the penalty expiration") {
    io::BufferStream truncated(encoded.subspan(0, encoded.size() - 1));
    CHECK_FALSE(loadbalance::LoadBalanceFlowFileCodec::decode(truncated));
  }
  SECTION("Missing attribute values") {
    io::BufferStream truncated(encoded.subspan(0, 10));
    CHECK_FALSE(loadbalance::LoadBalanceFlowFileCodec::decode(truncated));
  }
  SECTION("Empty block") {
    io::BufferStream empty;
    CHECK_FALSE(loadbalance::LoadBalanceFlowFileCodec::decode(empty));
  }
}
