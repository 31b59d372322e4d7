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
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "Exception.h"
#include "core/FlowFileQueue.h"
#include "core/QueueProvider.h"
#include "core/ResourceClaimManager.h"
#include "core/repository/VolatileContentRepository.h"
#include "core/repository/VolatileFlowFileRepository.h"
#include "io/BufferStream.h"
#include "loadbalance/LoadBalanceClient.h"
#include "loadbalance/LoadBalanceProtocol.h"
#include "loadbalance/LoadBalanceProtocolConstants.h"
#include "utils/Id.h"

namespace io = flowstore::io;
namespace loadbalance = flowstore::loadbalance;
namespace protocol = flowstore::loadbalance::protocol;

namespace {

std::span<const std::byte> asBytes(const std::string& str) {
  return std::as_bytes(std::span<const char>(str));
}

std::string asString(const std::vector<std::byte>& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::vector<std::byte> codes(std::initializer_list<uint8_t> values) {
  std::vector<std::byte> result;
  for (auto value : values) {
    result.push_back(static_cast<std::byte>(value));
  }
  return result;
}

/**
 * Connection which replays the bytes of the peer and records everything written to it.
 */
class ScriptedConnection : public io::BaseStream {
 public:
  explicit ScriptedConnection(std::span<const std::byte> incoming) : incoming_(incoming) {}

  using io::BaseStream::read;
  using io::BaseStream::write;

  size_t read(std::span<std::byte> buffer) override {
    return incoming_.read(buffer);
  }

  size_t write(const uint8_t* value, size_t size) override {
    return outgoing_.write(value, size);
  }

  std::vector<std::byte> getOutgoing() const {
    const auto buffer = outgoing_.getBuffer();
    return {buffer.begin(), buffer.end()};
  }

 private:
  io::BufferStream incoming_;
  io::BufferStream outgoing_;
};

struct LoadBalanceFixture {
  LoadBalanceFixture() {
    REQUIRE(sender_content->initialize(configuration, sender_claims));
    REQUIRE(receiver_content->initialize(configuration, receiver_claims));
    REQUIRE(receiver_flow_files->initialize(configuration, receiver_claims));
    queue_provider->addQueue(queue);
  }

  std::shared_ptr<core::FlowFile> createFlowFile(const std::string& filename, const std::string& content) {
    auto flow_file = std::make_shared<core::FlowFile>(++sequence, utils::IdGenerator::getIdGenerator()->generate());
    flow_file->setAttribute(core::SpecialFlowAttribute::FILENAME, filename);
    if (!content.empty()) {
      flow_file->setContentClaim(sender_content->importFrom(asBytes(content)));
    }
    return flow_file;
  }

  // bytes the client sends in a transaction the peer confirms
  std::vector<std::byte> send(const std::vector<std::shared_ptr<core::FlowFile>>& flow_files, bool compress = false, const std::string& queue_id = "q1") {
    ScriptedConnection connection(codes({protocol::VERSION_ACCEPTED, protocol::CONFIRM_CHECKSUM, protocol::CONFIRM_COMPLETE_TRANSACTION}));
    REQUIRE(client.sendFlowFiles(connection, queue_id, flow_files, compress, false) == loadbalance::TransactionResult::COMPLETE);
    return connection.getOutgoing();
  }

  std::vector<std::byte> receive(const std::vector<std::byte>& transcript) {
    ScriptedConnection connection(transcript);
    REQUIRE(receiver.receiveFlowFiles(connection, "127.0.0.1:50000"));
    return connection.getOutgoing();
  }

  TestController test_controller;
  uint64_t sequence{0};
  std::shared_ptr<flowstore::Configure> configuration = std::make_shared<flowstore::Configure>();

  std::shared_ptr<core::ResourceClaimManager> sender_claims = std::make_shared<core::ResourceClaimManager>();
  std::shared_ptr<core::repository::VolatileContentRepository> sender_content = std::make_shared<core::repository::VolatileContentRepository>();
  loadbalance::LoadBalanceClient client{"node-a:6342", sender_content};

  std::shared_ptr<core::ResourceClaimManager> receiver_claims = std::make_shared<core::ResourceClaimManager>();
  std::shared_ptr<core::repository::VolatileContentRepository> receiver_content = std::make_shared<core::repository::VolatileContentRepository>();
  std::shared_ptr<core::repository::VolatileFlowFileRepository> receiver_flow_files = std::make_shared<core::repository::VolatileFlowFileRepository>();
  std::shared_ptr<core::FlowFileQueue> queue = std::make_shared<core::FlowFileQueue>("q1");
  std::shared_ptr<core::StandardQueueProvider> queue_provider = std::make_shared<core::StandardQueueProvider>();
  loadbalance::LoadBalanceProtocol receiver{receiver_flow_files, receiver_content, queue_provider};
};

const auto CONFIRMED = codes({protocol::VERSION_ACCEPTED, protocol::CONFIRM_CHECKSUM, protocol::CONFIRM_COMPLETE_TRANSACTION});

// NO_MORE_FLOWFILES, CONFIRM_CHECKSUM, the checksum and COMPLETE_TRANSACTION close every transcript
constexpr size_t TRANSACTION_TRAILER_SIZE = 1 + 1 + 8 + 1;

}  // namespace

TEST_CASE("A transaction delivers FlowFiles with their attributes and content", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  bool compress = false;
  SECTION("Uncompressed") {
    compress = false;
  }
  SECTION("Compressed") {
    compress = true;
  }

  // spans several data frames
  std::string large_content;
  for (size_t i = 0; large_content.size() < 150000; ++i) {
    large_content += std::to_string(i) + ",";
  }
  std::vector<std::shared_ptr<core::FlowFile>> sent{
      fixture.createFlowFile("small.txt", "hello"),
      fixture.createFlowFile("large.csv", large_content),
      fixture.createFlowFile("empty.txt", "")};
  sent[0]->setAttribute("mime.type", "text/plain");
  sent[2]->setPenaltyExpiration(core::FlowFile::fromMillis(1700000000000));

  const auto transcript = fixture.send(sent, compress);
  ScriptedConnection connection(transcript);
  REQUIRE(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"));
  CHECK(connection.getOutgoing() == CONFIRMED);
  // the peer has nothing more to say
  CHECK_FALSE(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"));

  CHECK(fixture.receiver_flow_files->getRecordCount() == 3);
  REQUIRE(fixture.queue->size() == 3);
  for (const auto& expected : sent) {
    auto received = fixture.queue->poll();
    REQUIRE(received);
    CHECK(received->getUUIDStr() == expected->getUUIDStr());
    CHECK(received->getAttributes() == expected->getAttributes());
    CHECK(received->getQueueId() == "q1");
    CHECK(received->getSize() == expected->getSize());
    CHECK(received->getEntryDate() == expected->getEntryDate());
    CHECK(received->getLineageStartDate() == expected->getLineageStartDate());
    CHECK(received->getPenaltyExpiration() == expected->getPenaltyExpiration());
    if (expected->getContentClaim()) {
      REQUIRE(received->getContentClaim());
      CHECK(asString(fixture.receiver_content->readAll(*received->getContentClaim()))
          == asString(fixture.sender_content->readAll(*expected->getContentClaim())));
    } else {
      CHECK_FALSE(received->getContentClaim());
    }
  }
}

TEST_CASE("The space check honors the backpressure of the destination queue", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  fixture.queue->setBackpressureThresholds(1, 0);
  fixture.queue->put(fixture.createFlowFile("queued.txt", ""));
  std::vector<std::shared_ptr<core::FlowFile>> flow_files{fixture.createFlowFile("a.txt", "a")};

  SECTION("The client asks for space and stops when the queue is full") {
    ScriptedConnection client_connection(codes({protocol::VERSION_ACCEPTED, protocol::QUEUE_FULL}));
    CHECK(fixture.client.sendFlowFiles(client_connection, "q1", flow_files, false, true) == loadbalance::TransactionResult::QUEUE_FULL);

    CHECK(fixture.receive(client_connection.getOutgoing()) == codes({protocol::VERSION_ACCEPTED, protocol::QUEUE_FULL}));
    CHECK(fixture.queue->size() == 1);
    CHECK(fixture.receiver_flow_files->getRecordCount() == 0);
  }
  SECTION("A client skipping the space check is accepted regardless") {
    CHECK(fixture.receive(fixture.send(flow_files)) == CONFIRMED);
    CHECK(fixture.queue->size() == 2);
  }
  SECTION("The client sends once there is space") {
    REQUIRE(fixture.queue->poll());
    ScriptedConnection client_connection(codes({protocol::VERSION_ACCEPTED, protocol::SPACE_AVAILABLE, protocol::CONFIRM_CHECKSUM, protocol::CONFIRM_COMPLETE_TRANSACTION}));
    CHECK(fixture.client.sendFlowFiles(client_connection, "q1", flow_files, false, true) == loadbalance::TransactionResult::COMPLETE);

    CHECK(fixture.receive(client_connection.getOutgoing())
        == codes({protocol::VERSION_ACCEPTED, protocol::SPACE_AVAILABLE, protocol::CONFIRM_CHECKSUM, protocol::CONFIRM_COMPLETE_TRANSACTION}));
    CHECK(fixture.queue->size() == 1);
  }
}

TEST_CASE("A resent transaction is received once", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  std::vector<std::shared_ptr<core::FlowFile>> flow_files{
      fixture.createFlowFile("a.txt", "a"),
      fixture.createFlowFile("b.txt", "bb"),
      fixture.createFlowFile("c.txt", "ccc")};
  const auto transcript = fixture.send(flow_files);

  CHECK(fixture.receive(transcript) == CONFIRMED);
  // the sender did not see the confirmation and resends the same batch
  CHECK(fixture.receive(transcript) == CONFIRMED);
  CHECK(fixture.queue->size() == 3);
  CHECK(fixture.receiver_flow_files->getRecordCount() == 3);
  CHECK(fixture.receiver.getDuplicateCount() == 3);

  SECTION("Transfers are remembered after the FlowFiles left the queue") {
    CHECK(fixture.queue->poll(3).size() == 3);
    CHECK(fixture.receive(transcript) == CONFIRMED);
    CHECK(fixture.queue->isEmpty());
    CHECK(fixture.receiver.getDuplicateCount() == 6);
  }
}

TEST_CASE("A FlowFile sent twice in a transaction is received once", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  auto flow_file = fixture.createFlowFile("a.txt", "content");
  CHECK(fixture.receive(fixture.send({flow_file, flow_file})) == CONFIRMED);

  CHECK(fixture.queue->size() == 1);
  CHECK(fixture.receiver.getDuplicateCount() == 1);
  // the content of the duplicate is not stored
  auto received = fixture.queue->poll();
  CHECK(fixture.receiver_claims->getClaimantCount(received->getResourceClaim()) == 1);
}

TEST_CASE("A checksum mismatch aborts the transaction", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  std::vector<std::shared_ptr<core::FlowFile>> flow_files{fixture.createFlowFile("a.txt", "content")};

  SECTION("Receiving side") {
    auto transcript = fixture.send(flow_files);
    // corrupt the checksum, the sender answers the rejection with an abort
    transcript[transcript.size() - 2] ^= std::byte{0xff};
    transcript.back() = static_cast<std::byte>(protocol::ABORT_TRANSACTION);

    ScriptedConnection connection(transcript);
    CHECK_THROWS_AS(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"), flowstore::TransactionAbortedException);
    CHECK(connection.getOutgoing() == codes({protocol::VERSION_ACCEPTED, protocol::REJECT_CHECKSUM}));
    CHECK(fixture.queue->isEmpty());
    CHECK(fixture.receiver_flow_files->getRecordCount() == 0);
    // the received content is released
    CHECK(fixture.receiver_content->reclaim() == 1);
  }
  SECTION("Sending side") {
    ScriptedConnection connection(codes({protocol::VERSION_ACCEPTED, protocol::REJECT_CHECKSUM}));
    CHECK_THROWS_AS(fixture.client.sendFlowFiles(connection, "q1", flow_files, false, false), flowstore::TransactionAbortedException);
    CHECK(connection.getOutgoing().back() == static_cast<std::byte>(protocol::ABORT_TRANSACTION));
  }
}

TEST_CASE("An aborted data transfer commits nothing", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  auto transcript = fixture.send({fixture.createFlowFile("a.txt", "content")});
  transcript.resize(transcript.size() - TRANSACTION_TRAILER_SIZE);
  transcript.push_back(static_cast<std::byte>(protocol::ABORT_DATA_TRANSFER));

  ScriptedConnection connection(transcript);
  CHECK_THROWS_AS(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"), flowstore::TransactionAbortedException);
  CHECK(fixture.queue->isEmpty());
  CHECK(fixture.receiver_flow_files->getRecordCount() == 0);
  CHECK(fixture.receiver_content->reclaim() == 1);
}

TEST_CASE("A transaction cut short commits nothing", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  auto transcript = fixture.send({fixture.createFlowFile("a.txt", "content"), fixture.createFlowFile("b.txt", "more content")});
  transcript.resize(transcript.size() / 2);

  ScriptedConnection connection(transcript);
  CHECK_THROWS_AS(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"), flowstore::Exception);
  CHECK(fixture.queue->isEmpty());
  CHECK(fixture.receiver_flow_files->getRecordCount() == 0);
}

TEST_CASE("FlowFiles sent to an unknown queue are refused", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;
  const auto transcript = fixture.send({fixture.createFlowFile("a.txt", "content")}, false, "removed-queue");

  ScriptedConnection connection(transcript);
  CHECK_THROWS_AS(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"), flowstore::Exception);
  CHECK(fixture.queue->isEmpty());
  CHECK(fixture.receiver_flow_files->getRecordCount() == 0);
}

TEST_CASE("The protocol version is negotiated", "[LoadBalanceProtocol]") {
  LoadBalanceFixture fixture;

  SECTION("The receiving side requests the version it speaks") {
    auto transcript = codes({2});
    const auto transaction = fixture.send({fixture.createFlowFile("a.txt", "content")});
    transcript.insert(transcript.end(), transaction.begin(), transaction.end());

    CHECK(fixture.receive(transcript) == codes({protocol::REQUEST_DIFFERENT_VERSION, protocol::PROTOCOL_VERSION,
        protocol::VERSION_ACCEPTED, protocol::CONFIRM_CHECKSUM, protocol::CONFIRM_COMPLETE_TRANSACTION}));
    CHECK(fixture.queue->size() == 1);
  }
  SECTION("The receiving side gives up after repeated unknown versions") {
    ScriptedConnection connection(codes({2, 3, 4}));
    CHECK_THROWS_AS(fixture.receiver.receiveFlowFiles(connection, "127.0.0.1:50000"), flowstore::Exception);
    CHECK(connection.getOutgoing().back() == static_cast<std::byte>(protocol::ABORT_PROTOCOL_NEGOTIATION));
  }
  SECTION("The sending side aborts when asked for another version") {
    ScriptedConnection connection(codes({protocol::REQUEST_DIFFERENT_VERSION, 2}));
    CHECK_THROWS_AS(fixture.client.sendFlowFiles(connection, "q1", {fixture.createFlowFile("a.txt", "content")}, false, false), flowstore::Exception);
    CHECK(connection.getOutgoing() == codes({protocol::PROTOCOL_VERSION, protocol::ABORT_PROTOCOL_NEGOTIATION}));
  }
}
