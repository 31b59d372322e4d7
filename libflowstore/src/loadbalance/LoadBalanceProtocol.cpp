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
#include "loadbalance/LoadBalanceProtocol.h"

#include <utility>

#include "Exception.h"
#include "core/RepositoryRecord.h"
#include "core/logging/LoggerFactory.h"
#include "io/BufferStream.h"
#include "io/CRCStream.h"
#include "io/Gzip.h"
#include "loadbalance/LoadBalanceFlowFileCodec.h"
#include "loadbalance/LoadBalanceProtocolConstants.h"
#include "utils/Id.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::loadbalance {

namespace {

constexpr int MAX_VERSION_PROPOSALS = 3;

uint8_t readCode(io::InputStream& stream) {
  uint8_t code = 0;
  if (stream.read(code) != 1) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Load-balance connection closed in the middle of a transaction");
  }
  return code;
}

void writeCode(io::OutputStream& stream, uint8_t code) {
  if (stream.write(code) != 1) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to write to the load-balance connection");
  }
}

std::vector<std::byte> readBlock(io::InputStream& stream, uint32_t max_length, const char* description) {
  uint32_t length = 0;
  if (stream.read(length) != 4) {
    throw Exception(LOAD_BALANCE_EXCEPTION, std::string("Load-balance connection closed while reading the length of ") + description);
  }
  if (length > max_length) {
    throw Exception(PROTOCOL_EXCEPTION, std::string("Length ") + std::to_string(length) + " of " + description + " exceeds the limit of " + std::to_string(max_length));
  }
  std::vector<std::byte> block(length);
  if (length > 0 && stream.readFully(block) != length) {
    throw Exception(LOAD_BALANCE_EXCEPTION, std::string("Load-balance connection closed while reading ") + description);
  }
  return block;
}

std::vector<std::byte> decompressIfNeeded(std::vector<std::byte> block, bool compressed, const char* description) {
  if (!compressed) {
    return block;
  }
  auto decompressed = io::gzip::decompress(block);
  if (!decompressed) {
    throw Exception(PROTOCOL_EXCEPTION, std::string("Failed to decompress ") + description);
  }
  return std::move(*decompressed);
}

}  // namespace

LoadBalanceProtocol::ReceivedFlowFiles::~ReceivedFlowFiles() {
  if (committed) {
    return;
  }
  for (const auto& flow_file : flow_files) {
    if (auto claim = flow_file->getResourceClaim()) {
      claim_manager_->decrementClaimantCount(claim);
    }
  }
}

LoadBalanceProtocol::LoadBalanceProtocol(std::shared_ptr<core::FlowFileRepository> flow_file_repository, std::shared_ptr<core::ContentRepository> content_repository,
    std::shared_ptr<core::QueueProvider> queue_provider, size_t max_remembered_transfers)
    : flow_file_repository_(std::move(flow_file_repository)),
      content_repository_(std::move(content_repository)),
      queue_provider_(std::move(queue_provider)),
      max_remembered_transfers_(max_remembered_transfers),
      logger_(core::logging::LoggerFactory<LoadBalanceProtocol>::getLogger()) {
}

bool LoadBalanceProtocol::negotiateVersion(io::BaseStream& stream, const std::string& peer_description) {
  uint8_t version = 0;
  if (stream.read(version) != 1) {
    logger_->log_debug("{} closed the load-balance connection", peer_description);
    return false;
  }
  for (int proposal = 1; version != protocol::PROTOCOL_VERSION; ++proposal) {
    if (proposal >= MAX_VERSION_PROPOSALS) {
      writeCode(stream, protocol::ABORT_PROTOCOL_NEGOTIATION);
      throw Exception(PROTOCOL_EXCEPTION, "Could not agree on a load-balance protocol version with " + peer_description);
    }
    logger_->log_debug("{} proposed load-balance protocol version {}, requesting version {}", peer_description, version, protocol::PROTOCOL_VERSION);
    writeCode(stream, protocol::REQUEST_DIFFERENT_VERSION);
    writeCode(stream, protocol::PROTOCOL_VERSION);
    const auto response = readCode(stream);
    if (response == protocol::ABORT_PROTOCOL_NEGOTIATION) {
      throw Exception(PROTOCOL_EXCEPTION, peer_description + " aborted the load-balance protocol negotiation");
    }
    version = response;
  }
  writeCode(stream, protocol::VERSION_ACCEPTED);
  return true;
}

bool LoadBalanceProtocol::receiveFlowFiles(io::BaseStream& stream, const std::string& peer_description) {
  if (!negotiateVersion(stream, peer_description)) {
    return false;
  }

  std::string node_id;
  std::string connection_id;
  if (io::isError(stream.read(node_id, true)) || io::isError(stream.read(connection_id, true))) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to read the transaction header of " + peer_description);
  }
  auto queue = queue_provider_->getQueue(connection_id);
  if (!queue) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Node " + node_id + " sent FlowFiles to the unknown queue " + connection_id);
  }

  const auto space_check = readCode(stream);
  if (space_check == protocol::CHECK_SPACE) {
    if (queue->isFull()) {
      logger_->log_debug("Queue {} is full, rejecting the transaction of node {}", connection_id, node_id);
      writeCode(stream, protocol::QUEUE_FULL);
      return true;
    }
    writeCode(stream, protocol::SPACE_AVAILABLE);
  } else if (space_check != protocol::SKIP_SPACE_CHECK) {
    throw Exception(PROTOCOL_EXCEPTION, "Expected a space check request from " + peer_description + ", got " + std::to_string(space_check));
  }

  ReceivedFlowFiles received(content_repository_->getResourceClaimManager());
  io::CRCStream crc_stream(gsl::make_not_null(&stream));
  const auto compression = readCode(crc_stream);
  if (compression != protocol::COMPRESSION_NONE && compression != protocol::COMPRESSION_GZIP) {
    throw Exception(PROTOCOL_EXCEPTION, "Unknown compression " + std::to_string(compression) + " requested by " + peer_description);
  }
  const bool compressed = compression == protocol::COMPRESSION_GZIP;

  while (true) {
    const auto code = readCode(crc_stream);
    if (code == protocol::NO_MORE_FLOWFILES) {
      break;
    }
    if (code == protocol::ABORT_DATA_TRANSFER) {
      throw TransactionAbortedException(peer_description + " aborted the transfer to queue " + connection_id);
    }
    if (code != protocol::MORE_FLOWFILES) {
      throw Exception(PROTOCOL_EXCEPTION, "Unexpected code " + std::to_string(code) + " from " + peer_description + " while receiving FlowFiles");
    }
    receiveFlowFile(crc_stream, compressed, *queue, received);
  }
  const auto calculated_checksum = crc_stream.getCRC();

  if (readCode(stream) != protocol::CONFIRM_CHECKSUM) {
    throw Exception(PROTOCOL_EXCEPTION, "Expected the checksum of the transaction from " + peer_description);
  }
  uint64_t checksum = 0;
  if (stream.read(checksum) != 8) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Load-balance connection closed while reading the checksum of " + peer_description);
  }
  if (checksum != calculated_checksum) {
    logger_->log_error("Checksum {} of the transaction from {} does not match the calculated checksum {}", checksum, peer_description, calculated_checksum);
    writeCode(stream, protocol::REJECT_CHECKSUM);
    if (readCode(stream) != protocol::ABORT_TRANSACTION) {
      throw Exception(PROTOCOL_EXCEPTION, peer_description + " did not abort the transaction after its checksum was rejected");
    }
    throw TransactionAbortedException("checksum mismatch in the transaction from " + peer_description);
  }
  writeCode(stream, protocol::CONFIRM_CHECKSUM);

  const auto completion = readCode(stream);
  if (completion == protocol::ABORT_TRANSACTION) {
    throw TransactionAbortedException(peer_description + " aborted the transaction to queue " + connection_id);
  }
  if (completion != protocol::COMPLETE_TRANSACTION) {
    throw Exception(PROTOCOL_EXCEPTION, "Expected the completion of the transaction from " + peer_description + ", got " + std::to_string(completion));
  }

  {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    std::vector<core::RepositoryRecord> records;
    std::vector<std::shared_ptr<core::FlowFile>> accepted;
    records.reserve(received.flow_files.size());
    for (const auto& flow_file : received.flow_files) {
      // a concurrent transaction may have delivered the same FlowFile meanwhile
      if (transferred_uuids_.contains(flow_file->getUUIDStr()) || queue->contains(flow_file->getUUIDStr())) {
        ++duplicate_count_;
        if (auto claim = flow_file->getResourceClaim()) {
          content_repository_->getResourceClaimManager()->decrementClaimantCount(claim);
        }
        continue;
      }
      flow_file->setQueueId(connection_id);
      records.push_back(core::RepositoryRecord::create(flow_file, connection_id));
      accepted.push_back(flow_file);
    }
    received.flow_files = accepted;

    flow_file_repository_->updateRepository(records);
    received.committed = true;
    queue->putAll(accepted);
    rememberTransfers(accepted);
  }

  writeCode(stream, protocol::CONFIRM_COMPLETE_TRANSACTION);
  logger_->log_info("Received {} FlowFiles from node {} into queue {}", received.flow_files.size(), node_id, connection_id);
  return true;
}

void LoadBalanceProtocol::receiveFlowFile(io::InputStream& stream, bool compressed, const core::FlowFileQueue& queue, ReceivedFlowFiles& received) {
  auto block = decompressIfNeeded(readBlock(stream, protocol::MAX_ATTRIBUTE_BLOCK_SIZE, "the attributes of a FlowFile"), compressed, "the attributes of a FlowFile");
  io::BufferStream attribute_stream(block);
  auto attributes = LoadBalanceFlowFileCodec::decode(attribute_stream);
  if (!attributes) {
    throw Exception(PROTOCOL_EXCEPTION, "Malformed attributes of a FlowFile in queue " + queue.getIdentifier());
  }

  std::optional<utils::Identifier> uuid;
  if (auto it = attributes->attributes.find(core::SpecialFlowAttribute::UUID); it != attributes->attributes.end()) {
    uuid = utils::Identifier::parse(it->second);
  }
  if (!uuid) {
    uuid = utils::IdGenerator::getIdGenerator()->generate();
    logger_->log_warn("Received a FlowFile without a valid uuid in queue {}, assigning {}", queue.getIdentifier(), uuid->to_string());
  }

  if (isDuplicate(uuid->to_string(), queue, received)) {
    ++duplicate_count_;
    logger_->log_debug("FlowFile {} has already been received into queue {}, skipping it", uuid->to_string(), queue.getIdentifier());
    receiveContent(stream, compressed, true);
    return;
  }

  auto flow_file = std::make_shared<core::FlowFile>(flow_file_repository_->getNextFlowFileSequence(), *uuid);
  for (const auto& [key, value] : attributes->attributes) {
    if (key != core::SpecialFlowAttribute::UUID) {
      flow_file->setAttribute(key, value);
    }
  }
  flow_file->setLineageStartDate(attributes->lineage_start_date);
  flow_file->setEntryDate(attributes->entry_date);
  flow_file->setPenaltyExpiration(attributes->penalty_expiration);
  if (auto claim = receiveContent(stream, compressed, false)) {
    flow_file->setContentClaim(std::move(claim));
  }
  received.uuids.insert(flow_file->getUUIDStr());
  received.flow_files.push_back(std::move(flow_file));
}

std::shared_ptr<core::ContentClaim> LoadBalanceProtocol::receiveContent(io::InputStream& stream, bool compressed, bool discard) {
  std::shared_ptr<core::ContentClaim> claim;
  std::unique_ptr<io::OutputStream> writer;
  bool complete = false;
  auto release_incomplete = gsl::finally([&] {
    if (!complete && claim) {
      writer.reset();
      content_repository_->getResourceClaimManager()->decrementClaimantCount(claim->getResourceClaim());
    }
  });

  while (true) {
    const auto code = readCode(stream);
    if (code == protocol::NO_DATA_FRAME) {
      break;
    }
    if (code == protocol::ABORT_DATA_TRANSFER) {
      throw TransactionAbortedException("the peer aborted the transfer of content");
    }
    if (code != protocol::DATA_FRAME_FOLLOWS) {
      throw Exception(PROTOCOL_EXCEPTION, "Unexpected code " + std::to_string(code) + " while receiving content");
    }
    auto frame = readBlock(stream, protocol::MAX_WIRE_FRAME_SIZE, "a data frame");
    if (discard) {
      continue;
    }
    frame = decompressIfNeeded(std::move(frame), compressed, "a data frame");
    if (!claim) {
      claim = content_repository_->create(false);
      writer = content_repository_->write(claim);
    }
    if (writer->write(std::span<const std::byte>(frame)) != frame.size()) {
      throw Exception(FILE_OPERATION_EXCEPTION, "Failed to write received content to " + claim->getResourceClaim()->getKey());
    }
  }

  if (writer) {
    writer->close();
    writer.reset();
  }
  complete = true;
  return claim;
}

bool LoadBalanceProtocol::isDuplicate(const std::string& uuid, const core::FlowFileQueue& queue, const ReceivedFlowFiles& received) const {
  if (received.uuids.contains(uuid) || queue.contains(uuid)) {
    return true;
  }
  std::lock_guard<std::mutex> lock(transfers_mutex_);
  return transferred_uuids_.contains(uuid);
}

void LoadBalanceProtocol::rememberTransfers(const std::vector<std::shared_ptr<core::FlowFile>>& flow_files) {
  for (const auto& flow_file : flow_files) {
    auto uuid = flow_file->getUUIDStr();
    if (transferred_uuids_.insert(uuid).second) {
      transfer_order_.push_back(std::move(uuid));
    }
  }
  while (transfer_order_.size() > max_remembered_transfers_) {
    transferred_uuids_.erase(transfer_order_.front());
    transfer_order_.pop_front();
  }
}

}  // namespace org::apache::nifi::flowstore::loadbalance
