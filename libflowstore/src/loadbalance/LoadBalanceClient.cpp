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
#include "loadbalance/LoadBalanceClient.h"

#include <algorithm>
#include <utility>

#include "Exception.h"
#include "core/logging/LoggerFactory.h"
#include "io/BufferStream.h"
#include "io/CRCStream.h"
#include "io/Gzip.h"
#include "loadbalance/LoadBalanceFlowFileCodec.h"
#include "loadbalance/LoadBalanceProtocolConstants.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::loadbalance {

namespace {

void writeCode(io::OutputStream& stream, uint8_t code) {
  if (stream.write(code) != 1) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to write to the load-balance connection");
  }
}

void writeBlock(io::OutputStream& stream, std::span<const std::byte> block) {
  if (stream.write(gsl::narrow<uint32_t>(block.size())) != 4 || stream.write(block) != block.size()) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to write to the load-balance connection");
  }
}

uint8_t readCode(io::InputStream& stream) {
  uint8_t code = 0;
  if (stream.read(code) != 1) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Load-balance connection closed while waiting for the response of the peer");
  }
  return code;
}

}  // namespace

LoadBalanceClient::LoadBalanceClient(std::string local_node_id, std::shared_ptr<core::ContentRepository> content_repository)
    : local_node_id_(std::move(local_node_id)),
      content_repository_(std::move(content_repository)),
      logger_(core::logging::LoggerFactory<LoadBalanceClient>::getLogger()) {
}

void LoadBalanceClient::negotiateVersion(io::BaseStream& stream) {
  writeCode(stream, protocol::PROTOCOL_VERSION);
  const auto response = readCode(stream);
  switch (response) {
    case protocol::VERSION_ACCEPTED:
      return;
    case protocol::REQUEST_DIFFERENT_VERSION: {
      uint8_t preferred_version = 0;
      if (stream.read(preferred_version) != 1) {
        throw Exception(LOAD_BALANCE_EXCEPTION, "Load-balance connection closed during version negotiation");
      }
      writeCode(stream, protocol::ABORT_PROTOCOL_NEGOTIATION);
      throw Exception(PROTOCOL_EXCEPTION, "Peer requested load-balance protocol version " + std::to_string(preferred_version)
          + ", only version " + std::to_string(protocol::PROTOCOL_VERSION) + " is supported");
    }
    case protocol::ABORT_PROTOCOL_NEGOTIATION:
      throw Exception(PROTOCOL_EXCEPTION, "Peer does not support load-balance protocol version " + std::to_string(protocol::PROTOCOL_VERSION));
    default:
      throw Exception(PROTOCOL_EXCEPTION, "Unexpected response " + std::to_string(response) + " to the load-balance protocol version");
  }
}

TransactionResult LoadBalanceClient::sendFlowFiles(io::BaseStream& stream, const std::string& connection_id, const std::vector<std::shared_ptr<core::FlowFile>>& flow_files,
    bool compress, bool honor_backpressure) {
  negotiateVersion(stream);
  if (io::isError(stream.write(local_node_id_, true)) || io::isError(stream.write(connection_id, true))) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to write to the load-balance connection");
  }

  if (honor_backpressure) {
    writeCode(stream, protocol::CHECK_SPACE);
    const auto response = readCode(stream);
    if (response == protocol::QUEUE_FULL) {
      logger_->log_debug("Queue {} of the peer is full, not sending {} FlowFiles", connection_id, flow_files.size());
      return TransactionResult::QUEUE_FULL;
    }
    if (response != protocol::SPACE_AVAILABLE) {
      throw Exception(PROTOCOL_EXCEPTION, "Unexpected response " + std::to_string(response) + " to the space check");
    }
  } else {
    writeCode(stream, protocol::SKIP_SPACE_CHECK);
  }

  io::CRCStream crc_stream(gsl::make_not_null(&stream));
  writeCode(crc_stream, compress ? protocol::COMPRESSION_GZIP : protocol::COMPRESSION_NONE);
  for (const auto& flow_file : flow_files) {
    sendFlowFile(crc_stream, *flow_file, compress);
  }
  writeCode(crc_stream, protocol::NO_MORE_FLOWFILES);

  writeCode(stream, protocol::CONFIRM_CHECKSUM);
  if (stream.write(crc_stream.getCRC()) != 8) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to write to the load-balance connection");
  }
  const auto checksum_response = readCode(stream);
  if (checksum_response == protocol::REJECT_CHECKSUM) {
    writeCode(stream, protocol::ABORT_TRANSACTION);
    throw TransactionAbortedException("the peer rejected the checksum of " + std::to_string(flow_files.size()) + " FlowFiles");
  }
  if (checksum_response != protocol::CONFIRM_CHECKSUM) {
    throw Exception(PROTOCOL_EXCEPTION, "Unexpected response " + std::to_string(checksum_response) + " to the checksum");
  }

  writeCode(stream, protocol::COMPLETE_TRANSACTION);
  const auto completion_response = readCode(stream);
  if (completion_response != protocol::CONFIRM_COMPLETE_TRANSACTION) {
    throw Exception(PROTOCOL_EXCEPTION, "Unexpected response " + std::to_string(completion_response) + " to the completion of the transaction");
  }
  logger_->log_debug("Sent {} FlowFiles to queue {}", flow_files.size(), connection_id);
  return TransactionResult::COMPLETE;
}

void LoadBalanceClient::sendFlowFile(io::OutputStream& stream, const core::FlowFile& flow_file, bool compress) {
  writeCode(stream, protocol::MORE_FLOWFILES);

  io::BufferStream attributes;
  if (!LoadBalanceFlowFileCodec::encode(flow_file, attributes)) {
    throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to encode the attributes of FlowFile " + flow_file.getUUIDStr());
  }
  if (compress) {
    auto compressed = io::gzip::compress(attributes.getBuffer());
    if (!compressed) {
      throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to compress the attributes of FlowFile " + flow_file.getUUIDStr());
    }
    writeBlock(stream, *compressed);
  } else {
    writeBlock(stream, attributes.getBuffer());
  }

  sendContent(stream, flow_file, compress);
}

void LoadBalanceClient::sendContent(io::OutputStream& stream, const core::FlowFile& flow_file, bool compress) {
  const auto& claim = flow_file.getContentClaim();
  if (!claim || claim->getLength() <= 0) {
    writeCode(stream, protocol::NO_DATA_FRAME);
    return;
  }

  std::shared_ptr<io::InputStream> content;
  try {
    content = content_repository_->read(*claim);
  } catch (const ContentNotFoundException&) {
    writeCode(stream, protocol::ABORT_DATA_TRANSFER);
    throw;
  }

  const auto expected = static_cast<uint64_t>(claim->getLength());
  uint64_t sent = 0;
  std::vector<std::byte> buffer(protocol::MAX_DATA_FRAME_SIZE);
  while (sent < expected) {
    const auto to_read = static_cast<size_t>(std::min<uint64_t>(buffer.size(), expected - sent));
    const auto read = content->read(std::span(buffer.data(), to_read));
    if (io::isError(read) || read == 0) {
      writeCode(stream, protocol::ABORT_DATA_TRANSFER);
      throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to read the content of FlowFile " + flow_file.getUUIDStr() + " after " + std::to_string(sent) + " bytes");
    }
    const std::span<const std::byte> frame(buffer.data(), read);
    if (compress) {
      auto compressed = io::gzip::compress(frame);
      if (!compressed) {
        writeCode(stream, protocol::ABORT_DATA_TRANSFER);
        throw Exception(LOAD_BALANCE_EXCEPTION, "Failed to compress the content of FlowFile " + flow_file.getUUIDStr());
      }
      writeCode(stream, protocol::DATA_FRAME_FOLLOWS);
      writeBlock(stream, *compressed);
    } else {
      writeCode(stream, protocol::DATA_FRAME_FOLLOWS);
      writeBlock(stream, frame);
    }
    sent += read;
  }
  writeCode(stream, protocol::NO_DATA_FRAME);
}

}  // namespace org::apache::nifi::flowstore::loadbalance
