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
#include "core/FlowFileRecord.h"

#include <utility>

#include "core/logging/LoggerFactory.h"
#include "io/BufferStream.h"
#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::core {

namespace {
std::shared_ptr<logging::Logger> logger = logging::LoggerFactory<FlowFileRecord>::getLogger();

bool isFailedStringOp(size_t ret) {
  return ret == 0 || io::isError(ret);
}
}  // namespace

bool FlowFileRecord::Serialize(io::OutputStream& output_stream) const {
  gsl_Expects(flow_file);
  if (output_stream.write(SERIALIZATION_VERSION) != 4) {
    return false;
  }
  if (output_stream.write(flow_file->getId()) != 8) {
    return false;
  }
  if (isFailedStringOp(output_stream.write(flow_file->getUUID()))) {
    return false;
  }
  for (auto time_point : {flow_file->getEntryDate(), flow_file->getLineageStartDate(), flow_file->getPenaltyExpiration()}) {
    if (output_stream.write(FlowFile::toMillis(time_point)) != 8) {
      return false;
    }
  }
  if (io::isError(output_stream.write(flow_file->getQueueId()))) {
    return false;
  }

  const auto& attributes = flow_file->getAttributes();
  if (output_stream.write(gsl::narrow<uint32_t>(attributes.size())) != 4) {
    return false;
  }
  for (const auto& [key, value] : attributes) {
    if (isFailedStringOp(output_stream.write(key, true)) || io::isError(output_stream.write(value, true))) {
      return false;
    }
  }

  const auto& claim = flow_file->getContentClaim();
  if (output_stream.write(claim != nullptr) != 1) {
    return false;
  }
  if (claim) {
    const auto& resource_claim = claim->getResourceClaim();
    if (isFailedStringOp(output_stream.write(resource_claim->getContainer()))
        || isFailedStringOp(output_stream.write(resource_claim->getSection()))
        || isFailedStringOp(output_stream.write(resource_claim->getId()))
        || output_stream.write(resource_claim->isLossTolerant()) != 1
        || output_stream.write(claim->getOffset()) != 8
        || output_stream.write(static_cast<uint64_t>(claim->getLength())) != 8) {
      return false;
    }
  }
  if (output_stream.write(flow_file->getSize()) != 8) {
    return false;
  }
  return !io::isError(output_stream.write(swap_location));
}

std::vector<std::byte> FlowFileRecord::Serialize() const {
  io::BufferStream stream;
  if (!Serialize(stream)) {
    return {};
  }
  return stream.moveBuffer();
}

std::optional<FlowFileRecord> FlowFileRecord::DeSerialize(io::InputStream& input_stream, ResourceClaimManager& claim_manager, ClaimTracking tracking) {
  uint32_t version = 0;
  if (input_stream.read(version) != 4) {
    return std::nullopt;
  }
  if (version != SERIALIZATION_VERSION) {
    logger->log_error("Unsupported FlowFile record version {}", version);
    return std::nullopt;
  }

  uint64_t id = 0;
  if (input_stream.read(id) != 8) {
    return std::nullopt;
  }
  utils::Identifier uuid;
  if (isFailedStringOp(input_stream.read(uuid))) {
    return std::nullopt;
  }
  auto flow_file = std::make_shared<FlowFile>(id, uuid);

  uint64_t entry_date = 0;
  uint64_t lineage_start_date = 0;
  uint64_t penalty_expiration = 0;
  if (input_stream.read(entry_date) != 8 || input_stream.read(lineage_start_date) != 8 || input_stream.read(penalty_expiration) != 8) {
    return std::nullopt;
  }
  flow_file->setEntryDate(FlowFile::fromMillis(entry_date));
  flow_file->setLineageStartDate(FlowFile::fromMillis(lineage_start_date));
  flow_file->setPenaltyExpiration(FlowFile::fromMillis(penalty_expiration));

  std::string queue_id;
  if (io::isError(input_stream.read(queue_id))) {
    return std::nullopt;
  }
  flow_file->setQueueId(std::move(queue_id));

  uint32_t num_attributes = 0;
  if (input_stream.read(num_attributes) != 4) {
    return std::nullopt;
  }
  for (uint32_t i = 0; i < num_attributes; ++i) {
    std::string key;
    std::string value;
    if (isFailedStringOp(input_stream.read(key, true)) || io::isError(input_stream.read(value, true))) {
      return std::nullopt;
    }
    flow_file->setAttribute(key, std::move(value));
  }

  bool has_claim = false;
  if (input_stream.read(has_claim) != 1) {
    return std::nullopt;
  }
  if (has_claim) {
    std::string container;
    std::string section;
    std::string claim_id;
    bool loss_tolerant = false;
    uint64_t offset = 0;
    uint64_t length = 0;
    if (isFailedStringOp(input_stream.read(container))
        || isFailedStringOp(input_stream.read(section))
        || isFailedStringOp(input_stream.read(claim_id))
        || input_stream.read(loss_tolerant) != 1
        || input_stream.read(offset) != 8
        || input_stream.read(length) != 8) {
      return std::nullopt;
    }
    std::shared_ptr<ResourceClaim> resource_claim;
    if (tracking == ClaimTracking::Register) {
      resource_claim = claim_manager.newResourceClaim(container, section, claim_id, loss_tolerant, false);
    } else if (!(resource_claim = claim_manager.getResourceClaim(container, section, claim_id))) {
      resource_claim = std::make_shared<ResourceClaim>(container, section, claim_id, loss_tolerant, false);
    }
    flow_file->setContentClaim(std::make_shared<ContentClaim>(std::move(resource_claim), offset, static_cast<int64_t>(length)));
  }

  uint64_t size = 0;
  if (input_stream.read(size) != 8) {
    return std::nullopt;
  }
  flow_file->setSize(size);

  FlowFileRecord record{std::move(flow_file), {}};
  if (io::isError(input_stream.read(record.swap_location))) {
    return std::nullopt;
  }
  return record;
}

std::optional<FlowFileRecord> FlowFileRecord::DeSerialize(std::span<const std::byte> buffer, ResourceClaimManager& claim_manager, ClaimTracking tracking) {
  io::BufferStream stream(buffer);
  return DeSerialize(stream, claim_manager, tracking);
}

}  // namespace org::apache::nifi::flowstore::core
