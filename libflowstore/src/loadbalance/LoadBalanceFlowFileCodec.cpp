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
#include "loadbalance/LoadBalanceFlowFileCodec.h"

#include <utility>

#include "utils/gsl.h"

namespace org::apache::nifi::flowstore::loadbalance {

bool LoadBalanceFlowFileCodec::encode(const core::FlowFile& flow_file, io::OutputStream& stream) {
  const auto& attributes = flow_file.getAttributes();
  if (stream.write(gsl::narrow<uint32_t>(attributes.size())) != 4) {
    return false;
  }
  for (const auto& [key, value] : attributes) {
    if (io::isError(stream.write(key, true)) || io::isError(stream.write(value, true))) {
      return false;
    }
  }
  return stream.write(core::FlowFile::toMillis(flow_file.getLineageStartDate())) == 8
      && stream.write(core::FlowFile::toMillis(flow_file.getEntryDate())) == 8
      && stream.write(core::FlowFile::toMillis(flow_file.getPenaltyExpiration())) == 8;
}

std::optional<LoadBalancedAttributes> LoadBalanceFlowFileCodec::decode(io::InputStream& stream) {
  uint32_t attribute_count = 0;
  if (stream.read(attribute_count) != 4) {
    return std::nullopt;
  }
  LoadBalancedAttributes result;
  for (uint32_t i = 0; i < attribute_count; ++i) {
    std::string key;
    std::string value;
    if (io::isError(stream.read(key, true)) || io::isError(stream.read(value, true))) {
      return std::nullopt;
    }
    result.attributes[std::move(key)] = std::move(value);
  }
  uint64_t lineage_start_date = 0;
  uint64_t entry_date = 0;
  uint64_t penalty_expiration = 0;
  if (stream.read(lineage_start_date) != 8 || stream.read(entry_date) != 8 || stream.read(penalty_expiration) != 8) {
    return std::nullopt;
  }
  result.lineage_start_date = core::FlowFile::fromMillis(lineage_start_date);
  result.entry_date = core::FlowFile::fromMillis(entry_date);
  result.penalty_expiration = core::FlowFile::fromMillis(penalty_expiration);
  return result;
}

}  // namespace org::apache::nifi::flowstore::loadbalance
