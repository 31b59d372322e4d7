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
#include "core/ContentRepository.h"

#include "Exception.h"

namespace org::apache::nifi::flowstore::core {

std::shared_ptr<ContentClaim> ContentRepository::importFrom(std::span<const std::byte> data, bool loss_tolerant) {
  auto claim = create(loss_tolerant);
  auto stream = write(claim);
  if (stream->write(data) != data.size()) {
    stream->close();
    claim_manager_->decrementClaimantCount(claim->getResourceClaim());
    throw Exception(FILE_OPERATION_EXCEPTION, "Failed to write content of " + claim->to_string());
  }
  stream->close();
  return claim;
}

std::vector<std::byte> ContentRepository::readAll(const ContentClaim& claim) {
  auto stream = read(claim);
  std::vector<std::byte> buffer(stream->size());
  if (!buffer.empty() && stream->readFully(buffer) != buffer.size()) {
    throw ContentNotFoundException(claim.to_string());
  }
  return buffer;
}

}  // namespace org::apache::nifi::flowstore::core
