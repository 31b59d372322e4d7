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
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/FlowFile.h"
#include "core/ResourceClaimManager.h"
#include "io/InputStream.h"
#include "io/OutputStream.h"

namespace org::apache::nifi::flowstore::core {

enum class ClaimTracking {
  // resource claims the claim manager does not know yet are registered with it
  Register,
  // claims the claim manager tracks are shared, others are left untracked
  LookupOnly
};

/**
 * Persisted form of a FlowFile, shared by the FlowFile repository and swap files.
 * Content bytes are never part of a record, only the reference to the content claim.
 */
struct FlowFileRecord {
  static constexpr uint32_t SERIALIZATION_VERSION = 1;

  std::shared_ptr<FlowFile> flow_file;
  // set while the FlowFile lives in a swap file instead of its queue
  std::string swap_location;

  bool Serialize(io::OutputStream& output_stream) const;
  std::vector<std::byte> Serialize() const;

  /**
   * Resource claims are resolved through the claim manager, so records referring to the
   * same backing object share a single ResourceClaim instance. Claimant counts are not changed.
   * Readers that only inspect records use ClaimTracking::LookupOnly, which leaves no entries
   * behind in the claim manager.
   */
  static std::optional<FlowFileRecord> DeSerialize(io::InputStream& input_stream, ResourceClaimManager& claim_manager,
      ClaimTracking tracking = ClaimTracking::Register);
  static std::optional<FlowFileRecord> DeSerialize(std::span<const std::byte> buffer, ResourceClaimManager& claim_manager,
      ClaimTracking tracking = ClaimTracking::Register);
};

}  // namespace org::apache::nifi::flowstore::core
