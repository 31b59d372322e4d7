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

#include <map>
#include <optional>
#include <string>

#include "core/FlowFile.h"
#include "io/InputStream.h"
#include "io/OutputStream.h"

namespace org::apache::nifi::flowstore::loadbalance {

struct LoadBalancedAttributes {
  std::map<std::string, std::string> attributes;
  core::FlowFile::TimePoint lineage_start_date;
  core::FlowFile::TimePoint entry_date;
  core::FlowFile::TimePoint penalty_expiration;
};

/**
 * Attribute block of a FlowFile on the load-balance wire: the attribute count, the
 * key/value pairs as int length + UTF-8 bytes, then the lineage start date, the entry date
 * and the penalty expiration as millisecond longs.
 */
class LoadBalanceFlowFileCodec {
 public:
  static bool encode(const core::FlowFile& flow_file, io::OutputStream& stream);

  /**
   * @return std::nullopt if the stream ends early or the block is malformed
   */
  static std::optional<LoadBalancedAttributes> decode(io::InputStream& stream);
};

}  // namespace org::apache::nifi::flowstore::loadbalance
