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

#include <cstdint>
#include <optional>

namespace org::apache::nifi::flowstore::utils {

/**
 * Operating system values that are only available on some platforms.
 * Every getter returns std::nullopt where the value cannot be determined.
 */
class PlatformCapabilities {
 public:
  virtual ~PlatformCapabilities() = default;

  [[nodiscard]] virtual std::optional<uint64_t> getOpenFileDescriptorCount() const;
  [[nodiscard]] virtual std::optional<uint64_t> getMaxFileDescriptorCount() const;

  static const PlatformCapabilities& get();
};

}  // namespace org::apache::nifi::flowstore::utils
