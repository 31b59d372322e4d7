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
#include "utils/PlatformCapabilities.h"

#include <filesystem>
#include <system_error>

#ifdef __linux__
#include <sys/resource.h>
#endif

namespace org::apache::nifi::flowstore::utils {

std::optional<uint64_t> PlatformCapabilities::getOpenFileDescriptorCount() const {
#ifdef __linux__
  std::error_code error;
  uint64_t count = 0;
  for (std::filesystem::directory_iterator it("/proc/self/fd", error), end; !error && it != end; it.increment(error)) {
    ++count;
  }
  if (error) {
    return std::nullopt;
  }
  return count;
#else
  return std::nullopt;
#endif
}

std::optional<uint64_t> PlatformCapabilities::getMaxFileDescriptorCount() const {
#ifdef __linux__
  rlimit limit{};
  if (getrlimit(RLIMIT_NOFILE, &limit) != 0 || limit.rlim_cur == RLIM_INFINITY) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(limit.rlim_cur);
#else
  return std::nullopt;
#endif
}

const PlatformCapabilities& PlatformCapabilities::get() {
  static const PlatformCapabilities capabilities;
  return capabilities;
}

}  // namespace org::apache::nifi::flowstore::utils
