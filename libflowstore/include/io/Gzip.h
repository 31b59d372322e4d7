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
#include <optional>
#include <span>
#include <vector>

namespace org::apache::nifi::flowstore::io::gzip {

/**
 * Compresses a whole buffer into a single gzip member. nullopt if zlib fails.
 */
std::optional<std::vector<std::byte>> compress(std::span<const std::byte> input);

/**
 * Inflates a whole gzip member. nullopt on corrupt or truncated input.
 */
std::optional<std::vector<std::byte>> decompress(std::span<const std::byte> input);

}  // namespace org::apache::nifi::flowstore::io::gzip
