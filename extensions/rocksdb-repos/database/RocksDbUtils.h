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

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rocksdb/options.h"
#include "properties/Configure.h"

namespace org::apache::nifi::flowstore::internal {

/**
 * Options are applied as patches on top of the RocksDB defaults, each database
 * keeps its patches and applies them again whenever it reopens.
 */
using DBOptionsPatch = std::function<void(rocksdb::DBOptions&)>;
using ColumnFamilyOptionsPatch = std::function<void(rocksdb::ColumnFamilyOptions&)>;

/**
 * The compression named by config_key: none, zlib, bzip2, zstd (or auto), lz4 or lz4hc.
 * nullopt if the property is not set.
 * @throws Exception REPOSITORY_EXCEPTION for any other value
 */
std::optional<rocksdb::CompressionType> readConfiguredCompressionType(const Configure& configuration, const std::string& config_key);

void setCommonRocksDbOptions(rocksdb::DBOptions& db_options);

/**
 * Raw RocksDB options set in the configuration under the global prefix and the
 * prefix of the repository, with the latter taking precedence. The prefixes are stripped.
 */
std::unordered_map<std::string, std::string> getRocksDbOptionsToOverride(const Configure& configuration, std::string_view repository_prefix);

}  // namespace org::apache::nifi::flowstore::internal
