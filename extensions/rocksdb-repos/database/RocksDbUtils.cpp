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
#include "RocksDbUtils.h"

#include <array>
#include <utility>

#include "Exception.h"
#include "utils/Literals.h"

namespace org::apache::nifi::flowstore::internal {

namespace {

constexpr std::array<std::pair<std::string_view, rocksdb::CompressionType>, 7> COMPRESSION_TYPES{{
    {"none", rocksdb::CompressionType::kNoCompression},
    {"zlib", rocksdb::CompressionType::kZlibCompression},
    {"bzip2", rocksdb::CompressionType::kBZip2Compression},
    {"zstd", rocksdb::CompressionType::kZSTD},
    {"auto", rocksdb::CompressionType::kZSTD},
    {"lz4", rocksdb::CompressionType::kLZ4Compression},
    {"lz4hc", rocksdb::CompressionType::kLZ4HCCompression}
}};

}  // namespace

std::optional<rocksdb::CompressionType> readConfiguredCompressionType(const Configure& configuration, const std::string& config_key) {
  std::string value;
  if (!configuration.getString(config_key, value) || value.empty()) {
    return std::nullopt;
  }
  for (const auto& [name, type] : COMPRESSION_TYPES) {
    if (name == value) {
      return type;
    }
  }
  throw Exception(REPOSITORY_EXCEPTION, "RocksDB compression type not supported: " + value);
}

void setCommonRocksDbOptions(rocksdb::DBOptions& db_options) {
  db_options.create_if_missing = true;
  // RocksDB keeps its own info log next to the data, one small file is enough
  db_options.keep_log_file_num = 1;
  db_options.max_log_file_size = 1_MiB;
}

std::unordered_map<std::string, std::string> getRocksDbOptionsToOverride(const Configure& configuration, std::string_view repository_prefix) {
  std::unordered_map<std::string, std::string> options;
  const auto properties = configuration.getProperties();
  for (const std::string_view prefix : {std::string_view{Configure::flowstore_global_rocksdb_options}, repository_prefix}) {
    if (prefix.empty()) {
      continue;
    }
    for (const auto& [key, value] : properties) {
      if (key.starts_with(prefix)) {
        options[key.substr(prefix.size())] = value;
      }
    }
  }
  return options;
}

}  // namespace org::apache::nifi::flowstore::internal
