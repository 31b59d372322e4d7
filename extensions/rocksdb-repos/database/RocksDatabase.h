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

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "rocksdb/db.h"
#include "core/logging/Logger.h"
#include "RocksDbUtils.h"
#include "OpenRocksDb.h"

namespace org::apache::nifi::flowstore::internal {

/**
 * Purpose: owns the handle of a RocksDB database and reopens it lazily.
 * The handle is dropped when the database reports that it ran out of space,
 * the next call to open() tries again.
 */
class RocksDatabase {
 public:
  static std::unique_ptr<RocksDatabase> create(const DBOptionsPatch& db_options_patch,
                                               const ColumnFamilyOptionsPatch& cf_options_patch,
                                               const std::string& path,
                                               const std::unordered_map<std::string, std::string>& db_config_override);

  RocksDatabase(std::string path, DBOptionsPatch db_options_patch, ColumnFamilyOptionsPatch cf_options_patch,
      std::unordered_map<std::string, std::string> db_config_override);

  RocksDatabase(const RocksDatabase&) = delete;
  RocksDatabase(RocksDatabase&&) = delete;
  RocksDatabase& operator=(const RocksDatabase&) = delete;
  RocksDatabase& operator=(RocksDatabase&&) = delete;

  ~RocksDatabase();

  std::optional<OpenRocksDb> open();

  void invalidate();

  const std::string& getPath() const {
    return path_;
  }

 private:
  const std::string path_;
  const DBOptionsPatch db_options_patch_;
  const ColumnFamilyOptionsPatch cf_options_patch_;
  const std::unordered_map<std::string, std::string> db_config_override_;

  std::mutex mtx_;
  std::shared_ptr<rocksdb::DB> impl_;

  static std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::internal
