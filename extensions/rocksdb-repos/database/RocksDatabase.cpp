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
#include "RocksDatabase.h"

#include <utility>

#include "core/logging/LoggerFactory.h"
#include "rocksdb/convenience.h"

namespace org::apache::nifi::flowstore::internal {

std::shared_ptr<core::logging::Logger> RocksDatabase::logger_ = core::logging::LoggerFactory<RocksDatabase>::getLogger();

std::unique_ptr<RocksDatabase> RocksDatabase::create(const DBOptionsPatch& db_options_patch,
                                                     const ColumnFamilyOptionsPatch& cf_options_patch,
                                                     const std::string& path,
                                                     const std::unordered_map<std::string, std::string>& db_config_override) {
  logger_->log_trace("Creating database handle for '{}'", path);
  return std::make_unique<RocksDatabase>(path, db_options_patch, cf_options_patch, db_config_override);
}

RocksDatabase::RocksDatabase(std::string path, DBOptionsPatch db_options_patch, ColumnFamilyOptionsPatch cf_options_patch,
    std::unordered_map<std::string, std::string> db_config_override)
    : path_(std::move(path)),
      db_options_patch_(std::move(db_options_patch)),
      cf_options_patch_(std::move(cf_options_patch)),
      db_config_override_(std::move(db_config_override)) {
}

RocksDatabase::~RocksDatabase() {
  std::lock_guard<std::mutex> guard{mtx_};
  if (impl_) {
    auto status = impl_->FlushWAL(true);
    if (!status.ok()) {
      logger_->log_error("Failed to flush the write ahead log of '{}': {}", path_, status.ToString());
    }
  }
  impl_.reset();
}

void RocksDatabase::invalidate() {
  std::lock_guard<std::mutex> guard{mtx_};
  // the handle is dropped once every OpenRocksDb holding it is gone
  impl_.reset();
}

std::optional<OpenRocksDb> RocksDatabase::open() {
  std::lock_guard<std::mutex> guard{mtx_};
  if (!impl_) {
    rocksdb::DBOptions db_options;
    if (db_options_patch_) {
      db_options_patch_(db_options);
    }
    rocksdb::ColumnFamilyOptions cf_options;
    if (cf_options_patch_) {
      cf_options_patch_(cf_options);
    }

    rocksdb::ConfigOptions conf_options;
    conf_options.sanity_level = rocksdb::ConfigOptions::kSanityLevelLooselyCompatible;
    if (!db_config_override_.empty()) {
      auto status = rocksdb::GetDBOptionsFromMap(conf_options, db_options, db_config_override_, &db_options);
      if (!status.ok()) {
        logger_->log_error("Failed to override RocksDB options of '{}' from the configuration: {}", path_, status.ToString());
        return std::nullopt;
      }
    }

    rocksdb::Options options(db_options, cf_options);
    rocksdb::DB* db_instance = nullptr;
    const auto result = rocksdb::DB::Open(options, path_, &db_instance);
    if (!result.ok() || !db_instance) {
      logger_->log_error("Cannot open RocksDB database '{}', error: {}", path_, result.ToString());
      delete db_instance;
      return std::nullopt;
    }
    logger_->log_debug("Opened RocksDB database '{}'", path_);
    impl_.reset(db_instance);
  }
  return OpenRocksDb(*this, impl_);
}

}  // namespace org::apache::nifi::flowstore::internal
