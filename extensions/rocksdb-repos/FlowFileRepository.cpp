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
#include "FlowFileRepository.h"

#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>

#include "Exception.h"
#include "core/logging/LoggerFactory.h"
#include "rocksdb/env.h"
#include "rocksdb/write_batch.h"
#include "utils/file/FileUtils.h"

using namespace std::literals::chrono_literals;

namespace org::apache::nifi::flowstore::core::repository {

FlowFileRepository::FlowFileRepository(std::string name, std::string directory)
    : core::FlowFileRepository(std::move(name)),
      directory_(std::move(directory)),
      logger_(logging::LoggerFactory<FlowFileRepository>::getLogger()) {
}

FlowFileRepository::~FlowFileRepository() {
  stop();
}

bool FlowFileRepository::initialize(const std::shared_ptr<Configure>& configure, std::shared_ptr<ResourceClaimManager> claim_manager) {
  if (!core::FlowFileRepository::initialize(configure, std::move(claim_manager))) {
    return false;
  }
  std::string value;
  if (configure->getString(Configure::flowstore_flowfile_repository_directory_default, value) && !value.empty()) {
    directory_ = value;
  }
  logger_->log_debug("FlowStore FlowFile Repository Directory {}", directory_);

  if (configure->has(Configure::flowstore_flowfile_repository_sync_writes)) {
    if (auto sync_writes = configure->getBool(Configure::flowstore_flowfile_repository_sync_writes)) {
      sync_writes_ = *sync_writes;
    } else {
      logger_->log_error("Malformed property '{}', expected a boolean, using {}", Configure::flowstore_flowfile_repository_sync_writes, sync_writes_);
    }
  }

  setCompactionPeriod(configure);

  auto db_options = [] (rocksdb::DBOptions& options) {
    internal::setCommonRocksDbOptions(options);
    options.env = rocksdb::Env::Default();
  };

  // Write buffers are used as db operation logs. When they get filled the events are merged and serialized.
  // The default size of 64MB is far more than a FlowFile repository needs, a higher number of smaller
  // buffers keeps the memory footprint low without stalling writes under heavy load.
  std::optional<rocksdb::CompressionType> compression_type;
  try {
    compression_type = internal::readConfiguredCompressionType(*configure, Configure::flowstore_flowfile_repository_rocksdb_compression);
  } catch (const Exception& exception) {
    logger_->log_error("{}", exception.what());
    return false;
  }
  auto cf_options = [compression_type] (rocksdb::ColumnFamilyOptions& cf_opts) {
    cf_opts.OptimizeForPointLookup(4);
    cf_opts.write_buffer_size = 8ULL << 20U;
    cf_opts.max_write_buffer_number = 20;
    cf_opts.min_write_buffer_number_to_merge = 1;
    if (compression_type) {
      cf_opts.compression = *compression_type;
    }
  };

  if (utils::file::create_dir(directory_) != 0) {
    logger_->log_error("Could not create FlowFile repository directory {}", directory_);
    return false;
  }
  db_ = internal::RocksDatabase::create(db_options, cf_options, directory_,
    internal::getRocksDbOptionsToOverride(*configure, Configure::flowstore_flowfile_repository_rocksdb_options));
  if (db_->open()) {
    logger_->log_debug("FlowStore FlowFile Repository database open {} success", directory_);
    return true;
  } else {
    logger_->log_error("FlowStore FlowFile Repository database open {} fail", directory_);
    return false;
  }
}

void FlowFileRepository::setCompactionPeriod(const std::shared_ptr<Configure>& configure) {
  compaction_period_ = DEFAULT_COMPACTION_PERIOD;
  if (!configure->has(Configure::flowstore_flowfile_repository_rocksdb_compaction_period)) {
    logger_->log_debug("Using default compaction period of {}", compaction_period_);
    return;
  }
  if (auto compaction_period = configure->getDuration(Configure::flowstore_flowfile_repository_rocksdb_compaction_period)) {
    compaction_period_ = *compaction_period;
    if (compaction_period_.count() == 0) {
      logger_->log_warn("Setting '{}' to 0 disables forced compaction", Configure::flowstore_flowfile_repository_rocksdb_compaction_period);
    }
  } else {
    logger_->log_error("Malformed property '{}', expected time period, using default", Configure::flowstore_flowfile_repository_rocksdb_compaction_period);
  }
}

void FlowFileRepository::start() {
  if (compaction_period_.count() != 0 && !compaction_thread_) {
    compaction_thread_ = std::make_unique<utils::StoppableThread>([this] () {
      runCompaction();
    });
  }
}

void FlowFileRepository::stop() {
  compaction_thread_.reset();
}

void FlowFileRepository::runCompaction() {
  do {
    if (auto opendb = db_->open()) {
      auto status = opendb->RunCompaction();
      logger_->log_trace("Compaction triggered: {}", status.ToString());
    } else {
      logger_->log_error("Failed to open database for compaction");
    }
  } while (!utils::StoppableThread::waitForStopRequest(compaction_period_));
}

bool FlowFileRepository::ExecuteWithRetry(const std::function<rocksdb::Status()>& operation) {
  constexpr int RETRY_COUNT = 3;
  std::chrono::milliseconds wait_time = 0ms;
  for (int i = 0; i < RETRY_COUNT; ++i) {
    auto status = operation();
    if (status.ok()) {
      logger_->log_trace("Rocksdb operation executed successfully");
      return true;
    }
    logger_->log_error("Rocksdb operation failed: {}", status.ToString());
    wait_time += FLOWFILE_REPOSITORY_RETRY_INTERVAL_INCREMENTS;
    std::this_thread::sleep_for(wait_time);
  }
  return false;
}

bool FlowFileRepository::persist(const std::vector<RepositoryRecord>& records) {
  if (!db_) {
    logger_->log_error("FlowFile repository {} is not initialized", getName());
    return false;
  }
  auto opendb = db_->open();
  if (!opendb) {
    return false;
  }
  rocksdb::WriteBatch batch;
  for (const auto& record : records) {
    const auto key = record.current->getUUIDStr();
    rocksdb::Status status;
    if (record.type == RepositoryRecordType::DELETE) {
      status = batch.Delete(key);
    } else {
      const auto value = toFlowFileRecord(record).Serialize();
      if (value.empty()) {
        logger_->log_error("Failed to serialize {} record of FlowFile {}", toString(record.type), key);
        return false;
      }
      status = batch.Put(key, rocksdb::Slice(reinterpret_cast<const char*>(value.data()), value.size()));
    }
    if (!status.ok()) {
      logger_->log_error("Failed to add {} record of FlowFile {} to batch operation: {}", toString(record.type), key, status.ToString());
      return false;
    }
  }
  rocksdb::WriteOptions options;
  options.sync = sync_writes_;
  auto operation = [&batch, &opendb, &options]() { return opendb->Write(options, &batch); };
  return ExecuteWithRetry(operation);
}

void FlowFileRepository::forEachRecord(const std::function<void(FlowFileRecord&&)>& visitor, ClaimTracking tracking) const {
  if (!db_) {
    throw Exception(REPOSITORY_EXCEPTION, "FlowFile repository " + getName() + " is not initialized");
  }
  auto opendb = db_->open();
  if (!opendb) {
    throw Exception(REPOSITORY_EXCEPTION, "Couldn't open the database of FlowFile repository " + getName());
  }
  logger_->log_debug("Reading existing flow files from database");
  const auto it = opendb->NewIterator(rocksdb::ReadOptions());
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    const auto value = it->value();
    auto record = FlowFileRecord::DeSerialize(std::span<const std::byte>(reinterpret_cast<const std::byte*>(value.data()), value.size()), *claim_manager_, tracking);
    if (!record) {
      throw Exception(REPOSITORY_EXCEPTION, "Could not deserialize FlowFile record " + it->key().ToString() + " of " + getName());
    }
    visitor(std::move(*record));
  }
  if (!it->status().ok()) {
    throw Exception(REPOSITORY_EXCEPTION, "Failed to read the FlowFile repository " + getName() + ": " + it->status().ToString());
  }
}

uint64_t FlowFileRepository::getRecordCount() const {
  if (!db_) {
    return 0;
  }
  auto opendb = db_->open();
  if (!opendb) {
    return 0;
  }
  uint64_t count = 0;
  const auto it = opendb->NewIterator(rocksdb::ReadOptions());
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    ++count;
  }
  return count;
}

void FlowFileRepository::purge() {
  if (!db_) {
    return;
  }
  auto opendb = db_->open();
  if (!opendb) {
    logger_->log_error("Failed to open database {} for purging", directory_);
    return;
  }
  rocksdb::WriteBatch batch;
  {
    const auto it = opendb->NewIterator(rocksdb::ReadOptions());
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      auto status = batch.Delete(it->key());
      if (!status.ok()) {
        logger_->log_error("Failed to add {} to purge operation: {}", it->key().ToString(), status.ToString());
        return;
      }
    }
  }
  rocksdb::WriteOptions options;
  options.sync = true;
  auto operation = [&batch, &opendb, &options]() { return opendb->Write(options, &batch); };
  if (ExecuteWithRetry(operation)) {
    logger_->log_info("Purged {} records from FlowFile repository {}", batch.Count(), directory_);
  } else {
    logger_->log_error("Failed to purge FlowFile repository {}", directory_);
  }
}

uint64_t FlowFileRepository::getStorageCapacity() const {
  const auto space = utils::file::space(directory_);
  return space ? space->capacity : 0;
}

uint64_t FlowFileRepository::getUsableStorageSpace() const {
  const auto space = utils::file::space(directory_);
  return space ? space->available : 0;
}

}  // namespace org::apache::nifi::flowstore::core::repository
