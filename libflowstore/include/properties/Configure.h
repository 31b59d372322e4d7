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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "properties/Properties.h"

namespace org::apache::nifi::flowstore {

class Configure : public Properties {
 public:
  Configure() : Properties("FlowStore configuration") {}

  static constexpr const char *flowstore_flowfile_repository_class_name = "flowstore.flowfile.repository.class.name";
  static constexpr const char *flowstore_flowfile_repository_directory_default = "flowstore.flowfile.repository.directory.default";
  static constexpr const char *flowstore_flowfile_repository_rocksdb_compaction_period = "flowstore.flowfile.repository.rocksdb.compaction.period";
  static constexpr const char *flowstore_flowfile_repository_rocksdb_compression = "flowstore.flowfile.repository.rocksdb.compression";
  static constexpr const char *flowstore_flowfile_repository_sync_writes = "flowstore.flowfile.repository.sync.writes";
  static constexpr const char *flowstore_flowfile_repository_rocksdb_options = "flowstore.flowfile.repository.rocksdb.options.";
  static constexpr const char *flowstore_global_rocksdb_options = "flowstore.global.rocksdb.options.";

  static constexpr const char *flowstore_content_repository_class_name = "flowstore.content.repository.class.name";
  static constexpr const char *flowstore_content_repository_directory_prefix = "flowstore.content.repository.directory.";
  static constexpr const char *flowstore_content_repository_sections = "flowstore.content.repository.sections";
  static constexpr const char *flowstore_content_repository_max_appendable_claim_size = "flowstore.content.repository.max.appendable.claim.size";
  static constexpr const char *flowstore_content_repository_always_sync = "flowstore.content.repository.always.sync";
  static constexpr const char *flowstore_content_repository_purge_period = "flowstore.content.repository.purge.period";
  static constexpr const char *flowstore_volatile_content_repository_max_bytes = "flowstore.volatile.content.repository.max.bytes";

  static constexpr const char *flowstore_queues = "flowstore.queues";
  static constexpr const char *flowstore_queue_swap_threshold = "flowstore.queue.swap.threshold";
  static constexpr const char *flowstore_queue_backpressure_object_count = "flowstore.queue.backpressure.object.count";
  static constexpr const char *flowstore_queue_backpressure_data_size = "flowstore.queue.backpressure.data.size";

  static constexpr const char *flowstore_load_balance_address = "flowstore.load.balance.address";
  static constexpr const char *flowstore_load_balance_port = "flowstore.load.balance.port";
  static constexpr const char *flowstore_load_balance_connections_per_node = "flowstore.load.balance.connections.per.node";
  static constexpr const char *flowstore_load_balance_comms_timeout = "flowstore.load.balance.comms.timeout";
  static constexpr const char *flowstore_load_balance_max_thread_count = "flowstore.load.balance.max.thread.count";
  static constexpr const char *flowstore_load_balance_client_max_thread_count = "flowstore.load.balance.client.max.thread.count";
  static constexpr const char *flowstore_load_balance_poll_period = "flowstore.load.balance.poll.period";
  static constexpr const char *flowstore_load_balance_retry_backoff_initial = "flowstore.load.balance.retry.backoff.initial";
  static constexpr const char *flowstore_load_balance_retry_backoff_max = "flowstore.load.balance.retry.backoff.max";
  static constexpr const char *flowstore_cluster_node_identifier = "flowstore.cluster.node.identifier";

  static constexpr const char *flowstore_uid_implementation = "flowstore.uid.implementation";

  /**
   * The value of a boolean property, nullopt when absent or not a boolean
   */
  std::optional<bool> getBool(const std::string& key) const;

  /**
   * The value of a time period property ("10 sec", "500 ms"), nullopt when absent or invalid
   */
  std::optional<std::chrono::milliseconds> getDuration(const std::string& key) const;

  /**
   * The value of a data size property ("1 MB", "512 KB"), nullopt when absent or invalid
   */
  std::optional<uint64_t> getDataSize(const std::string& key) const;
};

}  // namespace org::apache::nifi::flowstore
