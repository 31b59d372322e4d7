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
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/FlowFileQueue.h"

namespace org::apache::nifi::flowstore::core {

/**
 * Supplies the queues of the current flow by connection id.
 */
class QueueProvider {
 public:
  virtual ~QueueProvider() = default;

  /**
   * @return the queue, or nullptr if the flow has no such connection
   */
  virtual std::shared_ptr<FlowFileQueue> getQueue(const std::string& queue_id) const = 0;

  virtual std::vector<std::shared_ptr<FlowFileQueue>> getAllQueues() const = 0;
};

class StandardQueueProvider : public QueueProvider {
 public:
  std::shared_ptr<FlowFileQueue> getQueue(const std::string& queue_id) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(queue_id);
    return it == queues_.end() ? nullptr : it->second;
  }

  std::vector<std::shared_ptr<FlowFileQueue>> getAllQueues() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<FlowFileQueue>> queues;
    queues.reserve(queues_.size());
    for (const auto& [queue_id, queue] : queues_) {
      queues.push_back(queue);
    }
    return queues;
  }

  void addQueue(std::shared_ptr<FlowFileQueue> queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto queue_id = queue->getIdentifier();
    queues_[queue_id] = std::move(queue);
  }

  bool removeQueue(const std::string& queue_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.erase(queue_id) > 0;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<FlowFileQueue>> queues_;
};

}  // namespace org::apache::nifi::flowstore::core
