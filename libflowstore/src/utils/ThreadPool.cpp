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
#include "utils/ThreadPool.h"

#include <utility>

#include "core/logging/LoggerFactory.h"

namespace org::apache::nifi::flowstore::utils {

ThreadPool::ThreadPool(int max_worker_threads, std::string name)
    : max_worker_threads_(max_worker_threads),
      name_(std::move(name)),
      logger_(core::logging::LoggerFactory<ThreadPool>::getLogger()) {
}

void ThreadPool::execute(const TaskId& identifier, Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_tasks_.insert(identifier);
    schedule_.emplace(std::chrono::steady_clock::now(), ScheduledTask{identifier, std::move(task)});
  }
  schedule_changed_.notify_one();
}

void ThreadPool::stopTasks(const TaskId& identifier) {
  std::unique_lock<std::mutex> lock(mutex_);
  active_tasks_.erase(identifier);
  std::erase_if(schedule_, [&](const auto& entry) { return entry.second.identifier == identifier; });
  task_returned_.wait(lock, [&] { return !running_tasks_.contains(identifier); });
}

void ThreadPool::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < max_worker_threads_; ++i) {
    workers_.emplace_back([this] { runTasks(); });
  }
  logger_->log_debug("Started thread pool {} with {} workers", name_, max_worker_threads_);
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  schedule_changed_.notify_all();
  for (auto& worker : workers_) {
    worker.join();
  }
  workers_.clear();

  std::lock_guard<std::mutex> lock(mutex_);
  schedule_.clear();
  active_tasks_.clear();
  logger_->log_debug("Thread pool {} shut down", name_);
}

void ThreadPool::runTasks() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (schedule_.empty()) {
      schedule_changed_.wait(lock);
      continue;
    }
    const auto next_run = schedule_.begin()->first;
    if (next_run > std::chrono::steady_clock::now()) {
      // woken early when a task is scheduled before next_run
      schedule_changed_.wait_until(lock, next_run);
      continue;
    }
    auto node = schedule_.extract(schedule_.begin());
    ScheduledTask scheduled = std::move(node.mapped());
    running_tasks_.insert(scheduled.identifier);
    lock.unlock();

    const TaskRescheduleInfo result = scheduled.task();

    lock.lock();
    running_tasks_.erase(scheduled.identifier);
    if (result.isFinished()) {
      active_tasks_.erase(scheduled.identifier);
    } else if (active_tasks_.contains(scheduled.identifier)) {
      schedule_.emplace(result.getNextExecutionTime(), std::move(scheduled));
      schedule_changed_.notify_one();
    }
    task_returned_.notify_all();
  }
}

}  // namespace org::apache::nifi::flowstore::utils
