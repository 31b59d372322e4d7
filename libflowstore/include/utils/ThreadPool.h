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
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Monitors.h"
#include "core/logging/Logger.h"

namespace org::apache::nifi::flowstore::utils {

using TaskId = std::string;

/**
 * Runs recurring tasks on a fixed number of threads.
 *
 * A task runs again at the time its TaskRescheduleInfo names until it reports
 * Done or it is stopped. Task identifiers must be unique among the tasks of
 * a pool.
 */
class ThreadPool {
 public:
  using Task = std::function<TaskRescheduleInfo()>;

  ThreadPool(int max_worker_threads, std::string name);

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  ~ThreadPool() {
    shutdown();
  }

  /**
   * Schedules the task to run as soon as a worker is free. Tasks scheduled
   * before start() wait for it.
   */
  void execute(const TaskId& identifier, Task task);

  /**
   * Removes the task from the schedule and waits for a running instance of it
   * to finish. Must not be called from the task itself.
   */
  void stopTasks(const TaskId& identifier);

  void start();

  /**
   * Waits for the running tasks to return, then drops every scheduled one.
   */
  void shutdown();

 private:
  struct ScheduledTask {
    TaskId identifier;
    Task task;
  };

  void runTasks();

  const int max_worker_threads_;
  const std::string name_;
  std::vector<std::thread> workers_;

  std::mutex mutex_;
  bool running_ = false;
  std::condition_variable schedule_changed_;
  std::condition_variable task_returned_;
  std::multimap<std::chrono::steady_clock::time_point, ScheduledTask> schedule_;
  std::unordered_set<TaskId> active_tasks_;
  std::unordered_set<TaskId> running_tasks_;

  std::shared_ptr<core::logging::Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::utils
