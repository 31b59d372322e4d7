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
#include "utils/StoppableThread.h"

namespace org::apache::nifi::flowstore::utils {

namespace {
thread_local StoppableThread* current_thread = nullptr;
}  // namespace

StoppableThread::StoppableThread(std::function<void()> fn)
    : thread_([this, fn = std::move(fn)] {
        current_thread = this;
        fn();
      }) {}

bool StoppableThread::waitForStopRequest(std::chrono::milliseconds time) {
  StoppableThread* thread = current_thread;
  if (thread == nullptr) {
    std::this_thread::sleep_for(time);
    return false;
  }
  std::unique_lock lock(thread->mtx_);
  return thread->cv_.wait_for(lock, time, [&] { return !thread->running_.load(); });
}

}  // namespace org::apache::nifi::flowstore::utils
