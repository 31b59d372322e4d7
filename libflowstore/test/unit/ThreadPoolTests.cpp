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
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "IntegrationTestUtils.h"
#include "utils/ThreadPool.h"

using namespace std::literals::chrono_literals;

TEST_CASE("A task is run again until it reports that it is done", "[ThreadPool]") {
  TestController testController;
  utils::ThreadPool pool(2, "test");
  std::atomic<int> runs{0};
  pool.execute("counter", [&runs] {
    return ++runs < 5 ? utils::TaskRescheduleInfo::RetryImmediately() : utils::TaskRescheduleInfo::Done();
  });
  CHECK(runs == 0);

  pool.start();
  REQUIRE(utils::verifyEventHappenedInPollTime(5s, [&runs] { return runs == 5; }));
  std::this_thread::sleep_for(50ms);
  CHECK(runs == 5);
  pool.shutdown();
}

TEST_CASE("A task asking for a retry later is not run before that time", "[ThreadPool]") {
  TestController testController;
  utils::ThreadPool pool(1, "test");
  std::vector<std::chrono::steady_clock::time_point> run_times;
  std::atomic<bool> finished{false};
  pool.execute("delayed", [&] {
    run_times.push_back(std::chrono::steady_clock::now());
    if (run_times.size() < 2) {
      return utils::TaskRescheduleInfo::RetryIn(200ms);
    }
    finished = true;
    return utils::TaskRescheduleInfo::Done();
  });
  pool.start();
  REQUIRE(utils::verifyEventHappenedInPollTime(5s, [&finished] { return finished.load(); }));
  pool.shutdown();

  REQUIRE(run_times.size() == 2);
  CHECK(run_times[1] - run_times[0] >= 200ms);
}

TEST_CASE("A stopped task is not run again", "[ThreadPool]") {
  TestController testController;
  utils::ThreadPool pool(2, "test");
  std::atomic<int> stopped_runs{0};
  std::atomic<int> other_runs{0};
  std::atomic<bool> in_task{false};
  pool.execute("stopped", [&] {
    in_task = true;
    std::this_thread::sleep_for(20ms);
    ++stopped_runs;
    in_task = false;
    return utils::TaskRescheduleInfo::RetryImmediately();
  });
  pool.execute("other", [&other_runs] {
    ++other_runs;
    return utils::TaskRescheduleInfo::RetryIn(5ms);
  });
  pool.start();
  REQUIRE(utils::verifyEventHappenedInPollTime(5s, [&stopped_runs] { return stopped_runs >= 2; }));

  pool.stopTasks("stopped");
  CHECK_FALSE(in_task);
  const int runs_when_stopped = stopped_runs;
  const int other_runs_when_stopped = other_runs;
  std::this_thread::sleep_for(100ms);
  CHECK(stopped_runs == runs_when_stopped);
  CHECK(other_runs > other_runs_when_stopped);
  pool.shutdown();
}

TEST_CASE("Shutting down waits for the running tasks and drops the scheduled ones", "[ThreadPool]") {
  TestController testController;
  utils::ThreadPool pool(1, "test");
  std::atomic<bool> started{false};
  std::atomic<bool> completed{false};
  std::atomic<int> later_runs{0};
  pool.execute("slow", [&] {
    started = true;
    std::this_thread::sleep_for(100ms);
    completed = true;
    return utils::TaskRescheduleInfo::Done();
  });
  pool.execute("later", [&later_runs] {
    ++later_runs;
    return utils::TaskRescheduleInfo::Done();
  });
  pool.start();
  REQUIRE(utils::verifyEventHappenedInPollTime(5s, [&started] { return started.load(); }));

  pool.shutdown();
  CHECK(completed);
  std::this_thread::sleep_for(50ms);
  CHECK(later_runs == 0);
}
