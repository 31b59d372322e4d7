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
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "spdlog/common.h"
#include "Catch.h"
#include "core/ClassName.h"
#include "core/logging/Logger.h"
#include "core/logging/LoggerConfiguration.h"
#include "core/logging/LoggerFactory.h"
#include "core/logging/LoggerProperties.h"
#include "properties/Configure.h"
#include "utils/StringUtils.h"

namespace flowstore = org::apache::nifi::flowstore;
namespace core = flowstore::core;
namespace logging = flowstore::core::logging;
namespace utils = flowstore::utils;

class LogTestController {
 public:
  ~LogTestController() = default;

  static LogTestController& getInstance() {
    static LogTestController instance;
    return instance;
  }

  template<typename T>
  void setTrace() {
    setLevel<T>(spdlog::level::trace);
  }

  template<typename T>
  void setDebug() {
    setLevel<T>(spdlog::level::debug);
  }

  template<typename T>
  void setInfo() {
    setLevel<T>(spdlog::level::info);
  }

  template<typename T>
  void setWarn() {
    setLevel<T>(spdlog::level::warn);
  }

  template<typename T>
  void setError() {
    setLevel<T>(spdlog::level::err);
  }

  template<typename T>
  void setOff() {
    setLevel<T>(spdlog::level::off);
  }

  template<typename T>
  void setLevel(spdlog::level::level_enum level) {
    logging::LoggerFactory<T>::getLogger();
    const std::string name{core::className<T>()};
    modified_loggers_.insert(name);
    setLevel(name, level);
  }

  /**
   * Polls the captured log output until the text shows up or the timeout expires.
   */
  bool contains(const std::string& ending, std::chrono::milliseconds timeout = std::chrono::seconds(3), std::chrono::milliseconds sleep_interval = std::chrono::milliseconds(200));

  int countOccurrences(const std::string& pattern) const;

  std::string getLog() const;

  void reset();

  void clear();

  std::shared_ptr<logging::Logger> logger_;

 private:
  LogTestController();

  void setLevel(const std::string& name, spdlog::level::level_enum level);

  class CapturingSink;

  std::shared_ptr<CapturingSink> capturing_sink_;
  std::set<std::string> modified_loggers_;
};

class TestController {
 public:
  TestController();
  ~TestController();

  TestController(const TestController&) = delete;
  TestController& operator=(const TestController&) = delete;

  std::filesystem::path createTempDirectory();

  LogTestController& getLog() const {
    return log_;
  }

 private:
  LogTestController& log_;
  std::vector<std::filesystem::path> directories_;
};
