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
#include <string_view>
#include <vector>

#include "spdlog/common.h"
#include "spdlog/formatter.h"
#include "spdlog/logger.h"
#include "spdlog/sinks/sink.h"

#include "core/logging/Logger.h"
#include "core/logging/LoggerProperties.h"

class LogTestController;

namespace org::apache::nifi::flowstore::core::logging {

class LoggerConfiguration {
  friend class ::LogTestController;

 public:
  /**
   * Gets the current log configuration
   */
  static LoggerConfiguration& getConfiguration();

  void disableLogging() {
    controller_->setEnabled(false);
  }

  void enableLogging() {
    controller_->setEnabled(true);
  }

  /**
   * (Re)initializes the logging configuration with the given logger properties.
   * Loggers handed out earlier are rewired to the new sinks and levels.
   */
  void initialize(const std::shared_ptr<LoggerProperties>& logger_properties);

  /**
   * Can be used to get arbitrarily named Logger, LoggerFactory should be preferred within a class.
   */
  std::shared_ptr<Logger> getLogger(std::string_view name);

  static const char *spdlog_default_pattern;

 private:
  class LoggerImpl : public Logger {
   public:
    LoggerImpl(std::string name, const std::shared_ptr<LoggerControl>& controller, const std::shared_ptr<spdlog::logger>& delegate)
        : Logger(delegate, controller),
          name(std::move(name)) {
    }

    void set_delegate(std::shared_ptr<spdlog::logger> delegate) {
      std::lock_guard<std::mutex> lock(mutex_);
      delegate_ = std::move(delegate);
    }

    std::string name;
  };

  struct SinkSetup {
    spdlog::level::level_enum root_level{spdlog::level::info};
    std::vector<spdlog::sink_ptr> sinks;
    // "logger.<prefix>" overrides, longest matching prefix wins
    std::map<std::string, spdlog::level::level_enum> levels;
  };

  LoggerConfiguration();

  static SinkSetup createSinkSetup(const std::shared_ptr<LoggerProperties>& logger_properties);
  static spdlog::sink_ptr createRotatingFileSink(const std::string& appender_key, const LoggerProperties& properties);
  spdlog::level::level_enum levelFor(const std::string& name) const;
  std::shared_ptr<spdlog::logger> createSpdlogLogger(const std::lock_guard<std::mutex>&, const std::string& name);

  SinkSetup setup_;
  std::shared_ptr<spdlog::formatter> formatter_;
  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<LoggerImpl>> loggers_;
  std::shared_ptr<LoggerControl> controller_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace org::apache::nifi::flowstore::core::logging
