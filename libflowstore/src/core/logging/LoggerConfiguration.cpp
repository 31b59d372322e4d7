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
#include "core/logging/LoggerConfiguration.h"

#include <algorithm>
#include <filesystem>
#include <optional>

#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/null_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/ClassName.h"
#include "core/logging/LoggerFactory.h"
#include "utils/Literals.h"
#include "utils/StringUtils.h"

namespace org::apache::nifi::flowstore::core::logging {

const char* LoggerConfiguration::spdlog_default_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

namespace {
constexpr std::string_view logger_prefix = "logger.";
constexpr std::string_view root_logger_key = "logger.root";
constexpr std::string_view appender_prefix = "appender.";

std::optional<spdlog::level::level_enum> parseLevel(std::string_view level_str) {
  const auto level = utils::string::toLower(utils::string::trim(level_str));
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error" || level == "err") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return std::nullopt;
}

spdlog::sink_ptr createFallbackSink() {
  return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
}
}  // namespace

std::shared_ptr<Logger> getLoggerByName(std::string_view name) {
  return LoggerConfiguration::getConfiguration().getLogger(name);
}

LoggerConfiguration::LoggerConfiguration()
    : formatter_(std::make_shared<spdlog::pattern_formatter>(spdlog_default_pattern)),
      controller_(std::make_shared<LoggerControl>()) {
  setup_.sinks.push_back(createFallbackSink());
  logger_ = getLogger(core::className<LoggerConfiguration>());
}

LoggerConfiguration& LoggerConfiguration::getConfiguration() {
  static LoggerConfiguration logger_configuration;
  return logger_configuration;
}

void LoggerConfiguration::initialize(const std::shared_ptr<LoggerProperties>& logger_properties) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    setup_ = createSinkSetup(logger_properties);
    std::string pattern = spdlog_default_pattern;
    if (logger_properties) {
      logger_properties->getString("spdlog.pattern", pattern);
    }
    formatter_ = std::make_shared<spdlog::pattern_formatter>(pattern);
    for (auto& [name, logger] : loggers_) {
      logger->set_delegate(createSpdlogLogger(lock, name));
    }
  }
  logger_->log_debug("Logging configuration (re)initialized with {} sink(s)", setup_.sinks.size());
}

std::shared_ptr<Logger> LoggerConfiguration::getLogger(std::string_view name) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string name_str{name};
  if (auto it = loggers_.find(name_str); it != loggers_.end()) {
    return it->second;
  }
  auto logger = std::make_shared<LoggerImpl>(name_str, controller_, createSpdlogLogger(lock, name_str));
  loggers_.emplace(name_str, logger);
  return logger;
}

LoggerConfiguration::SinkSetup LoggerConfiguration::createSinkSetup(const std::shared_ptr<LoggerProperties>& logger_properties) {
  SinkSetup setup;
  if (!logger_properties) {
    setup.sinks.push_back(createFallbackSink());
    return setup;
  }

  const auto initial_sinks = logger_properties->initial_sinks();
  if (auto root = logger_properties->getString(std::string{root_logger_key})) {
    auto parts = utils::string::splitAndTrim(*root, ",");
    if (!parts.empty()) {
      if (auto level = parseLevel(parts.front())) {
        setup.root_level = *level;
      }
      for (auto it = std::next(parts.begin()); it != parts.end(); ++it) {
        const auto& appender_name = *it;
        if (auto sink_it = initial_sinks.find(appender_name); sink_it != initial_sinks.end()) {
          setup.sinks.push_back(sink_it->second);
          continue;
        }
        const std::string appender_key = std::string{appender_prefix} + appender_name;
        const auto appender_type = utils::string::toLower(logger_properties->getString(appender_key).value_or("stderr"));
        if (appender_type == "rollingappender") {
          setup.sinks.push_back(createRotatingFileSink(appender_key, *logger_properties));
        } else if (appender_type == "stdout") {
          setup.sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        } else if (appender_type == "nullappender") {
          setup.sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        } else {
          setup.sinks.push_back(createFallbackSink());
        }
      }
    }
  }
  if (setup.sinks.empty()) {
    setup.sinks.push_back(createFallbackSink());
  }

  for (const auto& key : logger_properties->getConfiguredKeys()) {
    if (!key.starts_with(logger_prefix) || key == root_logger_key) {
      continue;
    }
    const auto value = logger_properties->getString(key).value_or("");
    const auto parts = utils::string::splitAndTrim(value, ",");
    if (parts.empty()) {
      continue;
    }
    if (auto level = parseLevel(parts.front())) {
      setup.levels[key.substr(logger_prefix.size())] = *level;
    }
  }
  return setup;
}

spdlog::sink_ptr LoggerConfiguration::createRotatingFileSink(const std::string& appender_key, const LoggerProperties& properties) {
  std::filesystem::path directory = properties.getString(appender_key + ".directory").value_or("logs");
  std::string file_name = properties.getString(appender_key + ".file_name").value_or("flowstore-app.log");
  const auto max_files = static_cast<size_t>(properties.getInt(appender_key + ".max_files", 3));
  const auto max_file_size = utils::string::toDataSize(properties.getString(appender_key + ".max_file_size").value_or("5 MB")).value_or(5_MiB);

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>((directory / file_name).string(), max_file_size, max_files);
}

spdlog::level::level_enum LoggerConfiguration::levelFor(const std::string& name) const {
  size_t best_match = 0;
  auto level = setup_.root_level;
  for (const auto& [prefix, prefix_level] : setup_.levels) {
    if (name.starts_with(prefix) && prefix.size() >= best_match) {
      best_match = prefix.size();
      level = prefix_level;
    }
  }
  return level;
}

std::shared_ptr<spdlog::logger> LoggerConfiguration::createSpdlogLogger(const std::lock_guard<std::mutex>&, const std::string& name) {
  if (spdlog::get(name)) {
    spdlog::drop(name);
  }
  auto spd_logger = std::make_shared<spdlog::logger>(name, setup_.sinks.begin(), setup_.sinks.end());
  spd_logger->set_level(levelFor(name));
  spd_logger->set_formatter(formatter_->clone());
  spd_logger->flush_on(spdlog::level::err);
  spdlog::register_logger(spd_logger);
  return spd_logger;
}

}  // namespace org::apache::nifi::flowstore::core::logging
