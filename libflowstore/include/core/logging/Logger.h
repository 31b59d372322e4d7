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

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "spdlog/common.h"
#include "spdlog/logger.h"
#include "fmt/chrono.h"
#include "fmt/format.h"
#include "fmt/std.h"

namespace org::apache::nifi::flowstore::core::logging {

inline constexpr size_t LOG_BUFFER_SIZE = 4096;

class LoggerControl {
 public:
  LoggerControl() = default;

  [[nodiscard]] bool is_enabled() const {
    return is_enabled_;
  }

  void setEnabled(bool status) {
    is_enabled_ = status;
  }

 protected:
  std::atomic<bool> is_enabled_{true};
};

enum LOG_LEVEL {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  err = 4,
  critical = 5,
  off = 6
};

inline spdlog::level::level_enum mapToSpdLogLevel(LOG_LEVEL level) {
  switch (level) {
    case trace: return spdlog::level::trace;
    case debug: return spdlog::level::debug;
    case info: return spdlog::level::info;
    case warn: return spdlog::level::warn;
    case err: return spdlog::level::err;
    case critical: return spdlog::level::critical;
    case off: return spdlog::level::off;
  }
  throw std::invalid_argument(fmt::format("Invalid LOG_LEVEL {}", static_cast<int>(level)));
}

inline LOG_LEVEL mapFromSpdLogLevel(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace: return LOG_LEVEL::trace;
    case spdlog::level::debug: return LOG_LEVEL::debug;
    case spdlog::level::info: return LOG_LEVEL::info;
    case spdlog::level::warn: return LOG_LEVEL::warn;
    case spdlog::level::err: return LOG_LEVEL::err;
    case spdlog::level::critical: return LOG_LEVEL::critical;
    case spdlog::level::off: return LOG_LEVEL::off;
    case spdlog::level::n_levels: break;
  }
  throw std::invalid_argument(fmt::format("Invalid spdlog::level::level_enum {}", static_cast<int>(level)));
}

class Logger {
 public:
  Logger(Logger const&) = delete;
  Logger& operator=(Logger const&) = delete;
  virtual ~Logger() = default;

  template<typename ...Args>
  void log_with_level(LOG_LEVEL log_level, fmt::format_string<Args...> fmt, Args&& ...args) {
    return log(mapToSpdLogLevel(log_level), std::move(fmt), std::forward<Args>(args)...);
  }

  template<typename ...Args>
  void log_critical(fmt::format_string<Args...> fmt, Args&& ...args) {
    log(spdlog::level::critical, std::move(fmt), std::forward<Args>(args)...);
  }

  template<typename ...Args>
  void log_error(fmt::format_string<Args...> fmt, Args&& ...args) {
    log(spdlog::level::err, std::move(fmt), std::forward<Args>(args)...);
  }

  template<typename ...Args>
  void log_warn(fmt::format_string<Args...> fmt, Args&& ...args) {
    log(spdlog::level::warn, std::move(fmt), std::forward<Args>(args)...);
  }

  template<typename ...Args>
  void log_info(fmt::format_string<Args...> fmt, Args&& ...args) {
    log(spdlog::level::info, std::move(fmt), std::forward<Args>(args)...);
  }

  template<typename ...Args>
  void log_debug(fmt::format_string<Args...> fmt, Args&& ...args) {
    log(spdlog::level::debug, std::move(fmt), std::forward<Args>(args)...);
  }

  template<typename ...Args>
  void log_trace(fmt::format_string<Args...> fmt, Args&& ...args) {
    log(spdlog::level::trace, std::move(fmt), std::forward<Args>(args)...);
  }

  void set_max_log_size(int size) {
    max_log_size_ = size;
  }

  bool should_log(LOG_LEVEL level);
  void log_string(LOG_LEVEL level, std::string str);
  [[nodiscard]] LOG_LEVEL level() const;

 protected:
  Logger(std::shared_ptr<spdlog::logger> delegate, std::shared_ptr<LoggerControl> controller);

  std::shared_ptr<spdlog::logger> delegate_;
  std::shared_ptr<LoggerControl> controller_;

  mutable std::mutex mutex_;

 private:
  std::string trimToMaxSize(std::string my_string) const {
    auto max_log_size = max_log_size_.load();
    if (max_log_size >= 0 && my_string.size() > static_cast<size_t>(max_log_size))
      my_string = my_string.substr(0, max_log_size);
    return my_string;
  }

  template<typename ...Args>
  inline void log(spdlog::level::level_enum level, fmt::format_string<Args...> fmt, Args&& ...args) {
    if (controller_ && !controller_->is_enabled())
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!delegate_->should_log(level)) {
      return;
    }
    delegate_->log(level, trimToMaxSize(fmt::format(std::move(fmt), std::forward<Args>(args)...)));
  }

  std::atomic<int> max_log_size_{LOG_BUFFER_SIZE};
};

}  // namespace org::apache::nifi::flowstore::core::logging
