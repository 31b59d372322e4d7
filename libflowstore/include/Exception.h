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

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

#include "utils/StringUtils.h"

namespace org::apache::nifi::flowstore {

enum ExceptionType {
  FILE_OPERATION_EXCEPTION = 0,
  FLOWFILE_EXCEPTION,
  REPOSITORY_EXCEPTION,
  CONTENT_NOT_FOUND_EXCEPTION,
  SWAP_EXCEPTION,
  LOAD_BALANCE_EXCEPTION,
  PROTOCOL_EXCEPTION,
  CONFIGURATION_EXCEPTION,
  GENERAL_EXCEPTION,
  MAX_EXCEPTION
};

static const char *ExceptionStr[MAX_EXCEPTION] = { "File Operation", "Flow File Operation", "Repository Operation", "Content Not Found", "Swap Operation",
    "Load Balance Operation", "Load Balance Protocol", "Configuration", "General Operation"};

inline const char *ExceptionTypeToString(ExceptionType type) {
  if (type < MAX_EXCEPTION)
    return ExceptionStr[type];
  else
    return nullptr;
}

struct Exception : public std::runtime_error {
  Exception(ExceptionType type, const std::string& errorMsg)
      :std::runtime_error{ utils::string::join_pack(ExceptionTypeToString(type), ": ", errorMsg) }, type_{type}
  { }

  Exception(ExceptionType type, const char* errorMsg)
      :std::runtime_error{ utils::string::join_pack(ExceptionTypeToString(type), ": ", errorMsg) }, type_{type}
  { }

  ExceptionType getType() const { return type_; }

 protected:
  explicit Exception(const std::string& errmsg)
      :std::runtime_error{ errmsg }
  {}
  explicit Exception(const char* errmsg)
      :std::runtime_error{ errmsg }
  {}

 private:
  ExceptionType type_{GENERAL_EXCEPTION};
};

/**
 * Thrown when the content of a claim is requested but the backing
 * resource no longer exists (or never existed).
 */
struct ContentNotFoundException : Exception {
  explicit ContentNotFoundException(const std::string& claim)
      :Exception{ CONTENT_NOT_FOUND_EXCEPTION, utils::string::join_pack("Could not find content for ", claim) }
  {}
};

/**
 * Thrown by the load balance protocol when the peer aborts the transaction
 * or a checksum is rejected.
 */
struct TransactionAbortedException : Exception {
  explicit TransactionAbortedException(const std::string& reason)
      :Exception{ LOAD_BALANCE_EXCEPTION, utils::string::join_pack("Transaction aborted: ", reason) }
  {}
};

struct SystemErrorException : Exception {
  explicit SystemErrorException(const char* const operation, std::error_condition error_condition)
      :Exception{ utils::string::join_pack(operation, ": ", error_condition.message()) },
      error_condition_{ error_condition }
  {}

  std::error_condition error_condition() { return error_condition_; }

 private:
  std::error_condition error_condition_;
};

}  // namespace org::apache::nifi::flowstore
