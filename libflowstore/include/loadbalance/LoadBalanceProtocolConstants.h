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

#include <cstddef>
#include <cstdint>

namespace org::apache::nifi::flowstore::loadbalance {

namespace protocol {

constexpr uint8_t PROTOCOL_VERSION = 1;

// version negotiation
constexpr uint8_t VERSION_ACCEPTED = 0x10;
constexpr uint8_t REQUEST_DIFFERENT_VERSION = 0x11;
constexpr uint8_t ABORT_PROTOCOL_NEGOTIATION = 0x12;

// space check
constexpr uint8_t CHECK_SPACE = 0x61;
constexpr uint8_t SKIP_SPACE_CHECK = 0x62;
constexpr uint8_t SPACE_AVAILABLE = 0x65;
constexpr uint8_t QUEUE_FULL = 0x66;

// FlowFile transfer
constexpr uint8_t MORE_FLOWFILES = 0x24;
constexpr uint8_t NO_MORE_FLOWFILES = 0x25;

// content frames
constexpr uint8_t NO_DATA_FRAME = 0x40;
constexpr uint8_t DATA_FRAME_FOLLOWS = 0x42;
// sent in place of a frame or a FlowFile
constexpr uint8_t ABORT_DATA_TRANSFER = 0x99;

// checksum
constexpr uint8_t CONFIRM_CHECKSUM = 0x51;
constexpr uint8_t REJECT_CHECKSUM = 0x52;

// transaction completion
constexpr uint8_t COMPLETE_TRANSACTION = 0x71;
constexpr uint8_t ABORT_TRANSACTION = 0x72;
constexpr uint8_t CONFIRM_COMPLETE_TRANSACTION = 0x73;

constexpr uint8_t COMPRESSION_NONE = 0;
constexpr uint8_t COMPRESSION_GZIP = 1;

constexpr size_t MAX_DATA_FRAME_SIZE = 64 * 1024;
// a compressed frame may be slightly larger than its uncompressed payload
constexpr uint32_t MAX_WIRE_FRAME_SIZE = 2 * MAX_DATA_FRAME_SIZE;
constexpr uint32_t MAX_ATTRIBUTE_BLOCK_SIZE = 64 * 1024 * 1024;

}  // namespace protocol

}  // namespace org::apache::nifi::flowstore::loadbalance
