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
#include "core/ResourceClaim.h"

#include <utility>

namespace org::apache::nifi::flowstore::core {

ResourceClaim::ResourceClaim(std::string container, std::string section, std::string id, bool loss_tolerant, bool in_use)
    : container_(std::move(container)),
      section_(std::move(section)),
      id_(std::move(id)),
      key_(container_ + "/" + section_ + "/" + id_),
      loss_tolerant_(loss_tolerant),
      in_use_(in_use) {
}

}  // namespace org::apache::nifi::flowstore::core
