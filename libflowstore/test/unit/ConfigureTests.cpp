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
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "Catch.h"
#include "TestBase.h"
#include "properties/Configure.h"
#include "properties/PropertiesFile.h"

using namespace std::literals::chrono_literals;

TEST_CASE("Configure parses durations", "[Configure]") {
  flowstore::Configure configuration;
  configuration.set("a", "500 ms");
  configuration.set("b", "10 sec");
  configuration.set("c", "2 min");
  configuration.set("d", "250");
  configuration.set("e", "1 hour");
  configuration.set("f", "soon");
  configuration.set("g", "5 fortnights");

  CHECK(configuration.getDuration("a") == 500ms);
  CHECK(configuration.getDuration("b") == 10s);
  CHECK(configuration.getDuration("c") == 2min);
  CHECK(configuration.getDuration("d") == 250ms);
  CHECK(configuration.getDuration("e") == 1h);
  CHECK_FALSE(configuration.getDuration("f"));
  CHECK_FALSE(configuration.getDuration("g"));
  CHECK_FALSE(configuration.getDuration("missing"));
}

TEST_CASE("Configure parses data sizes", "[Configure]") {
  flowstore::Configure configuration;
  configuration.set("a", "100");
  configuration.set("b", "512 KB");
  configuration.set("c", "1 MB");
  configuration.set("d", "2GB");
  configuration.set("e", "many bytes");
  configuration.set("f", "3 PB");

  CHECK(configuration.getDataSize("a") == 100);
  CHECK(configuration.getDataSize("b") == 512 * 1024);
  CHECK(configuration.getDataSize("c") == 1024 * 1024);
  CHECK(configuration.getDataSize("d") == uint64_t{2} * 1024 * 1024 * 1024);
  CHECK_FALSE(configuration.getDataSize("e"));
  CHECK_FALSE(configuration.getDataSize("f"));
}

TEST_CASE("Configure parses booleans and integers", "[Configure]") {
  flowstore::Configure configuration;
  configuration.set("yes", " TRUE ");
  configuration.set("no", "false");
  configuration.set("neither", "1");
  configuration.set("number", "42");

  CHECK(configuration.getBool("yes") == true);
  CHECK(configuration.getBool("no") == false);
  CHECK_FALSE(configuration.getBool("neither"));
  CHECK_FALSE(configuration.getBool("missing"));
  CHECK(configuration.getInt("number", 7) == 42);
  CHECK(configuration.getInt("yes", 7) == 7);
  CHECK(configuration.getInt("missing", 7) == 7);
}

TEST_CASE("Properties files consist of trimmed key=value lines", "[PropertiesFile]") {
  std::istringstream input{
      "# a comment\n"
      "\n"
      "flowstore.queues = q1, q2\n"
      "  flowstore.load.balance.port=6342  \n"
      "not a property\n"
      "=no key\n"
      "flowstore.flowfile.repository.rocksdb.options.max_open_files=a=b\n"};
  flowstore::PropertiesFile file{input};

  CHECK(file.size() == 7);
  CHECK(file.getValue("flowstore.queues") == "q1, q2");
  CHECK(file.getValue("flowstore.load.balance.port") == "6342");
  CHECK(file.getValue("flowstore.flowfile.repository.rocksdb.options.max_open_files") == "a=b");
  CHECK_FALSE(file.hasValue("not a property"));
  CHECK_FALSE(file.getValue(""));
}

TEST_CASE("Configure loads a properties file", "[Configure]") {
  TestController testController;
  const auto dir = testController.createTempDirectory();
  const auto properties_file = dir / "flowstore.properties";
  std::ofstream{properties_file}
      << "flowstore.content.repository.sections=16\n"
      << "flowstore.load.balance.comms.timeout=30 sec\n";

  flowstore::Configure configuration;
  configuration.set("stale", "value");
  REQUIRE(configuration.loadConfigureFile(properties_file));
  CHECK(configuration.getFilePath() == properties_file);
  CHECK(configuration.getInt(flowstore::Configure::flowstore_content_repository_sections, 1024) == 16);
  CHECK(configuration.getDuration(flowstore::Configure::flowstore_load_balance_comms_timeout) == 30s);
  CHECK_FALSE(configuration.has("stale"));

  CHECK_FALSE(configuration.loadConfigureFile(dir / "missing.properties"));
  CHECK_FALSE(configuration.loadConfigureFile(""));
}
