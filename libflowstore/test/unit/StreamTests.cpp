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
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "Catch.h"
#include "TestBase.h"
#include "io/BufferStream.h"
#include "io/CRCStream.h"
#include "io/FileStream.h"
#include "io/StreamSlice.h"
#include "io/Gzip.h"

namespace io = flowstore::io;

namespace {

std::span<const std::byte> asBytes(const std::string& str) {
  return std::as_bytes(std::span<const char>(str));
}

std::string asString(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace

TEST_CASE("Integers are written in network byte order", "[BufferStream]") {
  io::BufferStream stream;
  CHECK(stream.write(uint32_t{0x01020304}) == 4);
  CHECK(stream.write(uint8_t{0x99}) == 1);
  CHECK(stream.write(uint64_t{42}) == 8);
  REQUIRE(stream.size() == 13);
  CHECK(stream.getBuffer()[0] == std::byte{0x01});
  CHECK(stream.getBuffer()[3] == std::byte{0x04});
  CHECK(stream.getBuffer()[4] == std::byte{0x99});

  uint32_t int32 = 0;
  uint8_t int8 = 0;
  uint64_t int64 = 0;
  CHECK(stream.read(int32) == 4);
  CHECK(stream.read(int8) == 1);
  CHECK(stream.read(int64) == 8);
  CHECK(int32 == 0x01020304);
  CHECK(int8 == 0x99);
  CHECK(int64 == 42);
  CHECK(io::isError(stream.read(int8)));
}

TEST_CASE("Strings carry a length prefix", "[BufferStream]") {
  io::BufferStream stream;
  const std::string text = "node-1:6342";
  CHECK(stream.write(text) == 2 + text.size());
  CHECK(stream.write(text, true) == 4 + text.size());
  CHECK(stream.write(std::string{}, true) == 4);

  std::string short_prefixed;
  std::string widened;
  std::string empty = "overwritten";
  CHECK(stream.read(short_prefixed) == 2 + text.size());
  CHECK(stream.read(widened, true) == 4 + text.size());
  CHECK(stream.read(empty, true) == 4);
  CHECK(short_prefixed == text);
  CHECK(widened == text);
  CHECK(empty.empty());

  io::BufferStream truncated;
  truncated.write(uint32_t{100});
  truncated.write(asBytes("short"));
  std::string result;
  CHECK(io::isError(truncated.read(result, true)));
}

TEST_CASE("CRCStream computes the CRC-32 of the bytes passing through", "[CRCStream]") {
  io::BufferStream buffer;
  {
    io::CRCStream crc_stream(gsl::make_not_null(&buffer));
    crc_stream.write(asBytes("123456789"));
    CHECK(crc_stream.getCRC() == 0xCBF43926);
    crc_stream.reset();
    CHECK(crc_stream.getCRC() == 0);
  }

  io::CRCStream reading_crc_stream(gsl::make_not_null(&buffer));
  std::vector<std::byte> content(9);
  CHECK(reading_crc_stream.read(content) == 9);
  CHECK(asString(content) == "123456789");
  CHECK(reading_crc_stream.getCRC() == 0xCBF43926);
}

TEST_CASE("CRCStream continues from an initial CRC", "[CRCStream]") {
  io::BufferStream buffer;
  io::CRCStream first_half(gsl::make_not_null(&buffer));
  first_half.write(asBytes("12345"));
  io::CRCStream second_half(gsl::make_not_null(&buffer), first_half.getCRC());
  second_half.write(asBytes("6789"));
  CHECK(second_half.getCRC() == 0xCBF43926);
}

TEST_CASE("StreamSlice exposes a window of the underlying stream", "[StreamSlice]") {
  auto stream = std::make_shared<io::BufferStream>(std::string("hello world"));
  io::StreamSlice slice(stream, 6, 5);
  CHECK(slice.size() == 5);
  CHECK(asString(slice.getBuffer()) == "world");

  std::vector<std::byte> content(10);
  CHECK(slice.read(content) == 5);
  CHECK(asString(std::span<const std::byte>(content).subspan(0, 5)) == "world");
  CHECK(slice.read(content) == 0);

  slice.seek(2);
  CHECK(slice.tell() == 2);
  std::vector<std::byte> tail(3);
  CHECK(slice.readFully(tail) == 3);
  CHECK(asString(tail) == "rld");

  CHECK_THROWS_AS(io::StreamSlice(stream, 6, 6), std::invalid_argument);
}

TEST_CASE("Compressed data decompresses to the original", "[Gzip]") {
  std::string original;
  for (int i = 0; i < 1000; ++i) {
    original += "attribute-" + std::to_string(i % 7) + "=value;";
  }
  const auto compressed = io::gzip::compress(asBytes(original));
  REQUIRE(compressed);
  CHECK(compressed->size() < original.size());
  // gzip header
  CHECK((*compressed)[0] == std::byte{0x1f});
  CHECK((*compressed)[1] == std::byte{0x8b});

  const auto decompressed = io::gzip::decompress(*compressed);
  REQUIRE(decompressed);
  CHECK(asString(*decompressed) == original);

  const auto empty = io::gzip::compress({});
  REQUIRE(empty);
  const auto decompressed_empty = io::gzip::decompress(*empty);
  REQUIRE(decompressed_empty);
  CHECK(decompressed_empty->empty());
}

TEST_CASE("Corrupt compressed data is rejected", "[Gzip]") {
  TestController testController;
  const auto compressed = io::gzip::compress(asBytes("some attributes to compress"));
  REQUIRE(compressed);

  SECTION("Truncated") {
    CHECK_FALSE(io::gzip::decompress(std::span<const std::byte>(*compressed).subspan(0, compressed->size() / 2)));
  }

  SECTION("Not compressed at all") {
    CHECK_FALSE(io::gzip::decompress(asBytes("plain text, not gzip")));
  }
}

TEST_CASE("An appending FileStream continues at the end of the file", "[FileStream]") {
  TestController testController;
  const auto path = testController.createTempDirectory() / "resource";
  {
    io::FileStream stream(path, io::FileStream::Mode::Overwrite);
    REQUIRE(stream.isOpen());
    CHECK(stream.write(asBytes("hello")) == 5);
    CHECK(stream.sync());
  }
  {
    io::FileStream stream(path, io::FileStream::Mode::Append);
    REQUIRE(stream.isOpen());
    CHECK(stream.size() == 5);
    CHECK(stream.tell() == 5);
    CHECK(stream.write(asBytes(" world")) == 6);
    CHECK(stream.size() == 11);
    CHECK_THROWS_AS(stream.seek(0), std::runtime_error);
    std::vector<std::byte> buffer(4);
    CHECK(io::isError(stream.read(buffer)));
  }
  CHECK(std::filesystem::file_size(path) == 11);
}

TEST_CASE("A reading FileStream returns what is left at the end of the file", "[FileStream]") {
  TestController testController;
  const auto path = testController.createTempDirectory() / "resource";
  {
    io::FileStream stream(path, io::FileStream::Mode::Overwrite);
    REQUIRE(stream.write(asBytes("hello world")) == 11);
  }
  io::FileStream stream(path, io::FileStream::Mode::Read);
  REQUIRE(stream.isOpen());
  CHECK(stream.size() == 11);
  CHECK(io::isError(stream.write(asBytes("x"))));

  stream.seek(6);
  std::vector<std::byte> buffer(10);
  CHECK(stream.read(buffer) == 5);
  CHECK(asString(std::span<const std::byte>(buffer).subspan(0, 5)) == "world");
  CHECK(stream.tell() == 11);
  CHECK(stream.read(buffer) == 0);

  stream.seek(0);
  CHECK(stream.read(std::span<std::byte>(buffer).subspan(0, 5)) == 5);
  CHECK(asString(std::span<const std::byte>(buffer).subspan(0, 5)) == "hello");
}

TEST_CASE("A FileStream of a missing file is not open", "[FileStream]") {
  TestController testController;
  const auto dir = testController.createTempDirectory();
  io::FileStream stream(dir / "missing", io::FileStream::Mode::Read);
  CHECK_FALSE(stream.isOpen());
  std::vector<std::byte> buffer(1);
  CHECK(io::isError(stream.read(buffer)));
}
