/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "colmap/util/uuid.h"

#include <cstdint>
#include <mutex>
#include <string>

#include "colmap/result.h"
#include "colmap/util/formatter.h"  // IWYU pragma: keep

namespace colmap {

namespace {

constexpr std::array<uint8_t, 256> BuildHexTable() {
  std::array<uint8_t, 256> buf{};
  for (int32_t i = 0; i < 256; i++) {
    if (i >= '0' && i <= '9') {
      buf[i] = static_cast<uint8_t>(i - '0');
    } else if (i >= 'a' && i <= 'f') {
      buf[i] = static_cast<uint8_t>(i - 'a' + 10);
    } else if (i >= 'A' && i <= 'F') {
      buf[i] = static_cast<uint8_t>(i - 'A' + 10);
    } else {
      buf[i] = 0xFF;
    }
  }
  return buf;
}

constexpr auto kHexTable = BuildHexTable();

// Parse a UUID string without dashes, e.g. "67e5504410b1426f9247bb680e5fe0c8"
Result<Uuid> ParseSimple(std::string_view s) {
  std::array<uint8_t, Uuid::kLength> uuid{};
  for (size_t i = 0; i < Uuid::kLength; i++) {
    uint8_t h1 = kHexTable[static_cast<uint8_t>(s[i * 2])];
    uint8_t h2 = kHexTable[static_cast<uint8_t>(s[i * 2 + 1])];
    if ((h1 | h2) == 0xFF) [[unlikely]] {
      return InvalidArgument("Invalid UUID string: {}", s);
    }
    uuid[i] = static_cast<uint8_t>((h1 << 4) | h2);
  }
  return Uuid(uuid);
}

// Parse a UUID string with dashes, e.g. "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
Result<Uuid> ParseHyphenated(std::string_view s) {
  if (!(s[8] == '-' && s[13] == '-' && s[18] == '-' && s[23] == '-')) [[unlikely]] {
    return InvalidArgument("Invalid UUID string: {}", s);
  }

  std::string simple;
  simple.reserve(32);
  for (char c : s) {
    if (c != '-') {
      simple.push_back(c);
    }
  }
  if (simple.size() != 32) [[unlikely]] {
    return InvalidArgument("Invalid UUID string: {}", s);
  }
  return ParseSimple(simple);
}

}  // namespace

Uuid::Uuid(std::array<uint8_t, kLength> data) : data_(data) {}

Uuid Uuid::GenerateV4() {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};
  std::lock_guard<std::mutex> lock(mutex);
  return GenerateV4(engine);
}

Uuid Uuid::GenerateV4(std::mt19937_64& engine) {
  std::array<uint8_t, kLength> uuid{};

  uint64_t high_bits = engine();
  uint64_t low_bits = engine();
  for (size_t i = 0; i < 8; ++i) {
    uuid[i] = static_cast<uint8_t>(high_bits >> (56 - 8 * i));
    uuid[i + 8] = static_cast<uint8_t>(low_bits >> (56 - 8 * i));
  }

  // Set magic numbers for a "version 4" (pseudorandom) UUID and variant,
  // see https://datatracker.ietf.org/doc/html/rfc9562#name-uuid-version-4
  uuid[6] = (uuid[6] & 0x0F) | 0x40;
  // Set variant field, top two bits are 1, 0
  uuid[8] = (uuid[8] & 0x3F) | 0x80;

  return Uuid(uuid);
}

Result<Uuid> Uuid::FromString(std::string_view str) {
  if (str.size() == 32) {
    return ParseSimple(str);
  } else if (str.size() == 36) {
    return ParseHyphenated(str);
  } else {
    return InvalidArgument("Invalid UUID string: {}", str);
  }
}

std::string Uuid::ToString() const {
  return std::format(
      "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}"
      "{:02x}{:02x}{:02x}",
      data_[0], data_[1], data_[2], data_[3], data_[4], data_[5], data_[6], data_[7],
      data_[8], data_[9], data_[10], data_[11], data_[12], data_[13], data_[14],
      data_[15]);
}

}  // namespace colmap
