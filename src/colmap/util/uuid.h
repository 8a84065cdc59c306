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

#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <span>
#include <string_view>

#include "colmap/colmap_export.h"
#include "colmap/result.h"
#include "colmap/util/formattable.h"

/// \file colmap/util/uuid.h
/// \brief UUID (Universally Unique Identifier) representation.

namespace colmap {

class COLMAP_EXPORT Uuid : public util::Formattable {
 public:
  Uuid() = delete;
  constexpr static size_t kLength = 16;

  explicit Uuid(std::array<uint8_t, kLength> data);

  /// \brief Generate a random UUID (version 4) from a process-wide engine.
  static Uuid GenerateV4();

  /// \brief Generate a random UUID (version 4) drawing bits from `engine`.
  ///
  /// Seeding the engine makes the generated sequence reproducible.
  static Uuid GenerateV4(std::mt19937_64& engine);

  /// \brief Create a UUID from a string in standard format.
  static Result<Uuid> FromString(std::string_view str);

  /// \brief Get the raw bytes of the UUID.
  std::span<const uint8_t> bytes() const { return data_; }

  /// \brief Convert the UUID to a string in standard format.
  std::string ToString() const override;

  friend bool operator==(const Uuid& lhs, const Uuid& rhs) {
    return lhs.data_ == rhs.data_;
  }

 private:
  std::array<uint8_t, kLength> data_;
};

}  // namespace colmap
