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

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>

#include "colmap/colmap_export.h"

namespace colmap {

class COLMAP_EXPORT StringUtils {
 public:
  static std::string ToLower(std::string_view str) {
    return str | std::ranges::views::transform([](char c) {
             return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
           }) |
           std::ranges::to<std::string>();
  }

  static bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(lhs, rhs, [](char lc, char rc) {
      return std::tolower(static_cast<unsigned char>(lc)) ==
             std::tolower(static_cast<unsigned char>(rc));
    });
  }

  /// \brief Quote a name with backticks, doubling any backtick inside it.
  static std::string QuoteWithBackticks(std::string_view name) {
    std::string quoted = "`";
    for (char c : name) {
      if (c == '`') {
        quoted += '`';
      }
      quoted += c;
    }
    quoted += '`';
    return quoted;
  }
};

}  // namespace colmap
