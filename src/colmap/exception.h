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

/// \file colmap/exception.h
/// Common exception types for colmap.  Errors are reported through Result and
/// Status; an exception is only thrown where no return channel exists, e.g. a
/// configuration entry whose string value cannot be converted.

#include <format>
#include <stdexcept>
#include <string>

#include "colmap/colmap_export.h"

namespace colmap {

/// \brief Base exception class for exceptions thrown by colmap.
class COLMAP_EXPORT ColmapError : public std::runtime_error {
 public:
  explicit ColmapError(const std::string& what) : std::runtime_error(what) {}
};

#define COLMAP_CHECK_OR_DIE(condition, ...)                \
  do {                                                     \
    if (!(condition)) [[unlikely]] {                       \
      throw colmap::ColmapError(std::format(__VA_ARGS__)); \
    }                                                      \
  } while (0)

}  // namespace colmap
