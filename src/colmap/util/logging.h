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

/// \file colmap/util/logging.h
/// Logging for colmap.  Messages go to an spdlog logger registered under the
/// name "colmap"; applications can replace it by dropping and re-registering a
/// logger with that name, or tune it through spdlog's registry.

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "colmap/colmap_export.h"

namespace colmap {

constexpr std::string_view kLoggerName = "colmap";

/// \brief Get the logger used by colmap.
///
/// The first call registers a clone of spdlog's default logger under
/// kLoggerName unless one is already registered.
COLMAP_EXPORT std::shared_ptr<spdlog::logger> Logger();

}  // namespace colmap

/// Arguments are only evaluated when the logger accepts `level`.
#define COLMAP_LOG(level, ...)                   \
  do {                                           \
    if (auto colmap_logger = ::colmap::Logger(); \
        colmap_logger->should_log(level)) {      \
      colmap_logger->log(level, __VA_ARGS__);    \
    }                                            \
  } while (false)

#define COLMAP_LOG_TRACE(...) COLMAP_LOG(::spdlog::level::trace, __VA_ARGS__)
#define COLMAP_LOG_DEBUG(...) COLMAP_LOG(::spdlog::level::debug, __VA_ARGS__)
#define COLMAP_LOG_INFO(...) COLMAP_LOG(::spdlog::level::info, __VA_ARGS__)
#define COLMAP_LOG_WARN(...) COLMAP_LOG(::spdlog::level::warn, __VA_ARGS__)
