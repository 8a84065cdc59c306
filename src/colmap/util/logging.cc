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

#include "colmap/util/logging.h"

#include <string>

namespace colmap {

std::shared_ptr<spdlog::logger> Logger() {
  static const bool kRegistered = [] {
    if (spdlog::get(std::string(kLoggerName)) == nullptr) {
      spdlog::register_logger(spdlog::default_logger()->clone(std::string(kLoggerName)));
    }
    return true;
  }();
  (void)kRegistered;

  // The registered logger may have been dropped by the application.
  if (auto logger = spdlog::get(std::string(kLoggerName)); logger != nullptr) {
    return logger;
  }
  return spdlog::default_logger();
}

}  // namespace colmap
