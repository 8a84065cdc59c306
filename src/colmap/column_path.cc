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

#include "colmap/column_path.h"

#include "colmap/exception.h"
#include "colmap/util/string_util.h"

namespace colmap {

ColumnPath::ColumnPath(std::vector<std::string> names) : names_(std::move(names)) {
  COLMAP_CHECK_OR_DIE(!names_.empty(), "ColumnPath: a path needs at least one name");
}

ColumnPath::ColumnPath(std::initializer_list<std::string> names)
    : ColumnPath(std::vector<std::string>(names)) {}

Result<ColumnPath> ColumnPath::Make(std::vector<std::string> names) {
  if (names.empty()) [[unlikely]] {
    return InvalidArgument("Column path must not be empty");
  }
  return ColumnPath(std::move(names));
}

ColumnPath ColumnPath::Child(std::string name) const {
  std::vector<std::string> names = names_;
  names.push_back(std::move(name));
  return ColumnPath(std::move(names));
}

std::string ColumnPath::ToString() const {
  std::string repr;
  for (size_t i = 0; i < names_.size(); ++i) {
    if (i > 0) {
      repr += '.';
    }
    repr += StringUtils::QuoteWithBackticks(names_[i]);
  }
  return repr;
}

}  // namespace colmap
