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

/// \file colmap/column_path.h
/// A reference to a (possibly nested) column as a sequence of names.

#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include "colmap/colmap_export.h"
#include "colmap/result.h"
#include "colmap/util/formattable.h"

namespace colmap {

/// \brief An ordered, non-empty list of names from the schema root to a column.
///
/// Each name selects a struct field, or one of the "element", "key" and
/// "value" positions of an array or a map.  Names are kept verbatim; dots
/// inside a name do not split it.
class COLMAP_EXPORT ColumnPath : public util::Formattable {
 public:
  /// \brief Construct a path.  Throws ColmapError if `names` is empty.
  explicit ColumnPath(std::vector<std::string> names);
  ColumnPath(std::initializer_list<std::string> names);

  /// \brief Create a path, failing with InvalidArgument if `names` is empty.
  static Result<ColumnPath> Make(std::vector<std::string> names);

  [[nodiscard]] std::span<const std::string> names() const { return names_; }

  [[nodiscard]] size_t size() const { return names_.size(); }

  [[nodiscard]] const std::string& operator[](size_t i) const { return names_[i]; }

  /// \brief Return a new path with `name` appended.
  ColumnPath Child(std::string name) const;

  /// \brief Render as `a`.`b`.`c`, doubling backticks inside names.
  std::string ToString() const override;

  friend bool operator==(const ColumnPath& lhs, const ColumnPath& rhs) {
    return lhs.names_ == rhs.names_;
  }

 private:
  std::vector<std::string> names_;
};

}  // namespace colmap
