//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <string>

#include "type/type.hpp"

namespace mangatint {
/**
 * @brief A uniquely named directory below a root, removed with its contents on destruction
 */
class ScopedTempDir {
 private:
  file_path_t path_;

 public:
  ScopedTempDir(const file_path_t& root, const std::string& prefix);
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&)            = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  auto Path() const -> const file_path_t& { return path_; }
};
};  // namespace mangatint
