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

#include <chrono>
#include <string>

namespace mangatint {
class TimeProvider {
 public:
  using steady_point_t = std::chrono::steady_clock::time_point;

  static auto Now() -> std::chrono::system_clock::time_point;
  static auto TimePointToString(const std::chrono::system_clock::time_point& tp) -> std::string;
  /**
   * @brief Milliseconds elapsed since start, as a double for timing metadata
   */
  static auto ElapsedMs(const steady_point_t& start) -> double;
};
}  // namespace mangatint
