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

#include <cstdint>
#include <string>

namespace mangatint {
/**
 * @brief Parse a command-line value as a finite number
 *
 * @throws InvalidRequestError naming the flag when the value is not a whole-string number
 */
auto ParseNumber(const std::string& flag, const std::string& value) -> double;

/**
 * @brief Parse a command-line value as an int; fractions and out-of-range values are rejected
 */
auto ParseInteger(const std::string& flag, const std::string& value) -> int;

auto ParseSeed(const std::string& flag, const std::string& value) -> uint64_t;
};  // namespace mangatint
