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

#include "cli/cli_args.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "type/errors.hpp"

namespace mangatint {
auto ParseNumber(const std::string& flag, const std::string& value) -> double {
  double number = 0.0;
  try {
    size_t used = 0;
    number      = std::stod(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw InvalidRequestError("[ERROR] mangatint: " + flag + " expects a number, got '" + value +
                              "'");
  }
  if (!std::isfinite(number)) {
    throw InvalidRequestError("[ERROR] mangatint: " + flag + " expects a finite number, got '" +
                              value + "'");
  }
  return number;
}

auto ParseInteger(const std::string& flag, const std::string& value) -> int {
  const double number = ParseNumber(flag, value);
  if (number != std::trunc(number) ||
      number < static_cast<double>(std::numeric_limits<int>::min()) ||
      number > static_cast<double>(std::numeric_limits<int>::max())) {
    throw InvalidRequestError("[ERROR] mangatint: " + flag + " expects an integer, got '" + value +
                              "'");
  }
  return static_cast<int>(number);
}

auto ParseSeed(const std::string& flag, const std::string& value) -> uint64_t {
  // stoull accepts a sign and wraps negatives
  if (value.empty() || value.front() == '-' || value.front() == '+') {
    throw InvalidRequestError("[ERROR] mangatint: " + flag + " expects an unsigned integer, got '" +
                              value + "'");
  }
  try {
    size_t   used = 0;
    uint64_t seed = std::stoull(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return seed;
  } catch (const std::logic_error&) {
    throw InvalidRequestError("[ERROR] mangatint: " + flag + " expects an unsigned integer, got '" +
                              value + "'");
  }
}
};  // namespace mangatint
