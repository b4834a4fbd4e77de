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
enum class EngineVariant : uint8_t { FAST, GENERATIVE };

enum class EngineState : uint8_t {
  IDLE,
  PREPROCESSING,
  CONDITIONING,
  SAMPLING,
  POSTPROCESSING,
  DONE,
  FAILED
};

// Working resolution granularity of each variant
inline constexpr int kFastGranularity       = 32;
inline constexpr int kGenerativeGranularity = 8;

auto EngineVariantToString(EngineVariant variant) -> std::string;
/**
 * @throws InvalidRequestError on an unknown name
 */
auto EngineVariantFromString(const std::string& name) -> EngineVariant;
auto EngineStateToString(EngineState state) -> std::string;
auto GranularityOf(EngineVariant variant) -> int;
};  // namespace mangatint
