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

#include "engine/engine_variant.hpp"

#include "type/errors.hpp"

namespace mangatint {
auto EngineVariantToString(EngineVariant variant) -> std::string {
  return variant == EngineVariant::FAST ? "fast" : "generative";
}

auto EngineVariantFromString(const std::string& name) -> EngineVariant {
  if (name == "fast") {
    return EngineVariant::FAST;
  }
  if (name == "generative") {
    return EngineVariant::GENERATIVE;
  }
  throw InvalidRequestError("[ERROR] ColorizationRequest: Unknown engine '" + name + "'");
}

auto EngineStateToString(EngineState state) -> std::string {
  switch (state) {
    case EngineState::IDLE:
      return "idle";
    case EngineState::PREPROCESSING:
      return "preprocessing";
    case EngineState::CONDITIONING:
      return "conditioning";
    case EngineState::SAMPLING:
      return "sampling";
    case EngineState::POSTPROCESSING:
      return "postprocessing";
    case EngineState::DONE:
      return "done";
    default:
      return "failed";
  }
}

auto GranularityOf(EngineVariant variant) -> int {
  return variant == EngineVariant::FAST ? kFastGranularity : kGenerativeGranularity;
}
};  // namespace mangatint
