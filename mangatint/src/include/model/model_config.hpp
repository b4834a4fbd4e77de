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

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_map>

#include "type/type.hpp"

namespace mangatint {
namespace models {
inline constexpr std::string_view kLineArt       = "lineart";
inline constexpr std::string_view kFastColorizer = "fast-colorizer";
inline constexpr std::string_view kDenoiser      = "denoiser";

inline constexpr std::string_view kBuiltinScheme = "builtin:";
};  // namespace models

/**
 * @brief Where a model comes from. The uri is either a file readable by cv::dnn or
 * "builtin:<name>" for an in-process implementation.
 */
struct ModelConfig {
  model_id_t  id_;
  std::string uri_;
  // Square network input side, 0 when the network accepts any size
  int         input_size_ = 0;

  auto        IsBuiltin() const -> bool;
  auto        BuiltinName() const -> std::string;

  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const model_id_t& id, const nlohmann::json& j) -> ModelConfig;
};

auto DefaultModelConfigs() -> std::unordered_map<model_id_t, ModelConfig>;
};  // namespace mangatint
