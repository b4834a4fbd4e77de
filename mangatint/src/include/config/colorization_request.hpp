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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "engine/engine_variant.hpp"

namespace mangatint {
inline constexpr std::string_view kDefaultPrompt =
    "full color manga page, anime style coloring, clean lineart preserved, soft cel shading, "
    "consistent colors, detailed lighting, high quality";
inline constexpr std::string_view kDefaultNegativePrompt =
    "blurry, repainting lines, messy colors, color bleeding, oversaturated, artifacts, low "
    "quality, bad anatomy";

/**
 * @brief Mutable builder for ColorizationRequest
 */
struct ColorizationParams {
  std::optional<std::string> prompt_;
  std::optional<std::string> negative_prompt_;
  float                      denoise_strength_ = 0.45f;
  float                      guidance_scale_   = 7.0f;
  int                        steps_            = 25;
  std::optional<uint64_t>    seed_;
  bool                       protect_text_     = true;
  int                        ink_threshold_    = 80;
  int                        max_side_         = 1024;
  EngineVariant              engine_           = EngineVariant::GENERATIVE;

  /**
   * @brief Overlay the keys present in j, leaving the others as they are
   */
  void                       MergeJson(const nlohmann::json& j);
};

/**
 * @brief Immutable, validated options of one colorization call
 */
class ColorizationRequest {
 private:
  ColorizationParams params_;

  explicit ColorizationRequest(ColorizationParams params);

 public:
  // All defaults, always valid
  ColorizationRequest();

  /**
   * @throws InvalidRequestError when a value is out of range
   */
  static auto Create(ColorizationParams params) -> ColorizationRequest;
  static auto FromJson(const nlohmann::json& j, const ColorizationParams& defaults = {})
      -> ColorizationRequest;
  static void Validate(const ColorizationParams& params);

  auto        ToJson() const -> nlohmann::json;
  auto        Params() const -> const ColorizationParams& { return params_; }

  auto        WithPrompt(std::string prompt) const -> ColorizationRequest;
  auto        WithSeed(uint64_t seed) const -> ColorizationRequest;

  // The prompt in effect, defaults applied
  auto        Prompt() const -> std::string;
  auto        NegativePrompt() const -> std::string;
  auto        DenoiseStrength() const -> float { return params_.denoise_strength_; }
  auto        GuidanceScale() const -> float { return params_.guidance_scale_; }
  // Sampling steps, 1 for the fast engine
  auto        Steps() const -> int;
  auto        Seed() const -> const std::optional<uint64_t>& { return params_.seed_; }
  auto        ProtectText() const -> bool { return params_.protect_text_; }
  auto        InkThreshold() const -> int { return params_.ink_threshold_; }
  auto        MaxSide() const -> int { return params_.max_side_; }
  auto        Engine() const -> EngineVariant { return params_.engine_; }
  auto        Granularity() const -> int { return GranularityOf(params_.engine_); }
};
};  // namespace mangatint
