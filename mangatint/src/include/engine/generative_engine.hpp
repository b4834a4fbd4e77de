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
#include <string_view>
#include <vector>

#include "engine/engine_base.hpp"
#include "engine/prompt_encoder.hpp"

namespace mangatint {
/**
 * @brief Conditioned sampler over a noise-predicting model.
 *
 * The page is noised to denoise_strength * sigma_max with noise drawn at 1/granularity of the
 * working size, then walked back to zero with Euler steps
 * over a linear sigma schedule. Each step runs the model under the prompt and the negative
 * prompt and mixes the two predictions with the guidance scale. The line art is passed as the
 * control map on every step. Given a seed, the run is reproducible on one backend/precision.
 */
class GenerativeEngine : public EngineBase<GenerativeEngine> {
 private:
  PromptEncoder encoder_;
  float         sigma_max_ = 1.0f;

 public:
  static constexpr std::string_view _engine_name = "GenerativeEngine";
  static constexpr EngineVariant    _variant     = EngineVariant::GENERATIVE;
  static constexpr int              _granularity = kGenerativeGranularity;

  explicit GenerativeEngine(std::shared_ptr<ModelHandle> model);

  /**
   * @brief steps + 1 sigmas from strength * sigma_max down to 0
   */
  static auto SigmaSchedule(float strength, float sigma_max, int steps) -> std::vector<float>;

  auto        Execute(const cv::Mat& image, const LineArtMap& line_art,
                      const ColorizationRequest& request) -> EngineOutput;
};
};  // namespace mangatint
