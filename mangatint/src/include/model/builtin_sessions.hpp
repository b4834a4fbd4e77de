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

#include <memory>
#include <opencv2/core.hpp>
#include <string>

#include "model/inference_session.hpp"

namespace mangatint {
/**
 * @brief Map an 8-bit gray page to 8-bit BGR through luminance bands in LAB space. Light bands
 * lean warm, dark bands lean cool.
 */
auto ToneMapBGR(const cv::Mat& gray8) -> cv::Mat;

/**
 * @brief Ink strokes and edges as a single-channel float map, 1 on a stroke and 0 elsewhere
 */
class BuiltinLineArtSession final : public InferenceSession {
 public:
  // in: "image" CV_32FC1 [0,1]   out: "lineart" CV_32FC1 [0,1]
  auto Run(const TensorMap& inputs) -> TensorMap override;
  auto Describe() const -> std::string override { return "builtin:lineart"; }
};

class ToneMapSession final : public InferenceSession {
 public:
  // in: "image" CV_32FC1 [0,1], "lineart" CV_32FC1 [0,1]   out: "color" CV_32FC3 BGR [0,1]
  auto Run(const TensorMap& inputs) -> TensorMap override;
  auto Describe() const -> std::string override { return "builtin:tone-map"; }
};

/**
 * @brief Noise predictor whose clean estimate is the tone-mapped page shifted by a tint derived
 * from the prompt embedding. Strokes marked in the control map are pulled back to neutral gray.
 */
class TonePriorDenoiserSession final : public InferenceSession {
 private:
  float tint_scale_ = 0.5f;
  // Spread of clean images in [-1, 1]; sets how long the noisy sample keeps its weight
  float sigma_data_ = 0.25f;

 public:
  // in: "sample" CV_32FC3 [-1,1], "sigma" 1x1, "control" CV_32FC1, "embedding" 1xD,
  //     "image" CV_32FC1 [0,1]
  // out: "eps" CV_32FC3
  auto Run(const TensorMap& inputs) -> TensorMap override;
  auto Describe() const -> std::string override { return "builtin:tone-prior"; }
};

/**
 * @brief Create a builtin session by name ("lineart", "tone-map", "tone-prior")
 *
 * @throws ModelLoadError on an unknown name
 */
auto CreateBuiltinSession(const std::string& name) -> std::shared_ptr<InferenceSession>;
};  // namespace mangatint
