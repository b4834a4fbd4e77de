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

#include "engine/generative_engine.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <random>
#include <utility>

namespace mangatint {
GenerativeEngine::GenerativeEngine(std::shared_ptr<ModelHandle> model)
    : EngineBase<GenerativeEngine>(std::move(model)) {}

auto GenerativeEngine::SigmaSchedule(float strength, float sigma_max, int steps)
    -> std::vector<float> {
  std::vector<float> sigmas(static_cast<size_t>(steps) + 1);
  const float        start = strength * sigma_max;
  for (int i = 0; i <= steps; ++i) {
    sigmas[i] = start * (1.0f - static_cast<float>(i) / static_cast<float>(steps));
  }
  return sigmas;
}

auto GenerativeEngine::Execute(const cv::Mat& image, const LineArtMap& line_art,
                               const ColorizationRequest& request) -> EngineOutput {
  EASY_BLOCK("GenerativeEngine::Run");
  Transition(EngineState::PREPROCESSING);
  const cv::Mat gray = PrepareInput(image, line_art);
  cv::Mat       init;
  cv::cvtColor(gray, init, cv::COLOR_GRAY2BGR);
  init.convertTo(init, CV_32F, 2.0, -1.0);

  Transition(EngineState::CONDITIONING);
  const cv::Mat  cond   = encoder_.Encode(request.Prompt());
  const cv::Mat  uncond = encoder_.Encode(request.NegativePrompt());
  const uint64_t seed   = request.Seed().value_or(
      (static_cast<uint64_t>(std::random_device{}()) << 32) | std::random_device{}());

  const int    steps  = request.Steps();
  const auto   sigmas = SigmaSchedule(request.DenoiseStrength(), sigma_max_, steps);
  const double scale  = request.GuidanceScale();

  // Noise is drawn at latent resolution so a seed varies colour regions, not single pixels
  cv::RNG rng(seed);
  cv::Mat latent_noise(std::max(1, init.rows / _granularity), std::max(1, init.cols / _granularity),
                       CV_32FC3);
  rng.fill(latent_noise, cv::RNG::NORMAL, 0.0, 1.0);
  cv::Mat noise;
  cv::resize(latent_noise, noise, init.size(), 0, 0, cv::INTER_LINEAR);
  cv::Mat sample = init + noise * sigmas.front();

  Transition(EngineState::SAMPLING);
  cv::Mat   sigma_t(1, 1, CV_32F);
  TensorMap inputs{{"control", line_art.map_}, {"image", gray}};
  auto&     session = model_->Session();
  for (int i = 0; i < steps; ++i) {
    EASY_BLOCK("GenerativeEngine::Step");
    sigma_t.at<float>(0, 0) = sigmas[i];
    inputs["sample"]        = sample;
    inputs["sigma"]         = sigma_t;

    inputs["embedding"]     = cond;
    const cv::Mat eps_cond  = TakeOutput(session.Run(inputs), "eps");
    inputs["embedding"]     = uncond;
    const cv::Mat eps_neg   = TakeOutput(session.Run(inputs), "eps");
    if (eps_cond.size() != sample.size() || eps_cond.type() != sample.type() ||
        eps_neg.size() != sample.size() || eps_neg.type() != sample.type()) {
      throw EngineExecutionError("[ERROR] GenerativeEngine: Noise prediction has the wrong layout");
    }

    const cv::Mat eps = eps_neg + (eps_cond - eps_neg) * scale;
    sample            = sample + eps * static_cast<double>(sigmas[i + 1] - sigmas[i]);
  }

  Transition(EngineState::POSTPROCESSING);
  cv::Mat color;
  sample.convertTo(color, CV_32F, 0.5, 0.5);

  EngineOutput output;
  output.color_     = FinishOutput(color, image.size());
  output.steps_run_ = steps;
  output.seed_      = seed;
  return output;
}
};  // namespace mangatint
