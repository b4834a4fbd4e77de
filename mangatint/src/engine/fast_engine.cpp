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

#include "engine/fast_engine.hpp"

#include <easy/profiler.h>

namespace mangatint {
auto FastEngine::Execute(const cv::Mat& image, const LineArtMap& line_art,
                         const ColorizationRequest& /*request*/) -> EngineOutput {
  EASY_BLOCK("FastEngine::Run");
  Transition(EngineState::PREPROCESSING);
  const cv::Mat gray = PrepareInput(image, line_art);

  Transition(EngineState::CONDITIONING);
  TensorMap inputs{{"image", gray}, {"lineart", line_art.map_}};

  // One pass stands in for the whole sampling stage
  Transition(EngineState::SAMPLING);
  TensorMap outputs = model_->Session().Run(inputs);

  Transition(EngineState::POSTPROCESSING);
  EngineOutput output;
  output.color_     = FinishOutput(TakeOutput(outputs, "color"), image.size());
  output.steps_run_ = 1;
  return output;
}
};  // namespace mangatint
