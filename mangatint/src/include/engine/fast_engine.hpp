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

#include <string_view>

#include "engine/engine_base.hpp"

namespace mangatint {
/**
 * @brief Single forward pass of the colorizer model. No sampling loop and no seed, the same
 * input always gives the same output.
 */
class FastEngine : public EngineBase<FastEngine> {
 public:
  static constexpr std::string_view _engine_name = "FastEngine";
  static constexpr EngineVariant    _variant     = EngineVariant::FAST;
  static constexpr int              _granularity = kFastGranularity;

  using EngineBase<FastEngine>::EngineBase;

  auto Execute(const cv::Mat& image, const LineArtMap& line_art,
               const ColorizationRequest& request) -> EngineOutput;
};
};  // namespace mangatint
