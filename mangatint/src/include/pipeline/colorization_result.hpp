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
#include <opencv2/core.hpp>
#include <optional>
#include <string>

#include "engine/engine_variant.hpp"
#include "type/type.hpp"

namespace mangatint {
// Milliseconds spent in each stage of one page
struct StageTimings {
  double prepare_ms_  = 0.0;
  double line_art_ms_ = 0.0;
  double detect_ms_   = 0.0;
  double engine_ms_   = 0.0;
  double compose_ms_  = 0.0;
  double total_ms_    = 0.0;

  auto   ToJson() const -> nlohmann::json;
};

struct ColorizationResult {
  cv::Mat                 image_;       // CV_8UC3 BGR
  cv::Mat                 comparison_;  // empty unless requested
  image_path_t            output_path_;
  image_path_t            comparison_path_;

  StageTimings            timings_;
  EngineVariant           engine_         = EngineVariant::GENERATIVE;
  int                     steps_run_      = 0;
  std::optional<uint64_t> seed_;
  size_t                  text_regions_   = 0;
  bool                    text_suppressed_ = false;
  cv::Size                working_size_;
  cv::Size                output_size_;
  std::string             finished_at_;

  auto                    ToJson() const -> nlohmann::json;
};
};  // namespace mangatint
