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

#include "pipeline/colorization_result.hpp"

namespace mangatint {
auto StageTimings::ToJson() const -> nlohmann::json {
  return {{"prepare_ms", prepare_ms_}, {"line_art_ms", line_art_ms_}, {"detect_ms", detect_ms_},
          {"engine_ms", engine_ms_},   {"compose_ms", compose_ms_},   {"total_ms", total_ms_}};
}

auto ColorizationResult::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["output_path"]     = output_path_.string();
  j["timings"]         = timings_.ToJson();
  j["engine"]          = EngineVariantToString(engine_);
  j["steps"]           = steps_run_;
  j["seed"]            = seed_ ? nlohmann::json(*seed_) : nlohmann::json();
  j["text_regions"]    = text_regions_;
  j["text_suppressed"] = text_suppressed_;
  j["working_size"]    = {working_size_.width, working_size_.height};
  j["output_size"]     = {output_size_.width, output_size_.height};
  j["finished_at"]     = finished_at_;
  if (!comparison_path_.empty()) {
    j["comparison_path"] = comparison_path_.string();
  }
  return j;
}
};  // namespace mangatint
