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
#include <unordered_map>

#include "config/colorization_request.hpp"
#include "detect/text_region_detector.hpp"
#include "io/image/image_writer.hpp"
#include "model/model_config.hpp"
#include "type/type.hpp"

namespace mangatint {
/**
 * @brief Process-level settings of a Colorizer, loaded from a JSON file. Every key is optional.
 */
struct ColorizerConfig {
  file_path_t                                 output_root_   = "output";
  std::string                                 output_suffix_ = "_colored";
  OutputFormatOptions                         output_format_;
  std::string                                 archive_name_  = "colored_pages.zip";
  file_path_t                                 temp_root_;
  bool                                        restore_original_size_ = true;
  bool                                        save_comparison_       = false;
  bool                                        color_consistency_     = true;
  std::unordered_map<model_id_t, ModelConfig> models_;
  TextDetectorParams                          detector_;
  ColorizationParams                          request_;

  ColorizerConfig();

  /**
   * @throws InvalidRequestError on malformed or out-of-range values
   */
  static auto FromJson(const nlohmann::json& j) -> ColorizerConfig;
  static auto LoadFromFile(const file_path_t& path) -> ColorizerConfig;
  auto        ToJson() const -> nlohmann::json;

  auto        DefaultRequest() const -> ColorizationRequest;
};
};  // namespace mangatint
