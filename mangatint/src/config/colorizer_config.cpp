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

#include "config/colorizer_config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "type/errors.hpp"

namespace mangatint {
ColorizerConfig::ColorizerConfig()
    : temp_root_(std::filesystem::temp_directory_path() / "mangatint"),
      models_(DefaultModelConfigs()) {}

auto ColorizerConfig::FromJson(const nlohmann::json& j) -> ColorizerConfig {
  if (!j.is_object()) {
    throw InvalidRequestError("[ERROR] ColorizerConfig: Expected a JSON object");
  }
  ColorizerConfig config;
  try {
    if (j.contains("output_root")) {
      config.output_root_ = j["output_root"].get<std::string>();
    }
    if (j.contains("temp_root")) {
      config.temp_root_ = j["temp_root"].get<std::string>();
    }
    config.output_suffix_         = j.value("output_suffix", config.output_suffix_);
    config.archive_name_          = j.value("archive_name", config.archive_name_);
    config.restore_original_size_ = j.value("restore_original_size", config.restore_original_size_);
    config.save_comparison_       = j.value("save_comparison", config.save_comparison_);
    config.color_consistency_     = j.value("color_consistency", config.color_consistency_);

    if (j.contains("output_format")) {
      const auto& format = j["output_format"];
      if (format.is_string()) {
        config.output_format_.format_ = FormatFromString(format.get<std::string>());
      } else {
        config.output_format_.format_ =
            FormatFromString(format.value("format", FormatToString(config.output_format_.format_)));
        config.output_format_.quality_ = format.value("quality", config.output_format_.quality_);
        config.output_format_.compression_level_ =
            format.value("compression_level", config.output_format_.compression_level_);
      }
    }
    if (j.contains("models")) {
      for (const auto& [id, entry] : j["models"].items()) {
        config.models_[id] = ModelConfig::FromJson(id, entry);
      }
    }
    if (j.contains("detector")) {
      config.detector_ = TextDetectorParams::FromJson(j["detector"]);
    }
    if (j.contains("request")) {
      config.request_.MergeJson(j["request"]);
    }
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequestError(std::string("[ERROR] ColorizerConfig: ") + e.what());
  }

  if (config.output_suffix_.empty()) {
    std::cerr << "[WARN] ColorizerConfig: Empty output suffix, outputs may overwrite inputs "
                 "written to the same folder"
              << std::endl;
  }
  if (config.output_format_.quality_ < 0 || config.output_format_.quality_ > 100 ||
      config.output_format_.compression_level_ < 0 ||
      config.output_format_.compression_level_ > 9) {
    throw InvalidRequestError("[ERROR] ColorizerConfig: Output quality or compression out of range");
  }
  // Reject bad request defaults now rather than on the first call
  ColorizationRequest::Validate(config.request_);
  return config;
}

auto ColorizerConfig::LoadFromFile(const file_path_t& path) -> ColorizerConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw InvalidRequestError("[ERROR] ColorizerConfig: Cannot open " + path.string());
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw InvalidRequestError("[ERROR] ColorizerConfig: Cannot parse " + path.string() + ": " +
                              e.what());
  }
  return FromJson(j);
}

auto ColorizerConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["output_root"]           = output_root_.string();
  j["output_suffix"]         = output_suffix_;
  j["output_format"]         = {{"format", FormatToString(output_format_.format_)},
                                {"quality", output_format_.quality_},
                                {"compression_level", output_format_.compression_level_}};
  j["archive_name"]          = archive_name_;
  j["temp_root"]             = temp_root_.string();
  j["restore_original_size"] = restore_original_size_;
  j["save_comparison"]       = save_comparison_;
  j["color_consistency"]     = color_consistency_;
  nlohmann::json models      = nlohmann::json::object();
  for (const auto& [id, model] : models_) {
    models[id] = model.ToJson();
  }
  j["models"]   = models;
  j["detector"] = detector_.ToJson();
  j["request"]  = DefaultRequest().ToJson();
  return j;
}

auto ColorizerConfig::DefaultRequest() const -> ColorizationRequest {
  return ColorizationRequest::Create(request_);
}
};  // namespace mangatint
