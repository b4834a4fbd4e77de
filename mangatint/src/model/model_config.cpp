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

#include "model/model_config.hpp"

#include "type/errors.hpp"

namespace mangatint {
auto ModelConfig::IsBuiltin() const -> bool { return uri_.starts_with(models::kBuiltinScheme); }

auto ModelConfig::BuiltinName() const -> std::string {
  if (!IsBuiltin()) {
    return {};
  }
  return uri_.substr(models::kBuiltinScheme.size());
}

auto ModelConfig::ToJson() const -> nlohmann::json {
  return {{"uri", uri_}, {"input_size", input_size_}};
}

auto ModelConfig::FromJson(const model_id_t& id, const nlohmann::json& j) -> ModelConfig {
  ModelConfig config;
  config.id_ = id;
  try {
    if (j.is_string()) {
      config.uri_ = j.get<std::string>();
    } else {
      config.uri_        = j.at("uri").get<std::string>();
      config.input_size_ = j.value("input_size", 0);
    }
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequestError("[ERROR] ModelConfig: Malformed entry for model '" + id +
                              "': " + e.what());
  }
  if (config.uri_.empty()) {
    throw InvalidRequestError("[ERROR] ModelConfig: Empty uri for model '" + id + "'");
  }
  if (config.input_size_ < 0) {
    throw InvalidRequestError("[ERROR] ModelConfig: Negative input_size for model '" + id + "'");
  }
  return config;
}

auto DefaultModelConfigs() -> std::unordered_map<model_id_t, ModelConfig> {
  std::unordered_map<model_id_t, ModelConfig> configs;
  auto add = [&configs](std::string_view id, std::string uri) {
    ModelConfig config;
    config.id_  = std::string(id);
    config.uri_ = std::move(uri);
    configs.emplace(config.id_, config);
  };
  add(models::kLineArt, "builtin:lineart");
  add(models::kFastColorizer, "builtin:tone-map");
  add(models::kDenoiser, "builtin:tone-prior");
  return configs;
}
};  // namespace mangatint
