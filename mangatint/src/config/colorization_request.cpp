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

#include "config/colorization_request.hpp"

#include <utility>

#include "type/errors.hpp"

namespace mangatint {
namespace {
template <typename T>
void RequireRange(const char* key, T value, T lo, T hi) {
  if (value < lo || value > hi) {
    throw InvalidRequestError(std::string("[ERROR] ColorizationRequest: ") + key + " = " +
                              std::to_string(value) + " is outside [" + std::to_string(lo) +
                              ", " + std::to_string(hi) + "]");
  }
}
}  // namespace

void ColorizationParams::MergeJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw InvalidRequestError("[ERROR] ColorizationRequest: Expected a JSON object");
  }
  try {
    if (j.contains("prompt")) {
      prompt_ = j["prompt"].is_null() ? std::nullopt
                                      : std::optional<std::string>(j["prompt"].get<std::string>());
    }
    if (j.contains("negative_prompt")) {
      negative_prompt_ = j["negative_prompt"].is_null()
                             ? std::nullopt
                             : std::optional<std::string>(j["negative_prompt"].get<std::string>());
    }
    if (j.contains("seed")) {
      seed_ = j["seed"].is_null() ? std::nullopt
                                  : std::optional<uint64_t>(j["seed"].get<uint64_t>());
    }
    denoise_strength_ = j.value("denoise_strength", denoise_strength_);
    guidance_scale_   = j.value("guidance_scale", guidance_scale_);
    steps_            = j.value("steps", steps_);
    protect_text_     = j.value("protect_text", protect_text_);
    ink_threshold_    = j.value("ink_threshold", ink_threshold_);
    max_side_         = j.value("max_side", max_side_);
    if (j.contains("engine")) {
      engine_ = EngineVariantFromString(j["engine"].get<std::string>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequestError(std::string("[ERROR] ColorizationRequest: ") + e.what());
  }
}

ColorizationRequest::ColorizationRequest() = default;

ColorizationRequest::ColorizationRequest(ColorizationParams params) : params_(std::move(params)) {}

void ColorizationRequest::Validate(const ColorizationParams& params) {
  RequireRange("ink_threshold", params.ink_threshold_, 0, 255);
  const int granularity = GranularityOf(params.engine_);
  if (params.max_side_ <= 0 || params.max_side_ % granularity != 0) {
    throw InvalidRequestError("[ERROR] ColorizationRequest: max_side = " +
                              std::to_string(params.max_side_) + " is not a positive multiple of " +
                              std::to_string(granularity));
  }
  if (params.engine_ == EngineVariant::GENERATIVE) {
    RequireRange("denoise_strength", params.denoise_strength_, 0.3f, 0.5f);
    RequireRange("guidance_scale", params.guidance_scale_, 7.0f, 9.0f);
    RequireRange("steps", params.steps_, 20, 30);
  }
}

auto ColorizationRequest::Create(ColorizationParams params) -> ColorizationRequest {
  Validate(params);
  return ColorizationRequest(std::move(params));
}

auto ColorizationRequest::FromJson(const nlohmann::json& j, const ColorizationParams& defaults)
    -> ColorizationRequest {
  ColorizationParams params = defaults;
  params.MergeJson(j);
  return Create(std::move(params));
}

auto ColorizationRequest::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["prompt"]           = params_.prompt_ ? nlohmann::json(*params_.prompt_) : nlohmann::json();
  j["negative_prompt"]  = params_.negative_prompt_ ? nlohmann::json(*params_.negative_prompt_)
                                                   : nlohmann::json();
  j["denoise_strength"] = params_.denoise_strength_;
  j["guidance_scale"]   = params_.guidance_scale_;
  j["steps"]            = params_.steps_;
  j["seed"]             = params_.seed_ ? nlohmann::json(*params_.seed_) : nlohmann::json();
  j["protect_text"]     = params_.protect_text_;
  j["ink_threshold"]    = params_.ink_threshold_;
  j["max_side"]         = params_.max_side_;
  j["engine"]           = EngineVariantToString(params_.engine_);
  return j;
}

auto ColorizationRequest::WithPrompt(std::string prompt) const -> ColorizationRequest {
  ColorizationParams params = params_;
  params.prompt_            = std::move(prompt);
  return ColorizationRequest(std::move(params));
}

auto ColorizationRequest::WithSeed(uint64_t seed) const -> ColorizationRequest {
  ColorizationParams params = params_;
  params.seed_              = seed;
  return ColorizationRequest(std::move(params));
}

auto ColorizationRequest::Prompt() const -> std::string {
  return params_.prompt_.value_or(std::string(kDefaultPrompt));
}

auto ColorizationRequest::NegativePrompt() const -> std::string {
  return params_.negative_prompt_.value_or(std::string(kDefaultNegativePrompt));
}

auto ColorizationRequest::Steps() const -> int {
  return params_.engine_ == EngineVariant::FAST ? 1 : params_.steps_;
}
};  // namespace mangatint
