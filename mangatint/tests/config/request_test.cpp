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

#include <gtest/gtest.h>

#include "config/colorizer_config.hpp"
#include "type/errors.hpp"

namespace mangatint {
TEST(ColorizationRequestTests, Defaults_AreValid) {
  ColorizationRequest request;
  EXPECT_EQ(request.Engine(), EngineVariant::GENERATIVE);
  EXPECT_EQ(request.Steps(), 25);
  EXPECT_FLOAT_EQ(request.DenoiseStrength(), 0.45f);
  EXPECT_TRUE(request.ProtectText());
  EXPECT_EQ(request.Prompt(), std::string(kDefaultPrompt));
  EXPECT_EQ(request.NegativePrompt(), std::string(kDefaultNegativePrompt));
  EXPECT_FALSE(request.Seed().has_value());
  EXPECT_NO_THROW(ColorizationRequest::Validate(request.Params()));
}

TEST(ColorizationRequestTests, GenerativeRanges_AreEnforced) {
  const auto with = [](auto mutate) {
    ColorizationParams params;
    mutate(params);
    return params;
  };
  EXPECT_THROW(ColorizationRequest::Create(with([](auto& p) { p.denoise_strength_ = 0.6f; })),
               InvalidRequestError);
  EXPECT_THROW(ColorizationRequest::Create(with([](auto& p) { p.denoise_strength_ = 0.2f; })),
               InvalidRequestError);
  EXPECT_THROW(ColorizationRequest::Create(with([](auto& p) { p.guidance_scale_ = 6.5f; })),
               InvalidRequestError);
  EXPECT_THROW(ColorizationRequest::Create(with([](auto& p) { p.steps_ = 31; })),
               InvalidRequestError);
  EXPECT_NO_THROW(ColorizationRequest::Create(with([](auto& p) {
    p.denoise_strength_ = 0.3f;
    p.guidance_scale_   = 9.0f;
    p.steps_            = 20;
  })));
}

TEST(ColorizationRequestTests, CommonRanges_AreEnforced) {
  ColorizationParams params;
  params.ink_threshold_ = 256;
  EXPECT_THROW(ColorizationRequest::Create(params), InvalidRequestError);
  params.ink_threshold_ = 80;
  params.max_side_      = 1020;  // not a multiple of 8
  EXPECT_THROW(ColorizationRequest::Create(params), InvalidRequestError);
  params.max_side_ = 0;
  EXPECT_THROW(ColorizationRequest::Create(params), InvalidRequestError);
}

TEST(ColorizationRequestTests, FastEngine_IgnoresSamplingFields) {
  ColorizationParams params;
  params.engine_           = EngineVariant::FAST;
  params.steps_            = 500;
  params.denoise_strength_ = 0.9f;
  params.guidance_scale_   = 1.0f;
  const auto request       = ColorizationRequest::Create(params);
  EXPECT_EQ(request.Steps(), 1);
  EXPECT_EQ(request.Granularity(), 32);

  // The fast engine still needs its own granularity
  params.max_side_ = 1000;
  EXPECT_THROW(ColorizationRequest::Create(params), InvalidRequestError);
}

TEST(ColorizationRequestTests, FromJson_OverlaysDefaults) {
  ColorizationParams defaults;
  defaults.max_side_ = 512;
  const auto request = ColorizationRequest::FromJson(
      {{"prompt", "sunset sky"}, {"seed", 42}, {"engine", "fast"}, {"protect_text", false}},
      defaults);
  EXPECT_EQ(request.Prompt(), "sunset sky");
  ASSERT_TRUE(request.Seed().has_value());
  EXPECT_EQ(*request.Seed(), 42u);
  EXPECT_EQ(request.Engine(), EngineVariant::FAST);
  EXPECT_FALSE(request.ProtectText());
  EXPECT_EQ(request.MaxSide(), 512);

  EXPECT_THROW(ColorizationRequest::FromJson({{"engine", "turbo"}}), InvalidRequestError);
  EXPECT_THROW(ColorizationRequest::FromJson({{"steps", "many"}}), InvalidRequestError);
  EXPECT_THROW(ColorizationRequest::FromJson(nlohmann::json::array()), InvalidRequestError);
}

TEST(ColorizationRequestTests, WithPrompt_LeavesOriginalUntouched) {
  ColorizationRequest base;
  const auto          hinted = base.WithPrompt("red scarf").WithSeed(5);
  EXPECT_EQ(hinted.Prompt(), "red scarf");
  EXPECT_EQ(*hinted.Seed(), 5u);
  EXPECT_EQ(base.Prompt(), std::string(kDefaultPrompt));
  EXPECT_FALSE(base.Seed().has_value());

  const auto json = hinted.ToJson();
  EXPECT_EQ(json["engine"], "generative");
  EXPECT_EQ(json["seed"], 5);
  EXPECT_TRUE(json["negative_prompt"].is_null());
}

TEST(ColorizerConfigTests, FromJson_ReadsEverySection) {
  const nlohmann::json j = {
      {"output_root", "/tmp/colored"},
      {"output_suffix", "_tinted"},
      {"output_format", {{"format", "jpg"}, {"quality", 80}}},
      {"save_comparison", true},
      {"models", {{"denoiser", "/models/denoiser.onnx"}}},
      {"detector", {{"merge_padding", 4}}},
      {"request", {{"engine", "fast"}, {"max_side", 512}}}};
  const auto config = ColorizerConfig::FromJson(j);
  EXPECT_EQ(config.output_root_, file_path_t("/tmp/colored"));
  EXPECT_EQ(config.output_suffix_, "_tinted");
  EXPECT_EQ(config.output_format_.format_, ImageFormatType::JPEG);
  EXPECT_EQ(config.output_format_.quality_, 80);
  EXPECT_TRUE(config.save_comparison_);
  EXPECT_EQ(config.models_.at("denoiser").uri_, "/models/denoiser.onnx");
  // Untouched models keep their builtin defaults
  EXPECT_TRUE(config.models_.at("lineart").IsBuiltin());
  EXPECT_EQ(config.detector_.merge_padding_, 4);
  EXPECT_EQ(config.DefaultRequest().Engine(), EngineVariant::FAST);
  EXPECT_EQ(config.DefaultRequest().MaxSide(), 512);
}

TEST(ColorizerConfigTests, FromJson_RejectsBadValues) {
  EXPECT_THROW(ColorizerConfig::FromJson({{"output_format", "tiff"}}), InvalidRequestError);
  EXPECT_THROW(ColorizerConfig::FromJson({{"output_format", {{"quality", 150}}}}),
               InvalidRequestError);
  EXPECT_THROW(ColorizerConfig::FromJson({{"request", {{"guidance_scale", 20.0}}}}),
               InvalidRequestError);
  EXPECT_THROW(ColorizerConfig::FromJson({{"save_comparison", "yes"}}), InvalidRequestError);
  EXPECT_THROW(ColorizerConfig::LoadFromFile("/nonexistent/mangatint.json"), InvalidRequestError);
}

TEST(ColorizerConfigTests, ToJson_RoundTrips) {
  ColorizerConfig config;
  config.output_suffix_ = "_c";
  config.request_.seed_ = 11;
  const auto again      = ColorizerConfig::FromJson(config.ToJson());
  EXPECT_EQ(again.output_suffix_, "_c");
  EXPECT_EQ(again.request_.seed_, std::optional<uint64_t>(11));
  EXPECT_EQ(again.models_.size(), config.models_.size());
}
};  // namespace mangatint
