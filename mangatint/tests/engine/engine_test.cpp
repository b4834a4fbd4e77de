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

#include <gtest/gtest.h>

#include <cmath>

#include "engine/engine_test_fixation.hpp"
#include "engine/generative_engine.hpp"
#include "engine/prompt_encoder.hpp"
#include "type/errors.hpp"

namespace mangatint {
namespace {
auto SameBytes(const cv::Mat& a, const cv::Mat& b) -> bool {
  return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

// Mean absolute difference in 8-bit levels
auto MeanLevelDiff(const cv::Mat& a, const cv::Mat& b) -> double {
  cv::Mat a8, b8;
  a.convertTo(a8, CV_8U, 255.0);
  b.convertTo(b8, CV_8U, 255.0);
  return cv::norm(a8, b8, cv::NORM_L1) / static_cast<double>(a8.total() * a8.channels());
}
}  // namespace

TEST_F(EngineTests, FastEngine_IsDeterministic) {
  auto [prepared, line_art] = Prepare(EngineVariant::FAST);
  auto engine               = MakeEngine(EngineVariant::FAST);
  EXPECT_EQ(engine->GetName(), "FastEngine");
  EXPECT_EQ(engine->GetGranularity(), 32);
  EXPECT_EQ(engine->GetState(), EngineState::IDLE);

  ColorizationParams params;
  params.engine_  = EngineVariant::FAST;
  params.max_side_ = 128;
  const auto request = ColorizationRequest::Create(params);

  const auto first  = engine->Run(prepared.bgr_, line_art, request);
  const auto second = engine->Run(prepared.bgr_, line_art, request);
  EXPECT_EQ(engine->GetState(), EngineState::DONE);
  EXPECT_EQ(first.color_.size(), prepared.geometry_.working_size_);
  EXPECT_EQ(first.color_.type(), CV_32FC3);
  EXPECT_EQ(first.steps_run_, 1);
  EXPECT_FALSE(first.seed_.has_value());
  EXPECT_TRUE(SameBytes(first.color_, second.color_));
}

TEST_F(EngineTests, GenerativeEngine_SameSeed_SameImage) {
  auto [prepared, line_art] = Prepare(EngineVariant::GENERATIVE);
  auto engine               = MakeEngine(EngineVariant::GENERATIVE);

  auto params  = GenerativeRequest();
  params.seed_ = 1234;
  const auto request = ColorizationRequest::Create(params);

  const auto first  = engine->Run(prepared.bgr_, line_art, request);
  const auto second = engine->Run(prepared.bgr_, line_art, request);
  ASSERT_TRUE(first.seed_.has_value());
  EXPECT_EQ(*first.seed_, 1234u);
  EXPECT_EQ(first.steps_run_, 20);
  EXPECT_TRUE(SameBytes(first.color_, second.color_));

  const auto other = engine->Run(prepared.bgr_, line_art, request.WithSeed(99));
  EXPECT_GT(MeanLevelDiff(first.color_, other.color_), 1.0);
}

TEST_F(EngineTests, GenerativeEngine_DenoiseStrength_ChangesTheImage) {
  auto [prepared, line_art] = Prepare(EngineVariant::GENERATIVE);
  auto engine               = MakeEngine(EngineVariant::GENERATIVE);

  auto params              = GenerativeRequest();
  params.seed_             = 1234;
  params.denoise_strength_ = 0.3f;
  const auto light         = engine->Run(prepared.bgr_, line_art, ColorizationRequest::Create(params));
  params.denoise_strength_ = 0.5f;
  const auto heavy         = engine->Run(prepared.bgr_, line_art, ColorizationRequest::Create(params));
  EXPECT_GT(MeanLevelDiff(light.color_, heavy.color_), 1.0);
}

TEST_F(EngineTests, GenerativeEngine_LowerStrength_StaysCloserToThePage) {
  auto [prepared, line_art] = Prepare(EngineVariant::GENERATIVE);
  auto    engine            = MakeEngine(EngineVariant::GENERATIVE);
  cv::Mat page;
  prepared.bgr_.convertTo(page, CV_32F, 1.0 / 255.0);

  auto params  = GenerativeRequest();
  params.seed_ = 5;
  double distance[2];
  float  strengths[2] = {0.3f, 0.5f};
  for (int i = 0; i < 2; ++i) {
    params.denoise_strength_ = strengths[i];
    const auto output = engine->Run(prepared.bgr_, line_art, ColorizationRequest::Create(params));
    distance[i]       = MeanLevelDiff(output.color_, page);
  }
  EXPECT_LT(distance[0], distance[1]);
}

TEST_F(EngineTests, GenerativeEngine_WithoutSeed_ReportsTheSeedItUsed) {
  auto [prepared, line_art] = Prepare(EngineVariant::GENERATIVE);
  auto       engine         = MakeEngine(EngineVariant::GENERATIVE);
  const auto request        = ColorizationRequest::Create(GenerativeRequest());

  const auto first = engine->Run(prepared.bgr_, line_art, request);
  ASSERT_TRUE(first.seed_.has_value());
  const auto replay = engine->Run(prepared.bgr_, line_art, request.WithSeed(*first.seed_));
  EXPECT_TRUE(SameBytes(first.color_, replay.color_));
}

TEST_F(EngineTests, GenerativeEngine_OutputStaysInRange) {
  auto [prepared, line_art] = Prepare(EngineVariant::GENERATIVE);
  auto       engine         = MakeEngine(EngineVariant::GENERATIVE);
  auto       params         = GenerativeRequest();
  params.seed_              = 7;
  params.guidance_scale_    = 9.0f;
  params.denoise_strength_  = 0.5f;
  const auto output         = engine->Run(prepared.bgr_, line_art, ColorizationRequest::Create(params));

  double     lo = 0.0, hi = 0.0;
  cv::minMaxLoc(output.color_.reshape(1), &lo, &hi);
  EXPECT_GE(lo, 0.0);
  EXPECT_LE(hi, 1.0);
}

TEST_F(EngineTests, LineArtSizeMismatch_ThrowsContractError) {
  auto [prepared, line_art] = Prepare(EngineVariant::FAST);
  auto       engine         = MakeEngine(EngineVariant::FAST);
  LineArtMap wrong{cv::Mat::zeros(32, 32, CV_32F)};
  ColorizationParams params;
  params.engine_ = EngineVariant::FAST;
  EXPECT_THROW(engine->Run(prepared.bgr_, wrong, ColorizationRequest::Create(params)),
               ContractError);
  EXPECT_EQ(engine->GetState(), EngineState::FAILED);
}

TEST_F(EngineTests, UnalignedInput_ThrowsContractError) {
  auto engine = MakeEngine(EngineVariant::FAST);
  const cv::Mat image(40, 40, CV_8UC3, cv::Scalar::all(255));
  LineArtMap    line_art{cv::Mat::zeros(40, 40, CV_32F)};
  ColorizationParams params;
  params.engine_ = EngineVariant::FAST;
  EXPECT_THROW(engine->Run(image, line_art, ColorizationRequest::Create(params)), ContractError);
}

TEST_F(EngineTests, FailingModel_ThrowsEngineExecutionError) {
  ModelManager failing(CpuDevice(), [](const ModelConfig&, const ComputeDevice&) {
    return std::static_pointer_cast<InferenceSession>(std::make_shared<ThrowingSession>());
  });
  ModelConfig config;
  config.id_  = models::kFastColorizer;
  config.uri_ = "test://broken";
  auto engine = EngineFactory::Create(EngineVariant::FAST,
                                      failing.Acquire(config.id_, config));

  auto [prepared, line_art] = Prepare(EngineVariant::FAST);
  ColorizationParams params;
  params.engine_ = EngineVariant::FAST;
  try {
    engine->Run(prepared.bgr_, line_art, ColorizationRequest::Create(params));
    FAIL() << "Expected EngineExecutionError";
  } catch (const EngineExecutionError& e) {
    EXPECT_EQ(e.Kind(), ErrorKind::ENGINE_EXECUTION);
    EXPECT_NE(std::string(e.what()).find("out of device memory"), std::string::npos);
  }
  EXPECT_EQ(engine->GetState(), EngineState::FAILED);
}

TEST_F(EngineTests, Factory_PicksModelPerVariant) {
  EXPECT_EQ(EngineFactory::RequiredModel(EngineVariant::FAST), std::string(models::kFastColorizer));
  EXPECT_EQ(EngineFactory::RequiredModel(EngineVariant::GENERATIVE), std::string(models::kDenoiser));
  auto engine = MakeEngine(EngineVariant::GENERATIVE);
  EXPECT_EQ(engine->GetVariant(), EngineVariant::GENERATIVE);
  EXPECT_EQ(engine->GetGranularity(), 8);
}

TEST(SigmaScheduleTests, DescendsLinearlyToZero) {
  const auto sigmas = GenerativeEngine::SigmaSchedule(0.4f, 1.0f, 20);
  ASSERT_EQ(sigmas.size(), 21u);
  EXPECT_FLOAT_EQ(sigmas.front(), 0.4f);
  EXPECT_FLOAT_EQ(sigmas.back(), 0.0f);
  for (size_t i = 1; i < sigmas.size(); ++i) {
    EXPECT_LT(sigmas[i], sigmas[i - 1]);
  }
}

TEST(PromptEncoderTests, Encode_IsUnitLengthAndCaseInsensitive) {
  PromptEncoder encoder;
  const cv::Mat a = encoder.Encode("Red Hair, blue EYES");
  const cv::Mat b = encoder.Encode("red hair blue eyes");
  EXPECT_EQ(a.size(), cv::Size(PromptEncoder::kDefaultDim, 1));
  EXPECT_NEAR(cv::norm(a, cv::NORM_L2), 1.0, 1e-5);
  EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0);
  EXPECT_GT(cv::norm(a, encoder.Encode("green forest"), cv::NORM_L2), 0.0);
}

TEST(PromptEncoderTests, Encode_EmptyTextIsZero) {
  PromptEncoder encoder(16);
  EXPECT_EQ(cv::countNonZero(encoder.Encode(" , ;")), 0);
  EXPECT_EQ(PromptEncoder::Tokenize("Soft cel-shading!"),
            (std::vector<std::string>{"soft", "cel", "shading"}));
  EXPECT_THROW(PromptEncoder(2), InvalidRequestError);
}
};  // namespace mangatint
