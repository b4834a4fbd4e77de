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

#include "pipeline/colorization_pipeline.hpp"

#include <easy/profiler.h>

#include <chrono>
#include <mutex>
#include <utility>

#include "engine/engine_factory.hpp"
#include "process/image_processor.hpp"
#include "type/errors.hpp"
#include "utils/clock/time_provider.hpp"

namespace mangatint {
ColorizationPipeline::ColorizationPipeline(ModelManager& models, TextDetectorParams detector,
                                           PipelineOptions options)
    : models_(models), detector_(std::move(detector)), options_(options) {}

ColorizationPipeline::~ColorizationPipeline() { Close(); }

void ColorizationPipeline::Open(EngineVariant variant) {
  if (IsOpen() && variant_ == variant) {
    return;
  }
  Close();
  line_art_model_ = models_.Acquire(std::string(models::kLineArt));
  try {
    engine_model_ = models_.Acquire(EngineFactory::RequiredModel(variant));
  } catch (const ModelLoadError&) {
    models_.Release(line_art_model_);
    line_art_model_.reset();
    throw;
  }
  extractor_ = std::make_unique<LineArtExtractor>(line_art_model_, models_.GetExecutionLock());
  engine_    = EngineFactory::Create(variant, engine_model_);
  variant_   = variant;
}

void ColorizationPipeline::Close() {
  engine_.reset();
  extractor_.reset();
  if (engine_model_) {
    models_.Release(engine_model_);
    engine_model_.reset();
  }
  if (line_art_model_) {
    models_.Release(line_art_model_);
    line_art_model_.reset();
  }
}

auto ColorizationPipeline::Process(const RawImage& image, const ColorizationRequest& request)
    -> ColorizationResult {
  EASY_BLOCK("ColorizationPipeline::Process");
  if (!IsOpen()) {
    Open(request.Engine());
  }
  if (request.Engine() != variant_) {
    throw InvalidRequestError("[ERROR] ColorizationPipeline: Request asks for the " +
                              EngineVariantToString(request.Engine()) + " engine, " +
                              EngineVariantToString(variant_) + " is open");
  }

  ColorizationResult result;
  result.engine_   = variant_;
  const auto start = std::chrono::steady_clock::now();
  auto       stage = start;

  PreparedImage prepared = ImageProcessor::Prepare(image, request.MaxSide(), request.Granularity());
  result.working_size_        = prepared.geometry_.working_size_;
  result.timings_.prepare_ms_ = TimeProvider::ElapsedMs(stage);

  stage               = std::chrono::steady_clock::now();
  LineArtMap line_art = extractor_->Extract(image, prepared.geometry_);
  result.timings_.line_art_ms_ = TimeProvider::ElapsedMs(stage);

  stage = std::chrono::steady_clock::now();
  TextMask mask;
  if (request.ProtectText()) {
    mask = detector_.Detect(prepared.gray_, detector_.Params().text_padding_);
    if (mask.Size() != prepared.geometry_.working_size_) {
      throw ContractError(
          "[ERROR] ColorizationPipeline: Text mask does not match the working resolution");
    }
  }
  result.text_regions_       = mask.regions_.size();
  result.text_suppressed_    = mask.suppressed_;
  result.timings_.detect_ms_ = TimeProvider::ElapsedMs(stage);

  stage = std::chrono::steady_clock::now();
  EngineOutput generated;
  {
    std::lock_guard<std::mutex> lock(models_.GetExecutionLock());
    generated = engine_->Run(prepared.gray_, line_art, request);
  }
  result.steps_run_          = generated.steps_run_;
  result.seed_               = generated.seed_;
  result.timings_.engine_ms_ = TimeProvider::ElapsedMs(stage);

  stage            = std::chrono::steady_clock::now();
  cv::Mat composed = ImageProcessor::Finalize(generated.color_, mask.mask_, prepared, image,
                                              request.InkThreshold(),
                                              options_.restore_original_size_);
  result.image_       = ImageProcessor::Postprocess(composed);
  result.output_size_ = result.image_.size();
  if (options_.create_comparison_) {
    cv::Mat before     = options_.restore_original_size_
                             ? image.ToBGR()
                             : prepared.bgr_(prepared.geometry_.Content()).clone();
    result.comparison_ = ImageProcessor::CreateComparison(before, result.image_);
  }
  result.timings_.compose_ms_ = TimeProvider::ElapsedMs(stage);

  result.timings_.total_ms_   = TimeProvider::ElapsedMs(start);
  result.finished_at_         = TimeProvider::TimePointToString(TimeProvider::Now());
  return result;
}
};  // namespace mangatint
