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

#include <memory>

#include "config/colorization_request.hpp"
#include "detect/text_region_detector.hpp"
#include "engine/engine_base.hpp"
#include "image/raw_image.hpp"
#include "lineart/line_art_extractor.hpp"
#include "model/model_manager.hpp"
#include "pipeline/colorization_result.hpp"

namespace mangatint {
struct PipelineOptions {
  bool restore_original_size_ = true;
  bool create_comparison_     = false;
};

/**
 * @brief One page from decoded pixels to the final composed image: prepare, line art, text
 * mask, engine run, finalize, postprocess.
 *
 * Open() acquires the line art model and the model of the engine variant, Close() releases
 * them. The pipeline holds its handles between pages so a batch loads each model once.
 */
class ColorizationPipeline {
 private:
  ModelManager&                        models_;
  TextRegionDetector                   detector_;
  PipelineOptions                      options_;

  EngineVariant                        variant_ = EngineVariant::GENERATIVE;
  std::shared_ptr<ModelHandle>         line_art_model_;
  std::shared_ptr<ModelHandle>         engine_model_;
  std::unique_ptr<LineArtExtractor>    extractor_;
  std::unique_ptr<IColorizationEngine> engine_;

 public:
  ColorizationPipeline(ModelManager& models, TextDetectorParams detector, PipelineOptions options);
  ~ColorizationPipeline();

  ColorizationPipeline(const ColorizationPipeline&)            = delete;
  ColorizationPipeline& operator=(const ColorizationPipeline&) = delete;

  /**
   * @throws ModelLoadError when a model cannot be acquired, nothing stays acquired then
   */
  void Open(EngineVariant variant);
  void Close();
  auto IsOpen() const -> bool { return engine_ != nullptr; }
  auto Variant() const -> EngineVariant { return variant_; }
  auto Engine() const -> const IColorizationEngine* { return engine_.get(); }

  /**
   * @throws InvalidRequestError when the request names another engine than the open one
   * @throws InvalidImageError, EngineExecutionError, ContractError on page failures
   */
  auto Process(const RawImage& image, const ColorizationRequest& request) -> ColorizationResult;
};
};  // namespace mangatint
