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
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

#include "app/batch_orchestrator.hpp"
#include "app/progress.hpp"
#include "config/colorization_request.hpp"
#include "config/colorizer_config.hpp"
#include "device/device_resolver.hpp"
#include "image/raw_image.hpp"
#include "model/model_manager.hpp"
#include "pipeline/colorization_result.hpp"

namespace mangatint {
/**
 * @brief Entry point of the library. Owns the model manager and the batch orchestrator of one
 * configuration.
 */
class Colorizer {
 private:
  ColorizerConfig   config_;
  ModelManager      models_;
  BatchOrchestrator batch_;

 public:
  explicit Colorizer(ColorizerConfig config = {}, ProgressSink sink = {},
                     std::optional<ComputeDevice> device = std::nullopt,
                     ModelLoader                  loader = DefaultModelLoader());

  /**
   * @brief Colorize one page file and write the result.
   *
   * @param output explicit output file, <output_root>/<stem><suffix><ext> when absent
   * @throws ColorizeError subclasses for every failure, with the matching kind
   */
  auto ColorizeOne(const image_path_t& input, const ColorizationRequest& request,
                   const std::optional<image_path_t>& output = std::nullopt)
      -> ColorizationResult;
  auto ColorizeOne(const image_path_t& input) -> ColorizationResult;

  /**
   * @brief Colorize decoded pixels without touching the disk
   */
  auto ColorizeImage(const RawImage& image, const ColorizationRequest& request)
      -> ColorizationResult;

  /**
   * @brief Colorize a directory, archive or single page as a batch job on the calling thread.
   * Always returns the final snapshot, failures are listed in it.
   */
  auto ColorizeMany(const file_path_t& input, const ColorizationRequest& request,
                    bool create_archive = false) -> BatchJobSnapshot;

  auto GetModelInfo() -> nlohmann::json;
  /**
   * @brief Drop every cached model nobody holds
   */
  void Unload();

  auto Batch() -> BatchOrchestrator& { return batch_; }
  auto Models() -> ModelManager& { return models_; }
  auto Config() const -> const ColorizerConfig& { return config_; }
};
};  // namespace mangatint
