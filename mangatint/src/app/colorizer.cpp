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

#include "app/colorizer.hpp"

#include <easy/profiler.h>

#include <iostream>
#include <utility>

#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "pipeline/colorization_pipeline.hpp"

namespace mangatint {
Colorizer::Colorizer(ColorizerConfig config, ProgressSink sink,
                     std::optional<ComputeDevice> device, ModelLoader loader)
    : config_(std::move(config)),
      models_(device ? *device : DeviceResolver::System().Resolve(), std::move(loader)),
      batch_(models_, config_, std::move(sink)) {
  for (const auto& [id, model] : config_.models_) {
    models_.Register(model);
  }
}

auto Colorizer::ColorizeImage(const RawImage& image, const ColorizationRequest& request)
    -> ColorizationResult {
  EASY_BLOCK("Colorizer::ColorizeImage");
  ColorizationPipeline pipeline(models_, config_.detector_,
                                {config_.restore_original_size_, config_.save_comparison_});
  pipeline.Open(request.Engine());
  return pipeline.Process(image, request);
}

auto Colorizer::ColorizeOne(const image_path_t& input) -> ColorizationResult {
  return ColorizeOne(input, config_.DefaultRequest());
}

auto Colorizer::ColorizeOne(const image_path_t& input, const ColorizationRequest& request,
                            const std::optional<image_path_t>& output) -> ColorizationResult {
  EASY_BLOCK("Colorizer::ColorizeOne");
  RawImage           page   = PageLoader::LoadFromPath(input);
  ColorizationResult result = ColorizeImage(page, request);

  result.output_path_ =
      output ? *output
             : BatchOrchestrator::OutputPathFor(config_.output_root_, input.filename(),
                                                config_.output_suffix_,
                                                config_.output_format_.format_);
  ImageWriter::WriteImageToPath(result.output_path_, result.image_, config_.output_format_);
  if (!result.comparison_.empty()) {
    result.comparison_path_ = result.output_path_.parent_path() /
                              (input.stem().string() + "_comparison.png");
    ImageWriter::WriteImageToPath(result.comparison_path_, result.comparison_, {});
  }
  std::cout << "[INFO] Colorizer: " << input.filename().string() << " -> "
            << result.output_path_.string() << " in " << static_cast<int>(result.timings_.total_ms_)
            << " ms" << std::endl;
  return result;
}

auto Colorizer::ColorizeMany(const file_path_t& input, const ColorizationRequest& request,
                             bool create_archive) -> BatchJobSnapshot {
  BatchOptions options    = batch_.DefaultOptions();
  options.create_archive_ = create_archive;
  auto job                = batch_.CreateJobFromPath(input, request, options);
  return batch_.Start(job);
}

auto Colorizer::GetModelInfo() -> nlohmann::json { return models_.Info(); }

void Colorizer::Unload() {
  for (const auto& [id, model] : config_.models_) {
    models_.Evict(id);
  }
}
};  // namespace mangatint
