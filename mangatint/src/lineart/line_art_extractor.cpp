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

#include "lineart/line_art_extractor.hpp"

#include <easy/profiler.h>

#include <opencv2/imgproc.hpp>
#include <utility>

#include "type/errors.hpp"

namespace mangatint {
LineArtExtractor::LineArtExtractor(std::shared_ptr<ModelHandle> model, std::mutex& execution_lock)
    : model_(std::move(model)), execution_lock_(execution_lock) {
  if (!model_) {
    throw ModelLoadError("[ERROR] LineArtExtractor: No model handle");
  }
}

auto LineArtExtractor::Extract(const RawImage& image, const WorkingGeometry& target)
    -> LineArtMap {
  EASY_BLOCK("LineArtExtractor::Extract");
  if (image.Empty() || image.Width() <= 0 || image.Height() <= 0) {
    throw InvalidImageError("[ERROR] LineArtExtractor: Empty page " + image.Source().string());
  }
  if (target.working_size_.empty() || target.original_size_ != image.Size()) {
    throw InvalidImageError("[ERROR] LineArtExtractor: Target resolution does not belong to " +
                            image.Source().string());
  }

  cv::Mat gray = ImageProcessor::ToWorking(image.ToGray(), target, cv::INTER_AREA,
                                           cv::Scalar(255));
  cv::Mat input;
  gray.convertTo(input, CV_32F, 1.0 / 255.0);

  cv::Mat map;
  try {
    std::lock_guard<std::mutex> lock(execution_lock_);
    auto outputs = model_->Session().Run({{"image", input}});
    map          = TakeOutput(outputs, "lineart");
  } catch (const ColorizeError&) {
    throw;
  } catch (const std::exception& e) {
    throw EngineExecutionError(std::string("[ERROR] LineArtExtractor: Model run failed: ") +
                               e.what());
  }

  if (map.channels() == 3) {
    cv::cvtColor(map, map, cv::COLOR_BGR2GRAY);
  }
  if (map.channels() != 1) {
    throw EngineExecutionError("[ERROR] LineArtExtractor: Unexpected map layout");
  }
  map.convertTo(map, CV_32F);
  if (map.size() != target.working_size_) {
    cv::resize(map, map, target.working_size_, 0, 0, cv::INTER_LINEAR);
  }
  cv::max(map, 0.0, map);
  cv::min(map, 1.0, map);

  // Nothing to draw in the white padding
  const cv::Rect content = target.Content();
  map(cv::Rect(content.width, 0, map.cols - content.width, map.rows)).setTo(0.0f);
  map(cv::Rect(0, content.height, map.cols, map.rows - content.height)).setTo(0.0f);
  return {map};
}
};  // namespace mangatint
