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
#include <opencv2/core.hpp>

#include "image/raw_image.hpp"
#include "model/model_handle.hpp"
#include "process/image_processor.hpp"

namespace mangatint {
/**
 * @brief Single-channel structural map at working resolution, CV_32FC1 in [0,1] with strokes
 * high. Lives for one engine invocation.
 */
struct LineArtMap {
  cv::Mat map_;

  auto    Size() const -> cv::Size { return map_.size(); }
  auto    Empty() const -> bool { return map_.empty(); }
};

class LineArtExtractor {
 private:
  std::shared_ptr<ModelHandle> model_;
  std::mutex&                  execution_lock_;

 public:
  LineArtExtractor(std::shared_ptr<ModelHandle> model, std::mutex& execution_lock);

  /**
   * @brief Extract the map of a page at the given working resolution. The padded border is
   * always zero.
   *
   * @throws InvalidImageError on an empty page
   * @throws EngineExecutionError when the model run fails
   */
  auto Extract(const RawImage& image, const WorkingGeometry& target) -> LineArtMap;
};
};  // namespace mangatint
