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

#include <opencv2/core.hpp>

#include "type/type.hpp"

namespace mangatint {
/**
 * @brief A decoded page. Pixels are normalised to 8-bit gray or 8-bit BGR on construction and
 * never change afterwards.
 */
class RawImage {
 private:
  cv::Mat      pixels_;
  ColorMode    mode_ = ColorMode::GRAY;
  image_path_t source_;

  void         Normalize();

 public:
  RawImage() = default;
  RawImage(const cv::Mat& pixels, image_path_t source);
  RawImage(cv::Mat&& pixels, image_path_t source);

  auto Width() const -> int { return pixels_.cols; }
  auto Height() const -> int { return pixels_.rows; }
  auto Size() const -> cv::Size { return pixels_.size(); }
  auto Mode() const -> ColorMode { return mode_; }
  auto Source() const -> const image_path_t& { return source_; }
  auto Empty() const -> bool { return pixels_.empty(); }

  auto Pixels() const -> const cv::Mat& { return pixels_; }
  /**
   * @brief A fresh 3-channel BGR copy, gray pages are expanded
   */
  auto ToBGR() const -> cv::Mat;
  auto ToGray() const -> cv::Mat;
};
};  // namespace mangatint
