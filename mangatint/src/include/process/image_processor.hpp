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

#include "image/raw_image.hpp"

namespace mangatint {
/**
 * @brief How a page maps onto the working resolution. The page is scaled (never enlarged) so
 * its longest side fits max_side, then padded with white on the right and bottom up to the
 * next multiple of the engine granularity.
 */
struct WorkingGeometry {
  cv::Size original_size_;
  cv::Size scaled_size_;
  cv::Size working_size_;
  int      granularity_ = 1;

  auto     Content() const -> cv::Rect { return {cv::Point(0, 0), scaled_size_}; }
  auto     IsScaled() const -> bool { return scaled_size_ != original_size_; }
};

struct PreparedImage {
  WorkingGeometry geometry_;
  cv::Mat         bgr_;   // CV_8UC3, working resolution
  cv::Mat         gray_;  // CV_8UC1, working resolution
};

class ImageProcessor {
 public:
  static auto ComputeGeometry(const cv::Size& original, int max_side, int granularity)
      -> WorkingGeometry;

  /**
   * @brief Resize into the content area and pad the remainder with pad_value
   */
  static auto ToWorking(const cv::Mat& src, const WorkingGeometry& geometry, int interpolation,
                        const cv::Scalar& pad_value) -> cv::Mat;

  /**
   * @throws InvalidImageError on an empty page or non-positive max_side / granularity
   */
  static auto Prepare(const RawImage& image, int max_side, int granularity) -> PreparedImage;

  /**
   * @brief Keep the original pixel wherever it is ink (gray <= ink_threshold) or the mask is
   * set, the generated pixel everywhere else. An empty mask protects nothing.
   *
   * @param generated CV_8UC3 or CV_32FC3 in [0,1]
   * @param original CV_8UC1 or CV_8UC3
   * @param mask CV_8UC1, empty or the same size as original
   * @return CV_8UC3
   * @throws ContractError when the sizes disagree
   */
  static auto Compose(const cv::Mat& generated, const cv::Mat& original, const cv::Mat& mask,
                      int ink_threshold) -> cv::Mat;

  /**
   * @brief Crop generated output and mask to the content area, optionally bring them back to
   * the original page size, and compose against the matching original pixels
   */
  static auto Finalize(const cv::Mat& generated, const cv::Mat& mask, const PreparedImage& prepared,
                       const RawImage& original, int ink_threshold, bool restore_original_size)
      -> cv::Mat;

  /**
   * @brief Bring a composed page into the layout expected by the encoder. Only channel layout
   * changes, pixel values are untouched.
   */
  static auto Postprocess(const cv::Mat& composed) -> cv::Mat;

  /**
   * @brief Original on the left, result on the right, on a white canvas
   */
  static auto CreateComparison(const cv::Mat& original, const cv::Mat& colored) -> cv::Mat;

  static auto ToBGR8(const cv::Mat& image) -> cv::Mat;
};
};  // namespace mangatint
