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

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <vector>

namespace mangatint {
/**
 * @brief Heuristic thresholds of the detector. None of them is load-bearing beyond "no ink,
 * no regions" and "overlapping padded boxes merge".
 */
struct TextDetectorParams {
  int         block_size_     = 25;    // adaptive threshold window, odd
  double      threshold_c_    = 12.0;
  int         ink_cutoff_     = 160;   // nothing brighter counts as ink
  cv::Size    close_kernel_   = {5, 3};
  double      min_area_       = 100.0;
  double      max_area_ratio_ = 0.5;
  double      max_aspect_     = 15.0;
  int         merge_padding_  = 8;
  double      max_coverage_   = 0.30;
  int         text_padding_   = 6;     // default rasterisation padding

  auto        ToJson() const -> nlohmann::json;
  static auto FromJson(const nlohmann::json& j) -> TextDetectorParams;
};

struct TextRegion {
  cv::Rect bbox_;
  double   area_        = 0.0;
  int      merge_group_ = 0;
  // Number of raw candidates folded into this region
  int      members_     = 1;

  bool     operator==(const TextRegion& other) const = default;
};

struct TextMask {
  cv::Mat                 mask_;  // CV_8UC1, 255 = protect
  std::vector<TextRegion> regions_;
  // Set when the coverage guard dropped the protection
  bool                    suppressed_ = false;

  auto                    Size() const -> cv::Size { return mask_.size(); }
  auto                    Coverage() const -> double;
  auto                    Empty() const -> bool { return regions_.empty(); }
};

class TextRegionDetector {
 private:
  TextDetectorParams params_;

 public:
  explicit TextRegionDetector(TextDetectorParams params = {});

  /**
   * @brief Find text and bubble regions of a page and rasterise them, each padded by padding
   * pixels, into a mask of the page size. A page without candidates yields an all-clear mask.
   */
  auto        Detect(const cv::Mat& image, int padding) const -> TextMask;
  auto        Detect(const cv::Mat& image) const -> TextMask;

  /**
   * @brief Candidate boxes after binarisation, closing, contour extraction and filtering
   */
  auto        FindCandidates(const cv::Mat& gray) const -> std::vector<cv::Rect>;

  /**
   * @brief Union regions whose boxes, each grown by merge_padding, overlap. Repeats until no
   * pair overlaps, so applying it to its own output changes nothing.
   */
  static auto MergeRegions(std::vector<TextRegion> regions, int merge_padding)
      -> std::vector<TextRegion>;

  static auto Rasterize(const std::vector<TextRegion>& regions, const cv::Size& size, int padding)
      -> cv::Mat;

  auto        Params() const -> const TextDetectorParams& { return params_; }
};
};  // namespace mangatint
