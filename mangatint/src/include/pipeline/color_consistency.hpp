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

#include <deque>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config/colorization_request.hpp"

namespace mangatint {
/**
 * @brief Remembers the palette of the last pages of a batch and turns it into a prompt hint for
 * the next page
 */
class ColorConsistencyTracker {
 private:
  std::deque<std::vector<cv::Vec3b>> history_;
  size_t                             max_history_;

 public:
  explicit ColorConsistencyTracker(size_t max_history = 5);

  /**
   * @brief Colors at the 25th, 50th and 75th luminance percentile of the pixels that are
   * neither near-black nor near-white. Empty when fewer than 100 such pixels exist.
   */
  static auto ExtractDominantColors(const cv::Mat& bgr) -> std::vector<cv::Vec3b>;

  void        Update(const cv::Mat& bgr);
  auto        GuidancePrompt() const -> std::optional<std::string>;
  /**
   * @brief A copy of request with the palette hint appended to its prompt
   */
  auto        Apply(const ColorizationRequest& request) const -> ColorizationRequest;
  void        Reset() { history_.clear(); }
  auto        HistorySize() const -> size_t { return history_.size(); }
};
};  // namespace mangatint
