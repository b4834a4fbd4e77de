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

#include "pipeline/color_consistency.hpp"

#include <algorithm>
#include <iostream>

namespace mangatint {
namespace {
auto Luma(const cv::Vec3b& bgr) -> int { return 29 * bgr[0] + 150 * bgr[1] + 77 * bgr[2]; }
}  // namespace

ColorConsistencyTracker::ColorConsistencyTracker(size_t max_history) : max_history_(max_history) {}

auto ColorConsistencyTracker::ExtractDominantColors(const cv::Mat& bgr) -> std::vector<cv::Vec3b> {
  if (bgr.empty() || bgr.type() != CV_8UC3) {
    return {};
  }
  std::vector<cv::Vec3b> pixels;
  pixels.reserve(bgr.total());
  for (int y = 0; y < bgr.rows; ++y) {
    const cv::Vec3b* row = bgr.ptr<cv::Vec3b>(y);
    for (int x = 0; x < bgr.cols; ++x) {
      const auto [lo, hi] = std::minmax({row[x][0], row[x][1], row[x][2]});
      if (lo > 20 && hi < 235) {
        pixels.push_back(row[x]);
      }
    }
  }
  if (pixels.size() < 100) {
    return {};
  }
  std::sort(pixels.begin(), pixels.end(), [](const cv::Vec3b& a, const cv::Vec3b& b) {
    const int la = Luma(a), lb = Luma(b);
    if (la != lb) return la < lb;
    return std::lexicographical_compare(a.val, a.val + 3, b.val, b.val + 3);
  });
  std::vector<cv::Vec3b> colors;
  for (int percentile : {25, 50, 75}) {
    colors.push_back(pixels[pixels.size() * percentile / 100]);
  }
  return colors;
}

void ColorConsistencyTracker::Update(const cv::Mat& bgr) {
  auto colors = ExtractDominantColors(bgr);
  if (colors.empty()) {
    return;
  }
  history_.push_back(std::move(colors));
  while (history_.size() > max_history_) {
    history_.pop_front();
  }
  std::cout << "[INFO] ColorConsistencyTracker: Tracking " << history_.size() << " pages"
            << std::endl;
}

auto ColorConsistencyTracker::GuidancePrompt() const -> std::optional<std::string> {
  cv::Vec3d sum(0.0, 0.0, 0.0);
  size_t    count = 0;
  for (const auto& page : history_) {
    for (const auto& color : page) {
      sum += cv::Vec3d(color[0], color[1], color[2]);
      ++count;
    }
  }
  if (count == 0) {
    return std::nullopt;
  }
  const int   b = static_cast<int>(sum[0] / count);
  const int   g = static_cast<int>(sum[1] / count);
  const int   r = static_cast<int>(sum[2] / count);

  std::string palette;
  if (r > 140 && g < 100 && b < 100) {
    palette = "warm red and orange tones";
  } else if (b > 140 && r < 100 && g < 100) {
    palette = "cool blue tones";
  } else if (r > 120 && g > 120 && b < 80) {
    palette = "warm yellow and beige tones";
  } else if (r > 100 && g < 80 && b > 100) {
    palette = "purple and magenta tones";
  } else {
    palette = "consistent balanced colors";
  }
  return ", maintaining " + palette + " from previous pages";
}

auto ColorConsistencyTracker::Apply(const ColorizationRequest& request) const
    -> ColorizationRequest {
  auto hint = GuidancePrompt();
  if (!hint) {
    return request;
  }
  return request.WithPrompt(request.Prompt() + *hint);
}
};  // namespace mangatint
