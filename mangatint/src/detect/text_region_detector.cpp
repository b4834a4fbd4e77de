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

#include "detect/text_region_detector.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <iostream>
#include <opencv2/imgproc.hpp>
#include <utility>

#include "type/errors.hpp"

namespace mangatint {
namespace {
auto Grow(const cv::Rect& rect, int padding) -> cv::Rect {
  return {rect.x - padding, rect.y - padding, rect.width + 2 * padding,
          rect.height + 2 * padding};
}

// Touching counts as overlapping
auto Overlaps(const cv::Rect& a, const cv::Rect& b) -> bool {
  return a.x <= b.x + b.width && b.x <= a.x + a.width && a.y <= b.y + b.height &&
         b.y <= a.y + a.height;
}
}  // namespace

auto TextDetectorParams::ToJson() const -> nlohmann::json {
  return {{"block_size", block_size_},
          {"threshold_c", threshold_c_},
          {"ink_cutoff", ink_cutoff_},
          {"close_kernel", {close_kernel_.width, close_kernel_.height}},
          {"min_area", min_area_},
          {"max_area_ratio", max_area_ratio_},
          {"max_aspect", max_aspect_},
          {"merge_padding", merge_padding_},
          {"max_coverage", max_coverage_},
          {"text_padding", text_padding_}};
}

auto TextDetectorParams::FromJson(const nlohmann::json& j) -> TextDetectorParams {
  TextDetectorParams params;
  try {
    params.block_size_     = j.value("block_size", params.block_size_);
    params.threshold_c_    = j.value("threshold_c", params.threshold_c_);
    params.ink_cutoff_     = j.value("ink_cutoff", params.ink_cutoff_);
    params.min_area_       = j.value("min_area", params.min_area_);
    params.max_area_ratio_ = j.value("max_area_ratio", params.max_area_ratio_);
    params.max_aspect_     = j.value("max_aspect", params.max_aspect_);
    params.merge_padding_  = j.value("merge_padding", params.merge_padding_);
    params.max_coverage_   = j.value("max_coverage", params.max_coverage_);
    params.text_padding_   = j.value("text_padding", params.text_padding_);
    if (j.contains("close_kernel")) {
      const auto& kernel   = j.at("close_kernel");
      params.close_kernel_ = {kernel.at(0).get<int>(), kernel.at(1).get<int>()};
    }
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequestError(std::string("[ERROR] TextRegionDetector: Bad parameters: ") +
                              e.what());
  }
  if (params.block_size_ < 3 || params.block_size_ % 2 == 0) {
    throw InvalidRequestError("[ERROR] TextRegionDetector: block_size must be odd and >= 3");
  }
  if (params.close_kernel_.width <= 0 || params.close_kernel_.height <= 0 ||
      params.merge_padding_ < 0 || params.text_padding_ < 0) {
    throw InvalidRequestError("[ERROR] TextRegionDetector: Negative or empty sizes");
  }
  if (params.max_coverage_ <= 0.0 || params.max_coverage_ > 1.0 ||
      params.max_area_ratio_ <= 0.0 || params.max_area_ratio_ > 1.0) {
    throw InvalidRequestError("[ERROR] TextRegionDetector: Ratios must be in (0, 1]");
  }
  return params;
}

auto TextMask::Coverage() const -> double {
  if (mask_.empty()) {
    return 0.0;
  }
  return static_cast<double>(cv::countNonZero(mask_)) / static_cast<double>(mask_.total());
}

TextRegionDetector::TextRegionDetector(TextDetectorParams params) : params_(std::move(params)) {}

auto TextRegionDetector::FindCandidates(const cv::Mat& gray) const -> std::vector<cv::Rect> {
  EASY_BLOCK("TextRegionDetector::FindCandidates");
  cv::Mat local_ink;
  cv::adaptiveThreshold(gray, local_ink, 255, cv::ADAPTIVE_THRESH_MEAN_C, cv::THRESH_BINARY_INV,
                        params_.block_size_, params_.threshold_c_);
  cv::Mat dark;
  cv::threshold(gray, dark, params_.ink_cutoff_ - 1, 255, cv::THRESH_BINARY_INV);
  cv::Mat binary;
  cv::bitwise_and(local_ink, dark, binary);

  // Bridge the gaps between glyphs of one line before taking contours
  const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, params_.close_kernel_);
  cv::morphologyEx(binary, binary, cv::MORPH_CLOSE, kernel);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  const double           page_area = static_cast<double>(gray.total());
  std::vector<cv::Rect>  candidates;
  for (const auto& contour : contours) {
    const cv::Rect box  = cv::boundingRect(contour);
    const double   area = static_cast<double>(box.area());
    if (area < params_.min_area_ || area > params_.max_area_ratio_ * page_area) {
      continue;
    }
    const double aspect = static_cast<double>(std::max(box.width, box.height)) /
                          static_cast<double>(std::max(1, std::min(box.width, box.height)));
    if (aspect > params_.max_aspect_) {
      continue;
    }
    candidates.push_back(box);
  }
  return candidates;
}

auto TextRegionDetector::MergeRegions(std::vector<TextRegion> regions, int merge_padding)
    -> std::vector<TextRegion> {
  bool merged = true;
  while (merged) {
    merged = false;
    for (size_t i = 0; i < regions.size() && !merged; ++i) {
      for (size_t j = i + 1; j < regions.size(); ++j) {
        if (!Overlaps(Grow(regions[i].bbox_, merge_padding), Grow(regions[j].bbox_, merge_padding))) {
          continue;
        }
        regions[i].bbox_    |= regions[j].bbox_;
        regions[i].members_ += regions[j].members_;
        regions.erase(regions.begin() + static_cast<std::ptrdiff_t>(j));
        merged = true;
        break;
      }
    }
  }

  // Reading order gives stable group ids
  std::sort(regions.begin(), regions.end(), [](const TextRegion& a, const TextRegion& b) {
    return a.bbox_.y != b.bbox_.y ? a.bbox_.y < b.bbox_.y : a.bbox_.x < b.bbox_.x;
  });
  for (size_t i = 0; i < regions.size(); ++i) {
    regions[i].area_        = static_cast<double>(regions[i].bbox_.area());
    regions[i].merge_group_ = static_cast<int>(i);
  }
  return regions;
}

auto TextRegionDetector::Rasterize(const std::vector<TextRegion>& regions, const cv::Size& size,
                                   int padding) -> cv::Mat {
  cv::Mat        mask = cv::Mat::zeros(size, CV_8UC1);
  const cv::Rect bounds(cv::Point(0, 0), size);
  for (const auto& region : regions) {
    const cv::Rect rect = Grow(region.bbox_, std::max(0, padding)) & bounds;
    if (rect.area() > 0) {
      mask(rect).setTo(255);
    }
  }
  return mask;
}

auto TextRegionDetector::Detect(const cv::Mat& image) const -> TextMask {
  return Detect(image, params_.text_padding_);
}

auto TextRegionDetector::Detect(const cv::Mat& image, int padding) const -> TextMask {
  EASY_BLOCK("TextRegionDetector::Detect");
  if (image.empty()) {
    throw InvalidImageError("[ERROR] TextRegionDetector: Empty page");
  }
  cv::Mat gray;
  if (image.channels() == 1) {
    gray = image;
  } else {
    cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
  }
  if (gray.depth() != CV_8U) {
    gray.convertTo(gray, CV_8U, gray.depth() == CV_32F ? 255.0 : 1.0);
  }

  std::vector<TextRegion> regions;
  for (const auto& box : FindCandidates(gray)) {
    TextRegion region;
    region.bbox_ = box;
    region.area_ = static_cast<double>(box.area());
    regions.push_back(region);
  }

  TextMask result;
  result.regions_ = MergeRegions(std::move(regions), params_.merge_padding_);
  result.mask_    = Rasterize(result.regions_, gray.size(), padding);

  const double coverage = result.Coverage();
  if (coverage > params_.max_coverage_) {
    std::cerr << "[WARN] TextRegionDetector: Mask covers " << static_cast<int>(coverage * 100)
              << "% of the page, skipping text protection" << std::endl;
    result.mask_.setTo(0);
    result.regions_.clear();
    result.suppressed_ = true;
  }
  return result;
}
};  // namespace mangatint
