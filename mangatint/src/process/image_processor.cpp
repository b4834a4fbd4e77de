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

#include "process/image_processor.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <cmath>
#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

#include "type/errors.hpp"

namespace mangatint {
namespace {
auto SizeToString(const cv::Size& size) -> std::string {
  return std::to_string(size.width) + "x" + std::to_string(size.height);
}

auto RoundUp(int value, int multiple) -> int { return ((value + multiple - 1) / multiple) * multiple; }
}  // namespace

auto ImageProcessor::ComputeGeometry(const cv::Size& original, int max_side, int granularity)
    -> WorkingGeometry {
  if (original.width <= 0 || original.height <= 0) {
    throw InvalidImageError("[ERROR] ImageProcessor: Zero-size page");
  }
  if (max_side <= 0 || granularity <= 0) {
    throw InvalidImageError("[ERROR] ImageProcessor: Invalid working resolution " +
                            std::to_string(max_side) + "/" + std::to_string(granularity));
  }
  WorkingGeometry geometry;
  geometry.original_size_ = original;
  geometry.granularity_   = granularity;

  const int    longest    = std::max(original.width, original.height);
  const double scale      = std::min(1.0, static_cast<double>(max_side) / longest);
  geometry.scaled_size_   = {std::max(1, static_cast<int>(std::lround(original.width * scale))),
                             std::max(1, static_cast<int>(std::lround(original.height * scale)))};
  geometry.scaled_size_.width  = std::min(geometry.scaled_size_.width, max_side);
  geometry.scaled_size_.height = std::min(geometry.scaled_size_.height, max_side);
  geometry.working_size_       = {RoundUp(geometry.scaled_size_.width, granularity),
                                  RoundUp(geometry.scaled_size_.height, granularity)};
  return geometry;
}

auto ImageProcessor::ToWorking(const cv::Mat& src, const WorkingGeometry& geometry,
                               int interpolation, const cv::Scalar& pad_value) -> cv::Mat {
  cv::Mat scaled;
  if (src.size() != geometry.scaled_size_) {
    cv::resize(src, scaled, geometry.scaled_size_, 0, 0, interpolation);
  } else {
    scaled = src;
  }
  cv::Mat working;
  cv::copyMakeBorder(scaled, working, 0, geometry.working_size_.height - scaled.rows, 0,
                     geometry.working_size_.width - scaled.cols, cv::BORDER_CONSTANT, pad_value);
  return working;
}

auto ImageProcessor::Prepare(const RawImage& image, int max_side, int granularity)
    -> PreparedImage {
  EASY_BLOCK("ImageProcessor::Prepare");
  if (image.Empty()) {
    throw InvalidImageError("[ERROR] ImageProcessor: Empty page " + image.Source().string());
  }
  PreparedImage prepared;
  prepared.geometry_ = ComputeGeometry(image.Size(), max_side, granularity);
  prepared.bgr_      = ToWorking(image.ToBGR(), prepared.geometry_, cv::INTER_AREA,
                                 cv::Scalar(255, 255, 255));
  cv::cvtColor(prepared.bgr_, prepared.gray_, cv::COLOR_BGR2GRAY);
  return prepared;
}

auto ImageProcessor::ToBGR8(const cv::Mat& image) -> cv::Mat {
  cv::Mat out;
  if (image.depth() == CV_32F || image.depth() == CV_64F) {
    image.convertTo(out, CV_8U, 255.0);
  } else if (image.depth() == CV_8U) {
    out = image;
  } else {
    throw ContractError("[ERROR] ImageProcessor: Unsupported pixel depth " +
                        std::to_string(image.depth()));
  }
  if (out.channels() == 1) {
    cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
  } else if (out.channels() == 4) {
    cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
  }
  return out;
}

auto ImageProcessor::Compose(const cv::Mat& generated, const cv::Mat& original,
                             const cv::Mat& mask, int ink_threshold) -> cv::Mat {
  EASY_BLOCK("ImageProcessor::Compose");
  if (generated.size() != original.size()) {
    throw ContractError("[ERROR] ImageProcessor: Generated image is " +
                        SizeToString(generated.size()) + " but original is " +
                        SizeToString(original.size()));
  }
  if (!mask.empty() && (mask.size() != original.size() || mask.type() != CV_8UC1)) {
    throw ContractError("[ERROR] ImageProcessor: Text mask is " + SizeToString(mask.size()) +
                        " but original is " + SizeToString(original.size()));
  }
  const cv::Mat color = ToBGR8(generated);
  const cv::Mat base  = ToBGR8(original);
  cv::Mat       gray;
  if (original.channels() == 1 && original.depth() == CV_8U) {
    gray = original;
  } else {
    cv::cvtColor(base, gray, cv::COLOR_BGR2GRAY);
  }

  cv::Mat    out(base.size(), CV_8UC3);
  const bool has_mask = !mask.empty();
  cv::parallel_for_(cv::Range(0, out.rows), [&](const cv::Range& range) {
    for (int y = range.start; y < range.end; ++y) {
      const cv::Vec3b* gen  = color.ptr<cv::Vec3b>(y);
      const cv::Vec3b* orig = base.ptr<cv::Vec3b>(y);
      const uchar*     g    = gray.ptr<uchar>(y);
      const uchar*     m    = has_mask ? mask.ptr<uchar>(y) : nullptr;
      cv::Vec3b*       dst  = out.ptr<cv::Vec3b>(y);
      for (int x = 0; x < out.cols; ++x) {
        const bool keep = g[x] <= ink_threshold || (m != nullptr && m[x] != 0);
        dst[x]          = keep ? orig[x] : gen[x];
      }
    }
  });
  return out;
}

auto ImageProcessor::Finalize(const cv::Mat& generated, const cv::Mat& mask,
                              const PreparedImage& prepared, const RawImage& original,
                              int ink_threshold, bool restore_original_size) -> cv::Mat {
  EASY_BLOCK("ImageProcessor::Finalize");
  const auto& geometry = prepared.geometry_;
  if (generated.size() != geometry.working_size_) {
    throw ContractError("[ERROR] ImageProcessor: Engine output is " +
                        SizeToString(generated.size()) + ", working resolution is " +
                        SizeToString(geometry.working_size_));
  }
  if (!mask.empty() && mask.size() != geometry.working_size_) {
    throw ContractError("[ERROR] ImageProcessor: Text mask is " + SizeToString(mask.size()) +
                        ", working resolution is " + SizeToString(geometry.working_size_));
  }
  const cv::Rect content = geometry.Content();
  cv::Mat        color   = ToBGR8(generated(content));
  cv::Mat        protect = mask.empty() ? cv::Mat() : mask(content);

  if (!restore_original_size) {
    return Compose(color, prepared.bgr_(content), protect, ink_threshold);
  }
  if (geometry.IsScaled()) {
    cv::resize(color, color, geometry.original_size_, 0, 0, cv::INTER_LANCZOS4);
    if (!protect.empty()) {
      cv::resize(protect, protect, geometry.original_size_, 0, 0, cv::INTER_NEAREST);
    }
  }
  return Compose(color, original.Pixels(), protect, ink_threshold);
}

auto ImageProcessor::Postprocess(const cv::Mat& composed) -> cv::Mat {
  if (composed.depth() != CV_8U) {
    throw ContractError("[ERROR] ImageProcessor: Composed image must be 8-bit");
  }
  // Every supported encoder takes packed 8-bit BGR
  cv::Mat out = ToBGR8(composed);
  return out.isContinuous() ? out : out.clone();
}

auto ImageProcessor::CreateComparison(const cv::Mat& original, const cv::Mat& colored)
    -> cv::Mat {
  const cv::Mat left  = ToBGR8(original);
  const cv::Mat right = ToBGR8(colored);
  cv::Mat       canvas(std::max(left.rows, right.rows), left.cols + right.cols, CV_8UC3,
                       cv::Scalar(255, 255, 255));
  left.copyTo(canvas(cv::Rect(0, 0, left.cols, left.rows)));
  right.copyTo(canvas(cv::Rect(left.cols, 0, right.cols, right.rows)));
  return canvas;
}
};  // namespace mangatint
