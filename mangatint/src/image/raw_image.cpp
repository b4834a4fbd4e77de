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

#include "image/raw_image.hpp"

#include <opencv2/core/hal/interface.h>

#include <opencv2/imgproc.hpp>
#include <string>
#include <utility>

#include "type/errors.hpp"

namespace mangatint {
RawImage::RawImage(const cv::Mat& pixels, image_path_t source)
    : pixels_(pixels.clone()), source_(std::move(source)) {
  Normalize();
}

RawImage::RawImage(cv::Mat&& pixels, image_path_t source)
    : pixels_(std::move(pixels)), source_(std::move(source)) {
  Normalize();
}

void RawImage::Normalize() {
  if (pixels_.empty() || pixels_.cols <= 0 || pixels_.rows <= 0) {
    throw InvalidImageError("[ERROR] RawImage: Zero-size image '" + source_.string() + "'");
  }

  switch (pixels_.depth()) {
    case CV_8U:
      break;
    case CV_16U:
      pixels_.convertTo(pixels_, CV_MAKETYPE(CV_8U, pixels_.channels()), 1.0 / 257.0);
      break;
    case CV_32F:
      pixels_.convertTo(pixels_, CV_MAKETYPE(CV_8U, pixels_.channels()), 255.0);
      break;
    default:
      throw InvalidImageError("[ERROR] RawImage: Unsupported pixel depth in '" + source_.string() +
                              "'");
  }

  switch (pixels_.channels()) {
    case 1:
      mode_ = ColorMode::GRAY;
      break;
    case 3:
      mode_ = ColorMode::RGB;
      break;
    case 4:
      cv::cvtColor(pixels_, pixels_, cv::COLOR_BGRA2BGR);
      mode_ = ColorMode::RGB;
      break;
    default:
      throw InvalidImageError("[ERROR] RawImage: Unsupported channel count " +
                              std::to_string(pixels_.channels()) + " in '" + source_.string() +
                              "'");
  }
}

auto RawImage::ToBGR() const -> cv::Mat {
  cv::Mat bgr;
  if (mode_ == ColorMode::GRAY) {
    cv::cvtColor(pixels_, bgr, cv::COLOR_GRAY2BGR);
  } else {
    bgr = pixels_.clone();
  }
  return bgr;
}

auto RawImage::ToGray() const -> cv::Mat {
  cv::Mat gray;
  if (mode_ == ColorMode::GRAY) {
    gray = pixels_.clone();
  } else {
    cv::cvtColor(pixels_, gray, cv::COLOR_BGR2GRAY);
  }
  return gray;
}
};  // namespace mangatint
