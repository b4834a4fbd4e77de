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

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include "common/synthetic_pages.hpp"
#include "type/errors.hpp"

namespace mangatint {
namespace {
// Counts pixels that are ink or masked in the original but differ in the composed output
auto CountViolations(const cv::Mat& composed, const cv::Mat& original_gray, const cv::Mat& mask,
                     int ink_threshold) -> int {
  cv::Mat original_bgr;
  cv::cvtColor(original_gray, original_bgr, cv::COLOR_GRAY2BGR);
  int violations = 0;
  for (int y = 0; y < composed.rows; ++y) {
    for (int x = 0; x < composed.cols; ++x) {
      const bool protect = original_gray.at<uchar>(y, x) <= ink_threshold ||
                           (!mask.empty() && mask.at<uchar>(y, x) != 0);
      if (protect && composed.at<cv::Vec3b>(y, x) != original_bgr.at<cv::Vec3b>(y, x)) {
        ++violations;
      }
    }
  }
  return violations;
}
}  // namespace

TEST(ImageProcessorTests, Geometry_ShrinksLongestSide_AndPadsToGranularity) {
  const auto geometry = ImageProcessor::ComputeGeometry({1000, 1500}, 1024, 8);
  EXPECT_EQ(geometry.scaled_size_.height, 1024);
  EXPECT_EQ(geometry.scaled_size_.width, 683);
  EXPECT_EQ(geometry.working_size_, cv::Size(688, 1024));
  EXPECT_TRUE(geometry.IsScaled());
}

TEST(ImageProcessorTests, Geometry_NeverUpscales) {
  const auto geometry = ImageProcessor::ComputeGeometry({100, 50}, 1024, 32);
  EXPECT_EQ(geometry.scaled_size_, cv::Size(100, 50));
  EXPECT_EQ(geometry.working_size_, cv::Size(128, 64));
  EXPECT_FALSE(geometry.IsScaled());
}

TEST(ImageProcessorTests, Geometry_RejectsBadInput) {
  EXPECT_THROW(ImageProcessor::ComputeGeometry({0, 10}, 1024, 8), InvalidImageError);
  EXPECT_THROW(ImageProcessor::ComputeGeometry({10, 10}, 0, 8), InvalidImageError);
}

TEST(ImageProcessorTests, Prepare_PadsWithWhite) {
  RawImage   page(pages::Blank({50, 70}, 0), "black.png");
  const auto prepared = ImageProcessor::Prepare(page, 1024, 32);
  EXPECT_EQ(prepared.bgr_.size(), cv::Size(64, 96));
  EXPECT_EQ(prepared.gray_.type(), CV_8UC1);
  EXPECT_EQ(cv::countNonZero(prepared.gray_(prepared.geometry_.Content())), 0);
  // Right and bottom borders are white
  EXPECT_EQ(prepared.gray_.at<uchar>(10, 60), 255);
  EXPECT_EQ(prepared.gray_.at<uchar>(90, 10), 255);
}

TEST(ImageProcessorTests, Prepare_EmptyPage_ThrowsInvalidImage) {
  EXPECT_THROW(ImageProcessor::Prepare(RawImage(), 1024, 8), InvalidImageError);
}

TEST(ImageProcessorTests, Compose_KeepsInkAndMaskedPixels) {
  cv::RNG rng(42);
  cv::Mat original(120, 90, CV_8UC1);
  rng.fill(original, cv::RNG::UNIFORM, 0, 256);
  cv::Mat generated(original.size(), CV_8UC3);
  rng.fill(generated, cv::RNG::UNIFORM, 0, 256);
  cv::Mat mask = cv::Mat::zeros(original.size(), CV_8UC1);
  mask(cv::Rect(10, 10, 30, 20)).setTo(255);

  for (const int threshold : {0, 80, 200}) {
    const cv::Mat composed = ImageProcessor::Compose(generated, original, mask, threshold);
    ASSERT_EQ(composed.type(), CV_8UC3);
    EXPECT_EQ(CountViolations(composed, original, mask, threshold), 0) << threshold;
  }
}

TEST(ImageProcessorTests, Compose_UsesGeneratedColourOutsideProtection) {
  const cv::Mat original  = pages::Blank({16, 16}, 250);
  const cv::Mat generated(original.size(), CV_8UC3, cv::Scalar(10, 120, 200));
  const cv::Mat composed  = ImageProcessor::Compose(generated, original, cv::Mat(), 80);
  EXPECT_EQ(composed.at<cv::Vec3b>(5, 5), cv::Vec3b(10, 120, 200));
}

TEST(ImageProcessorTests, Compose_SizeMismatch_ThrowsContractError) {
  const cv::Mat original = pages::Blank({16, 16});
  const cv::Mat generated(cv::Size(16, 17), CV_8UC3, cv::Scalar::all(0));
  EXPECT_THROW(ImageProcessor::Compose(generated, original, cv::Mat(), 80), ContractError);
  const cv::Mat bad_mask = cv::Mat::zeros(8, 8, CV_8UC1);
  EXPECT_THROW(ImageProcessor::Compose(original, original, bad_mask, 80), ContractError);
}

TEST(ImageProcessorTests, Finalize_RestoresOriginalSize_AndKeepsInk) {
  const cv::Mat page = pages::Manga({300, 420});
  RawImage      raw(page, "page.png");
  const auto    prepared = ImageProcessor::Prepare(raw, 256, 8);
  ASSERT_TRUE(prepared.geometry_.IsScaled());

  // A uniform orange "generation" at working size
  const cv::Mat generated(prepared.geometry_.working_size_, CV_32FC3, cv::Scalar(0.2, 0.5, 0.9));
  const cv::Mat mask = cv::Mat::zeros(prepared.geometry_.working_size_, CV_8UC1);

  const cv::Mat restored = ImageProcessor::Finalize(generated, mask, prepared, raw, 80, true);
  EXPECT_EQ(restored.size(), page.size());
  EXPECT_EQ(CountViolations(restored, page, cv::Mat(), 80), 0);

  const cv::Mat working = ImageProcessor::Finalize(generated, mask, prepared, raw, 80, false);
  EXPECT_EQ(working.size(), prepared.geometry_.scaled_size_);
}

TEST(ImageProcessorTests, Finalize_WrongEngineSize_ThrowsContractError) {
  RawImage      raw(pages::Blank({64, 64}), "page.png");
  const auto    prepared = ImageProcessor::Prepare(raw, 1024, 32);
  const cv::Mat generated(cv::Size(32, 32), CV_32FC3, cv::Scalar::all(0.5));
  EXPECT_THROW(ImageProcessor::Finalize(generated, cv::Mat(), prepared, raw, 80, true),
               ContractError);
}

TEST(ImageProcessorTests, Comparison_PlacesOriginalLeftOfResult) {
  const cv::Mat original = pages::Blank({20, 30}, 0);
  const cv::Mat colored(cv::Size(20, 30), CV_8UC3, cv::Scalar(0, 0, 255));
  const cv::Mat canvas   = ImageProcessor::CreateComparison(original, colored);
  EXPECT_EQ(canvas.size(), cv::Size(40, 30));
  EXPECT_EQ(canvas.at<cv::Vec3b>(5, 5), cv::Vec3b(0, 0, 0));
  EXPECT_EQ(canvas.at<cv::Vec3b>(5, 25), cv::Vec3b(0, 0, 255));
}

TEST(ImageProcessorTests, Postprocess_ExpandsGrayAndRejectsFloat) {
  const cv::Mat out = ImageProcessor::Postprocess(pages::Blank({8, 8}, 100));
  EXPECT_EQ(out.type(), CV_8UC3);
  EXPECT_TRUE(out.isContinuous());
  EXPECT_THROW(ImageProcessor::Postprocess(cv::Mat(8, 8, CV_32FC3)), ContractError);
}
};  // namespace mangatint
