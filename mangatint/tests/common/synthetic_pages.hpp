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

#include <filesystem>
#include <fstream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

namespace mangatint {
namespace pages {
// White page, no ink at all
inline auto Blank(cv::Size size = {200, 300}, uchar value = 255) -> cv::Mat {
  return cv::Mat(size, CV_8UC1, cv::Scalar(value));
}

// One line of dark text on white, returns the area the text was drawn into
inline auto DrawText(cv::Mat& page, const std::string& text, cv::Point origin, double scale = 0.6)
    -> cv::Rect {
  int        baseline = 0;
  const auto size     = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, 2, &baseline);
  cv::putText(page, text, origin, cv::FONT_HERSHEY_SIMPLEX, scale, cv::Scalar(0), 2, cv::LINE_8);
  return {origin.x, origin.y - size.height, size.width, size.height + baseline};
}

/**
 * @brief A small manga-like page: panel borders, a character with screen tone, and a speech
 * bubble holding two lines of text
 */
inline auto Manga(cv::Size size = {240, 320}) -> cv::Mat {
  cv::Mat page = Blank(size);
  cv::rectangle(page, cv::Rect(8, 8, size.width - 16, size.height / 2 - 12), cv::Scalar(0), 3);
  cv::rectangle(page, cv::Rect(8, size.height / 2 + 4, size.width - 16, size.height / 2 - 12),
                cv::Scalar(0), 3);

  // Character: skin tone head, darker hair
  const cv::Point head(size.width / 3, size.height / 4 + 10);
  cv::circle(page, head, 30, cv::Scalar(215), cv::FILLED);
  cv::circle(page, head, 30, cv::Scalar(0), 2);
  cv::ellipse(page, head - cv::Point(0, 18), cv::Size(32, 16), 0, 180, 360, cv::Scalar(60),
              cv::FILLED);
  // Screen tone in the lower panel
  cv::rectangle(page, cv::Rect(20, size.height / 2 + 20, size.width / 2, size.height / 4),
                cv::Scalar(130), cv::FILLED);
  cv::rectangle(page, cv::Rect(20 + size.width / 4, size.height / 2 + 40, size.width / 4, 40),
                cv::Scalar(175), cv::FILLED);

  // Speech bubble
  const cv::Point bubble(size.width * 2 / 3 + 5, size.height / 4);
  cv::ellipse(page, bubble, cv::Size(50, 30), 0, 0, 360, cv::Scalar(255), cv::FILLED);
  cv::ellipse(page, bubble, cv::Size(50, 30), 0, 0, 360, cv::Scalar(0), 2);
  DrawText(page, "HEY", bubble + cv::Point(-20, -2), 0.5);
  DrawText(page, "YOU!", bubble + cv::Point(-22, 16), 0.5);
  return page;
}

inline void Write(const std::filesystem::path& path, const cv::Mat& page) {
  std::filesystem::create_directories(path.parent_path());
  cv::imwrite(path.string(), page);
}

// A file with an image extension and garbage content
inline void WriteCorrupt(const std::filesystem::path& path) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << "this is not an image, just some bytes pretending to be one";
}
};  // namespace pages

/**
 * @brief A fresh directory below the system temp dir for each test
 */
inline auto MakeTestDir(const std::string& name) -> std::filesystem::path {
  const auto dir = std::filesystem::temp_directory_path() / ("mangatint_test_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}
};  // namespace mangatint
