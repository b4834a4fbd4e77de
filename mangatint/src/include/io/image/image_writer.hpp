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
#include <opencv2/core.hpp>
#include <string>

#include "type/type.hpp"

namespace mangatint {
enum class ImageFormatType { PNG, JPEG, WEBP, BMP };

struct OutputFormatOptions {
  ImageFormatType format_            = ImageFormatType::PNG;
  int             quality_           = 95;  // JPEG / WEBP
  int             compression_level_ = 3;   // PNG
};

auto FormatFromString(const std::string& name) -> ImageFormatType;
auto FormatToString(ImageFormatType format) -> std::string;
auto ExtensionFor(ImageFormatType format) -> std::string;

class ImageWriter {
 public:
  /**
   * @brief Encode an 8-bit BGR (or gray) image and write it, creating parent directories.
   *
   * @throws OutputWriteError when encoding or writing fails
   */
  static void WriteImageToPath(const image_path_t& path, const cv::Mat& bgr8,
                               const OutputFormatOptions& options);
};
};  // namespace mangatint
