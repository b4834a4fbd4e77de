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

#include "io/image/image_writer.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <vector>

#include "type/errors.hpp"

namespace mangatint {
auto FormatFromString(const std::string& name) -> ImageFormatType {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!lowered.empty() && lowered.front() == '.') {
    lowered.erase(lowered.begin());
  }
  if (lowered == "png") return ImageFormatType::PNG;
  if (lowered == "jpg" || lowered == "jpeg") return ImageFormatType::JPEG;
  if (lowered == "webp") return ImageFormatType::WEBP;
  if (lowered == "bmp") return ImageFormatType::BMP;
  throw InvalidRequestError("[ERROR] ImageWriter: Unsupported output format '" + name + "'");
}

auto FormatToString(ImageFormatType format) -> std::string {
  switch (format) {
    case ImageFormatType::JPEG:
      return "jpeg";
    case ImageFormatType::WEBP:
      return "webp";
    case ImageFormatType::BMP:
      return "bmp";
    default:
      return "png";
  }
}

auto ExtensionFor(ImageFormatType format) -> std::string {
  switch (format) {
    case ImageFormatType::JPEG:
      return ".jpg";
    case ImageFormatType::WEBP:
      return ".webp";
    case ImageFormatType::BMP:
      return ".bmp";
    default:
      return ".png";
  }
}

void ImageWriter::WriteImageToPath(const image_path_t& path, const cv::Mat& bgr8,
                                   const OutputFormatOptions& options) {
  EASY_BLOCK("ImageWriter::WriteImageToPath");
  if (bgr8.empty() || bgr8.depth() != CV_8U) {
    throw OutputWriteError("[ERROR] ImageWriter: Refusing to write an empty or non 8-bit image to '" +
                           path.string() + "'");
  }

  std::vector<int> params;
  switch (options.format_) {
    case ImageFormatType::JPEG:
      params = {cv::IMWRITE_JPEG_QUALITY, options.quality_};
      break;
    case ImageFormatType::WEBP:
      params = {cv::IMWRITE_WEBP_QUALITY, options.quality_};
      break;
    case ImageFormatType::PNG:
      params = {cv::IMWRITE_PNG_COMPRESSION, options.compression_level_};
      break;
    default:
      break;
  }

  // Encode in memory so the extension of the target path does not decide the codec
  std::vector<uint8_t> encoded;
  bool                 ok = false;
  try {
    ok = cv::imencode(ExtensionFor(options.format_), bgr8, encoded, params);
  } catch (const cv::Exception& e) {
    throw OutputWriteError("[ERROR] ImageWriter: Failed to encode '" + path.string() +
                           "': " + e.what());
  }
  if (!ok) {
    throw OutputWriteError("[ERROR] ImageWriter: Failed to encode '" + path.string() + "'");
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw OutputWriteError("[ERROR] ImageWriter: Cannot create directory '" +
                             path.parent_path().string() + "': " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw OutputWriteError("[ERROR] ImageWriter: Cannot open '" + path.string() + "' for writing");
  }
  out.write(reinterpret_cast<const char*>(encoded.data()),
            static_cast<std::streamsize>(encoded.size()));
  if (!out) {
    throw OutputWriteError("[ERROR] ImageWriter: Failed to write '" + path.string() + "'");
  }
}
};  // namespace mangatint
