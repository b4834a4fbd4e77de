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

#include "io/image/image_loader.hpp"

#include <easy/profiler.h>

#include <filesystem>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

#include "type/errors.hpp"

namespace mangatint {
auto ByteBufferLoader::LoadFromPath(const image_path_t& path)
    -> std::shared_ptr<std::vector<uint8_t>> {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return nullptr;
  }
  std::streamsize file_size = file.tellg();
  if (file_size < 0) {
    return nullptr;
  }
  file.seekg(0, std::ios::beg);
  auto buffer = std::make_shared<std::vector<uint8_t>>(static_cast<size_t>(file_size));
  if (file_size > 0 && !file.read(reinterpret_cast<char*>(buffer->data()), file_size)) {
    return nullptr;
  }
  return buffer;
}

auto PageLoader::LoadFromPath(const image_path_t& path) -> RawImage {
  EASY_BLOCK("PageLoader::LoadFromPath");
  if (!std::filesystem::is_regular_file(path)) {
    throw CorruptInputError("[ERROR] PageLoader: File not found '" + path.string() + "'");
  }
  auto buffer = ByteBufferLoader::LoadFromPath(path);
  if (!buffer) {
    throw CorruptInputError("[ERROR] PageLoader: Failed to read '" + path.string() + "'");
  }
  return LoadFromBuffer(*buffer, path);
}

auto PageLoader::LoadFromBuffer(const std::vector<uint8_t>& buffer, const image_path_t& name)
    -> RawImage {
  if (buffer.empty()) {
    throw CorruptInputError("[ERROR] PageLoader: Empty file '" + name.string() + "'");
  }
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw CorruptInputError("[ERROR] PageLoader: Failed to decode '" + name.string() +
                            "': " + e.what());
  }
  if (decoded.empty()) {
    throw CorruptInputError("[ERROR] PageLoader: Failed to decode '" + name.string() + "'");
  }
  return RawImage{std::move(decoded), name};
}
};  // namespace mangatint
