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

#include <cstdint>
#include <memory>
#include <vector>

#include "image/raw_image.hpp"
#include "type/type.hpp"

namespace mangatint {
class ByteBufferLoader {
 public:
  /**
   * @brief Read a whole file into memory, nullptr when it cannot be opened or read
   */
  static auto LoadFromPath(const image_path_t& path) -> std::shared_ptr<std::vector<uint8_t>>;
};

class PageLoader {
 public:
  /**
   * @brief Decode a page from disk.
   *
   * @throws CorruptInputError when the file is missing or cannot be decoded
   * @throws InvalidImageError when the decoded image has no pixels
   */
  static auto LoadFromPath(const image_path_t& path) -> RawImage;
  static auto LoadFromBuffer(const std::vector<uint8_t>& buffer, const image_path_t& name)
      -> RawImage;
};
};  // namespace mangatint
