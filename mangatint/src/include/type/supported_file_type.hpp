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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace mangatint {
static const std::unordered_set<std::string> supported_extensions = {".png", ".jpg", ".jpeg",
                                                                     ".webp", ".bmp"};

inline auto LowerExtension(const fs::path& path) -> std::string {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

/**
 * @brief Extension-only check, the file does not have to exist
 */
inline bool is_supported_name(const fs::path& path) {
  return supported_extensions.count(LowerExtension(path)) > 0;
}

inline bool is_supported_file(const fs::path& path) {
  if (!fs::is_regular_file(path)) return false;
  return is_supported_name(path);
}

inline bool is_zip_file(const fs::path& path) { return LowerExtension(path) == ".zip"; }
};  // namespace mangatint
