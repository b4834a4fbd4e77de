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

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "type/type.hpp"

namespace mangatint {
struct ArchiveEntry {
  file_path_t source_;  // file on disk
  std::string name_;    // path inside the archive, '/' separated
};

class ZipArchive {
 public:
  // Larger entries are skipped rather than staged
  static constexpr size_t kMaxEntryBytes = size_t{256} << 20;

  /**
   * @brief Entry names that stay inside the extraction root: relative, no "..", no drive or
   * backslash tricks
   */
  static auto IsSafeEntryName(const std::string& name) -> bool;

  /**
   * @brief Non-empty file entries with a supported page extension, outside macOS metadata folders
   */
  static auto IsPageEntryName(const std::string& name) -> bool;

  /**
   * @brief Extract every supported image of an archive below dest, keeping relative folders.
   * Unsafe entries and entries above max_entry_bytes are skipped with a warning.
   *
   * @return relative paths of the extracted pages
   * @throws ArchiveError when the archive cannot be opened
   */
  static auto ExtractImages(const file_path_t& archive, const file_path_t& dest,
                            size_t max_entry_bytes = kMaxEntryBytes) -> std::vector<file_path_t>;

  /**
   * @brief Write a new archive (replacing an existing one) from files on disk
   *
   * @throws ArchiveError when any entry cannot be added or the archive cannot be written
   */
  static void Pack(const file_path_t& archive, const std::vector<ArchiveEntry>& entries);

  static auto ListEntries(const file_path_t& archive) -> std::vector<std::string>;
};
};  // namespace mangatint
