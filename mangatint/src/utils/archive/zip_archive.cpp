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

#include "utils/archive/zip_archive.hpp"

#include <easy/profiler.h>
#include <zip.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "type/errors.hpp"
#include "type/supported_file_type.hpp"

namespace mangatint {
namespace {
struct ZipCloser {
  void operator()(zip_t* archive) const {
    if (archive != nullptr) {
      zip_discard(archive);
    }
  }
};
using ZipPtr = std::unique_ptr<zip_t, ZipCloser>;

auto OpenForReading(const file_path_t& path) -> ZipPtr {
  int    error   = 0;
  zip_t* archive = zip_open(path.string().c_str(), ZIP_RDONLY, &error);
  if (archive == nullptr) {
    zip_error_t zip_error;
    zip_error_init_with_code(&zip_error, error);
    std::string message = zip_error_strerror(&zip_error);
    zip_error_fini(&zip_error);
    throw ArchiveError("[ERROR] ZipArchive: Cannot open " + path.string() + ": " + message);
  }
  return ZipPtr(archive);
}
}  // namespace

auto ZipArchive::IsSafeEntryName(const std::string& name) -> bool {
  if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos ||
      name.find(':') != std::string::npos) {
    return false;
  }
  for (const auto& part : std::filesystem::path(name)) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

auto ZipArchive::ListEntries(const file_path_t& archive) -> std::vector<std::string> {
  ZipPtr                   zip     = OpenForReading(archive);
  const zip_int64_t        count   = zip_get_num_entries(zip.get(), 0);
  std::vector<std::string> names;
  for (zip_int64_t i = 0; i < count; ++i) {
    const char* name = zip_get_name(zip.get(), static_cast<zip_uint64_t>(i), 0);
    if (name != nullptr) {
      names.emplace_back(name);
    }
  }
  return names;
}

auto ZipArchive::IsPageEntryName(const std::string& name) -> bool {
  return !name.empty() && name.back() != '/' && !name.starts_with("__MACOSX/") &&
         is_supported_name(name);
}

auto ZipArchive::ExtractImages(const file_path_t& archive, const file_path_t& dest,
                               size_t max_entry_bytes) -> std::vector<file_path_t> {
  EASY_BLOCK("ZipArchive::ExtractImages");
  ZipPtr                   zip   = OpenForReading(archive);
  const zip_int64_t        count = zip_get_num_entries(zip.get(), 0);
  std::vector<file_path_t> extracted;

  for (zip_int64_t i = 0; i < count; ++i) {
    const auto  index = static_cast<zip_uint64_t>(i);
    const char* raw   = zip_get_name(zip.get(), index, 0);
    if (raw == nullptr) {
      continue;
    }
    const std::string name(raw);
    if (!IsPageEntryName(name)) {
      continue;
    }
    if (!IsSafeEntryName(name)) {
      std::cerr << "[WARN] ZipArchive: Skipping unsafe entry " << name << std::endl;
      continue;
    }

    zip_stat_t stat;
    zip_stat_init(&stat);
    if (zip_stat_index(zip.get(), index, 0, &stat) != 0) {
      std::cerr << "[WARN] ZipArchive: Cannot stat entry " << name << std::endl;
      continue;
    }
    if ((stat.valid & ZIP_STAT_SIZE) == 0 || stat.size > max_entry_bytes) {
      std::cerr << "[WARN] ZipArchive: Skipping oversized entry " << name << std::endl;
      continue;
    }
    zip_file_t* file = zip_fopen_index(zip.get(), index, 0);
    if (file == nullptr) {
      std::cerr << "[WARN] ZipArchive: Cannot open entry " << name << std::endl;
      continue;
    }
    std::vector<char> data(static_cast<size_t>(stat.size));
    const zip_int64_t read = zip_fread(file, data.data(), stat.size);
    zip_fclose(file);

    // A truncated entry is still staged; decoding will report it as corrupt
    if (read < 0) {
      std::cerr << "[WARN] ZipArchive: Cannot read entry " << name << std::endl;
      data.clear();
    } else {
      data.resize(static_cast<size_t>(read));
    }

    const file_path_t relative = file_path_t(name).lexically_normal();
    const file_path_t target   = dest / relative;
    std::filesystem::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
      throw ArchiveError("[ERROR] ZipArchive: Cannot stage " + target.string());
    }
    extracted.push_back(relative);
  }
  return extracted;
}

void ZipArchive::Pack(const file_path_t& archive, const std::vector<ArchiveEntry>& entries) {
  EASY_BLOCK("ZipArchive::Pack");
  if (archive.has_parent_path()) {
    std::filesystem::create_directories(archive.parent_path());
  }
  int    error = 0;
  zip_t* raw   = zip_open(archive.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
  if (raw == nullptr) {
    throw ArchiveError("[ERROR] ZipArchive: Cannot create " + archive.string());
  }
  ZipPtr zip(raw);

  for (const auto& entry : entries) {
    if (!IsSafeEntryName(entry.name_)) {
      throw ArchiveError("[ERROR] ZipArchive: Refusing entry name " + entry.name_);
    }
    zip_source_t* source = zip_source_file(zip.get(), entry.source_.string().c_str(), 0, -1);
    if (source == nullptr) {
      throw ArchiveError("[ERROR] ZipArchive: Cannot read " + entry.source_.string() + ": " +
                         zip_strerror(zip.get()));
    }
    if (zip_file_add(zip.get(), entry.name_.c_str(), source,
                     ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
      zip_source_free(source);
      throw ArchiveError("[ERROR] ZipArchive: Cannot add " + entry.name_ + ": " +
                         zip_strerror(zip.get()));
    }
  }

  if (zip_close(zip.get()) != 0) {
    throw ArchiveError("[ERROR] ZipArchive: Cannot write " + archive.string() + ": " +
                       zip_strerror(zip.get()));
  }
  // Closed successfully, nothing left to discard
  (void)zip.release();
}
};  // namespace mangatint
