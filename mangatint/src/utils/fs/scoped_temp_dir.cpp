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

#include "utils/fs/scoped_temp_dir.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "type/errors.hpp"

namespace mangatint {
namespace {
std::atomic<uint64_t> temp_counter{0};
}  // namespace

ScopedTempDir::ScopedTempDir(const file_path_t& root, const std::string& prefix) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  path_            = root / (prefix + "_" + std::to_string(stamp) + "_" +
                  std::to_string(temp_counter.fetch_add(1)));
  std::error_code ec;
  std::filesystem::create_directories(path_, ec);
  if (ec) {
    throw OutputWriteError("[ERROR] ScopedTempDir: Cannot create " + path_.string() + ": " +
                           ec.message());
  }
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    std::cerr << "[WARN] ScopedTempDir: Cannot remove " << path_.string() << ": " << ec.message()
              << std::endl;
  }
}
};  // namespace mangatint
