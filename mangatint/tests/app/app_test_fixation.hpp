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

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "app/colorizer.hpp"
#include "common/synthetic_pages.hpp"
#include "model/model_test_fixation.hpp"

namespace mangatint {
/**
 * @brief A colorizer on the CPU with the builtin models, writing below a fresh test directory.
 * Requests default to the fast engine at 256 px so whole batches stay quick.
 */
class AppTests : public ::testing::Test {
 protected:
  file_path_t                               dir_;
  std::mutex                                events_mtx_;
  std::vector<ProgressEvent>                events_;
  std::function<void(const ProgressEvent&)> on_event_;
  std::unique_ptr<Colorizer>                colorizer_;

  void                                      SetUp() override {
    dir_       = MakeTestDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
    colorizer_ = MakeColorizer(DefaultModelLoader());
  }

  void TearDown() override {
    colorizer_.reset();
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  auto MakeConfig() -> ColorizerConfig {
    ColorizerConfig config;
    config.output_root_        = dir_ / "out";
    config.temp_root_          = dir_ / "tmp";
    config.request_.engine_    = EngineVariant::FAST;
    config.request_.max_side_  = 256;
    config.color_consistency_  = true;
    return config;
  }

  auto MakeColorizer(ModelLoader loader) -> std::unique_ptr<Colorizer> {
    auto sink = [this](const ProgressEvent& event) {
      {
        std::lock_guard<std::mutex> lock(events_mtx_);
        events_.push_back(event);
      }
      if (on_event_) {
        on_event_(event);
      }
    };
    return std::make_unique<Colorizer>(MakeConfig(), sink, CpuDevice(), std::move(loader));
  }

  auto Request() -> ColorizationRequest { return colorizer_->Config().DefaultRequest(); }

  /**
   * @brief page1.png .. pageN.png below folder, the page at corrupt (1-based) is garbage
   */
  auto WritePages(const file_path_t& folder, int count, std::optional<int> corrupt = std::nullopt)
      -> std::vector<file_path_t> {
    std::vector<file_path_t> paths;
    for (int i = 1; i <= count; ++i) {
      const auto path = folder / ("page" + std::to_string(i) + ".png");
      if (corrupt && *corrupt == i) {
        pages::WriteCorrupt(path);
      } else {
        cv::Mat page = pages::Manga({200 + 10 * i, 300});
        pages::Write(path, page);
      }
      paths.push_back(path);
    }
    return paths;
  }

  auto Output(const std::string& relative_stem) const -> file_path_t {
    return dir_ / "out" / (relative_stem + "_colored.png");
  }
};
};  // namespace mangatint
