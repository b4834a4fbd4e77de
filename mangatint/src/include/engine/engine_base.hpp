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

#include <atomic>
#include <cstdint>
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <optional>
#include <string>
#include <utility>

#include "config/colorization_request.hpp"
#include "engine/engine_variant.hpp"
#include "lineart/line_art_extractor.hpp"
#include "model/model_handle.hpp"
#include "type/errors.hpp"
#include "type/type.hpp"

namespace mangatint {
struct EngineOutput {
  cv::Mat                 color_;  // CV_32FC3 BGR in [0,1], working resolution
  int                     steps_run_ = 0;
  // Seed actually used by a sampling engine
  std::optional<uint64_t> seed_;
};

class IColorizationEngine {
 public:
  /**
   * @brief Colorize a page at working resolution
   *
   * @param image CV_8UC1 or CV_8UC3 page, padded to the working resolution
   * @param line_art structural map of the same size
   * @return color image of exactly the input size
   * @throws ContractError when image and line art disagree in size
   * @throws EngineExecutionError when the model run fails
   */
  virtual auto Run(const cv::Mat& image, const LineArtMap& line_art,
                   const ColorizationRequest& request) -> EngineOutput = 0;

  virtual auto GetState() const -> EngineState                       = 0;
  virtual auto GetName() const -> std::string                        = 0;
  virtual auto GetVariant() const -> EngineVariant                   = 0;
  virtual auto GetGranularity() const -> int                         = 0;

  virtual ~IColorizationEngine()                                     = default;
};

/**
 * @brief A base class for all engines
 *
 * @tparam Derived CRTP derived class
 */
template <typename Derived>
class EngineBase : public IColorizationEngine {
 protected:
  std::shared_ptr<ModelHandle> model_;
  std::atomic<EngineState>     state_ = EngineState::IDLE;

  void Transition(EngineState next) { state_ = next; }

  /**
   * @brief Gray float page in [0,1] after checking it against the line art
   */
  auto PrepareInput(const cv::Mat& image, const LineArtMap& line_art) const -> cv::Mat {
    if (image.empty()) {
      throw InvalidImageError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                              ": Empty input");
    }
    if (line_art.Empty() || line_art.Size() != image.size()) {
      throw ContractError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                          ": Line art does not match the working resolution");
    }
    if (image.cols % Derived::_granularity != 0 || image.rows % Derived::_granularity != 0) {
      throw ContractError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                          ": Working resolution is not a multiple of " +
                          std::to_string(Derived::_granularity));
    }
    cv::Mat gray;
    if (image.channels() == 3) {
      cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
      gray = image;
    }
    cv::Mat gray01;
    gray.convertTo(gray01, CV_32F, gray.depth() == CV_8U ? 1.0 / 255.0 : 1.0);
    return gray01;
  }

  /**
   * @brief Checked BGR float output of the input size
   */
  auto FinishOutput(cv::Mat color, const cv::Size& expected) const -> cv::Mat {
    if (color.size() != expected) {
      throw EngineExecutionError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                                 ": Model output does not match the working resolution");
    }
    if (color.channels() == 1) {
      cv::cvtColor(color, color, cv::COLOR_GRAY2BGR);
    }
    if (color.channels() != 3) {
      throw EngineExecutionError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                                 ": Model output is not a color image");
    }
    color.convertTo(color, CV_32F);
    cv::max(color, 0.0, color);
    cv::min(color, 1.0, color);
    return color;
  }

 public:
  explicit EngineBase(std::shared_ptr<ModelHandle> model) : model_(std::move(model)) {
    if (!model_) {
      throw ModelLoadError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                           ": No model handle");
    }
  }

  auto Run(const cv::Mat& image, const LineArtMap& line_art, const ColorizationRequest& request)
      -> EngineOutput override {
    try {
      auto output = static_cast<Derived*>(this)->Execute(image, line_art, request);
      Transition(EngineState::DONE);
      return output;
    } catch (const ColorizeError&) {
      Transition(EngineState::FAILED);
      throw;
    } catch (const std::exception& e) {
      Transition(EngineState::FAILED);
      throw EngineExecutionError(std::string("[ERROR] ") + std::string(Derived::_engine_name) +
                                 ": " + e.what());
    }
  }

  auto GetState() const -> EngineState override { return state_.load(); }
  auto GetName() const -> std::string override { return std::string(Derived::_engine_name); }
  auto GetVariant() const -> EngineVariant override { return Derived::_variant; }
  auto GetGranularity() const -> int override { return Derived::_granularity; }
};
};  // namespace mangatint
