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

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace mangatint {
/**
 * @brief Text to a fixed-size embedding by signed feature hashing of lower-cased word tokens.
 * The result is a 1 x dim CV_32F row with unit L2 norm, or all zeros for text without tokens.
 */
class PromptEncoder {
 private:
  int dim_;

 public:
  static constexpr int kDefaultDim = 64;

  explicit PromptEncoder(int dim = kDefaultDim);

  static auto Tokenize(const std::string& text) -> std::vector<std::string>;
  auto        Encode(const std::string& text) const -> cv::Mat;
  auto        Dim() const -> int { return dim_; }
};
};  // namespace mangatint
