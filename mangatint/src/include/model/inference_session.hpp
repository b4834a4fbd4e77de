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

#include <map>
#include <opencv2/core.hpp>
#include <string>

#include "type/errors.hpp"

namespace mangatint {
/**
 * @brief Named tensors. Images travel as HWC float matrices, vectors and scalars as 1xN rows.
 */
using TensorMap = std::map<std::string, cv::Mat>;

/**
 * @brief An opaque, loaded model. Implementations are not required to be thread-safe; callers
 * serialize runs through ModelManager::GetExecutionLock().
 */
class InferenceSession {
 public:
  virtual auto Run(const TensorMap& inputs) -> TensorMap = 0;
  virtual auto Describe() const -> std::string           = 0;

  virtual ~InferenceSession()                            = default;
};

/**
 * @brief Fetch an output by name, falling back to the only output of single-output networks
 */
inline auto TakeOutput(const TensorMap& outputs, const std::string& name) -> cv::Mat {
  auto it = outputs.find(name);
  if (it != outputs.end()) {
    return it->second;
  }
  if (outputs.size() == 1) {
    return outputs.begin()->second;
  }
  throw EngineExecutionError("[ERROR] InferenceSession: Missing output tensor '" + name + "'");
}

inline auto TakeInput(const TensorMap& inputs, const std::string& name) -> const cv::Mat& {
  auto it = inputs.find(name);
  if (it == inputs.end() || it->second.empty()) {
    throw EngineExecutionError("[ERROR] InferenceSession: Missing input tensor '" + name + "'");
  }
  return it->second;
}
};  // namespace mangatint
