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

#include <memory>
#include <opencv2/dnn.hpp>
#include <string>

#include "device/device_resolver.hpp"
#include "model/inference_session.hpp"
#include "model/model_config.hpp"

namespace mangatint {
/**
 * @brief A network file run through cv::dnn on the resolved backend and target.
 *
 * Image tensors (HxW, 1 or 3 channels) are packed into NCHW blobs, 1xN rows are fed unchanged.
 * When the model declares an input size, images are resized to it on the way in and outputs
 * are resized back to the size of the first image input.
 */
class DnnSession final : public InferenceSession {
 private:
  cv::dnn::Net net_;
  std::string  uri_;
  int          input_size_;

 public:
  DnnSession(cv::dnn::Net net, std::string uri, int input_size);

  /**
   * @throws ModelLoadError when the file is missing or cannot be parsed
   */
  static auto Load(const ModelConfig& config, const ComputeDevice& device)
      -> std::shared_ptr<DnnSession>;

  auto        Run(const TensorMap& inputs) -> TensorMap override;
  auto        Describe() const -> std::string override { return uri_; }
};
};  // namespace mangatint
