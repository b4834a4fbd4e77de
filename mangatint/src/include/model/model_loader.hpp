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

#include <functional>
#include <memory>

#include "device/device_resolver.hpp"
#include "model/inference_session.hpp"
#include "model/model_config.hpp"

namespace mangatint {
using ModelLoader = std::function<std::shared_ptr<InferenceSession>(const ModelConfig&,
                                                                     const ComputeDevice&)>;

/**
 * @brief Loader for "builtin:" uris and cv::dnn model files
 */
auto DefaultModelLoader() -> ModelLoader;
};  // namespace mangatint
