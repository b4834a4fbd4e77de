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
#include <string>

#include "device/device_resolver.hpp"
#include "model/inference_session.hpp"
#include "type/type.hpp"

namespace mangatint {
enum class ModelState : uint8_t { UNLOADED, LOADING, READY, ERROR };

auto ModelStateToString(ModelState state) -> std::string;

/**
 * @brief A cached model shared by every caller that acquired it. Only ModelManager mutates it;
 * everyone else reads.
 */
class ModelHandle {
  friend class ModelManager;

 private:
  model_id_t                        id_;
  ComputeDevice                     device_;
  std::shared_ptr<InferenceSession> session_;
  std::atomic<ModelState>           state_     = ModelState::UNLOADED;
  std::atomic<uint32_t>             ref_count_ = 0;

 public:
  ModelHandle(model_id_t id, ComputeDevice device);

  auto Id() const -> const model_id_t& { return id_; }
  auto Device() const -> const ComputeDevice& { return device_; }
  auto GetPrecision() const -> Precision { return device_.precision_; }
  auto State() const -> ModelState { return state_.load(); }
  auto RefCount() const -> uint32_t { return ref_count_.load(); }

  /**
   * @throws ModelLoadError if the handle is not ready
   */
  auto Session() const -> InferenceSession&;
};
};  // namespace mangatint
