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

#include "model/model_handle.hpp"

#include <utility>

#include "type/errors.hpp"

namespace mangatint {
auto ModelStateToString(ModelState state) -> std::string {
  switch (state) {
    case ModelState::LOADING:
      return "loading";
    case ModelState::READY:
      return "ready";
    case ModelState::ERROR:
      return "error";
    default:
      return "unloaded";
  }
}

ModelHandle::ModelHandle(model_id_t id, ComputeDevice device)
    : id_(std::move(id)), device_(std::move(device)) {}

auto ModelHandle::Session() const -> InferenceSession& {
  if (state_.load() != ModelState::READY || !session_) {
    throw ModelLoadError("[ERROR] ModelHandle: Model '" + id_ + "' is " +
                         ModelStateToString(state_.load()));
  }
  return *session_;
}
};  // namespace mangatint
