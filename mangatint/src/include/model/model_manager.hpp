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

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "device/device_resolver.hpp"
#include "model/model_config.hpp"
#include "model/model_handle.hpp"
#include "model/model_loader.hpp"
#include "type/type.hpp"

namespace mangatint {
/**
 * @brief Owns every model handle of one colorizer instance.
 *
 * Per model id: UNLOADED -> LOADING -> READY, LOADING -> ERROR on failure, ERROR -> LOADING on
 * the next acquire, READY -> UNLOADED on Evict. Concurrent acquires of an id that is loading
 * block until the load settles, so a model is never loaded twice at once.
 */
class ModelManager {
 private:
  struct Entry {
    std::shared_ptr<ModelHandle> handle_;
    std::condition_variable      settled_;
    std::string                  last_error_;
    uint32_t                     load_count_ = 0;
  };

  ComputeDevice                                          device_;
  ModelLoader                                            loader_;

  std::mutex                                             mtx_;
  std::unordered_map<model_id_t, std::unique_ptr<Entry>> entries_;
  std::unordered_map<model_id_t, ModelConfig>            configs_;

  // Only one engine or model run may hold the compute device
  std::mutex                                             execution_mtx_;

  auto GetOrCreateEntry(const model_id_t& id) -> Entry&;

 public:
  explicit ModelManager(ComputeDevice device, ModelLoader loader = DefaultModelLoader());

  ModelManager(const ModelManager&)            = delete;
  ModelManager& operator=(const ModelManager&) = delete;

  void Register(const ModelConfig& config);

  /**
   * @brief Acquire a model with its registered configuration
   *
   * @throws ModelLoadError when the id has no configuration or loading fails
   */
  auto Acquire(const model_id_t& id) -> std::shared_ptr<ModelHandle>;
  auto Acquire(const model_id_t& id, const ModelConfig& config) -> std::shared_ptr<ModelHandle>;
  void Release(const std::shared_ptr<ModelHandle>& handle);

  /**
   * @brief Drop the weights of a ready model nobody holds. Returns false when it is still
   * referenced or not ready.
   */
  auto Evict(const model_id_t& id) -> bool;

  auto State(const model_id_t& id) -> ModelState;
  auto LastError(const model_id_t& id) -> std::string;
  // Number of load sequences started for an id
  auto LoadCount(const model_id_t& id) -> uint32_t;
  auto Info() -> nlohmann::json;

  auto Device() const -> const ComputeDevice& { return device_; }
  auto GetExecutionLock() -> std::mutex& { return execution_mtx_; }
};
};  // namespace mangatint
