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

#include "model/model_manager.hpp"

#include <easy/profiler.h>

#include <iostream>
#include <utility>

#include "type/errors.hpp"

namespace mangatint {
ModelManager::ModelManager(ComputeDevice device, ModelLoader loader)
    : device_(std::move(device)), loader_(std::move(loader)) {
  if (!loader_) {
    loader_ = DefaultModelLoader();
  }
}

auto ModelManager::GetOrCreateEntry(const model_id_t& id) -> Entry& {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    auto entry     = std::make_unique<Entry>();
    entry->handle_ = std::make_shared<ModelHandle>(id, device_);
    it             = entries_.emplace(id, std::move(entry)).first;
  }
  return *it->second;
}

void ModelManager::Register(const ModelConfig& config) {
  std::lock_guard<std::mutex> lock(mtx_);
  configs_[config.id_] = config;
}

auto ModelManager::Acquire(const model_id_t& id) -> std::shared_ptr<ModelHandle> {
  ModelConfig config;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto                        it = configs_.find(id);
    if (it == configs_.end()) {
      throw ModelLoadError("[ERROR] ModelManager: No configuration for model '" + id + "'");
    }
    config = it->second;
  }
  return Acquire(id, config);
}

auto ModelManager::Acquire(const model_id_t& id, const ModelConfig& config)
    -> std::shared_ptr<ModelHandle> {
  std::unique_lock<std::mutex> lock(mtx_);
  Entry&                       entry  = GetOrCreateEntry(id);
  auto&                        handle = entry.handle_;

  bool                         waited = false;
  while (handle->state_ == ModelState::LOADING) {
    waited = true;
    entry.settled_.wait(lock);
  }
  if (handle->state_ == ModelState::READY) {
    ++handle->ref_count_;
    return handle;
  }
  if (waited && handle->state_ == ModelState::ERROR) {
    // The load this call waited for failed, do not start another one right away
    throw ModelLoadError("[ERROR] ModelManager: Loading '" + id + "' failed: " + entry.last_error_);
  }

  handle->state_ = ModelState::LOADING;
  ++entry.load_count_;
  lock.unlock();

  std::shared_ptr<InferenceSession> session;
  std::string                       error;
  {
    EASY_BLOCK("ModelManager::Load");
    std::cout << "[INFO] ModelManager: Loading '" << id << "' from " << config.uri_ << std::endl;
    try {
      session = loader_(config, device_);
      if (!session) {
        error = "loader returned no session";
      }
    } catch (const std::exception& e) {
      error = e.what();
    }
  }

  lock.lock();
  if (!session) {
    handle->state_   = ModelState::ERROR;
    entry.last_error_ = error;
    entry.settled_.notify_all();
    std::cerr << "[ERROR] ModelManager: Failed to load '" << id << "': " << error << std::endl;
    throw ModelLoadError("[ERROR] ModelManager: Loading '" + id + "' failed: " + error);
  }
  handle->session_ = std::move(session);
  handle->state_   = ModelState::READY;
  entry.last_error_.clear();
  ++handle->ref_count_;
  entry.settled_.notify_all();
  return handle;
}

void ModelManager::Release(const std::shared_ptr<ModelHandle>& handle) {
  if (!handle) {
    return;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  if (handle->ref_count_ == 0) {
    std::cerr << "[WARN] ModelManager: Release of unreferenced model '" << handle->id_ << "'"
              << std::endl;
    return;
  }
  --handle->ref_count_;
}

auto ModelManager::Evict(const model_id_t& id) -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        it = entries_.find(id);
  if (it == entries_.end()) {
    return false;
  }
  auto& handle = it->second->handle_;
  if (handle->state_ != ModelState::READY || handle->ref_count_ > 0) {
    return false;
  }
  handle->session_.reset();
  handle->state_ = ModelState::UNLOADED;
  std::cout << "[INFO] ModelManager: Evicted '" << id << "'" << std::endl;
  return true;
}

auto ModelManager::State(const model_id_t& id) -> ModelState {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        it = entries_.find(id);
  return it == entries_.end() ? ModelState::UNLOADED : it->second->handle_->State();
}

auto ModelManager::LastError(const model_id_t& id) -> std::string {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        it = entries_.find(id);
  return it == entries_.end() ? std::string() : it->second->last_error_;
}

auto ModelManager::LoadCount(const model_id_t& id) -> uint32_t {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        it = entries_.find(id);
  return it == entries_.end() ? 0 : it->second->load_count_;
}

auto ModelManager::Info() -> nlohmann::json {
  std::lock_guard<std::mutex> lock(mtx_);
  nlohmann::json              info;
  info["device"]    = device_.name_;
  info["precision"] = PrecisionToString(device_.precision_);

  nlohmann::json models = nlohmann::json::object();
  for (const auto& [id, config] : configs_) {
    models[id] = {{"uri", config.uri_}, {"state", "unloaded"}, {"ref_count", 0}};
  }
  for (const auto& [id, entry] : entries_) {
    auto& model        = models[id];
    model["state"]     = ModelStateToString(entry->handle_->State());
    model["ref_count"] = entry->handle_->RefCount();
    if (!entry->last_error_.empty()) {
      model["error"] = entry->last_error_;
    }
  }
  info["models"] = models;
  return info;
}
};  // namespace mangatint
