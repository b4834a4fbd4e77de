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

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "type/type.hpp"
#include "utils/queue/queue.hpp"

namespace mangatint {
/**
 * @brief Immutable progress snapshot of a batch job
 */
struct ProgressEvent {
  job_id_t    job_id_  = 0;
  uint32_t    current_ = 0;
  uint32_t    total_   = 0;
  std::string filename_;
  int         percent_ = 0;
  std::string message_;

  auto        ToJson() const -> nlohmann::json;
};

// Called on the processing thread, must return quickly
using ProgressSink = std::function<void(const ProgressEvent&)>;

auto PercentOf(uint32_t current, uint32_t total) -> int;

/**
 * @brief Buffers events for consumers that poll instead of subscribing
 */
class ProgressChannel {
 private:
  ConcurrentBlockingQueue<ProgressEvent> queue_;

 public:
  auto Sink() -> ProgressSink;
  auto TryPoll() -> std::optional<ProgressEvent>;
  auto Poll(std::chrono::milliseconds timeout) -> std::optional<ProgressEvent>;
  auto Pending() const -> size_t { return queue_.size(); }
};
};  // namespace mangatint
