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

#include "app/progress.hpp"

namespace mangatint {
auto ProgressEvent::ToJson() const -> nlohmann::json {
  return {{"job_id", job_id_},   {"current", current_}, {"total", total_},
          {"filename", filename_}, {"percent", percent_}, {"message", message_}};
}

auto PercentOf(uint32_t current, uint32_t total) -> int {
  if (total == 0) {
    return 100;
  }
  return static_cast<int>((static_cast<uint64_t>(current) * 100) / total);
}

auto ProgressChannel::Sink() -> ProgressSink {
  return [this](const ProgressEvent& event) { queue_.push(event); };
}

auto ProgressChannel::TryPoll() -> std::optional<ProgressEvent> { return queue_.try_pop(); }

auto ProgressChannel::Poll(std::chrono::milliseconds timeout) -> std::optional<ProgressEvent> {
  return queue_.pop_for(timeout);
}
};  // namespace mangatint
