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
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

namespace mangatint {
/**
 * @brief A thread-safe blocking queue. Progress events travel from the processing thread to
 * whichever consumer polls it.
 */
template <typename T>
class ConcurrentBlockingQueue {
 public:
  explicit ConcurrentBlockingQueue() = default;

  /**
   * @brief A thread-safe wrapper for push()
   *
   * @param value the element to enqueue
   */
  void push(T value) {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      queue_.push(std::move(value));
    }
    consumer_cv_.notify_all();
  }

  /**
   * @brief Blocks until an element is available
   *
   * @return the front-most element of the queue
   */
  T pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    consumer_cv_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  auto try_pop() -> std::optional<T> {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  template <typename Rep, typename Period>
  auto pop_for(const std::chrono::duration<Rep, Period>& timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!consumer_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  auto size() const -> size_t {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  bool empty() const { return size() == 0; }

 private:
  std::queue<T>           queue_;
  mutable std::mutex      mtx_;
  std::condition_variable consumer_cv_;
};
};  // namespace mangatint
