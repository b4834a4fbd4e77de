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
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "config/colorization_request.hpp"
#include "type/errors.hpp"
#include "type/type.hpp"
#include "utils/fs/scoped_temp_dir.hpp"

namespace mangatint {
enum class BatchItemStatus : uint8_t { QUEUED, PROCESSING, SUCCEEDED, FAILED, SKIPPED };
enum class BatchJobStatus : uint8_t {
  QUEUED,
  PROCESSING,
  COMPLETED,
  COMPLETED_WITH_ERRORS,
  FAILED,
  CANCELLED
};

auto BatchItemStatusToString(BatchItemStatus status) -> std::string;
auto BatchJobStatusToString(BatchJobStatus status) -> std::string;
// completed, completed-with-errors, failed or cancelled
auto IsFinished(BatchJobStatus status) -> bool;

struct BatchItem {
  image_path_t    source_;
  // Relative name used for outputs and the archive
  file_path_t     relative_;
  BatchItemStatus status_ = BatchItemStatus::QUEUED;
  std::string     error_;
  image_path_t    output_path_;

  auto            ToJson() const -> nlohmann::json;
};

struct BatchError {
  std::string item_;
  std::string message_;
  ErrorKind   kind_ = ErrorKind::UNKNOWN;

  auto        ToJson() const -> nlohmann::json;
};

struct BatchOptions {
  file_path_t output_root_;
  bool        create_archive_    = false;
  std::string archive_name_      = "colored_pages.zip";
  bool        save_comparison_   = false;
  bool        color_consistency_ = true;
};

struct BatchJobSnapshot {
  job_id_t                id_      = 0;
  BatchJobStatus          status_  = BatchJobStatus::QUEUED;
  uint32_t                current_ = 0;
  uint32_t                total_   = 0;
  std::string             message_;
  std::vector<BatchError> errors_;
  std::vector<BatchItem>  items_;
  image_path_t            archive_path_;

  auto                    ToJson() const -> nlohmann::json;
};

/**
 * @brief One batch. Created and driven by BatchOrchestrator; other threads only read snapshots
 * and request cancellation.
 */
class BatchJob {
  friend class BatchOrchestrator;

 private:
  job_id_t                       id_;
  ColorizationRequest            request_;
  BatchOptions                   options_;

  mutable std::mutex             mtx_;
  std::vector<BatchItem>         items_;
  BatchJobStatus                 status_  = BatchJobStatus::QUEUED;
  uint32_t                       current_ = 0;
  std::string                    message_;
  std::vector<BatchError>        errors_;
  image_path_t                   archive_path_;

  std::atomic<bool>              cancel_requested_{false};
  // Holds extracted archive pages until the job ends
  std::unique_ptr<ScopedTempDir> staging_;

 public:
  BatchJob(job_id_t id, ColorizationRequest request, BatchOptions options,
           std::vector<BatchItem> items);

  auto Id() const -> job_id_t { return id_; }
  auto Request() const -> const ColorizationRequest& { return request_; }
  auto Options() const -> const BatchOptions& { return options_; }
  auto Total() const -> uint32_t;

  void RequestCancel() { cancel_requested_.store(true); }
  auto IsCancelRequested() const -> bool { return cancel_requested_.load(); }

  auto IsFinished() const -> bool;
  auto Snapshot() const -> BatchJobSnapshot;
};
};  // namespace mangatint
