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

#include "app/batch_job.hpp"

#include <utility>

namespace mangatint {
auto BatchItemStatusToString(BatchItemStatus status) -> std::string {
  switch (status) {
    case BatchItemStatus::QUEUED:
      return "queued";
    case BatchItemStatus::PROCESSING:
      return "processing";
    case BatchItemStatus::SUCCEEDED:
      return "succeeded";
    case BatchItemStatus::FAILED:
      return "failed";
    default:
      return "skipped";
  }
}

auto BatchJobStatusToString(BatchJobStatus status) -> std::string {
  switch (status) {
    case BatchJobStatus::QUEUED:
      return "queued";
    case BatchJobStatus::PROCESSING:
      return "processing";
    case BatchJobStatus::COMPLETED:
      return "completed";
    case BatchJobStatus::COMPLETED_WITH_ERRORS:
      return "completed-with-errors";
    case BatchJobStatus::FAILED:
      return "failed";
    default:
      return "cancelled";
  }
}

auto IsFinished(BatchJobStatus status) -> bool {
  return status != BatchJobStatus::QUEUED && status != BatchJobStatus::PROCESSING;
}

auto BatchItem::ToJson() const -> nlohmann::json {
  nlohmann::json j{{"item", relative_.generic_string()},
                   {"status", BatchItemStatusToString(status_)}};
  if (!error_.empty()) {
    j["error"] = error_;
  }
  if (!output_path_.empty()) {
    j["output"] = output_path_.string();
  }
  return j;
}

auto BatchError::ToJson() const -> nlohmann::json {
  return {{"item", item_}, {"message", message_}, {"kind", ErrorKindToString(kind_)}};
}

auto BatchJobSnapshot::ToJson() const -> nlohmann::json {
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& error : errors_) {
    errors.push_back(error.ToJson());
  }
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : items_) {
    items.push_back(item.ToJson());
  }
  nlohmann::json j{{"id", id_},           {"status", BatchJobStatusToString(status_)},
                   {"current", current_}, {"total", total_},
                   {"message", message_}, {"errors", errors},
                   {"items", items}};
  if (!archive_path_.empty()) {
    j["archive"] = archive_path_.string();
  }
  return j;
}

BatchJob::BatchJob(job_id_t id, ColorizationRequest request, BatchOptions options,
                   std::vector<BatchItem> items)
    : id_(id), request_(std::move(request)), options_(std::move(options)), items_(std::move(items)) {}

auto BatchJob::Total() const -> uint32_t {
  std::lock_guard<std::mutex> lock(mtx_);
  return static_cast<uint32_t>(items_.size());
}

auto BatchJob::IsFinished() const -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return mangatint::IsFinished(status_);
}

auto BatchJob::Snapshot() const -> BatchJobSnapshot {
  std::lock_guard<std::mutex> lock(mtx_);
  BatchJobSnapshot            snapshot;
  snapshot.id_           = id_;
  snapshot.status_       = status_;
  snapshot.current_      = current_;
  snapshot.total_        = static_cast<uint32_t>(items_.size());
  snapshot.message_      = message_;
  snapshot.errors_       = errors_;
  snapshot.items_        = items_;
  snapshot.archive_path_ = archive_path_;
  return snapshot;
}
};  // namespace mangatint
