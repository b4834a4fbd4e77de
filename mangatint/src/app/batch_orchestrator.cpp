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

#include "app/batch_orchestrator.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <opencv2/core.hpp>
#include <utility>

#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "pipeline/color_consistency.hpp"
#include "pipeline/colorization_pipeline.hpp"
#include "type/supported_file_type.hpp"
#include "utils/archive/zip_archive.hpp"

namespace mangatint {
namespace {
auto LowerGeneric(const file_path_t& path) -> std::string {
  std::string name = path.generic_string();
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return name;
}

void SortByName(std::vector<BatchItem>& items) {
  std::stable_sort(items.begin(), items.end(), [](const BatchItem& a, const BatchItem& b) {
    const auto la = LowerGeneric(a.relative_);
    const auto lb = LowerGeneric(b.relative_);
    return la != lb ? la < lb : a.relative_.generic_string() < b.relative_.generic_string();
  });
}

auto MakeItem(image_path_t source, file_path_t relative) -> BatchItem {
  BatchItem item;
  item.source_   = std::move(source);
  item.relative_ = std::move(relative);
  return item;
}
}  // namespace

BatchOrchestrator::BatchOrchestrator(ModelManager& models, ColorizerConfig config,
                                     ProgressSink sink)
    : models_(models), config_(std::move(config)), sink_(std::move(sink)) {}

auto BatchOrchestrator::DefaultOptions() const -> BatchOptions {
  BatchOptions options;
  options.output_root_       = config_.output_root_;
  options.archive_name_      = config_.archive_name_;
  options.save_comparison_   = config_.save_comparison_;
  options.color_consistency_ = config_.color_consistency_;
  return options;
}

auto BatchOrchestrator::OutputPathFor(const file_path_t& root, const file_path_t& relative,
                                      const std::string& suffix, ImageFormatType format)
    -> file_path_t {
  const std::string name = relative.stem().string() + suffix + ExtensionFor(format);
  return root / relative.parent_path() / name;
}

auto BatchOrchestrator::EnumerateInputs(const file_path_t& input, const file_path_t& staging)
    -> std::vector<BatchItem> {
  namespace fs = std::filesystem;
  std::vector<BatchItem> items;
  if (!fs::exists(input)) {
    throw CorruptInputError("[ERROR] BatchOrchestrator: Input not found: " + input.string());
  }

  if (fs::is_directory(input)) {
    for (const auto& entry : fs::recursive_directory_iterator(input)) {
      if (entry.is_regular_file() && is_supported_name(entry.path())) {
        items.push_back(MakeItem(entry.path(), entry.path().lexically_relative(input)));
      }
    }
  } else if (is_zip_file(input)) {
    for (const auto& relative : ZipArchive::ExtractImages(input, staging)) {
      items.push_back(MakeItem(staging / relative, relative));
    }
  } else if (is_supported_name(input)) {
    items.push_back(MakeItem(input, input.filename()));
  } else {
    throw CorruptInputError("[ERROR] BatchOrchestrator: Unsupported input " + input.string());
  }

  if (items.empty()) {
    throw CorruptInputError("[ERROR] BatchOrchestrator: No supported pages in " + input.string());
  }
  SortByName(items);
  return items;
}

auto BatchOrchestrator::Register(std::shared_ptr<BatchJob> job) -> std::shared_ptr<BatchJob> {
  std::lock_guard<std::mutex> lock(jobs_mtx_);
  jobs_[job->Id()] = job;
  return job;
}

auto BatchOrchestrator::CreateJob(const std::vector<image_path_t>& inputs,
                                  const ColorizationRequest& request, const BatchOptions& options)
    -> std::shared_ptr<BatchJob> {
  std::vector<BatchItem> items;
  items.reserve(inputs.size());
  for (const auto& input : inputs) {
    items.push_back(MakeItem(input, input.filename()));
  }
  return Register(
      std::make_shared<BatchJob>(id_gen_.GenerateID(), request, options, std::move(items)));
}

auto BatchOrchestrator::CreateJobFromPath(const file_path_t& input,
                                          const ColorizationRequest& request,
                                          const BatchOptions& options)
    -> std::shared_ptr<BatchJob> {
  const job_id_t                 id = id_gen_.GenerateID();
  std::unique_ptr<ScopedTempDir> staging;
  std::vector<BatchItem>         items;
  try {
    if (is_zip_file(input)) {
      staging = std::make_unique<ScopedTempDir>(config_.temp_root_, "job" + std::to_string(id));
    }
    items = EnumerateInputs(input, staging ? staging->Path() : file_path_t());
  } catch (const ColorizeError& e) {
    std::cerr << e.what() << std::endl;
    auto job      = std::make_shared<BatchJob>(id, request, options, std::vector<BatchItem>{});
    job->status_  = BatchJobStatus::FAILED;
    job->message_ = e.what();
    job->errors_.push_back({input.filename().string(), e.what(), e.Kind()});
    return Register(job);
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "[ERROR] BatchOrchestrator: " << e.what() << std::endl;
    auto job      = std::make_shared<BatchJob>(id, request, options, std::vector<BatchItem>{});
    job->status_  = BatchJobStatus::FAILED;
    job->message_ = e.what();
    job->errors_.push_back({input.filename().string(), e.what(), ErrorKind::IO});
    return Register(job);
  }
  auto job      = std::make_shared<BatchJob>(id, request, options, std::move(items));
  job->staging_ = std::move(staging);
  return Register(job);
}

void BatchOrchestrator::Emit(const BatchJob& job, const std::string& filename,
                             const std::string& message) {
  if (!sink_) {
    return;
  }
  ProgressEvent event;
  {
    std::lock_guard<std::mutex> lock(job.mtx_);
    event.job_id_  = job.id_;
    event.current_ = job.current_;
    event.total_   = static_cast<uint32_t>(job.items_.size());
  }
  event.filename_ = filename;
  event.percent_  = PercentOf(event.current_, event.total_);
  event.message_  = message;
  sink_(event);
}

auto BatchOrchestrator::Start(const std::shared_ptr<BatchJob>& job) -> BatchJobSnapshot {
  if (!job) {
    throw InvalidRequestError("[ERROR] BatchOrchestrator: No job");
  }
  bool failed_on_creation = false;
  {
    std::lock_guard<std::mutex> lock(job->mtx_);
    if (job->status_ == BatchJobStatus::FAILED) {
      failed_on_creation = true;
    } else if (job->status_ != BatchJobStatus::QUEUED) {
      throw InvalidRequestError("[ERROR] BatchOrchestrator: Job " + std::to_string(job->id_) +
                                " was already started");
    } else {
      job->status_ = BatchJobStatus::PROCESSING;
    }
  }
  if (failed_on_creation) {
    return job->Snapshot();
  }
  Run(*job);
  // Staged archive pages are no longer needed
  job->staging_.reset();
  return job->Snapshot();
}

auto BatchOrchestrator::StartAsync(const std::shared_ptr<BatchJob>& job)
    -> std::future<BatchJobSnapshot> {
  return worker_.Enqueue([this, job]() { return Start(job); });
}

void BatchOrchestrator::Run(BatchJob& job) {
  EASY_BLOCK("BatchOrchestrator::Run");
  const BatchOptions&  options = job.options_;
  ColorizationPipeline pipeline(models_, config_.detector_,
                                {config_.restore_original_size_, options.save_comparison_});
  try {
    pipeline.Open(job.request_.Engine());
  } catch (const ColorizeError& e) {
    std::cerr << "[ERROR] BatchOrchestrator: Job " << job.id_ << " cannot start: " << e.what()
              << std::endl;
    std::lock_guard<std::mutex> lock(job.mtx_);
    job.status_  = BatchJobStatus::FAILED;
    job.message_ = e.what();
    job.errors_.push_back({"model", e.what(), e.Kind()});
    return;
  }
  Emit(job, "", "model ready");

  ColorConsistencyTracker tracker;
  const size_t            total     = job.Total();
  bool                    cancelled = false;

  for (size_t i = 0; i < total; ++i) {
    if (job.IsCancelRequested()) {
      std::lock_guard<std::mutex> lock(job.mtx_);
      for (size_t j = i; j < total; ++j) {
        job.items_[j].status_ = BatchItemStatus::SKIPPED;
      }
      cancelled = true;
      break;
    }

    BatchItem item;
    {
      std::lock_guard<std::mutex> lock(job.mtx_);
      job.items_[i].status_ = BatchItemStatus::PROCESSING;
      item                  = job.items_[i];
    }
    const std::string name = item.relative_.generic_string();

    BatchItemStatus   status = BatchItemStatus::SUCCEEDED;
    BatchError        error;
    try {
      RawImage page = PageLoader::LoadFromPath(item.source_);
      const ColorizationRequest request =
          options.color_consistency_ ? tracker.Apply(job.request_) : job.request_;
      ColorizationResult result = pipeline.Process(page, request);

      item.output_path_ = OutputPathFor(options.output_root_, item.relative_,
                                        config_.output_suffix_, config_.output_format_.format_);
      ImageWriter::WriteImageToPath(item.output_path_, result.image_, config_.output_format_);
      if (!result.comparison_.empty()) {
        const file_path_t comparison =
            OutputPathFor(options.output_root_, item.relative_, "_comparison", ImageFormatType::PNG);
        ImageWriter::WriteImageToPath(comparison, result.comparison_, {});
      }
      if (options.color_consistency_) {
        tracker.Update(result.image_);
      }
    } catch (const ColorizeError& e) {
      status = BatchItemStatus::FAILED;
      error  = {name, e.what(), e.Kind()};
    } catch (const cv::Exception& e) {
      status = BatchItemStatus::FAILED;
      error  = {name, std::string("[ERROR] OpenCV: ") + e.what(), ErrorKind::UNKNOWN};
    } catch (const std::exception& e) {
      status = BatchItemStatus::FAILED;
      error  = {name, e.what(), ErrorKind::UNKNOWN};
    }

    {
      std::lock_guard<std::mutex> lock(job.mtx_);
      auto&                       slot = job.items_[i];
      slot.status_                     = status;
      if (status == BatchItemStatus::SUCCEEDED) {
        slot.output_path_ = item.output_path_;
      } else {
        slot.error_ = error.message_;
        job.errors_.push_back(error);
      }
      ++job.current_;
    }
    if (status == BatchItemStatus::FAILED) {
      std::cerr << "[WARN] BatchOrchestrator: " << name << " failed: " << error.message_
                << std::endl;
    }
    Emit(job, name, status == BatchItemStatus::SUCCEEDED ? "done" : "failed");
  }

  pipeline.Close();
  Emit(job, "", "model released");

  if (options.create_archive_) {
    Package(job);
  }

  std::lock_guard<std::mutex> lock(job.mtx_);
  const size_t                failed = job.errors_.size();
  if (cancelled) {
    job.status_ = BatchJobStatus::CANCELLED;
  } else {
    job.status_ = failed == 0 ? BatchJobStatus::COMPLETED : BatchJobStatus::COMPLETED_WITH_ERRORS;
  }
  job.message_ = "Processed " + std::to_string(job.current_) + " of " +
                 std::to_string(job.items_.size()) + " pages, " + std::to_string(failed) +
                 " errors" + (cancelled ? ", cancelled" : "");
  std::cout << "[INFO] BatchOrchestrator: Job " << job.id_ << " "
            << BatchJobStatusToString(job.status_) << ": " << job.message_ << std::endl;
}

void BatchOrchestrator::Package(BatchJob& job) {
  std::vector<ArchiveEntry> entries;
  {
    std::lock_guard<std::mutex> lock(job.mtx_);
    for (const auto& item : job.items_) {
      if (item.status_ != BatchItemStatus::SUCCEEDED) {
        continue;
      }
      const file_path_t name = item.relative_.parent_path() / item.output_path_.filename();
      entries.push_back({item.output_path_, name.generic_string()});
    }
  }
  const file_path_t archive = job.options_.output_root_ / job.options_.archive_name_;
  try {
    ZipArchive::Pack(archive, entries);
    std::lock_guard<std::mutex> lock(job.mtx_);
    job.archive_path_ = archive;
  } catch (const ColorizeError& e) {
    std::cerr << e.what() << std::endl;
    std::lock_guard<std::mutex> lock(job.mtx_);
    job.errors_.push_back({job.options_.archive_name_, e.what(), e.Kind()});
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "[ERROR] BatchOrchestrator: Packaging failed: " << e.what() << std::endl;
    std::lock_guard<std::mutex> lock(job.mtx_);
    job.errors_.push_back({job.options_.archive_name_, e.what(), ErrorKind::ARCHIVE});
  }
}

void BatchOrchestrator::Cancel(const std::shared_ptr<BatchJob>& job) {
  if (job) {
    job->RequestCancel();
  }
}

auto BatchOrchestrator::Cancel(job_id_t id) -> bool {
  auto job = Find(id);
  if (!job) {
    return false;
  }
  job->RequestCancel();
  return true;
}

auto BatchOrchestrator::Find(job_id_t id) -> std::shared_ptr<BatchJob> {
  std::lock_guard<std::mutex> lock(jobs_mtx_);
  auto                        it = jobs_.find(id);
  return it == jobs_.end() ? nullptr : it->second;
}

auto BatchOrchestrator::Forget(job_id_t id) -> bool {
  std::lock_guard<std::mutex> lock(jobs_mtx_);
  auto                        it = jobs_.find(id);
  if (it == jobs_.end() || !it->second->IsFinished()) {
    return false;
  }
  jobs_.erase(it);
  return true;
}

auto BatchOrchestrator::PruneFinished() -> size_t {
  std::lock_guard<std::mutex> lock(jobs_mtx_);
  return std::erase_if(jobs_, [](const auto& entry) { return entry.second->IsFinished(); });
}

auto BatchOrchestrator::Status(job_id_t id) -> BatchJobSnapshot {
  auto job = Find(id);
  if (!job) {
    throw InvalidRequestError("[ERROR] BatchOrchestrator: Unknown job " + std::to_string(id));
  }
  return job->Snapshot();
}
};  // namespace mangatint
