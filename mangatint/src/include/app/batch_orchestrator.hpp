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

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/batch_job.hpp"
#include "app/progress.hpp"
#include "concurrency/thread_pool.hpp"
#include "config/colorizer_config.hpp"
#include "model/model_manager.hpp"
#include "utils/id/id_generator.hpp"

namespace mangatint {
/**
 * @brief Drives batch jobs through the colorization pipeline, one item at a time.
 *
 * A failing item is recorded and skipped over; only faults that stop the whole job (no inputs,
 * no model) end it as failed. Cancellation is observed between items.
 */
class BatchOrchestrator {
 private:
  ModelManager&                                       models_;
  ColorizerConfig                                     config_;
  ProgressSink                                        sink_;

  IncrID::IDGenerator<job_id_t>                       id_gen_{0};
  std::mutex                                          jobs_mtx_;
  std::unordered_map<job_id_t, std::shared_ptr<BatchJob>> jobs_;

  // Single worker, jobs started asynchronously still run one after another
  ThreadPool                                          worker_{1};

  void Emit(const BatchJob& job, const std::string& filename, const std::string& message);
  auto Register(std::shared_ptr<BatchJob> job) -> std::shared_ptr<BatchJob>;
  void Run(BatchJob& job);
  void Package(BatchJob& job);

 public:
  BatchOrchestrator(ModelManager& models, ColorizerConfig config, ProgressSink sink = {});

  /**
   * @brief Supported pages of a directory (recursive) or archive, ordered by relative path
   * without regard to case. A single image yields itself.
   *
   * @throws CorruptInputError when the path does not exist or holds no supported page
   * @throws ArchiveError when an archive cannot be read
   */
  static auto EnumerateInputs(const file_path_t& input, const file_path_t& staging)
      -> std::vector<BatchItem>;

  /**
   * @brief Output file of an item: <root>/<relative dir>/<stem><suffix><ext>
   */
  static auto OutputPathFor(const file_path_t& root, const file_path_t& relative,
                            const std::string& suffix, ImageFormatType format) -> file_path_t;

  auto DefaultOptions() const -> BatchOptions;

  // Items are processed in the order given
  auto CreateJob(const std::vector<image_path_t>& inputs, const ColorizationRequest& request,
                 const BatchOptions& options) -> std::shared_ptr<BatchJob>;
  /**
   * @brief A job over a directory, archive or single page. Enumeration errors produce a job
   * already in the failed state.
   */
  auto CreateJobFromPath(const file_path_t& input, const ColorizationRequest& request,
                         const BatchOptions& options) -> std::shared_ptr<BatchJob>;

  /**
   * @brief Run a queued job to its end on the calling thread. Never throws for job or item
   * faults, they are reported in the snapshot.
   *
   * @throws InvalidRequestError when the job was already started
   */
  auto Start(const std::shared_ptr<BatchJob>& job) -> BatchJobSnapshot;
  auto StartAsync(const std::shared_ptr<BatchJob>& job) -> std::future<BatchJobSnapshot>;

  void Cancel(const std::shared_ptr<BatchJob>& job);
  auto Cancel(job_id_t id) -> bool;

  /**
   * @throws InvalidRequestError on an unknown id
   */
  auto Status(job_id_t id) -> BatchJobSnapshot;
  auto Find(job_id_t id) -> std::shared_ptr<BatchJob>;

  /**
   * @brief Drop a finished job from the registry. Callers holding the job keep it alive.
   *
   * @return false when the id is unknown or the job is still queued or running
   */
  auto Forget(job_id_t id) -> bool;
  // Drops every finished job, returns how many were removed
  auto PruneFinished() -> size_t;
};
};  // namespace mangatint
