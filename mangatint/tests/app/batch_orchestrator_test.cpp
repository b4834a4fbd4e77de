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

#include <gtest/gtest.h>

#include "app/app_test_fixation.hpp"
#include "utils/archive/zip_archive.hpp"

namespace mangatint {
TEST_F(AppTests, Batch_CorruptPage_DoesNotStopTheJob) {
  WritePages(dir_ / "in", 5, 3);
  const auto snapshot = colorizer_->ColorizeMany(dir_ / "in", Request());

  EXPECT_EQ(snapshot.status_, BatchJobStatus::COMPLETED_WITH_ERRORS);
  EXPECT_EQ(snapshot.current_, 5u);
  EXPECT_EQ(snapshot.total_, 5u);
  ASSERT_EQ(snapshot.errors_.size(), 1u);
  EXPECT_EQ(snapshot.errors_[0].item_, "page3.png");
  EXPECT_EQ(snapshot.errors_[0].kind_, ErrorKind::CORRUPT_INPUT);
  EXPECT_EQ(snapshot.items_[2].status_, BatchItemStatus::FAILED);

  for (int i : {1, 2, 4, 5}) {
    EXPECT_TRUE(std::filesystem::exists(Output("page" + std::to_string(i)))) << i;
    EXPECT_EQ(snapshot.items_[i - 1].status_, BatchItemStatus::SUCCEEDED);
  }
  EXPECT_FALSE(std::filesystem::exists(Output("page3")));
  EXPECT_EQ(snapshot.ToJson()["status"], "completed-with-errors");
}

TEST_F(AppTests, Batch_CleanRun_Completes) {
  WritePages(dir_ / "in", 3);
  const auto snapshot = colorizer_->ColorizeMany(dir_ / "in", Request());
  EXPECT_EQ(snapshot.status_, BatchJobStatus::COMPLETED);
  EXPECT_TRUE(snapshot.errors_.empty());
  EXPECT_TRUE(snapshot.archive_path_.empty());

  // Outputs keep the original page size
  const cv::Mat first = cv::imread(Output("page1").string(), cv::IMREAD_UNCHANGED);
  EXPECT_EQ(first.size(), cv::Size(210, 300));
}

TEST_F(AppTests, Batch_CancelStopsBeforeTheNextItem) {
  WritePages(dir_ / "in", 5);
  on_event_ = [this](const ProgressEvent& event) {
    if (event.message_ == "done" && event.current_ == 2) {
      EXPECT_TRUE(colorizer_->Batch().Cancel(event.job_id_));
    }
  };
  const auto snapshot = colorizer_->ColorizeMany(dir_ / "in", Request());

  EXPECT_EQ(snapshot.status_, BatchJobStatus::CANCELLED);
  EXPECT_EQ(snapshot.current_, 2u);
  EXPECT_TRUE(std::filesystem::exists(Output("page1")));
  EXPECT_TRUE(std::filesystem::exists(Output("page2")));
  for (int i : {3, 4, 5}) {
    EXPECT_EQ(snapshot.items_[i - 1].status_, BatchItemStatus::SKIPPED) << i;
    EXPECT_FALSE(std::filesystem::exists(Output("page" + std::to_string(i)))) << i;
  }
}

TEST_F(AppTests, Batch_ZipInput_IsOrderedPackagedAndCleanedUp) {
  const auto sources = WritePages(dir_ / "src", 3);
  const auto input   = dir_ / "chapter.zip";
  ZipArchive::Pack(input, {{sources[1], "b/page2.png"},
                           {sources[0], "A/page1.png"},
                           {sources[2], "page0.png"},
                           {sources[2], "notes/readme.txt"}});

  const auto snapshot = colorizer_->ColorizeMany(input, Request(), true);
  EXPECT_EQ(snapshot.status_, BatchJobStatus::COMPLETED);
  ASSERT_EQ(snapshot.items_.size(), 3u);
  EXPECT_EQ(snapshot.items_[0].relative_.generic_string(), "A/page1.png");
  EXPECT_EQ(snapshot.items_[1].relative_.generic_string(), "b/page2.png");
  EXPECT_EQ(snapshot.items_[2].relative_.generic_string(), "page0.png");
  EXPECT_TRUE(std::filesystem::exists(Output("A/page1")));

  ASSERT_FALSE(snapshot.archive_path_.empty());
  EXPECT_EQ(snapshot.archive_path_, dir_ / "out" / "colored_pages.zip");
  auto entries = ZipArchive::ListEntries(snapshot.archive_path_);
  std::sort(entries.begin(), entries.end());
  EXPECT_EQ(entries, (std::vector<std::string>{"A/page1_colored.png", "b/page2_colored.png",
                                               "page0_colored.png"}));

  // Staged pages are gone once the job ends
  ASSERT_TRUE(std::filesystem::exists(dir_ / "tmp"));
  EXPECT_TRUE(std::filesystem::is_empty(dir_ / "tmp"));
}

TEST_F(AppTests, Batch_ModelFailure_FailsTheJob) {
  colorizer_ = MakeColorizer([](const ModelConfig& config, const ComputeDevice& device) {
    if (config.id_ == "fast-colorizer") {
      throw std::runtime_error("no weights");
    }
    return DefaultModelLoader()(config, device);
  });
  WritePages(dir_ / "in", 2);
  const auto snapshot = colorizer_->ColorizeMany(dir_ / "in", Request());

  EXPECT_EQ(snapshot.status_, BatchJobStatus::FAILED);
  EXPECT_EQ(snapshot.current_, 0u);
  ASSERT_EQ(snapshot.errors_.size(), 1u);
  EXPECT_EQ(snapshot.errors_[0].item_, "model");
  EXPECT_EQ(snapshot.errors_[0].kind_, ErrorKind::MODEL_LOAD);
  EXPECT_FALSE(std::filesystem::exists(Output("page1")));
}

TEST_F(AppTests, Batch_NothingToProcess_FailsTheJob) {
  auto missing = colorizer_->ColorizeMany(dir_ / "does_not_exist", Request());
  EXPECT_EQ(missing.status_, BatchJobStatus::FAILED);
  ASSERT_EQ(missing.errors_.size(), 1u);
  EXPECT_EQ(missing.errors_[0].kind_, ErrorKind::CORRUPT_INPUT);

  std::filesystem::create_directories(dir_ / "empty");
  pages::WriteCorrupt(dir_ / "empty" / "notes.txt");
  EXPECT_EQ(colorizer_->ColorizeMany(dir_ / "empty", Request()).status_, BatchJobStatus::FAILED);
}

TEST_F(AppTests, Batch_ReportsProgress) {
  WritePages(dir_ / "in", 2);
  colorizer_->ColorizeMany(dir_ / "in", Request());

  std::lock_guard<std::mutex> lock(events_mtx_);
  ASSERT_EQ(events_.size(), 4u);
  EXPECT_EQ(events_[0].message_, "model ready");
  EXPECT_EQ(events_[1].filename_, "page1.png");
  EXPECT_EQ(events_[1].percent_, 50);
  EXPECT_EQ(events_[2].current_, 2u);
  EXPECT_EQ(events_[2].percent_, 100);
  EXPECT_EQ(events_[3].message_, "model released");
  for (const auto& event : events_) {
    EXPECT_EQ(event.total_, 2u);
  }
}

TEST_F(AppTests, Batch_StartAsync_AndStatus) {
  const auto inputs = WritePages(dir_ / "in", 2);
  auto&      batch  = colorizer_->Batch();
  auto       job    = batch.CreateJob({inputs[1], inputs[0]}, Request(), batch.DefaultOptions());
  EXPECT_EQ(batch.Status(job->Id()).status_, BatchJobStatus::QUEUED);

  auto       future   = batch.StartAsync(job);
  const auto snapshot = future.get();
  EXPECT_EQ(snapshot.status_, BatchJobStatus::COMPLETED);
  // Explicit lists keep their order
  EXPECT_EQ(snapshot.items_[0].relative_, file_path_t("page2.png"));
  EXPECT_EQ(batch.Status(job->Id()).current_, 2u);

  EXPECT_THROW(batch.Start(job), InvalidRequestError);
  EXPECT_THROW(batch.Status(job->Id() + 100), InvalidRequestError);
  EXPECT_FALSE(batch.Cancel(job->Id() + 100));
}

TEST_F(AppTests, Batch_Forget_DropsOnlyFinishedJobs) {
  const auto inputs = WritePages(dir_ / "in", 1);
  auto&      batch  = colorizer_->Batch();
  auto       queued = batch.CreateJob(inputs, Request(), batch.DefaultOptions());
  auto       done   = batch.CreateJob(inputs, Request(), batch.DefaultOptions());
  batch.Start(done);

  EXPECT_FALSE(batch.Forget(queued->Id()));
  EXPECT_TRUE(batch.Forget(done->Id()));
  EXPECT_FALSE(batch.Forget(done->Id()));
  EXPECT_EQ(batch.Find(done->Id()), nullptr);
  EXPECT_THROW(batch.Status(done->Id()), InvalidRequestError);
  // The caller's handle outlives the registry entry
  EXPECT_EQ(done->Snapshot().status_, BatchJobStatus::COMPLETED);
  EXPECT_EQ(batch.Status(queued->Id()).status_, BatchJobStatus::QUEUED);
}

TEST_F(AppTests, Batch_PruneFinished_KeepsQueuedJobs) {
  const auto inputs  = WritePages(dir_ / "in", 1);
  auto&      batch   = colorizer_->Batch();
  auto       missing = batch.CreateJobFromPath(dir_ / "absent", Request(), batch.DefaultOptions());
  auto       done    = batch.CreateJob(inputs, Request(), batch.DefaultOptions());
  auto       queued  = batch.CreateJob(inputs, Request(), batch.DefaultOptions());
  batch.Start(done);

  EXPECT_EQ(batch.PruneFinished(), 2u);
  EXPECT_EQ(batch.Find(missing->Id()), nullptr);
  EXPECT_EQ(batch.Find(done->Id()), nullptr);
  EXPECT_EQ(batch.Find(queued->Id()), queued);
  EXPECT_EQ(batch.PruneFinished(), 0u);
}

TEST(BatchOrchestratorTests, OutputPath_KeepsFoldersAndSwapsExtension) {
  EXPECT_EQ(BatchOrchestrator::OutputPathFor("out", "ch1/p01.jpeg", "_colored",
                                             ImageFormatType::PNG),
            file_path_t("out/ch1/p01_colored.png"));
  EXPECT_EQ(BatchOrchestrator::OutputPathFor("out", "p.png", "_c", ImageFormatType::JPEG),
            file_path_t("out/p_c.jpg"));
}

TEST(BatchOrchestratorTests, Enumerate_SortsCaseInsensitively) {
  const auto dir = MakeTestDir("enumerate");
  for (const char* name : {"b.png", "A.PNG", "sub/a2.jpg"}) {
    pages::Write(dir / name, pages::Blank({4, 4}));
  }
  pages::WriteCorrupt(dir / "c.txt");
  const auto items = BatchOrchestrator::EnumerateInputs(dir, {});
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].relative_, file_path_t("A.PNG"));
  EXPECT_EQ(items[1].relative_, file_path_t("b.png"));
  EXPECT_EQ(items[2].relative_, file_path_t("sub/a2.jpg"));
  EXPECT_THROW(BatchOrchestrator::EnumerateInputs(dir / "c.txt", {}), CorruptInputError);
}
};  // namespace mangatint
