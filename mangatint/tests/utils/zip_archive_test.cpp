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

#include "utils/archive/zip_archive.hpp"

#include <gtest/gtest.h>
#include <zip.h>

#include <algorithm>

#include "common/synthetic_pages.hpp"
#include "type/errors.hpp"
#include "utils/fs/scoped_temp_dir.hpp"

namespace mangatint {
namespace {
// Writes an archive holding the given names, each with the same payload
void WriteRawArchive(const file_path_t& path, const std::vector<std::string>& names,
                     const std::string& payload) {
  int    error = 0;
  zip_t* zip   = zip_open(path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
  ASSERT_NE(zip, nullptr);
  for (const auto& name : names) {
    zip_source_t* source = zip_source_buffer(zip, payload.data(), payload.size(), 0);
    ASSERT_NE(source, nullptr);
    ASSERT_GE(zip_file_add(zip, name.c_str(), source, ZIP_FL_ENC_UTF_8), 0) << name;
  }
  ASSERT_EQ(zip_close(zip), 0);
}

auto ReadFile(const file_path_t& path) -> std::string {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}
}  // namespace

TEST(ZipArchiveTests, SafeEntryNames) {
  EXPECT_TRUE(ZipArchive::IsSafeEntryName("page01.png"));
  EXPECT_TRUE(ZipArchive::IsSafeEntryName("chapter1/page01.png"));
  EXPECT_FALSE(ZipArchive::IsSafeEntryName(""));
  EXPECT_FALSE(ZipArchive::IsSafeEntryName("/etc/passwd.png"));
  EXPECT_FALSE(ZipArchive::IsSafeEntryName("../escape.png"));
  EXPECT_FALSE(ZipArchive::IsSafeEntryName("chapter1/../../escape.png"));
  EXPECT_FALSE(ZipArchive::IsSafeEntryName("..\\escape.png"));
  EXPECT_FALSE(ZipArchive::IsSafeEntryName("C:/escape.png"));
}

TEST(ZipArchiveTests, Pack_ThenList) {
  const auto dir = MakeTestDir("zip_pack");
  pages::Write(dir / "a.png", pages::Blank({8, 8}));
  pages::Write(dir / "b.png", pages::Blank({8, 8}, 0));

  const auto archive = dir / "out" / "pages.zip";
  ZipArchive::Pack(archive, {{dir / "a.png", "a.png"}, {dir / "b.png", "sub/b.png"}});
  EXPECT_TRUE(std::filesystem::exists(archive));
  EXPECT_EQ(ZipArchive::ListEntries(archive), (std::vector<std::string>{"a.png", "sub/b.png"}));

  // Packing again replaces the archive
  ZipArchive::Pack(archive, {{dir / "a.png", "only.png"}});
  EXPECT_EQ(ZipArchive::ListEntries(archive), (std::vector<std::string>{"only.png"}));
}

TEST(ZipArchiveTests, Pack_MissingSource_ThrowsArchiveError) {
  const auto dir = MakeTestDir("zip_missing");
  EXPECT_THROW(ZipArchive::Pack(dir / "x.zip", {{dir / "nope.png", "nope.png"}}), ArchiveError);
  pages::Write(dir / "a.png", pages::Blank({8, 8}));
  EXPECT_THROW(ZipArchive::Pack(dir / "y.zip", {{dir / "a.png", "../a.png"}}), ArchiveError);
}

TEST(ZipArchiveTests, Extract_SkipsUnsafeAndUnsupportedEntries) {
  const auto dir     = MakeTestDir("zip_extract");
  const auto archive = dir / "input.zip";
  WriteRawArchive(archive,
                  {"ch1/p1.png", "../evil.png", "notes.txt", "__MACOSX/ch1/._p1.png", "p2.JPG"},
                  "payload");

  const auto dest = dir / "staging";
  auto       extracted = ZipArchive::ExtractImages(archive, dest);
  std::sort(extracted.begin(), extracted.end());
  EXPECT_EQ(extracted, (std::vector<file_path_t>{"ch1/p1.png", "p2.JPG"}));
  EXPECT_EQ(ReadFile(dest / "ch1" / "p1.png"), "payload");
  EXPECT_FALSE(std::filesystem::exists(dir / "evil.png"));
  EXPECT_FALSE(std::filesystem::exists(dest / "notes.txt"));
}

TEST(ZipArchiveTests, PageEntryNames) {
  EXPECT_TRUE(ZipArchive::IsPageEntryName("ch1/p1.png"));
  EXPECT_TRUE(ZipArchive::IsPageEntryName("P2.WEBP"));
  EXPECT_FALSE(ZipArchive::IsPageEntryName(""));
  EXPECT_FALSE(ZipArchive::IsPageEntryName("ch1/"));
  EXPECT_FALSE(ZipArchive::IsPageEntryName("__MACOSX/p1.png"));
  EXPECT_FALSE(ZipArchive::IsPageEntryName("readme.txt"));
}

TEST(ZipArchiveTests, Extract_SkipsEntriesAboveTheSizeLimit) {
  const auto dir     = MakeTestDir("zip_oversized");
  const auto archive = dir / "input.zip";
  WriteRawArchive(archive, {"big.png"}, std::string(64, 'x'));

  EXPECT_TRUE(ZipArchive::ExtractImages(archive, dir / "small", 16).empty());
  EXPECT_FALSE(std::filesystem::exists(dir / "small" / "big.png"));
  EXPECT_EQ(ZipArchive::ExtractImages(archive, dir / "large", 64),
            (std::vector<file_path_t>{"big.png"}));
}

TEST(ZipArchiveTests, OpenGarbage_ThrowsArchiveError) {
  const auto dir = MakeTestDir("zip_garbage");
  pages::WriteCorrupt(dir / "broken.zip");
  EXPECT_THROW(ZipArchive::ExtractImages(dir / "broken.zip", dir / "out"), ArchiveError);
  EXPECT_THROW(ZipArchive::ListEntries(dir / "absent.zip"), ArchiveError);
}

TEST(ScopedTempDirTests, RemovesItsTreeOnDestruction) {
  const auto  root = MakeTestDir("scoped_tmp");
  file_path_t kept;
  {
    ScopedTempDir tmp(root, "job");
    kept = tmp.Path();
    EXPECT_TRUE(std::filesystem::is_directory(kept));
    pages::Write(kept / "nested" / "p.png", pages::Blank({4, 4}));
    ScopedTempDir other(root, "job");
    EXPECT_NE(other.Path(), kept);
  }
  EXPECT_FALSE(std::filesystem::exists(kept));
}
};  // namespace mangatint
