// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_file_uploader.cpp
 * @brief Unit tests for FileUploader against the in-memory store
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "file_signature.hpp"
#include "file_uploader.hpp"
#include "in_memory_object_store.hpp"
#include "object_key.hpp"
#include "upload_coordinator.hpp"

namespace fs = std::filesystem;

using namespace folio::cli;
using namespace folio::upload;
using folio::upload::test::InMemoryObjectStore;
using Op = InMemoryObjectStore::Op;

namespace {

constexpr uint64_t kChunk = 5ULL * 1024 * 1024;

class FileUploaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("folio_uploader_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    retry_.initial_delay = std::chrono::milliseconds(1);
    retry_.max_delay = std::chrono::milliseconds(10);
    retry_.max_retries = 3;
  }

  void TearDown() override {
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  // 12 MiB: two full 5 MiB chunks and a 2 MiB tail
  std::string write_file(const std::string& name, size_t size = 12 * 1024 * 1024) {
    contents_.resize(size);
    for (size_t i = 0; i < size; ++i) {
      contents_[i] = static_cast<uint8_t>((i * 31 + 7) % 253);
    }
    auto path = test_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(contents_.data()), static_cast<std::streamsize>(size));
    return path.string();
  }

  FileUploader make_uploader() {
    return FileUploader(coordinator_, retry_, [this](std::chrono::milliseconds delay) {
      sleeps_.push_back(delay);
    });
  }

  std::vector<uint8_t> chunk(int part) const {
    uint64_t begin = static_cast<uint64_t>(part - 1) * kChunk;
    uint64_t end = std::min<uint64_t>(begin + kChunk, contents_.size());
    return std::vector<uint8_t>(contents_.begin() + begin, contents_.begin() + end);
  }

  InMemoryObjectStore store_;
  UploadCoordinator coordinator_{store_};
  RetryConfig retry_;
  std::vector<std::chrono::milliseconds> sleeps_;
  std::vector<uint8_t> contents_;
  fs::path test_dir_;
};

}  // namespace

TEST_F(FileUploaderTest, PushesWholeFile) {
  auto path = write_file("book.pdf");
  auto uploader = make_uploader();

  std::vector<std::pair<uint64_t, uint64_t>> progress;
  uploader.setProgressCallback([&progress](uint64_t done, uint64_t total) {
    progress.emplace_back(done, total);
  });

  auto result = uploader.push(path);
  ASSERT_TRUE(result.ok()) << result.error().describe();

  const auto& outcome = result.value();
  EXPECT_FALSE(outcome.resumed);
  EXPECT_FALSE(outcome.already_completed);
  EXPECT_EQ(outcome.chunks_sent, 3u);
  EXPECT_EQ(outcome.chunks_skipped, 0u);
  EXPECT_EQ(outcome.retries, 0);
  EXPECT_EQ(outcome.completed.file_name, "book.pdf");

  auto info = inspectLocalFile(path);
  ASSERT_TRUE(info.ok());
  EXPECT_EQ(outcome.completed.key, encodeKey(info.value().signature, "book.pdf").value());
  EXPECT_TRUE(store_.hasObject(outcome.completed.key));
  EXPECT_EQ(store_.objectBytes(outcome.completed.key), contents_);
  EXPECT_EQ(store_.sessionCount(), 0u);

  std::vector<std::pair<uint64_t, uint64_t>> expected = {{0, 3}, {1, 3}, {2, 3}, {3, 3}};
  EXPECT_EQ(progress, expected);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(FileUploaderTest, ResumesAfterPartialUpload) {
  auto path = write_file("thesis.pdf");
  auto info = inspectLocalFile(path).value();

  // A previous run stored the first chunk and then died
  auto init = coordinator_.initOrResume(info.signature, info.name, info.size);
  ASSERT_TRUE(init.ok());
  ASSERT_TRUE(coordinator_.uploadPart(init.value().upload_id, init.value().key, 1, chunk(1)).ok());

  auto uploader = make_uploader();
  auto result = uploader.push(path);
  ASSERT_TRUE(result.ok()) << result.error().describe();

  EXPECT_TRUE(result.value().resumed);
  EXPECT_EQ(result.value().chunks_skipped, 1u);
  EXPECT_EQ(result.value().chunks_sent, 2u);
  EXPECT_EQ(store_.callCount(Op::Create), 1u);
  EXPECT_EQ(store_.callCount(Op::UploadPart), 3u);
  EXPECT_EQ(store_.objectBytes(init.value().key), contents_);
}

TEST_F(FileUploaderTest, RetriesTransientChunkFailure) {
  auto path = write_file("paper.pdf");
  store_.failNext(Op::UploadPart, "SlowDown", true, 2);

  auto uploader = make_uploader();
  auto result = uploader.push(path);
  ASSERT_TRUE(result.ok()) << result.error().describe();

  EXPECT_EQ(result.value().retries, 2);
  EXPECT_EQ(result.value().chunks_sent, 3u);
  EXPECT_EQ(sleeps_.size(), 2u);
  EXPECT_EQ(store_.objectBytes(result.value().completed.key), contents_);
}

TEST_F(FileUploaderTest, ThrottledChunkBacksOffFurther) {
  auto path = write_file("paper.pdf");
  retry_.jitter = false;
  store_.failNext(Op::UploadPart, "ServiceUnavailable", true);

  auto uploader = make_uploader();
  ASSERT_TRUE(uploader.push(path).ok());
  ASSERT_EQ(sleeps_.size(), 1u);
  EXPECT_EQ(sleeps_[0].count(), 1);

  sleeps_.clear();
  auto other = write_file("other.pdf");
  store_.failNext(Op::UploadPart, "SlowDown", true);
  ASSERT_TRUE(make_uploader().push(other).ok());
  ASSERT_EQ(sleeps_.size(), 1u);
  EXPECT_EQ(sleeps_[0].count(), 2);
}

TEST_F(FileUploaderTest, GivesUpAfterMaxRetries) {
  auto path = write_file("paper.pdf");
  store_.failNext(Op::UploadPart, "ServiceUnavailable", true, 10);

  auto uploader = make_uploader();
  auto result = uploader.push(path);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::PartUploadFailed);
  EXPECT_EQ(sleeps_.size(), 3u);
  EXPECT_EQ(store_.callCount(Op::UploadPart), 4u);

  // The session stays for a later resume
  EXPECT_EQ(store_.sessionCount(), 1u);
}

TEST_F(FileUploaderTest, PermanentFailureIsNotRetried) {
  auto path = write_file("paper.pdf");
  store_.failNext(Op::UploadPart, "AccessDenied", false);

  auto uploader = make_uploader();
  auto result = uploader.push(path);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::PartUploadFailed);
  EXPECT_FALSE(result.error().retryable);
  EXPECT_TRUE(sleeps_.empty());
  EXPECT_EQ(store_.callCount(Op::UploadPart), 1u);
}

TEST_F(FileUploaderTest, RetriesTransientCompletionFailure) {
  auto path = write_file("notes.pdf");
  store_.failNext(Op::Complete, "InternalError", true);

  auto uploader = make_uploader();
  auto result = uploader.push(path);
  ASSERT_TRUE(result.ok()) << result.error().describe();
  EXPECT_EQ(result.value().retries, 1);
  EXPECT_EQ(store_.callCount(Op::Complete), 2u);
}

TEST_F(FileUploaderTest, AlreadyCompletedCountsAsSuccess) {
  auto path = write_file("shared.pdf");
  auto first = make_uploader().push(path);
  ASSERT_TRUE(first.ok());

  // A second push opens a fresh session; its completion finds the session
  // gone and the object already stored
  store_.advance(std::chrono::hours(1));
  store_.failNext(Op::Complete, kNoSuchUpload);

  auto second = make_uploader().push(path);
  ASSERT_TRUE(second.ok()) << second.error().describe();
  EXPECT_TRUE(second.value().already_completed);
  EXPECT_EQ(second.value().completed.key, first.value().completed.key);
  EXPECT_EQ(second.value().completed.file_name, "shared.pdf");
}

TEST_F(FileUploaderTest, SmallFileIsSingleChunk) {
  auto path = write_file("memo.pdf", 1024);

  auto result = make_uploader().push(path);
  ASSERT_TRUE(result.ok()) << result.error().describe();
  EXPECT_EQ(result.value().chunks_sent, 1u);
  EXPECT_EQ(store_.objectBytes(result.value().completed.key), contents_);
}

TEST_F(FileUploaderTest, MissingFileFails) {
  auto result = make_uploader().push((test_dir_ / "absent.pdf").string());
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(store_.totalCalls(), 0u);
}

TEST_F(FileUploaderTest, EmptyFileFails) {
  auto path = write_file("empty.pdf", 0);
  auto result = make_uploader().push(path);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
