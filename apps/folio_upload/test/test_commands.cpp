// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_commands.cpp
 * @brief Unit tests for the folio_upload command handler
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "file_signature.hpp"
#include "in_memory_object_store.hpp"
#include "object_key.hpp"

namespace fs = std::filesystem;

using namespace folio::cli;
using folio::upload::computeSignature;
using folio::upload::encodeKey;
using folio::upload::test::InMemoryObjectStore;
using Op = InMemoryObjectStore::Op;

namespace {

class CommandsTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("folio_commands_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    config_.storage.bucket = "documents";
    config_.retry.initial_delay_ms = 1;
    config_.retry.max_delay_ms = 1;
  }

  void TearDown() override {
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  int run(const std::vector<std::string>& args) {
    out_.str("");
    err_.str("");
    Commands commands(store_, config_, out_, err_);
    commands.set_sleeper([](std::chrono::milliseconds) {});
    commands.set_stop_flag(&stop_);
    return commands.execute(args);
  }

  std::string write_file(const std::string& name, size_t size) {
    auto path = test_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    for (size_t i = 0; i < size; ++i) {
      file.put(static_cast<char>('a' + i % 26));
    }
    return path.string();
  }

  // Value of a "Label: value" line
  std::string field(const std::string& label) const {
    std::istringstream lines(out_.str());
    std::string line;
    std::string prefix = label + ": ";
    while (std::getline(lines, line)) {
      if (line.compare(0, prefix.size(), prefix) == 0) {
        return line.substr(prefix.size());
      }
    }
    return "";
  }

  bool out_contains(const std::string& text) const {
    return out_.str().find(text) != std::string::npos;
  }

  bool err_contains(const std::string& text) const {
    return err_.str().find(text) != std::string::npos;
  }

  InMemoryObjectStore store_;
  AppConfig config_;
  std::atomic<bool> stop_{false};
  std::ostringstream out_;
  std::ostringstream err_;
  fs::path test_dir_;
};

const std::string kSig = "00112233aabbccdd";

}  // namespace

// =============================================================================
// Command parsing
// =============================================================================

TEST_F(CommandsTest, NoArgumentsPrintsUsage) {
  EXPECT_EQ(run({}), 0);
  EXPECT_TRUE(out_contains("Usage: folio_upload"));
}

TEST_F(CommandsTest, HelpPrintsUsage) {
  EXPECT_EQ(run({"help"}), 0);
  EXPECT_TRUE(out_contains("Commands:"));
}

TEST_F(CommandsTest, UnknownCommandFails) {
  EXPECT_EQ(run({"frobnicate"}), 1);
  EXPECT_TRUE(err_contains("Unknown command 'frobnicate'"));
}

TEST_F(CommandsTest, MissingArgumentsFail) {
  EXPECT_EQ(run({"push"}), 1);
  EXPECT_TRUE(err_contains("push requires <file>"));

  EXPECT_EQ(run({"init", kSig, "a.pdf"}), 1);
  EXPECT_TRUE(err_contains("init requires"));

  EXPECT_EQ(run({"complete", "upload-0001"}), 1);
  EXPECT_EQ(run({"status"}), 1);
  EXPECT_EQ(run({"url"}), 1);
  EXPECT_EQ(store_.totalCalls(), 0u);
}

// =============================================================================
// Local file commands
// =============================================================================

TEST_F(CommandsTest, SignaturePrintsHexDigest) {
  auto path = write_file("report.pdf", 100);
  auto info = folio::upload::inspectLocalFile(path);
  ASSERT_TRUE(info.ok());

  EXPECT_EQ(run({"signature", path}), 0);
  EXPECT_EQ(out_.str(), info.value().signature + "\n");
}

TEST_F(CommandsTest, SignatureOfMissingFileFails) {
  EXPECT_EQ(run({"signature", (test_dir_ / "absent.pdf").string()}), 1);
  EXPECT_TRUE(err_contains("InvalidArgument"));
}

TEST_F(CommandsTest, PushUploadsFile) {
  auto path = write_file("report.pdf", 4096);

  EXPECT_EQ(run({"push", path}), 0);
  std::string key = field("Uploaded");
  ASSERT_FALSE(key.empty());
  EXPECT_TRUE(store_.hasObject(key));
  EXPECT_EQ(store_.objectBytes(key).size(), 4096u);
  EXPECT_EQ(field("Location"), "memory://bucket/" + key);

  EXPECT_EQ(run({"list"}), 0);
  EXPECT_TRUE(out_contains("No pending uploads."));
}

TEST_F(CommandsTest, VerbosePushReportsProgress) {
  auto path = write_file("report.pdf", 4096);

  EXPECT_EQ(run({"--verbose", "push", path}), 0);
  EXPECT_TRUE(out_contains("Progress: 1/1 chunks"));
  EXPECT_TRUE(out_contains("Chunks sent: 1, retries: 0"));
}

// =============================================================================
// Session commands
// =============================================================================

TEST_F(CommandsTest, InitPutCompleteFlow) {
  auto chunk = write_file("chunk.bin", 2048);

  ASSERT_EQ(run({"init", kSig, "paper.pdf", "2048"}), 0);
  std::string upload_id = field("Upload ID");
  std::string key = field("Key");
  EXPECT_EQ(key, encodeKey(kSig, "paper.pdf").value());
  EXPECT_EQ(field("Total chunks"), "1");
  EXPECT_EQ(field("Completed chunks"), "0");
  EXPECT_EQ(field("Resume"), "no");

  ASSERT_EQ(run({"put", upload_id, key, "1", chunk}), 0);
  EXPECT_EQ(field("ETag").empty(), false);

  ASSERT_EQ(run({"status", upload_id}), 0);
  EXPECT_EQ(field("Completed chunks"), "1");
  EXPECT_EQ(field("File"), "paper.pdf");
  EXPECT_EQ(field("Uploaded"), "2 KB");

  ASSERT_EQ(run({"init", kSig, "paper.pdf", "2048"}), 0);
  EXPECT_EQ(field("Upload ID"), upload_id);
  EXPECT_EQ(field("Resume"), "yes");
  EXPECT_EQ(field("Completed chunks"), "1");

  ASSERT_EQ(run({"complete", upload_id, key}), 0);
  EXPECT_EQ(field("Completed"), key);
  EXPECT_TRUE(store_.hasObject(key));
}

TEST_F(CommandsTest, InitRejectsBadSize) {
  EXPECT_EQ(run({"init", kSig, "paper.pdf", "12abc"}), 1);
  EXPECT_TRUE(err_contains("Invalid file size"));
  EXPECT_EQ(run({"init", kSig, "paper.pdf", "-5"}), 1);
  EXPECT_EQ(store_.totalCalls(), 0u);
}

TEST_F(CommandsTest, PutRejectsBadPartNumber) {
  auto chunk = write_file("chunk.bin", 16);
  EXPECT_EQ(run({"put", "upload-0001", "uploads/x/y", "10001", chunk}), 1);
  EXPECT_TRUE(err_contains("Invalid part number"));
  EXPECT_EQ(run({"put", "upload-0001", "uploads/x/y", "one", chunk}), 1);
}

TEST_F(CommandsTest, CompleteWithMissingPartFails) {
  ASSERT_EQ(run({"init", kSig, "paper.pdf", "2048"}), 0);
  std::string upload_id = field("Upload ID");
  std::string key = field("Key");

  EXPECT_EQ(run({"complete", upload_id, key}), 1);
  EXPECT_TRUE(err_contains("CompletionFailed"));
}

TEST_F(CommandsTest, AbortRemovesSession) {
  ASSERT_EQ(run({"init", kSig, "paper.pdf", "2048"}), 0);
  std::string upload_id = field("Upload ID");
  std::string key = field("Key");

  ASSERT_EQ(run({"abort", upload_id, key}), 0);
  EXPECT_EQ(field("Aborted"), upload_id);
  EXPECT_FALSE(store_.hasSession(upload_id));

  EXPECT_EQ(run({"status", upload_id}), 1);
  EXPECT_TRUE(err_contains("SessionNotFound"));
}

TEST_F(CommandsTest, ListShowsPendingUploads) {
  ASSERT_EQ(run({"init", kSig, "first.pdf", "100"}), 0);
  ASSERT_EQ(run({"init", computeSignature("second.pdf", 100, 1), "second.pdf", "100"}), 0);

  ASSERT_EQ(run({"list"}), 0);
  EXPECT_TRUE(out_contains("first.pdf"));
  EXPECT_TRUE(out_contains("second.pdf"));
  EXPECT_TRUE(out_contains("2 pending upload(s)"));
}

TEST_F(CommandsTest, ListReportsBackendFailure) {
  store_.failNext(Op::ListUploads, "AccessDenied");
  EXPECT_EQ(run({"list"}), 1);
  EXPECT_TRUE(err_contains("BackendError"));
}

// =============================================================================
// Maintenance commands
// =============================================================================

TEST_F(CommandsTest, CleanupAbortsOldSessions) {
  auto now = std::chrono::system_clock::now();
  auto old_id = store_.insertSession(encodeKey(kSig, "old.pdf").value(), now - std::chrono::hours(25));
  auto fresh_id =
    store_.insertSession(encodeKey(kSig, "fresh.pdf").value(), now - std::chrono::hours(1));

  ASSERT_EQ(run({"cleanup"}), 0);
  EXPECT_TRUE(out_contains("Aborted 1 expired upload(s)"));
  EXPECT_FALSE(store_.hasSession(old_id));
  EXPECT_TRUE(store_.hasSession(fresh_id));
}

TEST_F(CommandsTest, CleanupAcceptsAge) {
  auto now = std::chrono::system_clock::now();
  store_.insertSession(encodeKey(kSig, "a.pdf").value(), now - std::chrono::hours(3));

  ASSERT_EQ(run({"cleanup", "2"}), 0);
  EXPECT_TRUE(out_contains("Aborted 1 expired upload(s)"));

  EXPECT_EQ(run({"cleanup", "0"}), 1);
  EXPECT_TRUE(err_contains("Invalid age"));
}

TEST_F(CommandsTest, CleanupRejectsAgeOutOfRange) {
  auto now = std::chrono::system_clock::now();
  auto fresh_id = store_.insertSession(encodeKey(kSig, "fresh.pdf").value(), now - std::chrono::hours(1));

  EXPECT_EQ(run({"cleanup", "18446744073709551615"}), 1);
  EXPECT_TRUE(err_contains("Invalid age"));

  EXPECT_EQ(run({"cleanup", "4000000"}), 1);
  EXPECT_TRUE(err_contains("Invalid age"));

  EXPECT_EQ(run({"cleanup", "87601"}), 1);
  EXPECT_TRUE(err_contains("Invalid age"));

  EXPECT_TRUE(store_.hasSession(fresh_id));
  EXPECT_EQ(store_.callCount(Op::Abort), 0u);

  ASSERT_EQ(run({"cleanup", "87600"}), 0);
  EXPECT_TRUE(out_contains("Aborted 0 expired upload(s)"));
  EXPECT_TRUE(store_.hasSession(fresh_id));
}

TEST_F(CommandsTest, UrlPrintsPresignedLink) {
  std::string key = encodeKey(kSig, "paper.pdf").value();

  ASSERT_EQ(run({"url", key}), 0);
  EXPECT_EQ(out_.str(), "memory://bucket/" + key + "?expires=3600\n");

  ASSERT_EQ(run({"url", key, "60"}), 0);
  EXPECT_EQ(out_.str(), "memory://bucket/" + key + "?expires=60\n");
}

TEST_F(CommandsTest, UrlRejectsForeignKeyAndBadExpiry) {
  EXPECT_EQ(run({"url", "other/paper.pdf"}), 1);
  EXPECT_TRUE(err_contains("MalformedKey"));

  std::string key = encodeKey(kSig, "paper.pdf").value();
  EXPECT_EQ(run({"url", key, "604801"}), 1);
  EXPECT_TRUE(err_contains("InvalidArgument"));
  EXPECT_EQ(store_.callCount(Op::Presign), 0u);
}

TEST_F(CommandsTest, ReapStopsWhenFlagSet) {
  stop_.store(true);
  EXPECT_EQ(run({"reap"}), 0);
  EXPECT_TRUE(out_contains("Reaper running"));
  EXPECT_TRUE(out_contains("Reaper stopped"));
}

// =============================================================================
// Formatting
// =============================================================================

TEST(CommandsFormatTest, FormatSize) {
  EXPECT_EQ(Commands::format_size(0), "0 B");
  EXPECT_EQ(Commands::format_size(1023), "1023 B");
  EXPECT_EQ(Commands::format_size(2048), "2 KB");
  EXPECT_EQ(Commands::format_size(5ULL * 1024 * 1024), "5 MB");
  EXPECT_EQ(Commands::format_size(3ULL * 1024 * 1024 * 1024 * 1024), "3 TB");
}

TEST(CommandsFormatTest, FormatTimeIsUtc) {
  auto time = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
  EXPECT_EQ(Commands::format_time(time), "2023-11-14 22:13:20 UTC");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
