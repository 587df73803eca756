// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_uploader.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

#include "file_signature.hpp"

#define FOLIO_LOG_COMPONENT "file_uploader"
#include <folio_log_macros.hpp>

namespace folio {
namespace cli {

using ::folio::logging::kv;
using upload::ErrorCode;
using upload::Result;

FileUploader::FileUploader(
  upload::UploadCoordinator& coordinator, const upload::RetryConfig& retry, Sleeper sleeper
)
    : coordinator_(coordinator)
    , retry_(retry)
    , sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

Result<PushOutcome> FileUploader::push(const std::string& path) {
  auto file_info = upload::inspectLocalFile(path);
  if (!file_info) {
    return Result<PushOutcome>::Failure(file_info.error());
  }
  const auto& info = file_info.value();

  auto init = coordinator_.initOrResume(info.signature, info.name, info.size);
  if (!init) {
    return Result<PushOutcome>::Failure(init.error());
  }
  const upload::InitResult& session = init.value();
  FOLIO_LOG_SCOPED_CONTEXT(session.upload_id, info.signature);

  PushOutcome outcome;
  outcome.resumed = session.is_resume;
  outcome.chunks_skipped = session.completed_chunks;

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<PushOutcome>::Failure(ErrorCode::InvalidArgument, "Cannot open " + path);
  }

  if (progress_cb_) {
    progress_cb_(session.completed_chunks, session.total_chunks);
  }

  std::vector<uint8_t> buffer;
  for (uint64_t part = session.completed_chunks + 1; part <= session.total_chunks; ++part) {
    uint64_t offset = (part - 1) * session.chunk_size;
    uint64_t length = std::min<uint64_t>(session.chunk_size, info.size - offset);

    buffer.resize(length);
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(file.gcount()) != length) {
      return Result<PushOutcome>::Failure(
        ErrorCode::InvalidArgument,
        "Short read at offset " + std::to_string(offset) + " of " + path +
          " (file changed during upload?)"
      );
    }

    auto etag = sendChunk(session, static_cast<int>(part), buffer, outcome.retries);
    if (!etag) {
      return Result<PushOutcome>::Failure(etag.error());
    }
    ++outcome.chunks_sent;

    if (progress_cb_) {
      progress_cb_(part, session.total_chunks);
    }
  }

  int attempt = 0;
  while (true) {
    auto completed = coordinator_.complete(session.upload_id, session.key);
    if (completed) {
      outcome.completed = completed.value();
      break;
    }

    const auto& error = completed.error();
    if (error.code == ErrorCode::AlreadyCompleted) {
      FOLIO_LOG_WARN("File was already uploaded by another session" << kv("key", session.key));
      outcome.already_completed = true;
      outcome.completed.key = session.key;
      outcome.completed.signature = info.signature;
      outcome.completed.file_name = info.name;
      break;
    }
    if (!retry_.shouldRetry(error, attempt)) {
      return Result<PushOutcome>::Failure(error);
    }
    auto delay = retry_.getDelay(error, attempt);
    FOLIO_LOG_WARN(
      "Completion failed, retrying" << kv("attempt", attempt + 1) << kv("delay_ms", delay.count())
                                    << kv("error", error.describe())
    );
    sleeper_(delay);
    ++attempt;
    ++outcome.retries;
  }

  FOLIO_LOG_INFO(
    "Push finished" << kv("key", outcome.completed.key) << kv("sent", outcome.chunks_sent)
                    << kv("skipped", outcome.chunks_skipped) << kv("retries", outcome.retries)
  );
  return Result<PushOutcome>::Success(outcome);
}

Result<std::string> FileUploader::sendChunk(
  const upload::InitResult& session, int part_number, const std::vector<uint8_t>& bytes,
  int& retries
) {
  int attempt = 0;
  while (true) {
    auto etag = coordinator_.uploadPart(session.upload_id, session.key, part_number, bytes);
    if (etag) {
      return etag;
    }

    const auto& error = etag.error();
    if (!retry_.shouldRetry(error, attempt)) {
      FOLIO_LOG_ERROR(
        "Chunk failed" << kv("part", part_number) << kv("attempts", attempt + 1)
                       << kv("error", error.describe())
      );
      return etag;
    }

    auto delay = retry_.getDelay(error, attempt);
    FOLIO_LOG_WARN(
      "Chunk failed, retrying" << kv("part", part_number) << kv("attempt", attempt + 1)
                               << kv("delay_ms", delay.count())
    );
    sleeper_(delay);
    ++attempt;
    ++retries;
  }
}

}  // namespace cli
}  // namespace folio
