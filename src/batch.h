#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "pipeline.h"

bool is_supported_media(const std::filesystem::path& path);

// A single file, or the supported media under a directory (sorted by path).
// Throws std::runtime_error when the input does not exist.
std::vector<std::filesystem::path> collect_media_files(const std::filesystem::path& input, bool recursive);

struct BatchSummary {
  std::vector<FileResult> results;  // same order as the input list
  size_t ok = 0;
  size_t failed = 0;
  size_t skipped = 0;    // not started because the run was cancelled
  size_t unchanged = 0;  // outputs already current, not processed again
};

using FileJob = std::function<FileResult(const std::filesystem::path&)>;

// Runs `job` over `files` on up to `jobs` worker threads. A failed file never
// stops the others; once `cancel` is set no new file is started.
BatchSummary run_batch(const std::vector<std::filesystem::path>& files, size_t jobs, const FileJob& job,
                       const std::atomic<bool>* cancel = nullptr);
