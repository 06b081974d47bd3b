#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "batch.h"
#include "logger.h"

// 64-bit FNV-1a as 16 hex digits.
std::string fnv1a_hex(const std::string& data);
// Streams the file; throws std::runtime_error if it cannot be read.
std::string hash_file(const std::filesystem::path& path);
// Hash of the compact JSON dump; object keys are already sorted.
std::string options_fingerprint(const nlohmann::json& options);

struct StateItem {
  std::string status;  // "ok" or "fail"
  std::uintmax_t size = 0;
  std::int64_t mtime = 0;
  std::string content_hash;
  std::string options_fp;
  std::string updated_at;
  std::string error;
};

// Per-input record of the last run, keyed by absolute path, persisted as
// JSON after every update. Safe to use from several batch workers.
class StateStore {
 public:
  explicit StateStore(std::filesystem::path path) : path_(std::move(path)) {}

  // A missing file is an empty state; an unreadable or malformed one is
  // logged and replaced on the next save.
  void load(Logger& log);
  void save() const;

  // True when the last run of `media` succeeded with the same options, the
  // file size and mtime are unchanged and every expected output exists.
  bool is_unchanged(const std::filesystem::path& media, const std::string& options_fp,
                    const std::vector<std::filesystem::path>& expected_outputs) const;
  void record(const std::filesystem::path& media, const FileResult& result, const std::string& options_fp);

  const std::filesystem::path& path() const { return path_; }
  size_t size() const;

 private:
  std::filesystem::path path_;
  mutable std::mutex mu_;
  std::map<std::string, StateItem> items_;

  void save_locked() const;
};

// Wraps `job`: unchanged inputs are reported as unchanged without running
// it, every other input runs and its outcome is recorded. `force` runs
// everything.
FileJob resumable_job(FileJob job, StateStore& store, std::string options_fp, OutputOptions output, bool force,
                      Logger log);
