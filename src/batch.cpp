#include "batch.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

bool is_supported_media(const fs::path& path) {
  static const std::set<std::string> kMediaExts = {
      ".mp4", ".mkv", ".mov", ".webm", ".avi", ".wmv", ".m4v", ".mts", ".m2ts",
      ".mp3", ".wav", ".m4a", ".aac",  ".flac", ".ogg", ".opus", ".wma",
  };
  std::string ext = path.extension().string();
  for (auto& c : ext) c = char(std::tolower(static_cast<unsigned char>(c)));
  return kMediaExts.count(ext) > 0;
}

std::vector<fs::path> collect_media_files(const fs::path& input, bool recursive) {
  if (!fs::exists(input)) throw std::runtime_error("Input not found: " + input.string());
  std::vector<fs::path> files;
  if (fs::is_regular_file(input)) {
    files.push_back(input);
    return files;
  }

  auto consider = [&](const fs::directory_entry& entry) {
    if (entry.is_regular_file() && is_supported_media(entry.path())) files.push_back(entry.path());
  };
  if (recursive) {
    for (const auto& entry : fs::recursive_directory_iterator(input)) consider(entry);
  } else {
    for (const auto& entry : fs::directory_iterator(input)) consider(entry);
  }
  std::sort(files.begin(), files.end());
  return files;
}

BatchSummary run_batch(const std::vector<fs::path>& files, size_t jobs, const FileJob& job,
                       const std::atomic<bool>* cancel) {
  BatchSummary summary;
  summary.results.resize(files.size());
  std::vector<bool> started(files.size(), false);

  std::atomic<size_t> next{0};
  std::mutex mu;
  auto worker = [&] {
    while (true) {
      if (cancel && cancel->load()) return;
      const size_t i = next.fetch_add(1);
      if (i >= files.size()) return;
      {
        std::lock_guard<std::mutex> lock(mu);
        started[i] = true;
      }
      FileResult r;
      try {
        r = job(files[i]);
      } catch (const std::exception& e) {
        r.media = files[i];
        r.ok = false;
        r.error = e.what();
      }
      std::lock_guard<std::mutex> lock(mu);
      summary.results[i] = std::move(r);
    }
  };

  const size_t n = std::max<size_t>(1, std::min(jobs, files.size()));
  std::vector<std::thread> workers;
  workers.reserve(n);
  for (size_t k = 0; k < n; ++k) workers.emplace_back(worker);
  for (auto& t : workers) t.join();

  for (size_t i = 0; i < files.size(); ++i) {
    auto& r = summary.results[i];
    if (!started[i]) {
      r.media = files[i];
      r.error = "cancelled";
      ++summary.skipped;
    } else if (r.unchanged) {
      ++summary.unchanged;
    } else if (r.ok) {
      ++summary.ok;
    } else {
      ++summary.failed;
    }
  }
  return summary;
}
