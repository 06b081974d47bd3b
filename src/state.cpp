#include "state.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "subtitle_writer.h"
#include "transcript_json.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t fnv1a_update(std::uint64_t h, const char* data, size_t n) {
  for (size_t i = 0; i < n; ++i) {
    h ^= static_cast<unsigned char>(data[i]);
    h *= kFnvPrime;
  }
  return h;
}

std::string to_hex(std::uint64_t h) {
  std::ostringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << h;
  return ss.str();
}

std::string state_key(const fs::path& media) {
  std::error_code ec;
  const fs::path abs = fs::absolute(media, ec);
  return (ec ? media : abs).lexically_normal().string();
}

bool file_signature(const fs::path& media, std::uintmax_t& size, std::int64_t& mtime) {
  std::error_code ec;
  size = fs::file_size(media, ec);
  if (ec) return false;
  const auto t = fs::last_write_time(media, ec);
  if (ec) return false;
  mtime = std::int64_t(t.time_since_epoch().count());
  return true;
}

StateItem item_from_json(const json& j) {
  StateItem item;
  item.status = j.at("status").get<std::string>();
  item.size = j.at("size").get<std::uintmax_t>();
  item.mtime = j.at("mtime").get<std::int64_t>();
  item.content_hash = j.value("hash", "");
  item.options_fp = j.at("options_fp").get<std::string>();
  item.updated_at = j.value("updated_at", "");
  item.error = j.value("error", "");
  return item;
}

json item_to_json(const StateItem& item) {
  json j;
  j["status"] = item.status;
  j["size"] = item.size;
  j["mtime"] = item.mtime;
  j["hash"] = item.content_hash;
  j["options_fp"] = item.options_fp;
  j["updated_at"] = item.updated_at;
  j["error"] = item.error.empty() ? json(nullptr) : json(item.error);
  return j;
}

}  // namespace

std::string fnv1a_hex(const std::string& data) { return to_hex(fnv1a_update(kFnvOffset, data.data(), data.size())); }

std::string hash_file(const fs::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open " + path.string());
  std::uint64_t h = kFnvOffset;
  char buffer[65536];
  while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) h = fnv1a_update(h, buffer, size_t(f.gcount()));
  return to_hex(h);
}

std::string options_fingerprint(const json& options) { return fnv1a_hex(options.dump()); }

void StateStore::load(Logger& log) {
  std::lock_guard<std::mutex> lock(mu_);
  items_.clear();
  if (!fs::exists(path_)) return;
  try {
    std::ifstream f(path_, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open");
    const json j = json::parse(f);
    const json& items = j.at("items");
    for (auto it = items.begin(); it != items.end(); ++it) items_[it.key()] = item_from_json(it.value());
  } catch (const std::exception& e) {
    items_.clear();
    log.warn("state file " + path_.string() + " ignored (" + e.what() + "); every input will be processed");
  }
}

void StateStore::save() const {
  std::lock_guard<std::mutex> lock(mu_);
  save_locked();
}

void StateStore::save_locked() const {
  json items = json::object();
  for (const auto& [key, item] : items_) items[key] = item_to_json(item);
  json j;
  j["version"] = 1;
  j["items"] = items;
  if (path_.has_parent_path()) fs::create_directories(path_.parent_path());
  // Written beside the target and renamed so a crash never leaves half a file.
  const fs::path tmp = path_.string() + ".tmp";
  write_text_file(tmp, j.dump(2) + "\n");
  fs::rename(tmp, path_);
}

bool StateStore::is_unchanged(const fs::path& media, const std::string& options_fp,
                              const std::vector<fs::path>& expected_outputs) const {
  StateItem item;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = items_.find(state_key(media));
    if (it == items_.end()) return false;
    item = it->second;
  }
  if (item.status != "ok" || item.options_fp != options_fp) return false;
  std::uintmax_t size = 0;
  std::int64_t mtime = 0;
  if (!file_signature(media, size, mtime) || size != item.size || mtime != item.mtime) return false;
  for (const auto& p : expected_outputs) {
    if (!fs::exists(p)) return false;
  }
  return true;
}

void StateStore::record(const fs::path& media, const FileResult& result, const std::string& options_fp) {
  StateItem item;
  item.status = result.ok ? "ok" : "fail";
  item.error = result.error;
  item.options_fp = options_fp;
  item.updated_at = utc_timestamp_now();
  if (file_signature(media, item.size, item.mtime)) item.content_hash = hash_file(media);

  std::lock_guard<std::mutex> lock(mu_);
  items_[state_key(media)] = std::move(item);
  save_locked();
}

size_t StateStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return items_.size();
}

FileJob resumable_job(FileJob job, StateStore& store, std::string options_fp, OutputOptions output, bool force,
                      Logger log) {
  return [job = std::move(job), &store, options_fp = std::move(options_fp), output = std::move(output), force,
          log](const fs::path& media) mutable {
    if (!force && store.is_unchanged(media, options_fp, planned_outputs(media.stem().string(), output))) {
      log.info("unchanged since the last run, skipped: " + media.string());
      FileResult r;
      r.media = media;
      r.ok = true;
      r.unchanged = true;
      return r;
    }
    FileResult r = job(media);
    if (r.cancelled) return r;
    try {
      store.record(media, r, options_fp);
    } catch (const std::exception& e) {
      log.warn(std::string("state not saved for ") + media.string() + ": " + e.what());
    }
    return r;
  };
}
