#include <catch2/catch.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>

#include "batch.h"
#include "pipeline.h"
#include "state.h"
#include "test_support.h"

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << content;
}

// Job that writes the planned outputs, like a successful process_file.
struct CountingJob {
  OutputOptions output;
  std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
  bool fail = false;

  FileResult operator()(const fs::path& media) const {
    ++*calls;
    FileResult r;
    r.media = media;
    if (fail) {
      r.error = "engine crashed";
      return r;
    }
    for (const auto& p : planned_outputs(media.stem().string(), output)) write_file(p, "x");
    r.ok = true;
    return r;
  }
};

}  // namespace

TEST_CASE("fnv1a_hex: standard 64-bit vectors", "[state]") {
  CHECK(fnv1a_hex("") == "cbf29ce484222325");
  CHECK(fnv1a_hex("a") == "af63dc4c8601ec8c");
}

TEST_CASE("options_fingerprint: key order does not matter, values do", "[state]") {
  nlohmann::json a;
  a["language"] = "pt";
  a["polish"] = true;
  nlohmann::json b;
  b["polish"] = true;
  b["language"] = "pt";
  CHECK(options_fingerprint(a) == options_fingerprint(b));
  b["polish"] = false;
  CHECK(options_fingerprint(a) != options_fingerprint(b));
}

TEST_CASE("StateStore: a successful run is unchanged until input, options or outputs change", "[state]") {
  CapturedLog cap;
  TempDir dir("capsync-test");
  const fs::path media = dir.path() / "talk.wav";
  write_file(media, "RIFF....");
  const fs::path srt = dir.path() / "out" / "talk.srt";
  write_file(srt, "1\n");

  StateStore store(dir.path() / "out" / "_state.json");
  store.load(cap.log);
  CHECK_FALSE(store.is_unchanged(media, "fp1", {srt}));

  FileResult ok;
  ok.media = media;
  ok.ok = true;
  store.record(media, ok, "fp1");
  CHECK(store.is_unchanged(media, "fp1", {srt}));
  CHECK_FALSE(store.is_unchanged(media, "fp2", {srt}));
  CHECK_FALSE(store.is_unchanged(media, "fp1", {srt, dir.path() / "out" / "talk.vtt"}));

  StateStore reloaded(store.path());
  reloaded.load(cap.log);
  CHECK(reloaded.size() == 1);
  CHECK(reloaded.is_unchanged(media, "fp1", {srt}));

  write_file(media, "RIFF........");
  CHECK_FALSE(store.is_unchanged(media, "fp1", {srt}));
}

TEST_CASE("StateStore: failed runs are never unchanged", "[state]") {
  CapturedLog cap;
  TempDir dir("capsync-test");
  const fs::path media = dir.path() / "a.mp3";
  write_file(media, "ID3");
  StateStore store(dir.path() / "_state.json");
  store.load(cap.log);

  FileResult failed;
  failed.media = media;
  failed.error = "boom";
  store.record(media, failed, "fp");
  CHECK_FALSE(store.is_unchanged(media, "fp", {}));

  std::ifstream in(store.path());
  const auto j = nlohmann::json::parse(in);
  const auto& item = j["items"].begin().value();
  CHECK(item["status"] == "fail");
  CHECK(item["error"] == "boom");
  CHECK(item["hash"].get<std::string>().size() == 16);
}

TEST_CASE("StateStore: a malformed state file is ignored with a warning", "[state]") {
  CapturedLog cap;
  TempDir dir("capsync-test");
  const fs::path path = dir.path() / "_state.json";
  write_file(path, "{not json");
  StateStore store(path);
  store.load(cap.log);
  CHECK(store.size() == 0);
  CHECK(cap.text().find("[WARN] state file") != std::string::npos);
}

TEST_CASE("resumable_job: second run skips unchanged inputs unless forced", "[state]") {
  CapturedLog cap;
  TempDir dir("capsync-test");
  const fs::path media = dir.path() / "in" / "clip.wav";
  write_file(media, "RIFF");
  OutputOptions output;
  output.output_dir = dir.path() / "out";
  CountingJob counting{output};
  StateStore store(output.output_dir / "_state.json");
  store.load(cap.log);

  const FileJob job = resumable_job(counting, store, "fp", output, false, cap.log);
  const auto first = run_batch({media}, 1, job);
  CHECK(first.ok == 1);
  CHECK(first.unchanged == 0);

  const auto second = run_batch({media}, 1, job);
  CHECK(second.unchanged == 1);
  CHECK(second.ok == 0);
  CHECK(second.results[0].unchanged);
  CHECK(counting.calls->load() == 1);
  CHECK(cap.text().find("unchanged since the last run") != std::string::npos);

  const FileJob forced = resumable_job(counting, store, "fp", output, true, cap.log);
  CHECK(run_batch({media}, 1, forced).ok == 1);
  CHECK(counting.calls->load() == 2);

  const FileJob other_options = resumable_job(counting, store, "fp-other", output, false, cap.log);
  CHECK(run_batch({media}, 1, other_options).ok == 1);
  CHECK(counting.calls->load() == 3);
}

TEST_CASE("resumable_job: failures are recorded and retried", "[state]") {
  CapturedLog cap;
  TempDir dir("capsync-test");
  const fs::path media = dir.path() / "clip.wav";
  write_file(media, "RIFF");
  OutputOptions output;
  output.output_dir = dir.path() / "out";
  CountingJob counting{output};
  counting.fail = true;
  StateStore store(output.output_dir / "_state.json");
  store.load(cap.log);

  const FileJob job = resumable_job(counting, store, "fp", output, false, cap.log);
  CHECK(run_batch({media}, 1, job).failed == 1);
  CHECK(run_batch({media}, 1, job).failed == 1);
  CHECK(counting.calls->load() == 2);
  CHECK(store.size() == 1);
}
