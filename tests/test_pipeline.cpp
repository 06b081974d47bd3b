#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "batch.h"
#include "errors.h"
#include "pipeline.h"
#include "test_support.h"

namespace fs = std::filesystem;

namespace {

const char* kBaseSrt =
    "1\n00:00:00,000 --> 00:00:02,000\nhello world\n\n"
    "2\n00:00:02,500 --> 00:00:04,000\nsee you\n";

const char* kAlignedJson = R"({"language": "en", "segments": [{"start": 0.1, "end": 3.9, "words": [
  {"word": "Hello", "start": 0.1, "end": 0.8, "score": 0.9},
  {"word": "world.", "start": 0.9, "end": 1.8},
  {"word": "See", "start": 2.6, "end": 3.0},
  {"word": "you!", "start": 3.1, "end": 3.9}]}]})";

// In-process stand-in for ffmpeg, whisper-cli and whisperx.
class FakeBackend : public EngineBackend {
 public:
  Availability availability = Availability::Available;
  bool aligned_throws = false;
  std::string base_output = kBaseSrt;
  std::string aligned_output = kAlignedJson;
  int chunk_count = 2;

  int availability_calls = 0;
  int aligned_calls = 0;
  int base_calls = 0;
  bool last_diarize = false;

  std::optional<int> select_audio_stream(const fs::path&) override { return 0; }

  void extract_audio(const fs::path&, std::optional<int>, const fs::path& wav) override {
    std::ofstream f(wav, std::ios::binary);
    f << "RIFF";
  }

  std::vector<fs::path> split_audio(const fs::path&, int, const fs::path& out_dir) override {
    fs::create_directories(out_dir);
    std::vector<fs::path> chunks;
    for (int i = 0; i < chunk_count; ++i) chunks.push_back(out_dir / ("chunk_0000" + std::to_string(i) + ".wav"));
    return chunks;
  }

  std::string run_base_engine(const fs::path&, const fs::path&, const std::string&) override {
    ++base_calls;
    return base_output;
  }

  std::string run_aligned_engine(const fs::path&, const fs::path&, const std::string&, bool diarize) override {
    ++aligned_calls;
    last_diarize = diarize;
    if (aligned_throws) throw ProcessError("whisperx exited with 1", 1, "Traceback ...");
    return aligned_output;
  }

  Availability aligned_availability() override {
    ++availability_calls;
    return availability;
  }

  bool hf_token_present() const override { return false; }
};

std::string read_file(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

OutputOptions outputs_in(const TempDir& dir) {
  OutputOptions o;
  o.output_dir = dir.path() / "out";
  return o;
}

}  // namespace

TEST_CASE("process_file: aligned run writes every default output", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  TempDir dir("capsync-test");
  OutputOptions output = outputs_in(dir);
  output.karaoke = true;

  const auto r = process_file("/media/talk.mp4", PipelineConfig(), output, backend, cap.log);
  REQUIRE(r.ok);
  CHECK(r.error.empty());
  CHECK(r.outputs.size() == 6);

  const fs::path out = output.output_dir;
  for (const char* name : {"talk.srt", "talk.transcript.timestamps.txt", "talk.plain.txt", "talk.segments.json",
                           "talk.karaoke.ass", "talk.meta.json"}) {
    CHECK(fs::exists(out / name));
  }
  CHECK_FALSE(fs::exists(out / "talk.vtt"));

  CHECK(read_file(out / "talk.plain.txt") == "Hello world.\nSee you!\n");
  CHECK(read_file(out / "talk.srt").find("00:00:02,500 --> 00:00:04,000\nSee you!\n") != std::string::npos);

  const auto meta = nlohmann::json::parse(read_file(out / "talk.meta.json"));
  CHECK(meta["engine"]["aligned_used"] == true);
  CHECK(meta["engine"]["requested"] == "auto");
  CHECK(meta["transcript"]["words"] == 4);
  CHECK(meta["sync"]["repairs"]["text_replaced"] == 2);

  const auto segments = nlohmann::json::parse(read_file(out / "talk.segments.json"));
  CHECK(segments["word_timing"] == "measured");
  CHECK(segments["segments"][0]["words"][0]["word"] == "Hello");
}

TEST_CASE("process_file: auto mode falls back when the aligned engine fails", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  backend.availability = Availability::Unknown;
  backend.aligned_throws = true;
  TempDir dir("capsync-test");
  const OutputOptions output = outputs_in(dir);

  const auto r = process_file("clip.wav", PipelineConfig(), output, backend, cap.log);
  REQUIRE(r.ok);
  CHECK(backend.aligned_calls == 1);
  CHECK(cap.text().find("falling back to approximated word timing") != std::string::npos);

  const auto meta = nlohmann::json::parse(read_file(output.output_dir / "clip.meta.json"));
  CHECK(meta["engine"]["aligned_used"] == false);
  CHECK(meta["engine"]["fallback_reason"].get<std::string>().find("whisperx exited") != std::string::npos);
  CHECK(meta["transcript"]["word_timing"] == "approximated");
  CHECK(read_file(output.output_dir / "clip.plain.txt") == "hello world\nsee you\n");
}

TEST_CASE("process_file: auto mode skips a runtime known to be missing", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  backend.availability = Availability::Unavailable;
  TempDir dir("capsync-test");

  const auto r = process_file("clip.wav", PipelineConfig(), outputs_in(dir), backend, cap.log);
  CHECK(r.ok);
  CHECK(backend.aligned_calls == 0);
}

TEST_CASE("process_file: explicit aligned request fails the file", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  backend.aligned_throws = true;
  TempDir dir("capsync-test");
  PipelineConfig config;
  config.engine_request = EngineRequest::Aligned;

  const auto r = process_file("clip.wav", config, outputs_in(dir), backend, cap.log);
  CHECK_FALSE(r.ok);
  CHECK(r.error.find("whisperx") != std::string::npos);
  CHECK(r.outputs.empty());
  CHECK(cap.text().find("[ERROR] engine unavailable") != std::string::npos);
}

TEST_CASE("process_file: base_only never probes or runs the aligned engine", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  TempDir dir("capsync-test");
  PipelineConfig config;
  config.engine_request = EngineRequest::BaseOnly;
  config.diarize_request = DiarizeRequest::On;

  const auto r = process_file("clip.wav", config, outputs_in(dir), backend, cap.log);
  CHECK(r.ok);
  CHECK(backend.availability_calls == 0);
  CHECK(backend.aligned_calls == 0);
}

TEST_CASE("process_file: desynchronized timing fails the file", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  backend.aligned_output = R"({"segments": [{"start": 0.2, "end": 1.5, "words": [
    {"word": "hello", "start": 1.0, "end": 0.2}, {"word": "world", "start": 1.5, "end": 0.3}]}]})";
  TempDir dir("capsync-test");

  const auto r = process_file("clip.wav", PipelineConfig(), outputs_in(dir), backend, cap.log);
  CHECK_FALSE(r.ok);
  CHECK(r.error.find("desynchronized") != std::string::npos);
}

TEST_CASE("process_file: raw engine output kept on request", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  TempDir dir("capsync-test");
  OutputOptions output = outputs_in(dir);
  output.keep_engine_output = true;
  output.vtt = true;
  output.srt = false;

  REQUIRE(process_file("clip.wav", PipelineConfig(), output, backend, cap.log).ok);
  CHECK(read_file(output.output_dir / "clip.base.srt") == kBaseSrt);
  CHECK(fs::exists(output.output_dir / "clip.whisperx.json"));
  CHECK(fs::exists(output.output_dir / "clip.vtt"));
  CHECK_FALSE(fs::exists(output.output_dir / "clip.srt"));
}

TEST_CASE("transcribe_media: chunks are offset by the chunk length", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  PipelineConfig config;
  config.engine_request = EngineRequest::BaseOnly;
  config.chunk_seconds = 30;

  const auto outcome = transcribe_media("long.mp3", config, OutputOptions(), backend, cap.log);
  CHECK(backend.base_calls == 2);
  const auto& segs = outcome.sync.transcript.segments;
  REQUIRE(segs.size() == 4);
  CHECK(segs[2].interval.start == Approx(30.0));
  CHECK(segs[3].interval.end == Approx(34.0));
  CHECK_FALSE(outcome.schedule);
}

TEST_CASE("transcribe_media: text filters apply to the merged transcript", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  PipelineConfig config;
  config.filters.glossary = {{"world", "World"}};

  const auto outcome = transcribe_media("clip.wav", config, OutputOptions(), backend, cap.log);
  CHECK(outcome.aligned_used);
  CHECK(outcome.sync.transcript.segments[0].text == "Hello World.");
}

TEST_CASE("process_file: redaction covers numbers split across aligned words", "[pipeline]") {
  CapturedLog cap;
  FakeBackend backend;
  backend.base_output = "1\n00:00:00,000 --> 00:00:04,000\nligue 98765 4321 agora\n";
  backend.aligned_output = R"({"language": "pt", "segments": [{"start": 0.0, "end": 4.0, "words": [
    {"word": "ligue", "start": 0.0, "end": 0.6},
    {"word": "98765", "start": 0.7, "end": 1.6},
    {"word": "4321", "start": 1.7, "end": 2.6},
    {"word": "agora", "start": 2.8, "end": 3.6}]}]})";
  TempDir dir("capsync-test");
  OutputOptions output = outputs_in(dir);
  output.karaoke = true;
  output.keep_engine_output = true;
  PipelineConfig config;
  config.filters.redact = true;

  const auto r = process_file("call.wav", config, output, backend, cap.log);
  REQUIRE(r.ok);
  for (const auto& path : r.outputs) {
    if (path.filename() == "call.meta.json") continue;
    const std::string body = read_file(path);
    CHECK(body.find("98765") == std::string::npos);
    CHECK(body.find("4321") == std::string::npos);
  }
  CHECK(read_file(output.output_dir / "call.plain.txt") == "ligue [TEL] agora\n");
  CHECK_FALSE(fs::exists(output.output_dir / "call.base.srt"));
  CHECK_FALSE(fs::exists(output.output_dir / "call.whisperx.json"));
  CHECK(cap.text().find("raw engine output is not kept") != std::string::npos);
}

TEST_CASE("is_supported_media: known extensions, any case", "[batch]") {
  CHECK(is_supported_media("a.mp4"));
  CHECK(is_supported_media("b.FLAC"));
  CHECK(is_supported_media("dir/c.m2ts"));
  CHECK_FALSE(is_supported_media("notes.txt"));
  CHECK_FALSE(is_supported_media("noext"));
}

TEST_CASE("collect_media_files: directory listing, sorted, optionally recursive", "[batch]") {
  TempDir dir("capsync-test");
  const fs::path root = dir.path();
  fs::create_directories(root / "sub");
  for (const char* name : {"b.MP3", "a.wav", "readme.txt", "sub/c.mkv"}) std::ofstream(root / name) << "x";

  const auto flat = collect_media_files(root, false);
  REQUIRE(flat.size() == 2);
  CHECK(flat[0].filename() == "a.wav");
  CHECK(flat[1].filename() == "b.MP3");

  CHECK(collect_media_files(root, true).size() == 3);
  CHECK(collect_media_files(root / "readme.txt", false).size() == 1);
  CHECK_THROWS_AS(collect_media_files(root / "missing", false), std::runtime_error);
}

TEST_CASE("run_batch: one failing file does not stop the others", "[batch]") {
  const std::vector<fs::path> files = {"one.wav", "two.wav", "three.wav", "four.wav"};
  const FileJob job = [](const fs::path& p) {
    if (p == "two.wav") throw std::runtime_error("boom");
    FileResult r;
    r.media = p;
    r.ok = p != "four.wav";
    if (!r.ok) r.error = "bad audio";
    return r;
  };

  const auto summary = run_batch(files, 3, job);
  REQUIRE(summary.results.size() == 4);
  CHECK(summary.ok == 2);
  CHECK(summary.failed == 2);
  CHECK(summary.skipped == 0);
  CHECK(summary.results[1].media == "two.wav");
  CHECK(summary.results[1].error == "boom");
  CHECK(summary.results[3].error == "bad audio");
}

TEST_CASE("run_batch: nothing starts once cancelled", "[batch]") {
  std::atomic<bool> cancel{true};
  std::atomic<int> calls{0};
  const FileJob job = [&](const fs::path& p) {
    ++calls;
    FileResult r;
    r.media = p;
    r.ok = true;
    return r;
  };

  const auto summary = run_batch({"a.wav", "b.wav"}, 2, job, &cancel);
  CHECK(calls.load() == 0);
  CHECK(summary.skipped == 2);
  CHECK(summary.results[0].error == "cancelled");
}
