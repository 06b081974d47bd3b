#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "cli_args.h"
#include "errors.h"

namespace fs = std::filesystem;

namespace {

struct Argv {
  std::vector<std::string> storage;
  std::vector<char*> ptrs;

  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    storage.insert(storage.begin(), "capsync");
    for (auto& s : storage) ptrs.push_back(&s[0]);
    ptrs.push_back(nullptr);
  }

  int argc() const { return int(storage.size()); }
  char** argv() { return ptrs.data(); }
};

bool parse(std::vector<std::string> args, CliArgs& out, int& exit_code) {
  Argv a(std::move(args));
  return parse_cli_args(a.argc(), a.argv(), out, exit_code);
}

fs::path write_config(const std::string& name, const std::string& content) {
  const fs::path p = fs::temp_directory_path() / ("capsync_test_" + name);
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << content;
  return p;
}

}  // namespace

TEST_CASE("parse_cli_args: required arguments and defaults", "[cli]") {
  CliArgs args;
  int code = -1;
  REQUIRE(parse({"-i", "media", "--whisper-cli", "whisper-cli", "-m", "model.bin"}, args, code));
  CHECK(code == 0);
  CHECK(args.input == "media");
  CHECK(args.engine.whisper_model == "model.bin");
  CHECK(args.jobs == 1);
  CHECK(args.pipeline.engine_request == EngineRequest::Auto);
  CHECK(args.pipeline.diarize_request == DiarizeRequest::Auto);
  CHECK(args.pipeline.clip_fatal_ratio == Approx(0.20));
  CHECK(args.output.srt);
  CHECK_FALSE(args.output.karaoke);
}

TEST_CASE("parse_cli_args: missing or invalid arguments exit with 2", "[cli]") {
  int code = 0;
  {
    CliArgs args;
    CHECK_FALSE(parse({}, args, code));
    CHECK(code == 2);
  }
  {
    CliArgs args;
    code = 0;
    CHECK_FALSE(parse({"-i", "media", "--whisper-cli", "w"}, args, code));
    CHECK(code == 2);
  }
  for (const std::vector<std::string>& bad : std::vector<std::vector<std::string>>{
           {"media", "--whisper-cli", "w", "-m", "m", "--engine", "fast"},
           {"media", "--whisper-cli", "w", "-m", "m", "--jobs", "two"},
           {"media", "--whisper-cli", "w", "-m", "m", "--clip-fatal-ratio", "1.5"},
           {"media", "--whisper-cli", "w", "-m", "m", "--alignment-slack", "-1"},
           {"media", "--whisper-cli", "w", "-m", "m", "--bogus"},
           {"media", "other", "--whisper-cli", "w", "-m", "m"},
           {"media", "--whisper-cli", "w", "-m"}}) {
    CliArgs args;
    code = 0;
    CHECK_FALSE(parse(bad, args, code));
    CHECK(code == 2);
  }
}

TEST_CASE("parse_cli_args: engine, sync and output flags", "[cli]") {
  CliArgs args;
  int code = 0;
  REQUIRE(parse({"talk.mp4", "--whisper-cli", "w", "-m", "m", "-e", "aligned", "--diarize", "on", "-j", "4",
                 "--alignment-slack", "0.5", "--no-approximation", "--clip-fatal-ratio", "0.1", "--vtt", "--no-srt",
                 "-k", "--speaker-prefix", "--res", "1280x720", "--highlight", "00FF00", "--glossary", "terms.txt",
                 "--redact-pii", "--whisper-extra-args", "--beam-size 5", "--audio-stream", "2", "--timeout", "90"},
                args, code));
  CHECK(args.input == "talk.mp4");
  CHECK(args.pipeline.engine_request == EngineRequest::Aligned);
  CHECK(args.pipeline.diarize_request == DiarizeRequest::On);
  CHECK(args.jobs == 4);
  CHECK(args.pipeline.alignment_slack_sec == Approx(0.5));
  CHECK_FALSE(args.pipeline.approximation_enabled);
  CHECK(args.pipeline.clip_fatal_ratio == Approx(0.1));
  CHECK(args.output.vtt);
  CHECK_FALSE(args.output.srt);
  CHECK(args.output.karaoke);
  CHECK(args.output.captions.speaker_prefix);
  CHECK(args.output.ass.speaker_prefix);
  CHECK(args.output.ass.play_res_x == 1280);
  CHECK(args.output.ass.play_res_y == 720);
  CHECK(args.output.ass.highlight_rgb == "00FF00");
  CHECK(args.glossary == "terms.txt");
  CHECK(args.redact_pii);
  CHECK(args.engine.whisper_extra_args == std::vector<std::string>{"--beam-size", "5"});
  CHECK(*args.engine.audio_stream == 2);
  CHECK(args.engine.engine_timeout_sec == Approx(90.0));
}

TEST_CASE("parse_cli_args: flags override the config file wherever it appears", "[cli]") {
  const auto cfg = write_config("config.json", R"({
    "input": "from-config", "whisper_cli": "whisper-cli", "model": "cfg.bin",
    "engine": "base", "jobs": 3, "karaoke": true,
    "ass": {"font": "Verdana", "font_size": 60, "res": "1280x720"}
  })");

  CliArgs args;
  int code = 0;
  REQUIRE(parse({"-j", "2", "--config", cfg.string(), "cli-input"}, args, code));
  CHECK(args.input == "cli-input");
  CHECK(args.jobs == 2);
  CHECK(args.engine.whisper_model == "cfg.bin");
  CHECK(args.pipeline.engine_request == EngineRequest::BaseOnly);
  CHECK(args.output.karaoke);
  CHECK(args.output.ass.font_name == "Verdana");
  CHECK(args.output.ass.font_size == 60);
  CHECK(args.output.ass.play_res_y == 720);
  fs::remove(cfg);
}

TEST_CASE("parse_cli_args: broken config file is a usage error", "[cli]") {
  const auto cfg = write_config("broken.json", "{\"jobs\": ");
  CliArgs args;
  int code = 0;
  CHECK_FALSE(parse({"--config", cfg.string()}, args, code));
  CHECK(code == 2);
  fs::remove(cfg);
}

TEST_CASE("apply_config_json: unknown keys and wrong types are rejected", "[cli]") {
  CliArgs args;
  CHECK_THROWS_AS(apply_config_json(nlohmann::json{{"modle", "x"}}, args), std::runtime_error);
  CHECK_THROWS_AS(apply_config_json(nlohmann::json{{"ass", {{"colour", "x"}}}}, args), std::runtime_error);
  CHECK_THROWS_AS(apply_config_json(nlohmann::json{{"jobs", "many"}}, args), std::runtime_error);
  CHECK_THROWS_AS(apply_config_json(nlohmann::json::array(), args), std::runtime_error);
}

TEST_CASE("apply_config_json: extra args as a list or a string", "[cli]") {
  CliArgs args;
  apply_config_json(nlohmann::json{{"whisper_extra_args", {"-bs", "5"}}, {"diarize", "off"}}, args);
  CHECK(args.engine.whisper_extra_args == std::vector<std::string>{"-bs", "5"});
  CHECK(args.pipeline.diarize_request == DiarizeRequest::Off);

  apply_config_json(nlohmann::json{{"whisper_extra_args", "-bs 8 -nf"}}, args);
  CHECK(args.engine.whisper_extra_args.size() == 3);
}

TEST_CASE("load_config_file: invalid JSON is a ParseError", "[cli]") {
  const auto cfg = write_config("invalid.json", "not json");
  CliArgs args;
  CHECK_THROWS_AS(load_config_file(cfg, args), ParseError);
  fs::remove(cfg);
}

TEST_CASE("parse_cli_args: polish and resume flags", "[cli]") {
  CliArgs out;
  int code = 0;
  REQUIRE(parse({"-i", "talks", "--whisper-cli", "w", "-m", "m.bin", "-o", "subs", "--polish", "--max-cps", "15",
                 "--min-dur-ms", "500", "--max-dur-ms", "6000", "--merge-gap-ms", "100", "--force"},
                out, code));
  CHECK(out.pipeline.polish.enabled);
  CHECK(out.pipeline.polish.max_cps == Approx(15.0));
  CHECK(out.pipeline.polish.min_duration_sec == Approx(0.5));
  CHECK(out.pipeline.polish.max_duration_sec == Approx(6.0));
  CHECK(out.pipeline.polish.merge_gap_sec == Approx(0.1));
  CHECK(out.force);
  CHECK(out.state_file == fs::path("subs") / "_state.json");

  CliArgs bad;
  CHECK_FALSE(parse({"-i", "x", "--whisper-cli", "w", "-m", "m", "--min-dur-ms", "8000"}, bad, code));
  CHECK(code == 2);
}

TEST_CASE("apply_config_json: polish and state keys", "[cli]") {
  CliArgs out;
  apply_config_json(nlohmann::json::parse(R"({"polish": true, "max_dur_ms": 5000, "state_file": "/tmp/s.json"})"),
                    out);
  CHECK(out.pipeline.polish.enabled);
  CHECK(out.pipeline.polish.max_duration_sec == Approx(5.0));
  CHECK(out.state_file == fs::path("/tmp/s.json"));
}

TEST_CASE("fingerprint_options: changes with options that change the output", "[cli]") {
  CliArgs a;
  CliArgs b;
  CHECK(fingerprint_options(a) == fingerprint_options(b));
  b.pipeline.polish.enabled = true;
  CHECK(fingerprint_options(a) != fingerprint_options(b));
  CliArgs c;
  c.pipeline.filters.glossary = {{"gpt", "GPT"}};
  CHECK(fingerprint_options(a) != fingerprint_options(c));
  CliArgs d;
  d.jobs = 8;
  d.debug = true;
  CHECK(fingerprint_options(a) == fingerprint_options(d));
}
