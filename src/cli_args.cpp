#include "cli_args.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "errors.h"
#include "utf8_utils.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

static bool is_flag(const std::string& s) { return !s.empty() && s[0] == '-'; }

void print_usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  capsync --input <file|dir> --whisper-cli <bin> --model <ggml model> [options]\n";
  std::cerr << "\nInput/Output:\n";
  std::cerr << "  --input, -i            Media file or directory\n";
  std::cerr << "  --output, -o           Output directory (default: output)\n";
  std::cerr << "  --recursive, -R        Scan subdirectories\n";
  std::cerr << "  --jobs, -j             Files processed in parallel (default: 1)\n";
  std::cerr << "  --config, -c           JSON file with default values for any option\n";
  std::cerr << "  --vtt                  Also write .vtt\n";
  std::cerr << "  --no-srt               Skip .srt\n";
  std::cerr << "  --karaoke, -k          Write .karaoke.ass\n";
  std::cerr << "  --keep-engine-output   Keep raw engine output next to the captions\n";
  std::cerr << "  --state-file           Resume state (default: <output>/_state.json)\n";
  std::cerr << "  --force                Reprocess files whose outputs are current\n";
  std::cerr << "\nBase engine (whisper.cpp):\n";
  std::cerr << "  --whisper-cli          whisper-cli binary\n";
  std::cerr << "  --model, -m            ggml/gguf model path\n";
  std::cerr << "  --language, -l         Language code (default: auto)\n";
  std::cerr << "  --threads, -t          CPU threads (default: engine default)\n";
  std::cerr << "  --max-line-len         whisper-cli -ml value (default: 60)\n";
  std::cerr << "  --prompt               Initial prompt\n";
  std::cerr << "  --whisper-extra-args   Extra whisper-cli args (space separated)\n";
  std::cerr << "  --chunk-seconds        Split audio into chunks (default: 0 = off)\n";
  std::cerr << "\nAudio:\n";
  std::cerr << "  --ffmpeg / --ffprobe   Binaries (default: from PATH)\n";
  std::cerr << "  --audio-stream         Audio track index (default: longest track)\n";
  std::cerr << "  --no-auto-audio-stream Use the first audio track instead of probing\n";
  std::cerr << "  --audio-filter         ffmpeg -af filter\n";
  std::cerr << "\nWord alignment (WhisperX):\n";
  std::cerr << "  --engine, -e           auto | base | aligned (default: auto)\n";
  std::cerr << "  --diarize              auto | on | off (default: auto)\n";
  std::cerr << "  --whisperx             whisperx binary (default: whisperx)\n";
  std::cerr << "  --whisperx-model       WhisperX model (default: medium)\n";
  std::cerr << "  --hf-token-env         Env var holding the HF token (default: HUGGINGFACE_HUB_TOKEN)\n";
  std::cerr << "  --timeout              Seconds per engine invocation (default: none)\n";
  std::cerr << "\nSynchronization:\n";
  std::cerr << "  --alignment-slack      Matching tolerance in seconds (default: 0.25)\n";
  std::cerr << "  --no-approximation     Leave uncovered segments without words\n";
  std::cerr << "  --clip-fatal-ratio     Abort when clipped/(segments+words) exceeds this (default: 0.20)\n";
  std::cerr << "  --clip-warn-count      Warn from this many clipped elements (default: 1)\n";
  std::cerr << "\nText:\n";
  std::cerr << "  --glossary             Replacements (.txt 'wrong=right' or .json)\n";
  std::cerr << "  --redact-pii           Redact e-mail, phone, CPF and CNPJ\n";
  std::cerr << "  --speaker-prefix       Prefix captions with [SPEAKER]\n";
  std::cerr << "  --no-wrap              Do not wrap SRT/VTT lines\n";
  std::cerr << "  --max-chars-per-line   Caption line width (default: 42)\n";
  std::cerr << "  --max-lines            Caption lines (default: 2)\n";
  std::cerr << "\nPolish (off by default):\n";
  std::cerr << "  --polish               Merge close cues, split long ones, extend short or fast ones\n";
  std::cerr << "  --max-cps              Reading speed in characters per second (default: 17)\n";
  std::cerr << "  --min-dur-ms           Shortest cue (default: 700)\n";
  std::cerr << "  --max-dur-ms           Longest cue (default: 7000)\n";
  std::cerr << "  --merge-gap-ms         Merge cues closer than this (default: 200)\n";
  std::cerr << "\nKaraoke style:\n";
  std::cerr << "  --font, --font-size, --res WxH, --margin-v, --outline, --shadow\n";
  std::cerr << "  --highlight RRGGBB, --base RRGGBB, --all-caps, --ass-max-chars, --ass-max-lines\n";
  std::cerr << "\nLogging:\n";
  std::cerr << "  --log-file             Append log lines to this file\n";
  std::cerr << "  --debug, -d            Verbose logging\n";
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static int require_int(int& i, int argc, char** argv, const std::string& flag) {
  const std::string v = require_value(i, argc, argv, flag);
  size_t used = 0;
  int n = 0;
  try {
    n = std::stoi(v, &used);
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid integer for " + flag + ": " + v);
  }
  if (used != v.size()) throw std::runtime_error("Invalid integer for " + flag + ": " + v);
  return n;
}

static double require_double(int& i, int argc, char** argv, const std::string& flag) {
  const std::string v = require_value(i, argc, argv, flag);
  size_t used = 0;
  double d = 0.0;
  try {
    d = std::stod(v, &used);
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid number for " + flag + ": " + v);
  }
  if (used != v.size()) throw std::runtime_error("Invalid number for " + flag + ": " + v);
  return d;
}

static std::vector<std::string> split_args(const std::string& s) { return utf8::split_words(s); }

static void parse_resolution(const std::string& v, AssStyle& style) {
  const auto x = v.find('x');
  if (x == std::string::npos) throw std::runtime_error("Invalid resolution (expected WxH): " + v);
  try {
    style.play_res_x = std::stoi(v.substr(0, x));
    style.play_res_y = std::stoi(v.substr(x + 1));
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid resolution (expected WxH): " + v);
  }
}

template <typename T>
static void read_key(const json& j, const char* key, T& target) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  try {
    target = it->get<T>();
  } catch (const json::exception&) {
    throw std::runtime_error(std::string("Config key '") + key + "' has the wrong type");
  }
}

static void read_path(const json& j, const char* key, fs::path& target) {
  std::string s;
  read_key(j, key, s);
  if (!s.empty()) target = s;
}

static void apply_ass_json(const json& j, AssStyle& s) {
  static const char* kKnown[] = {"font",        "font_size", "highlight", "base",      "outline_color",
                                 "outline",     "shadow",    "margin_v",  "res",       "all_caps",
                                 "max_chars",   "max_lines"};
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool known = false;
    for (const char* k : kKnown) known = known || it.key() == k;
    if (!known) throw std::runtime_error("Unknown config key 'ass." + it.key() + "'");
  }
  read_key(j, "font", s.font_name);
  read_key(j, "font_size", s.font_size);
  read_key(j, "highlight", s.highlight_rgb);
  read_key(j, "base", s.base_rgb);
  read_key(j, "outline_color", s.outline_rgb);
  read_key(j, "outline", s.outline);
  read_key(j, "shadow", s.shadow);
  read_key(j, "margin_v", s.margin_v);
  read_key(j, "all_caps", s.all_caps);
  read_key(j, "max_chars", s.max_chars_per_line);
  read_key(j, "max_lines", s.max_lines);
  std::string res;
  read_key(j, "res", res);
  if (!res.empty()) parse_resolution(res, s);
}

void apply_config_json(const json& j, CliArgs& out) {
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");
  static const char* kKnown[] = {
      "input",          "output",          "recursive",          "jobs",
      "log_file",       "glossary",        "redact_pii",         "debug",
      "ffmpeg",         "ffprobe",         "audio_filter",       "audio_stream",
      "auto_audio_stream", "whisper_cli",  "model",              "threads",
      "max_line_len",   "prompt",          "whisper_extra_args", "whisperx",
      "whisperx_model", "hf_token_env",    "timeout",            "language",
      "engine",         "diarize",         "alignment_slack",    "approximation",
      "clip_fatal_ratio", "clip_warn_count", "chunk_seconds",    "srt",
      "vtt",            "karaoke",         "keep_engine_output", "speaker_prefix",
      "wrap",           "max_chars_per_line", "max_lines",       "ass",
      "state_file",     "force",           "polish",             "max_cps",
      "min_dur_ms",     "max_dur_ms",      "merge_gap_ms"};
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool known = false;
    for (const char* k : kKnown) known = known || it.key() == k;
    if (!known) throw std::runtime_error("Unknown config key '" + it.key() + "'");
  }

  read_path(j, "input", out.input);
  read_path(j, "output", out.output.output_dir);
  read_key(j, "recursive", out.recursive);
  read_key(j, "jobs", out.jobs);
  read_path(j, "log_file", out.log_file);
  read_path(j, "glossary", out.glossary);
  read_key(j, "redact_pii", out.redact_pii);
  read_key(j, "debug", out.debug);
  read_path(j, "state_file", out.state_file);
  read_key(j, "force", out.force);

  auto& e = out.engine;
  read_key(j, "ffmpeg", e.ffmpeg);
  read_key(j, "ffprobe", e.ffprobe);
  read_key(j, "audio_filter", e.audio_filter);
  if (j.contains("audio_stream") && !j["audio_stream"].is_null()) {
    int stream = 0;
    read_key(j, "audio_stream", stream);
    e.audio_stream = stream;
  }
  read_key(j, "auto_audio_stream", e.detect_audio_stream);
  read_key(j, "whisper_cli", e.whisper_cli);
  read_path(j, "model", e.whisper_model);
  read_key(j, "threads", e.threads);
  read_key(j, "max_line_len", e.max_line_len);
  read_key(j, "prompt", e.prompt);
  if (j.contains("whisper_extra_args")) {
    const auto& v = j["whisper_extra_args"];
    if (v.is_string()) {
      e.whisper_extra_args = split_args(v.get<std::string>());
    } else {
      read_key(j, "whisper_extra_args", e.whisper_extra_args);
    }
  }
  read_key(j, "whisperx", e.whisperx);
  read_key(j, "whisperx_model", e.whisperx_model);
  read_key(j, "hf_token_env", e.hf_token_env);
  read_key(j, "timeout", e.engine_timeout_sec);

  auto& p = out.pipeline;
  read_key(j, "language", p.language);
  std::string s;
  read_key(j, "engine", s);
  if (!s.empty()) p.engine_request = parse_engine_request(s);
  s.clear();
  read_key(j, "diarize", s);
  if (!s.empty()) p.diarize_request = parse_diarize_request(s);
  read_key(j, "alignment_slack", p.alignment_slack_sec);
  read_key(j, "approximation", p.approximation_enabled);
  read_key(j, "clip_fatal_ratio", p.clip_fatal_ratio);
  read_key(j, "clip_warn_count", p.clip_warn_count);
  read_key(j, "chunk_seconds", p.chunk_seconds);
  read_key(j, "polish", p.polish.enabled);
  read_key(j, "max_cps", p.polish.max_cps);
  double ms = -1.0;
  read_key(j, "min_dur_ms", ms);
  if (ms >= 0.0) p.polish.min_duration_sec = ms / 1000.0;
  ms = -1.0;
  read_key(j, "max_dur_ms", ms);
  if (ms >= 0.0) p.polish.max_duration_sec = ms / 1000.0;
  ms = -1.0;
  read_key(j, "merge_gap_ms", ms);
  if (ms >= 0.0) p.polish.merge_gap_sec = ms / 1000.0;

  auto& o = out.output;
  read_key(j, "srt", o.srt);
  read_key(j, "vtt", o.vtt);
  read_key(j, "karaoke", o.karaoke);
  read_key(j, "keep_engine_output", o.keep_engine_output);
  read_key(j, "speaker_prefix", o.captions.speaker_prefix);
  read_key(j, "wrap", o.captions.wrap);
  read_key(j, "max_chars_per_line", o.captions.max_chars_per_line);
  read_key(j, "max_lines", o.captions.max_lines);
  if (j.contains("ass")) {
    if (!j["ass"].is_object()) throw std::runtime_error("Config key 'ass' must be an object");
    apply_ass_json(j["ass"], o.ass);
  }
  o.ass.speaker_prefix = o.captions.speaker_prefix;
}

void load_config_file(const fs::path& path, CliArgs& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open config: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  json j;
  try {
    j = json::parse(utf8::strip_bom(ss.str()));
  } catch (const json::parse_error& e) {
    throw ParseError("Invalid config JSON in " + path.string() + ": " + e.what());
  }
  apply_config_json(j, out);
}

static bool fail(const std::string& msg, int& exit_code) {
  std::cerr << msg << "\n\n";
  print_usage();
  exit_code = 2;
  return false;
}

bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code) {
  exit_code = 0;
  if (argc <= 1) {
    print_usage();
    exit_code = 2;
    return false;
  }

  try {
    // Config first so that flags win regardless of their position.
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--config" || a == "-c") {
        out.config = fs::path(require_value(i, argc, argv, a));
        load_config_file(out.config, out);
      }
    }

    bool positional_seen = false;
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--config" || a == "-c") {
        ++i;
      } else if (a == "--input" || a == "-i") {
        out.input = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--output" || a == "-o") {
        out.output.output_dir = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--recursive" || a == "-R") {
        out.recursive = true;
      } else if (a == "--jobs" || a == "-j") {
        out.jobs = require_int(i, argc, argv, a);
      } else if (a == "--log-file") {
        out.log_file = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--debug" || a == "-d") {
        out.debug = true;
      } else if (a == "--glossary") {
        out.glossary = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--redact-pii") {
        out.redact_pii = true;
      } else if (a == "--whisper-cli") {
        out.engine.whisper_cli = require_value(i, argc, argv, a);
      } else if (a == "--model" || a == "-m") {
        out.engine.whisper_model = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--language" || a == "-l") {
        out.pipeline.language = require_value(i, argc, argv, a);
      } else if (a == "--threads" || a == "-t") {
        out.engine.threads = require_int(i, argc, argv, a);
      } else if (a == "--max-line-len") {
        out.engine.max_line_len = require_int(i, argc, argv, a);
      } else if (a == "--prompt") {
        out.engine.prompt = require_value(i, argc, argv, a);
      } else if (a == "--whisper-extra-args") {
        out.engine.whisper_extra_args = split_args(require_value(i, argc, argv, a));
      } else if (a == "--chunk-seconds") {
        out.pipeline.chunk_seconds = require_int(i, argc, argv, a);
      } else if (a == "--ffmpeg") {
        out.engine.ffmpeg = require_value(i, argc, argv, a);
      } else if (a == "--ffprobe") {
        out.engine.ffprobe = require_value(i, argc, argv, a);
      } else if (a == "--audio-stream") {
        out.engine.audio_stream = require_int(i, argc, argv, a);
      } else if (a == "--no-auto-audio-stream") {
        out.engine.detect_audio_stream = false;
      } else if (a == "--audio-filter") {
        out.engine.audio_filter = require_value(i, argc, argv, a);
      } else if (a == "--engine" || a == "-e") {
        out.pipeline.engine_request = parse_engine_request(require_value(i, argc, argv, a));
      } else if (a == "--diarize") {
        out.pipeline.diarize_request = parse_diarize_request(require_value(i, argc, argv, a));
      } else if (a == "--whisperx") {
        out.engine.whisperx = require_value(i, argc, argv, a);
      } else if (a == "--whisperx-model") {
        out.engine.whisperx_model = require_value(i, argc, argv, a);
      } else if (a == "--hf-token-env") {
        out.engine.hf_token_env = require_value(i, argc, argv, a);
      } else if (a == "--timeout") {
        out.engine.engine_timeout_sec = require_double(i, argc, argv, a);
      } else if (a == "--alignment-slack") {
        out.pipeline.alignment_slack_sec = require_double(i, argc, argv, a);
      } else if (a == "--no-approximation") {
        out.pipeline.approximation_enabled = false;
      } else if (a == "--clip-fatal-ratio") {
        out.pipeline.clip_fatal_ratio = require_double(i, argc, argv, a);
      } else if (a == "--clip-warn-count") {
        out.pipeline.clip_warn_count = size_t(std::max(0, require_int(i, argc, argv, a)));
      } else if (a == "--vtt") {
        out.output.vtt = true;
      } else if (a == "--no-srt") {
        out.output.srt = false;
      } else if (a == "--karaoke" || a == "-k") {
        out.output.karaoke = true;
      } else if (a == "--keep-engine-output") {
        out.output.keep_engine_output = true;
      } else if (a == "--speaker-prefix") {
        out.output.captions.speaker_prefix = true;
        out.output.ass.speaker_prefix = true;
      } else if (a == "--no-wrap") {
        out.output.captions.wrap = false;
      } else if (a == "--max-chars-per-line") {
        out.output.captions.max_chars_per_line = require_int(i, argc, argv, a);
      } else if (a == "--max-lines") {
        out.output.captions.max_lines = require_int(i, argc, argv, a);
      } else if (a == "--font") {
        out.output.ass.font_name = require_value(i, argc, argv, a);
      } else if (a == "--font-size") {
        out.output.ass.font_size = require_int(i, argc, argv, a);
      } else if (a == "--res") {
        parse_resolution(require_value(i, argc, argv, a), out.output.ass);
      } else if (a == "--margin-v") {
        out.output.ass.margin_v = require_int(i, argc, argv, a);
      } else if (a == "--outline") {
        out.output.ass.outline = require_int(i, argc, argv, a);
      } else if (a == "--shadow") {
        out.output.ass.shadow = require_int(i, argc, argv, a);
      } else if (a == "--highlight") {
        out.output.ass.highlight_rgb = require_value(i, argc, argv, a);
      } else if (a == "--base") {
        out.output.ass.base_rgb = require_value(i, argc, argv, a);
      } else if (a == "--all-caps") {
        out.output.ass.all_caps = true;
      } else if (a == "--ass-max-chars") {
        out.output.ass.max_chars_per_line = require_int(i, argc, argv, a);
      } else if (a == "--ass-max-lines") {
        out.output.ass.max_lines = require_int(i, argc, argv, a);
      } else if (a == "--state-file") {
        out.state_file = fs::path(require_value(i, argc, argv, a));
      } else if (a == "--force") {
        out.force = true;
      } else if (a == "--polish") {
        out.pipeline.polish.enabled = true;
      } else if (a == "--max-cps") {
        out.pipeline.polish.max_cps = require_double(i, argc, argv, a);
      } else if (a == "--min-dur-ms") {
        out.pipeline.polish.min_duration_sec = require_int(i, argc, argv, a) / 1000.0;
      } else if (a == "--max-dur-ms") {
        out.pipeline.polish.max_duration_sec = require_int(i, argc, argv, a) / 1000.0;
      } else if (a == "--merge-gap-ms") {
        out.pipeline.polish.merge_gap_sec = require_int(i, argc, argv, a) / 1000.0;
      } else if (is_flag(a)) {
        return fail("Unknown arg: " + a, exit_code);
      } else if (!positional_seen) {
        out.input = fs::path(a);
        positional_seen = true;
      } else {
        return fail("Unexpected positional arg: " + a, exit_code);
      }
    }
  } catch (const std::exception& e) {
    return fail(std::string("ERROR: ") + e.what(), exit_code);
  }

  // Validate required
  if (out.input.empty()) return fail("ERROR: --input is required", exit_code);
  if (out.engine.whisper_cli.empty()) return fail("ERROR: --whisper-cli is required", exit_code);
  if (out.engine.whisper_model.empty()) return fail("ERROR: --model is required", exit_code);
  if (out.pipeline.clip_fatal_ratio < 0.0 || out.pipeline.clip_fatal_ratio > 1.0) {
    return fail("ERROR: --clip-fatal-ratio must be within [0, 1]", exit_code);
  }
  if (out.pipeline.alignment_slack_sec < 0.0) return fail("ERROR: --alignment-slack must be >= 0", exit_code);
  const auto& polish = out.pipeline.polish;
  if (polish.max_duration_sec <= 0.0 || polish.min_duration_sec < 0.0 || polish.merge_gap_sec < 0.0 ||
      polish.min_duration_sec > polish.max_duration_sec) {
    return fail("ERROR: polish durations must satisfy 0 <= min-dur-ms <= max-dur-ms, max-dur-ms > 0", exit_code);
  }
  if (polish.max_cps < 0.0) return fail("ERROR: --max-cps must be >= 0", exit_code);

  if (out.jobs < 1) out.jobs = 1;
  if (out.pipeline.chunk_seconds < 0) out.pipeline.chunk_seconds = 0;
  out.output.ass.speaker_prefix = out.output.captions.speaker_prefix;
  if (out.state_file.empty()) out.state_file = out.output.output_dir / "_state.json";
  return true;
}

json fingerprint_options(const CliArgs& args) {
  const auto& e = args.engine;
  const auto& p = args.pipeline;
  const auto& o = args.output;
  json j;
  j["model"] = e.whisper_model.string();
  j["language"] = p.language;
  j["threads"] = e.threads;
  j["max_line_len"] = e.max_line_len;
  j["prompt"] = e.prompt;
  j["whisper_extra_args"] = e.whisper_extra_args;
  j["audio_filter"] = e.audio_filter;
  j["audio_stream"] = e.audio_stream ? json(*e.audio_stream) : json(nullptr);
  j["auto_audio_stream"] = e.detect_audio_stream;
  j["chunk_seconds"] = p.chunk_seconds;
  j["engine"] = engine_request_name(p.engine_request);
  j["diarize"] = diarize_request_name(p.diarize_request);
  j["whisperx_model"] = e.whisperx_model;
  j["sync"] = {{"alignment_slack", p.alignment_slack_sec},
               {"approximation", p.approximation_enabled},
               {"clip_fatal_ratio", p.clip_fatal_ratio}};
  j["polish"] = {{"enabled", p.polish.enabled},
                 {"max_cps", p.polish.max_cps},
                 {"min_dur", p.polish.min_duration_sec},
                 {"max_dur", p.polish.max_duration_sec},
                 {"merge_gap", p.polish.merge_gap_sec}};
  json glossary = json::array();
  for (const auto& [from, to] : p.filters.glossary) glossary.push_back({from, to});
  j["glossary"] = glossary;
  j["redact_pii"] = args.redact_pii;
  j["outputs"] = {{"srt", o.srt},         {"vtt", o.vtt},
                  {"karaoke", o.karaoke}, {"speaker_prefix", o.captions.speaker_prefix},
                  {"wrap", o.captions.wrap}, {"max_chars_per_line", o.captions.max_chars_per_line},
                  {"max_lines", o.captions.max_lines}};
  const auto& a = o.ass;
  j["ass"] = {{"font", a.font_name},       {"font_size", a.font_size},  {"highlight", a.highlight_rgb},
              {"base", a.base_rgb},        {"outline_color", a.outline_rgb}, {"outline", a.outline},
              {"shadow", a.shadow},        {"margin_v", a.margin_v},    {"res_x", a.play_res_x},
              {"res_y", a.play_res_y},     {"all_caps", a.all_caps},    {"max_chars", a.max_chars_per_line},
              {"max_lines", a.max_lines}};
  return j;
}
