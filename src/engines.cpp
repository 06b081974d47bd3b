#include "engines.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "errors.h"
#include "utf8_utils.h"

namespace fs = std::filesystem;

namespace {

std::string read_all_text(const fs::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

// Most recently written file with the given extension in `dir`.
std::optional<fs::path> pick_latest(const fs::path& dir, const std::string& ext) {
  std::optional<fs::path> best;
  fs::file_time_type best_time{};
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ext) continue;
    const auto t = entry.last_write_time(ec);
    if (!best || t > best_time) {
      best = entry.path();
      best_time = t;
    }
  }
  return best;
}

std::string tail(const std::string& s, size_t max_bytes = 2000) {
  return s.size() <= max_bytes ? s : s.substr(s.size() - max_bytes);
}

void throw_if_interrupted(const ProcessResult& r, const std::string& what) {
  if (r.cancelled) throw ProcessError(what + " cancelled", r.exit_code, r.output);
  if (r.timed_out) throw ProcessError(what + " timed out", r.exit_code, r.output);
}

}  // namespace

std::optional<int> select_longest_stream(const std::string& ffprobe_csv) {
  std::optional<int> best;
  double best_dur = -2.0;
  std::istringstream in(ffprobe_csv);
  std::string line;
  int ord = 0;
  while (std::getline(in, line)) {
    line = utf8::trim(line);
    if (line.empty()) continue;
    double dur = -1.0;
    const auto comma = line.find(',');
    if (comma != std::string::npos) {
      const std::string field = utf8::trim(line.substr(comma + 1));
      char* end = nullptr;
      const double v = std::strtod(field.c_str(), &end);
      if (!field.empty() && end && *end == '\0') dur = v;
    }
    if (dur > best_dur) {
      best_dur = dur;
      best = ord;
    }
    ++ord;
  }
  return best;
}

void check_base_engine(const EngineSettings& settings) {
  if (settings.whisper_cli.empty()) throw EngineUnavailableError("whisper-cli", "no binary configured");
  if (!find_executable(settings.whisper_cli)) {
    throw EngineUnavailableError("whisper-cli", "binary not found: " + settings.whisper_cli);
  }
  if (settings.whisper_model.empty() || !fs::is_regular_file(settings.whisper_model)) {
    throw EngineUnavailableError("whisper-cli", "model not found: " + settings.whisper_model.string());
  }
}

Availability probe_aligned_runtime(const EngineSettings& settings, const std::atomic<bool>* cancel) {
  if (settings.whisperx.empty() || !find_executable(settings.whisperx)) return Availability::Unavailable;
  ProcessOptions opts;
  opts.timeout_sec = settings.probe_timeout_sec;
  opts.cancel = cancel;
  const ProcessResult r = run_process({settings.whisperx, "--help"}, opts);
  if (r.ok()) return Availability::Available;
  if (r.exit_code == 127 && !r.timed_out && !r.cancelled) return Availability::Unavailable;
  return Availability::Unknown;
}

ProcessEngineBackend::ProcessEngineBackend(EngineSettings settings, const std::atomic<bool>* cancel, Logger log)
    : settings_(std::move(settings)), cancel_(cancel), log_(std::move(log)) {}

ProcessResult ProcessEngineBackend::run(const std::vector<std::string>& argv, double timeout_sec,
                                        const fs::path& cwd,
                                        const std::vector<std::pair<std::string, std::string>>& env) {
  log_.debug("exec: " + describe_command(argv));
  ProcessOptions opts;
  opts.timeout_sec = timeout_sec;
  opts.cancel = cancel_;
  opts.cwd = cwd;
  opts.env = env;
  return run_process(argv, opts);
}

std::optional<int> ProcessEngineBackend::select_audio_stream(const fs::path& media) {
  if (settings_.audio_stream) return settings_.audio_stream;
  if (!settings_.detect_audio_stream) return std::nullopt;
  const ProcessResult r = run({settings_.ffprobe, "-v", "error", "-select_streams", "a", "-show_entries",
                               "stream=index,duration", "-of", "csv=p=0", media.string()},
                              settings_.probe_timeout_sec);
  throw_if_interrupted(r, "ffprobe");
  if (!r.ok() || utf8::trim(r.output).empty()) {
    log_.warn("ffprobe could not list audio streams; using the first audio track");
    return std::nullopt;
  }
  const auto best = select_longest_stream(r.output);
  if (best) log_.info("audio track: 0:a:" + std::to_string(*best));
  return best;
}

void ProcessEngineBackend::extract_audio(const fs::path& media, std::optional<int> stream, const fs::path& wav) {
  std::vector<std::string> cmd = {settings_.ffmpeg, "-y", "-i", media.string(),
                                  "-map", "0:a:" + std::to_string(stream.value_or(0)),
                                  "-vn", "-ac", "1", "-ar", "16000", "-c:a", "pcm_s16le"};
  if (!settings_.audio_filter.empty()) {
    cmd.push_back("-af");
    cmd.push_back(settings_.audio_filter);
  }
  cmd.push_back(wav.string());
  const ProcessResult r = run(cmd, settings_.engine_timeout_sec);
  throw_if_interrupted(r, "ffmpeg");
  if (!r.ok()) throw ProcessError("ffmpeg failed to extract audio:\n" + tail(r.output), r.exit_code, r.output);
}

std::vector<fs::path> ProcessEngineBackend::split_audio(const fs::path& wav, int chunk_seconds,
                                                       const fs::path& out_dir) {
  fs::create_directories(out_dir);
  const ProcessResult r = run({settings_.ffmpeg, "-y", "-i", wav.string(), "-f", "segment", "-segment_time",
                               std::to_string(chunk_seconds), "-reset_timestamps", "1", "-acodec", "pcm_s16le",
                               "-ac", "1", "-ar", "16000", (out_dir / "chunk_%05d.wav").string()},
                              settings_.engine_timeout_sec);
  throw_if_interrupted(r, "ffmpeg split");
  if (!r.ok()) throw ProcessError("ffmpeg failed to split audio:\n" + tail(r.output), r.exit_code, r.output);

  std::vector<fs::path> chunks;
  for (const auto& entry : fs::directory_iterator(out_dir)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("chunk_", 0) == 0 && entry.path().extension() == ".wav") chunks.push_back(entry.path());
  }
  std::sort(chunks.begin(), chunks.end());
  return chunks;
}

std::vector<std::vector<std::string>> ProcessEngineBackend::base_attempts(const fs::path& wav,
                                                                          const std::string& language,
                                                                          bool with_prompt) const {
  const std::string ml = std::to_string(settings_.max_line_len);
  const std::string model = settings_.whisper_model.string();
  std::vector<std::vector<std::string>> attempts = {
      {settings_.whisper_cli, "-m", model, "-f", wav.string(), "-osrt", "-otxt", "-ml", ml},
      {settings_.whisper_cli, "--model", model, "--file", wav.string(), "--output-srt", "--output-txt", "-ml", ml},
      {settings_.whisper_cli, "-m", model, "-osrt", "-otxt", "-ml", ml, wav.string()},
  };
  const char* lang_flags[] = {"-l", "--language", "-l"};
  for (size_t i = 0; i < attempts.size(); ++i) {
    auto& a = attempts[i];
    if (!language.empty() && language != "auto") {
      a.push_back(lang_flags[i]);
      a.push_back(language);
    }
    if (settings_.threads > 0) {
      a.push_back("-t");
      a.push_back(std::to_string(settings_.threads));
    }
    if (with_prompt && !settings_.prompt.empty()) {
      a.push_back("--prompt");
      a.push_back(settings_.prompt);
    }
    a.insert(a.end(), settings_.whisper_extra_args.begin(), settings_.whisper_extra_args.end());
  }
  return attempts;
}

std::string ProcessEngineBackend::run_base_engine(const fs::path& wav, const fs::path& workdir,
                                                  const std::string& language) {
  std::string last_output;
  int last_code = -1;
  const bool has_prompt = !settings_.prompt.empty();
  for (bool with_prompt : {true, false}) {
    if (!with_prompt && !has_prompt) break;
    if (!with_prompt) log_.warn("whisper-cli failed with --prompt; retrying without it");
    for (const auto& cmd : base_attempts(wav, language, with_prompt)) {
      const ProcessResult r = run(cmd, settings_.engine_timeout_sec, workdir);
      throw_if_interrupted(r, "whisper-cli");
      last_output = r.output;
      last_code = r.exit_code;
      if (!r.ok()) {
        log_.debug("whisper-cli attempt exited with " + std::to_string(r.exit_code));
        continue;
      }
      const fs::path srt = fs::path(wav.string() + ".srt");
      if (fs::is_regular_file(srt)) return read_all_text(srt);
      if (const auto latest = pick_latest(workdir, ".srt")) return read_all_text(*latest);
      log_.warn("whisper-cli wrote no .srt; parsing its console output");
      return r.output;
    }
  }
  throw ProcessError("whisper-cli failed:\n" + tail(last_output), last_code, last_output);
}

std::string ProcessEngineBackend::run_aligned_engine(const fs::path& wav, const fs::path& workdir,
                                                     const std::string& language, bool diarize) {
  std::vector<std::string> base = {settings_.whisperx, wav.string(), "--model", settings_.whisperx_model,
                                   "--output_dir", workdir.string(), "--output_format", "json"};
  if (!language.empty() && language != "auto") {
    base.push_back("--language");
    base.push_back(language);
  }
  if (diarize) base.push_back("--diarize");

  std::vector<std::pair<std::string, std::string>> env;
  if (const char* token = std::getenv(settings_.hf_token_env.c_str())) {
    if (*token) env.emplace_back("HF_TOKEN", token);
  }

  std::vector<std::string> fp16 = base;
  fp16.push_back("--compute_type");
  fp16.push_back("float16");

  std::string last_output;
  int last_code = -1;
  for (const auto& cmd : {base, fp16}) {
    const ProcessResult r = run(cmd, settings_.engine_timeout_sec, workdir, env);
    throw_if_interrupted(r, "whisperx");
    last_output = r.output;
    last_code = r.exit_code;
    if (!r.ok()) continue;
    const fs::path expected = workdir / (wav.stem().string() + ".json");
    if (fs::is_regular_file(expected)) return read_all_text(expected);
    if (const auto latest = pick_latest(workdir, ".json")) return read_all_text(*latest);
    throw ProcessError("whisperx produced no JSON output:\n" + tail(r.output), r.exit_code, r.output);
  }
  throw ProcessError("whisperx failed:\n" + tail(last_output), last_code, last_output);
}

Availability ProcessEngineBackend::aligned_availability() {
  std::call_once(probe_once_, [this] {
    aligned_ = probe_aligned_runtime(settings_, cancel_);
    log_.info(std::string("aligned runtime: ") + availability_name(aligned_));
  });
  return aligned_;
}

bool ProcessEngineBackend::hf_token_present() const {
  const char* token = std::getenv(settings_.hf_token_env.c_str());
  return token && *token;
}
