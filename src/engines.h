#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine_policy.h"
#include "logger.h"
#include "process.h"

struct EngineSettings {
  std::string ffmpeg = "ffmpeg";
  std::string ffprobe = "ffprobe";
  std::string audio_filter;           // ffmpeg -af value, empty = none
  std::optional<int> audio_stream;    // explicit track, skips the probe
  bool detect_audio_stream = true;

  std::string whisper_cli;            // required
  std::filesystem::path whisper_model;  // required
  int threads = 0;                    // 0 = engine default
  int max_line_len = 60;
  std::string prompt;
  std::vector<std::string> whisper_extra_args;

  std::string whisperx = "whisperx";
  std::string whisperx_model = "medium";
  std::string hf_token_env = "HUGGINGFACE_HUB_TOKEN";

  double engine_timeout_sec = 0.0;  // per engine invocation, 0 = none
  double probe_timeout_sec = 20.0;
};

// Every external collaborator the pipeline talks to. The pipeline only sees
// this interface; tests substitute an in-process fake.
class EngineBackend {
 public:
  virtual ~EngineBackend() = default;

  // Audio-relative index (ffmpeg "0:a:N") of the track to transcribe.
  virtual std::optional<int> select_audio_stream(const std::filesystem::path& media) = 0;
  // Mono 16 kHz PCM WAV.
  virtual void extract_audio(const std::filesystem::path& media, std::optional<int> stream,
                             const std::filesystem::path& wav) = 0;
  virtual std::vector<std::filesystem::path> split_audio(const std::filesystem::path& wav, int chunk_seconds,
                                                         const std::filesystem::path& out_dir) = 0;
  // Raw segment output of the fast engine (SRT or console lines).
  virtual std::string run_base_engine(const std::filesystem::path& wav, const std::filesystem::path& workdir,
                                      const std::string& language) = 0;
  // Raw JSON of the word-alignment engine.
  virtual std::string run_aligned_engine(const std::filesystem::path& wav, const std::filesystem::path& workdir,
                                         const std::string& language, bool diarize) = 0;
  virtual Availability aligned_availability() = 0;
  virtual bool hf_token_present() const = 0;
};

class ProcessEngineBackend : public EngineBackend {
 public:
  ProcessEngineBackend(EngineSettings settings, const std::atomic<bool>* cancel, Logger log);

  std::optional<int> select_audio_stream(const std::filesystem::path& media) override;
  void extract_audio(const std::filesystem::path& media, std::optional<int> stream,
                     const std::filesystem::path& wav) override;
  std::vector<std::filesystem::path> split_audio(const std::filesystem::path& wav, int chunk_seconds,
                                                 const std::filesystem::path& out_dir) override;
  std::string run_base_engine(const std::filesystem::path& wav, const std::filesystem::path& workdir,
                              const std::string& language) override;
  std::string run_aligned_engine(const std::filesystem::path& wav, const std::filesystem::path& workdir,
                                 const std::string& language, bool diarize) override;
  // Probed once, on first use.
  Availability aligned_availability() override;
  bool hf_token_present() const override;

 private:
  ProcessResult run(const std::vector<std::string>& argv, double timeout_sec,
                    const std::filesystem::path& cwd = {},
                    const std::vector<std::pair<std::string, std::string>>& env = {});
  std::vector<std::vector<std::string>> base_attempts(const std::filesystem::path& wav, const std::string& language,
                                                      bool with_prompt) const;

  EngineSettings settings_;
  const std::atomic<bool>* cancel_;
  Logger log_;
  std::once_flag probe_once_;
  Availability aligned_ = Availability::Unknown;
};

// Index of the longest stream in ffprobe "index,duration" CSV output, counted
// among the listed (audio) streams. Unparseable durations rank lowest; ties
// keep the first. nullopt when there are no lines.
std::optional<int> select_longest_stream(const std::string& ffprobe_csv);

// Throws EngineUnavailableError when the base engine binary or its model is
// missing. Called once before any file is processed.
void check_base_engine(const EngineSettings& settings);

// "--help" probe: exit 0 -> Available, not found -> Unavailable, anything
// else (timeout, odd exit code) -> Unknown.
Availability probe_aligned_runtime(const EngineSettings& settings, const std::atomic<bool>* cancel);
