#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "engine_policy.h"
#include "engines.h"
#include "karaoke.h"
#include "karaoke_ass.h"
#include "logger.h"
#include "polish.h"
#include "subtitle_writer.h"
#include "synchronizer.h"
#include "text_filters.h"
#include "transcript_json.h"

// Everything the core consumes for one media file.
struct PipelineConfig {
  std::string language = "auto";
  EngineRequest engine_request = EngineRequest::Auto;
  DiarizeRequest diarize_request = DiarizeRequest::Auto;
  double alignment_slack_sec = 0.25;
  bool approximation_enabled = true;
  double clip_fatal_ratio = 0.20;
  size_t clip_warn_count = 1;
  int chunk_seconds = 0;  // 0 = transcribe the whole file at once
  TextFilters filters;
  PolishOptions polish;

  SyncOptions sync_options() const;
};

struct OutputOptions {
  std::filesystem::path output_dir = "output";
  bool srt = true;
  bool vtt = false;
  bool timestamped_txt = true;
  bool plain_txt = true;
  bool segments_json = true;
  bool meta_json = true;
  bool karaoke = false;
  bool keep_engine_output = false;  // raw engine output as <stem>.base.srt / <stem>.whisperx.json
  CaptionOptions captions;
  AssStyle ass;
};

struct TranscribeOutcome {
  SyncResult sync;
  std::optional<KaraokeSchedule> schedule;
  EngineDecision decision;
  bool aligned_used = false;
  std::string fallback_reason;
  std::string base_raw;
  std::string aligned_raw;
};

struct FileResult {
  std::filesystem::path media;
  bool ok = false;
  std::string error;
  std::vector<std::filesystem::path> outputs;
  double elapsed_sec = 0.0;
  bool unchanged = false;  // skipped: outputs from an earlier identical run are current
  bool cancelled = false;  // failed because the run was interrupted
};

// Scratch directory removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix = "capsync");
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Track selection, base engine, engine policy, optional aligned engine,
// synchronization, text filters, polishing and the karaoke schedule. Throws on fatal
// errors. With PII redaction on, the raw engine output is discarded.
TranscribeOutcome transcribe_media(const std::filesystem::path& media, const PipelineConfig& config,
                                   const OutputOptions& output, EngineBackend& backend, Logger& log,
                                   const std::atomic<bool>* cancel = nullptr);

// Rendered outputs write_outputs produces for `stem`, raw engine output
// excluded.
std::vector<std::filesystem::path> planned_outputs(const std::string& stem, const OutputOptions& output);

// Renders every requested format for `stem` into output.output_dir.
std::vector<std::filesystem::path> write_outputs(const std::string& stem, const TranscribeOutcome& outcome,
                                                 const RunMeta& meta, const OutputOptions& output);

// transcribe_media + write_outputs with every error captured in the result.
FileResult process_file(const std::filesystem::path& media, const PipelineConfig& config,
                        const OutputOptions& output, EngineBackend& backend, Logger& log,
                        const std::atomic<bool>* cancel = nullptr);
