#include "pipeline.h"

#include <chrono>
#include <random>
#include <system_error>

#include "aligned_adapter.h"
#include "base_adapter.h"
#include "errors.h"

namespace fs = std::filesystem;

namespace {

bool cancelled(const std::atomic<bool>* cancel) { return cancel && cancel->load(); }

void log_warnings(Logger& log, const std::string& source, const std::vector<std::string>& warnings) {
  for (const auto& w : warnings) log.warn(source + ": " + w);
}

BaseParseResult run_base(const fs::path& wav, const fs::path& workdir, const PipelineConfig& config,
                         EngineBackend& backend, Logger& log, std::string& raw) {
  if (config.chunk_seconds <= 0) {
    raw = backend.run_base_engine(wav, workdir, config.language);
    return parse_base_output(raw, config.language);
  }

  const auto chunks = backend.split_audio(wav, config.chunk_seconds, workdir / "chunks");
  log.info("split into " + std::to_string(chunks.size()) + " chunks of " + std::to_string(config.chunk_seconds) +
           "s");
  BaseParseResult merged;
  std::vector<Transcript> parts;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const std::string out = backend.run_base_engine(chunks[i], workdir / "chunks", config.language);
    raw += out;
    auto part = parse_base_output(out, config.language);
    for (auto& w : part.warnings) merged.warnings.push_back("chunk " + std::to_string(i) + ": " + w);
    parts.push_back(std::move(part.transcript));
  }
  merged.transcript = concat_chunks(parts, double(config.chunk_seconds));
  merged.transcript.language = config.language;
  return merged;
}

}  // namespace

SyncOptions PipelineConfig::sync_options() const {
  SyncOptions o;
  o.alignment_slack_sec = alignment_slack_sec;
  o.approximation_enabled = approximation_enabled;
  o.clip_fatal_ratio = clip_fatal_ratio;
  o.clip_warn_count = clip_warn_count;
  return o;
}

TempDir::TempDir(const std::string& prefix) {
  std::random_device rd;
  std::mt19937_64 rng(rd());
  const fs::path base = fs::temp_directory_path();
  for (int attempt = 0; attempt < 16; ++attempt) {
    const fs::path candidate = base / (prefix + "-" + std::to_string(rng() % 1000000000ULL));
    std::error_code ec;
    if (fs::create_directory(candidate, ec)) {
      path_ = candidate;
      return;
    }
  }
  throw std::runtime_error("Failed to create temporary directory under " + base.string());
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

TranscribeOutcome transcribe_media(const fs::path& media, const PipelineConfig& config, const OutputOptions& output,
                                   EngineBackend& backend, Logger& log, const std::atomic<bool>* cancel) {
  TempDir tmp;
  TranscribeOutcome outcome;

  const auto stream = backend.select_audio_stream(media);
  const fs::path wav = tmp.path() / (media.stem().string() + ".wav");
  backend.extract_audio(media, stream, wav);

  BaseParseResult base = run_base(wav, tmp.path(), config, backend, log, outcome.base_raw);
  log_warnings(log, "base", base.warnings);
  log.info("base engine: " + std::to_string(base.transcript.segments.size()) + " segments");
  if (base.transcript.segments.empty()) log.warn("base engine produced no segments");

  EngineInputs inputs;
  inputs.requested_engine = config.engine_request;
  inputs.diarize_requested = config.diarize_request;
  inputs.hf_token_present = backend.hf_token_present();
  inputs.aligned_runtime =
      config.engine_request == EngineRequest::BaseOnly ? Availability::Unknown : backend.aligned_availability();
  outcome.decision = select_engines(inputs);
  log.info("engine: " + outcome.decision.reason);

  std::optional<AlignedParseResult> aligned;
  if (outcome.decision.use_aligned) {
    try {
      outcome.aligned_raw =
          backend.run_aligned_engine(wav, tmp.path(), config.language, outcome.decision.use_diarization);
      AlignedParseResult parsed = parse_aligned_output(outcome.aligned_raw, config.language);
      log_warnings(log, "aligned", parsed.warnings);
      aligned = std::move(parsed);
      outcome.aligned_used = true;
    } catch (const std::exception& e) {
      if (cancelled(cancel)) throw;
      if (outcome.decision.aligned_failure_fatal) throw EngineUnavailableError("whisperx", e.what());
      outcome.fallback_reason = e.what();
      log.warn(std::string("aligned engine unavailable (") + e.what() +
               "); falling back to approximated word timing");
    }
  }
  if (outcome.decision.use_diarization && outcome.aligned_used && aligned->turns.empty() &&
      !aligned->transcript.diarized) {
    log.warn("diarization requested but the aligned engine returned no speaker labels");
  }

  const Transcript* aligned_ptr = aligned ? &aligned->transcript : nullptr;
  static const std::vector<DiarizationTurn> kNoTurns;
  const auto& turns = aligned ? aligned->turns : kNoTurns;
  outcome.sync = synchronize(base.transcript, aligned_ptr, turns, config.sync_options(), log);
  apply_text_filters(outcome.sync.transcript, config.filters);
  if (config.filters.redact) {
    // Raw engine output still carries the unredacted text.
    if (output.keep_engine_output) log.warn("PII redaction is on; raw engine output is not kept");
    outcome.base_raw.clear();
    outcome.aligned_raw.clear();
  }

  if (config.polish.enabled) {
    const PolishReport pr = polish_transcript(outcome.sync.transcript, config.polish);
    log.info("polish: " + std::to_string(pr.merged) + " merged, " + std::to_string(pr.split) + " split, " +
             std::to_string(pr.extended) + " extended");
  }

  for (const auto& issue : validate_transcript(outcome.sync.transcript)) log.debug("transcript: " + issue);

  if (output.karaoke) {
    outcome.schedule = build_karaoke_schedule(outcome.sync.transcript);
    for (const auto& issue : validate_schedule(*outcome.schedule)) log.warn("karaoke: " + issue);
  }
  return outcome;
}

std::vector<fs::path> planned_outputs(const std::string& stem, const OutputOptions& output) {
  std::vector<fs::path> out;
  auto add = [&](bool wanted, const std::string& suffix) {
    if (wanted) out.push_back(output.output_dir / (stem + suffix));
  };
  add(output.srt, ".srt");
  add(output.vtt, ".vtt");
  add(output.timestamped_txt, ".transcript.timestamps.txt");
  add(output.plain_txt, ".plain.txt");
  add(output.segments_json, ".segments.json");
  add(output.karaoke, ".karaoke.ass");
  add(output.meta_json, ".meta.json");
  return out;
}

std::vector<fs::path> write_outputs(const std::string& stem, const TranscribeOutcome& outcome, const RunMeta& meta,
                                    const OutputOptions& output) {
  fs::create_directories(output.output_dir);
  std::vector<fs::path> written;
  auto emit = [&](const std::string& suffix, const std::string& content) {
    const fs::path path = output.output_dir / (stem + suffix);
    write_text_file(path, content);
    written.push_back(path);
  };

  const Transcript& t = outcome.sync.transcript;
  if (output.srt) emit(".srt", render_srt(t, output.captions));
  if (output.vtt) emit(".vtt", render_vtt(t, output.captions));
  if (output.timestamped_txt) emit(".transcript.timestamps.txt", render_timestamped_text(t));
  if (output.plain_txt) emit(".plain.txt", render_plain_text(t));
  if (output.segments_json) emit(".segments.json", format_transcript_json(t));
  if (output.karaoke && outcome.schedule) emit(".karaoke.ass", render_ass_karaoke(t, *outcome.schedule, output.ass));
  if (output.keep_engine_output) {
    if (!outcome.base_raw.empty()) emit(".base.srt", outcome.base_raw);
    if (!outcome.aligned_raw.empty()) emit(".whisperx.json", outcome.aligned_raw);
  }
  if (output.meta_json) emit(".meta.json", format_meta_json(meta, outcome.sync));
  return written;
}

FileResult process_file(const fs::path& media, const PipelineConfig& config, const OutputOptions& output,
                        EngineBackend& backend, Logger& log, const std::atomic<bool>* cancel) {
  FileResult result;
  result.media = media;
  const auto started = std::chrono::steady_clock::now();
  auto elapsed = [&] {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  };

  try {
    log.info("processing " + media.string());
    TranscribeOutcome outcome = transcribe_media(media, config, output, backend, log, cancel);

    RunMeta meta;
    meta.input = media.string();
    meta.created_at = utc_timestamp_now();
    meta.engine_requested = engine_request_name(config.engine_request);
    meta.decision = outcome.decision;
    meta.aligned_used = outcome.aligned_used;
    meta.fallback_reason = outcome.fallback_reason;
    meta.processing_time = elapsed();

    result.outputs = write_outputs(media.stem().string(), outcome, meta, output);
    result.ok = true;
    log.info("done in " + std::to_string(meta.processing_time) + "s, " + std::to_string(result.outputs.size()) +
             " files written");
  } catch (const EngineUnavailableError& e) {
    result.error = e.what();
    log.error("engine unavailable: " + result.error);
  } catch (const DesyncError& e) {
    result.error = e.what();
    log.error("desync: " + result.error);
  } catch (const ProcessError& e) {
    result.error = e.what();
    log.error("process failed (exit " + std::to_string(e.exit_code()) + "): " + result.error);
  } catch (const std::exception& e) {
    result.error = e.what();
    log.error(result.error);
  }
  result.cancelled = !result.ok && cancelled(cancel);
  result.elapsed_sec = elapsed();
  return result;
}
