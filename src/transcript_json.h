#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "engine_policy.h"
#include "synchronizer.h"
#include "transcript.h"

// Per-file run metadata written next to the captions.
struct RunMeta {
  std::string input;
  std::string created_at;  // ISO-8601 UTC
  std::string engine_requested;
  EngineDecision decision;
  bool aligned_used = false;  // false when the aligned attempt failed and the run degraded
  std::string fallback_reason;
  double processing_time = 0.0;
};

// {"language", "source_engine", "diarized", "word_timing", "segments": [{start, end, text,
// speaker?, words: [{word, start, end, score?, speaker?}]}]}
nlohmann::json transcript_to_json(const Transcript& t);

std::string format_transcript_json(const Transcript& t);

// Run metadata plus a count of every repair kind applied by the synchronizer.
std::string format_meta_json(const RunMeta& meta, const SyncResult& sync);

std::string utc_timestamp_now();
