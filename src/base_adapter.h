#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "transcript.h"

struct BaseParseResult {
  Transcript transcript;              // source_engine = Base, no words, not diarized
  std::vector<std::string> warnings;  // dropped or clipped segments
};

// Normalize the fast engine's segment output into a Transcript.
// Accepts SRT blocks ("1" / "a --> b" / text...) and whisper.cpp console
// lines ("[a --> b]  text"), timestamps as HH:MM:SS,mmm or fractional
// seconds. Zero-duration, inverted, empty and duplicate segments are dropped
// with a warning. The result is sorted by start and overlaps are clipped at
// the midpoint of the overlapping region.
BaseParseResult parse_base_output(const std::string& content, const std::string& language);

BaseParseResult read_base_output(const std::filesystem::path& path, const std::string& language);

// Shift every segment and word by `seconds` (chunked transcription).
void offset_transcript(Transcript& t, double seconds);

// Concatenate per-chunk transcripts, each shifted by its chunk offset.
Transcript concat_chunks(const std::vector<Transcript>& chunks, double chunk_seconds);
