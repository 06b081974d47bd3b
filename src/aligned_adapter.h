#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "transcript.h"

struct AlignedParseResult {
  Transcript transcript;               // source_engine = Aligned
  std::vector<DiarizationTurn> turns;  // handed to the synchronizer, not kept afterwards
  std::vector<std::string> warnings;
};

// Parse the word-alignment engine's JSON (WhisperX layout).
// Supports: {"segments": [...]}, {"result": {"segments": [...]}} or a bare
// array of segments. Segment fields: start, end, text, speaker, words[].
// Word fields: word|text (required, non-empty), start, end, score, speaker.
// Words without usable start/end keep a null interval; inverted intervals are
// passed through untouched for the synchronizer to repair. Diarization turns
// come from a top-level "diarization" or "speaker_turns" array of
// {start, end, speaker}; when present every word and segment is labelled by
// maximal overlap. Throws ParseError on malformed JSON or layout.
AlignedParseResult parse_aligned_output(const std::string& content, const std::string& language);

AlignedParseResult read_aligned_output(const std::filesystem::path& path, const std::string& language);
