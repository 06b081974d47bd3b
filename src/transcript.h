#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "timing.h"

using SpeakerId = std::string;

struct Word {
  std::optional<TimeInterval> interval;  // absent when alignment failed for this token
  std::string text;
  Confidence confidence;
  std::optional<SpeakerId> speaker;
};

struct Segment {
  TimeInterval interval;
  std::string text;
  std::vector<Word> words;
  std::optional<SpeakerId> speaker;
};

enum class SourceEngine { Base, Aligned };

// How the word timings of a transcript were obtained.
enum class WordTiming {
  None,          // no word-level data
  Measured,      // reported by the aligned engine (gaps interpolated)
  Approximated,  // linear interpolation over segment duration, proportional to word length
  Mixed          // measured where aligned words matched, approximated elsewhere
};

struct Transcript {
  std::string language;
  std::vector<Segment> segments;
  SourceEngine source_engine = SourceEngine::Base;
  bool diarized = false;
  WordTiming word_timing = WordTiming::None;

  size_t word_count() const;
  // Segments plus words: the population the clip ratio is measured against.
  size_t element_count() const { return segments.size() + word_count(); }
};

struct DiarizationTurn {
  TimeInterval interval;
  SpeakerId speaker;
};

const char* source_engine_name(SourceEngine e);
const char* word_timing_name(WordTiming t);

// Space-joined word texts.
std::string join_word_texts(const std::vector<Word>& words);

// Non-fatal consistency report: ordering and overlap of segments and words,
// zero-length intervals, words outside their segment, words that do not
// reconstruct the segment text, words without timing. Empty when clean.
std::vector<std::string> validate_transcript(const Transcript& t);

// True when segments and, within each segment, words never start before the
// previous element ends.
bool is_monotonic(const Transcript& t);
