#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "transcript.h"

// Turn with the largest overlap with `iv`; ties go to the earliest-starting
// turn. nullopt when nothing overlaps.
std::optional<size_t> best_overlap_turn(const TimeInterval& iv, const std::vector<DiarizationTurn>& turns);

// Turn closest to `iv` by gap; ties go to the preceding turn.
std::optional<size_t> nearest_turn(const TimeInterval& iv, const std::vector<DiarizationTurn>& turns);

// Label timed words and segments by maximal overlap. Untimed words and spans
// that overlap no turn are left unlabelled. Sets `diarized` when turns exist.
void assign_speakers(Transcript& t, const std::vector<DiarizationTurn>& turns);

// Give every unlabelled word (and segment) a speaker: nearest turn when turns
// are known, otherwise the nearest labelled word in reading order (preceding
// first). Returns (segment, word) positions that were filled.
std::vector<std::pair<size_t, size_t>> fill_missing_speakers(Transcript& t,
                                                              const std::vector<DiarizationTurn>& turns);

// Positions of words without a speaker. Empty for a complete diarized transcript.
std::vector<std::pair<size_t, size_t>> check_speaker_completeness(const Transcript& t);

// Speaker covering most of the segment's timed words (by duration, then count).
std::optional<SpeakerId> majority_speaker(const std::vector<Word>& words);
