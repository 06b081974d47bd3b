#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "logger.h"
#include "transcript.h"

struct SyncOptions {
  double alignment_slack_sec = 0.25;  // ε: drift tolerated when matching aligned words to base segments
  bool approximation_enabled = true;  // synthesize words for segments the aligned engine did not cover
  double clip_fatal_ratio = 0.20;     // clipped / (segments + words) above this throws DesyncError
  size_t clip_warn_count = 1;         // log a warning once this many elements were clipped
};

enum class RepairKind {
  ApproximatedWords,     // words synthesized by proportional interpolation
  TextReplaced,          // base text replaced by the aligned wording
  OrphanSegment,         // aligned words with no base segment became a new segment
  InterpolatedInterval,  // word with no timing placed between its neighbours
  InvertedInterval,      // end < start collapsed to [start, start]
  ClampedToSegment,      // word interval pulled inside its segment
  MonotonicClip,         // start moved forward to the previous element's end
  SpeakerInherited       // speaker taken from the nearest turn or labelled word
};

const char* repair_kind_name(RepairKind k);

struct RepairAction {
  RepairKind kind = RepairKind::MonotonicClip;
  size_t segment = 0;           // index in the output transcript at the time of the repair
  std::optional<size_t> word;   // word index inside that segment, when the repair targets a word
  std::string detail;
};

struct SyncResult {
  Transcript transcript;
  std::vector<RepairAction> repairs;
  size_t clipped_count = 0;  // inverted intervals + monotonic clips
  size_t element_count = 0;  // segments + words of the output

  double clip_ratio() const { return element_count ? double(clipped_count) / double(element_count) : 0.0; }
  size_t count(RepairKind k) const;
};

// Words for a segment by linear interpolation: the duration is split in
// proportion to each word's character count, first word starting at the
// segment start and the last ending at the segment end.
std::vector<Word> approximate_words(const Segment& seg);

// Merge the base transcript with an optional aligned one into a single
// ordered, non-overlapping transcript. Base segments keep their boundaries;
// aligned words supply wording and word timing. Throws DesyncError when the
// clip ratio exceeds options.clip_fatal_ratio.
SyncResult synchronize(const Transcript& base, const Transcript* aligned, const std::vector<DiarizationTurn>& turns,
                       const SyncOptions& options, Logger& log);
