#pragma once

#include <cstddef>

#include "transcript.h"

// Reading-comfort adjustments for caption segments. Off unless requested.
struct PolishOptions {
  bool enabled = false;
  double max_cps = 17.0;          // characters per second a viewer can read
  double min_duration_sec = 0.7;  // shorter cues are extended
  double max_duration_sec = 7.0;  // longer cues are split at word boundaries
  double merge_gap_sec = 0.2;     // neighbours closer than this are merged
};

struct PolishReport {
  size_t merged = 0;
  size_t extended = 0;
  size_t split = 0;
};

// Merges close neighbours (same speaker, result not longer than
// max_duration_sec), splits overlong segments of four or more words into
// contiguous parts at word boundaries, then extends short or fast cues up to
// the next segment's start. Segments stay ordered and non-overlapping and
// every word stays inside its segment; time covered before polishing stays
// covered.
PolishReport polish_transcript(Transcript& t, const PolishOptions& options);
