#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "transcript.h"

struct RevealEntry {
  size_t word_index = 0;
  double reveal_time = 0.0;       // word starts highlighting
  double full_reveal_time = 0.0;  // word fully highlighted
};

struct SegmentReveal {
  size_t segment_index = 0;
  TimeInterval interval;
  std::vector<RevealEntry> reveals;  // word order
};

// Flat reveal schedule in segment order, then word order. Derived purely from
// a synchronized transcript, so identical input gives identical output.
struct KaraokeSchedule {
  std::vector<SegmentReveal> segments;

  size_t reveal_count() const;
};

bool operator==(const RevealEntry& a, const RevealEntry& b);
bool operator==(const SegmentReveal& a, const SegmentReveal& b);
bool operator==(const KaraokeSchedule& a, const KaraokeSchedule& b);

KaraokeSchedule build_karaoke_schedule(const Transcript& t);

// Entries outside their segment, or not strictly increasing inside it.
std::vector<std::string> validate_schedule(const KaraokeSchedule& schedule);
