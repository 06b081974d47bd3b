#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Closed time span in seconds. end >= start once a transcript has been
// synchronized; adapters may hand over raw (inverted) spans.
struct TimeInterval {
  double start = 0.0;
  double end = 0.0;

  double duration() const { return end - start; }
  double midpoint() const { return 0.5 * (start + end); }
  bool is_zero_length() const { return end == start; }
  bool is_inverted() const { return end < start; }
  bool contains(double t) const { return t >= start && t <= end; }
};

inline bool operator==(const TimeInterval& a, const TimeInterval& b) {
  return a.start == b.start && a.end == b.end;
}
inline bool operator!=(const TimeInterval& a, const TimeInterval& b) { return !(a == b); }

// Recognition confidence in [0,1]; absent when the engine reports none.
using Confidence = std::optional<float>;

Confidence make_confidence(double raw);

// Length of the shared part of two spans (0 when disjoint).
double overlap(const TimeInterval& a, const TimeInterval& b);

// Gap between two spans (0 when they touch or overlap).
double distance(const TimeInterval& a, const TimeInterval& b);

// Accepts "HH:MM:SS,mmm", "HH:MM:SS.mmm", "MM:SS.mmm" and plain fractional
// seconds ("12.5"). Throws ParseError on anything else.
double parse_timestamp(const std::string& text);
bool try_parse_timestamp(const std::string& text, double& out);

int64_t to_millis(double sec);

std::string format_srt_time(double sec);  // HH:MM:SS,mmm
std::string format_vtt_time(double sec);  // HH:MM:SS.mmm
std::string format_ass_time(double sec);  // H:MM:SS.cc
