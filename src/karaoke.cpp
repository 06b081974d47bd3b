#include "karaoke.h"

size_t KaraokeSchedule::reveal_count() const {
  size_t n = 0;
  for (const auto& s : segments) n += s.reveals.size();
  return n;
}

bool operator==(const RevealEntry& a, const RevealEntry& b) {
  return a.word_index == b.word_index && a.reveal_time == b.reveal_time && a.full_reveal_time == b.full_reveal_time;
}

bool operator==(const SegmentReveal& a, const SegmentReveal& b) {
  return a.segment_index == b.segment_index && a.interval == b.interval && a.reveals == b.reveals;
}

bool operator==(const KaraokeSchedule& a, const KaraokeSchedule& b) { return a.segments == b.segments; }

KaraokeSchedule build_karaoke_schedule(const Transcript& t) {
  KaraokeSchedule schedule;
  schedule.segments.reserve(t.segments.size());
  for (size_t i = 0; i < t.segments.size(); ++i) {
    const auto& seg = t.segments[i];
    SegmentReveal sr;
    sr.segment_index = i;
    sr.interval = seg.interval;
    for (size_t j = 0; j < seg.words.size(); ++j) {
      const auto& w = seg.words[j];
      if (!w.interval) continue;  // synchronized transcripts have none
      sr.reveals.push_back({j, w.interval->start, w.interval->end});
    }
    schedule.segments.push_back(std::move(sr));
  }
  return schedule;
}

std::vector<std::string> validate_schedule(const KaraokeSchedule& schedule) {
  std::vector<std::string> issues;
  for (const auto& sr : schedule.segments) {
    for (size_t k = 0; k < sr.reveals.size(); ++k) {
      const auto& e = sr.reveals[k];
      const std::string tag = "segment " + std::to_string(sr.segment_index) + " word " + std::to_string(e.word_index);
      if (e.reveal_time < sr.interval.start || e.full_reveal_time > sr.interval.end) {
        issues.push_back(tag + ": reveal outside segment interval");
      }
      if (e.full_reveal_time < e.reveal_time) issues.push_back(tag + ": full reveal before reveal");
      if (k > 0 && e.reveal_time <= sr.reveals[k - 1].reveal_time) {
        issues.push_back(tag + ": reveal not after previous word");
      }
    }
  }
  return issues;
}
