#include "transcript.h"

#include <sstream>

#include "utf8_utils.h"

namespace {

std::string where(size_t seg, size_t word) {
  std::ostringstream ss;
  ss << "segment " << seg << " word " << word;
  return ss.str();
}

}  // namespace

size_t Transcript::word_count() const {
  size_t n = 0;
  for (const auto& s : segments) n += s.words.size();
  return n;
}

const char* source_engine_name(SourceEngine e) {
  switch (e) {
    case SourceEngine::Base:
      return "base";
    case SourceEngine::Aligned:
      return "aligned";
  }
  return "base";
}

const char* word_timing_name(WordTiming t) {
  switch (t) {
    case WordTiming::None:
      return "none";
    case WordTiming::Measured:
      return "measured";
    case WordTiming::Approximated:
      return "approximated";
    case WordTiming::Mixed:
      return "mixed";
  }
  return "none";
}

std::string join_word_texts(const std::vector<Word>& words) {
  std::string out;
  for (const auto& w : words) {
    const std::string t = utf8::trim(w.text);
    if (t.empty()) continue;
    if (!out.empty()) out.push_back(' ');
    out += t;
  }
  return out;
}

std::vector<std::string> validate_transcript(const Transcript& t) {
  std::vector<std::string> issues;
  for (size_t i = 0; i < t.segments.size(); ++i) {
    const auto& seg = t.segments[i];
    const std::string tag = "segment " + std::to_string(i);
    if (seg.interval.is_inverted()) issues.push_back(tag + ": end before start");
    if (seg.interval.is_zero_length()) issues.push_back(tag + ": zero-length interval");
    if (i > 0 && seg.interval.start < t.segments[i - 1].interval.end) {
      issues.push_back(tag + ": overlaps previous segment");
    }
    if (i > 0 && seg.interval.start < t.segments[i - 1].interval.start) {
      issues.push_back(tag + ": out of order");
    }
    if (!seg.words.empty() &&
        utf8::collapse_whitespace(join_word_texts(seg.words)) != utf8::collapse_whitespace(seg.text)) {
      issues.push_back(tag + ": words do not reconstruct segment text");
    }

    double prev_end = seg.interval.start;
    for (size_t j = 0; j < seg.words.size(); ++j) {
      const auto& w = seg.words[j];
      if (utf8::trim(w.text).empty()) issues.push_back(where(i, j) + ": empty text");
      if (!w.interval) {
        issues.push_back(where(i, j) + ": missing interval");
        continue;
      }
      const auto& iv = *w.interval;
      if (iv.is_inverted()) issues.push_back(where(i, j) + ": end before start");
      if (iv.is_zero_length()) issues.push_back(where(i, j) + ": zero-length interval");
      if (iv.start < seg.interval.start || iv.end > seg.interval.end) {
        issues.push_back(where(i, j) + ": outside segment interval");
      }
      if (iv.start < prev_end) issues.push_back(where(i, j) + ": overlaps previous word");
      prev_end = iv.end;
    }
  }
  return issues;
}

bool is_monotonic(const Transcript& t) {
  double prev_seg_end = 0.0;
  bool first = true;
  for (const auto& seg : t.segments) {
    if (seg.interval.is_inverted()) return false;
    if (!first && seg.interval.start < prev_seg_end) return false;
    first = false;
    prev_seg_end = seg.interval.end;

    double prev_word_end = seg.interval.start;
    for (const auto& w : seg.words) {
      if (!w.interval) return false;
      if (w.interval->is_inverted() || w.interval->start < prev_word_end) return false;
      prev_word_end = w.interval->end;
    }
  }
  return true;
}
