#include "polish.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>
#include <vector>

#include "utf8_utils.h"

namespace {

bool same_speaker(const Segment& a, const Segment& b) { return a.speaker == b.speaker; }

size_t merge_close(std::vector<Segment>& segs, const PolishOptions& o) {
  if (segs.empty()) return 0;
  size_t merged = 0;
  std::vector<Segment> out;
  out.push_back(std::move(segs[0]));
  for (size_t i = 1; i < segs.size(); ++i) {
    auto& prev = out.back();
    auto& seg = segs[i];
    const double gap = seg.interval.start - prev.interval.end;
    const double span = seg.interval.end - prev.interval.start;
    if (gap >= 0.0 && gap <= o.merge_gap_sec && span <= o.max_duration_sec && same_speaker(prev, seg)) {
      prev.interval.end = seg.interval.end;
      prev.text = utf8::collapse_whitespace(prev.text + " " + seg.text);
      for (auto& w : seg.words) prev.words.push_back(std::move(w));
      ++merged;
      continue;
    }
    out.push_back(std::move(seg));
  }
  segs = std::move(out);
  return merged;
}

// Word-bounded parts, each ending at the end of its last word; the final part
// keeps the original end so coverage is unchanged.
std::vector<Segment> split_segment(Segment& seg, const PolishOptions& o) {
  const double dur = seg.interval.duration();
  const size_t n = seg.words.size();
  const size_t parts = std::max<size_t>(2, size_t(std::ceil(dur / o.max_duration_sec)));
  const size_t chunk = std::max<size_t>(1, n / parts);

  std::vector<Segment> out;
  double cursor = seg.interval.start;
  for (size_t k = 0; k < n; k += chunk) {
    const size_t last = std::min(n, k + chunk) - 1;
    Segment part;
    part.speaker = seg.speaker;
    part.words.assign(std::make_move_iterator(seg.words.begin() + std::ptrdiff_t(k)),
                      std::make_move_iterator(seg.words.begin() + std::ptrdiff_t(last + 1)));
    part.text = join_word_texts(part.words);
    double end = seg.interval.end;
    if (last + 1 < n) {
      const auto& tail = part.words.back().interval;
      const double share = cursor + (seg.interval.end - cursor) * double(last + 1 - k) / double(n - k);
      end = std::clamp(tail ? tail->end : share, cursor, seg.interval.end);
    }
    part.interval = {cursor, end};
    cursor = end;
    out.push_back(std::move(part));
  }
  return out;
}

size_t split_long(std::vector<Segment>& segs, const PolishOptions& o) {
  size_t split = 0;
  std::vector<Segment> out;
  for (auto& seg : segs) {
    if (seg.interval.duration() > o.max_duration_sec && seg.words.size() >= 4) {
      for (auto& part : split_segment(seg, o)) out.push_back(std::move(part));
      ++split;
      continue;
    }
    out.push_back(std::move(seg));
  }
  segs = std::move(out);
  return split;
}

size_t extend_short(std::vector<Segment>& segs, const PolishOptions& o) {
  size_t extended = 0;
  for (size_t i = 0; i < segs.size(); ++i) {
    auto& seg = segs[i];
    double wanted = std::max(seg.interval.duration(), o.min_duration_sec);
    if (o.max_cps > 0.0) {
      const double reading = double(utf8::codepoint_count(seg.text)) / o.max_cps;
      wanted = std::max(wanted, std::min(reading, o.max_duration_sec));
    }
    double end = seg.interval.start + wanted;
    if (i + 1 < segs.size()) end = std::min(end, segs[i + 1].interval.start);
    if (end > seg.interval.end) {
      seg.interval.end = end;
      ++extended;
    }
  }
  return extended;
}

}  // namespace

PolishReport polish_transcript(Transcript& t, const PolishOptions& options) {
  PolishReport report;
  if (!options.enabled) return report;
  report.merged = merge_close(t.segments, options);
  report.split = split_long(t.segments, options);
  report.extended = extend_short(t.segments, options);
  return report;
}
