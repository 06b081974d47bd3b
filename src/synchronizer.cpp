#include "synchronizer.h"

#include <algorithm>
#include <sstream>

#include "diarization.h"
#include "errors.h"
#include "utf8_utils.h"

namespace {

// Aligned word waiting to be placed, with the time used to match it.
struct PendingWord {
  Word word;
  size_t src_segment = 0;
  double match_time = 0.0;
  bool inverted = false;
};

// Output segment under construction.
struct WorkSegment {
  Segment seg;
  bool measured = false;  // words came from the aligned engine
  bool orphan = false;
  std::string base_text;  // text before the aligned wording replaced it
  std::vector<bool> inverted;
};

std::string span_str(const TimeInterval& iv) {
  std::ostringstream ss;
  ss.precision(3);
  ss << std::fixed << "[" << iv.start << ", " << iv.end << "]";
  return ss.str();
}

void add_repair(SyncResult& r, RepairKind kind, size_t seg, std::optional<size_t> word, std::string detail) {
  r.repairs.push_back({kind, seg, word, std::move(detail)});
}

std::vector<PendingWord> flatten_aligned(const Transcript& aligned) {
  std::vector<PendingWord> out;
  for (size_t si = 0; si < aligned.segments.size(); ++si) {
    const auto& seg = aligned.segments[si];
    const size_t first = out.size();
    for (const auto& w : seg.words) {
      PendingWord p;
      p.word = w;
      p.src_segment = si;
      if (p.word.interval && p.word.interval->is_inverted()) {
        p.word.interval->end = p.word.interval->start;
        p.inverted = true;
      }
      if (p.word.interval) p.match_time = p.word.interval->midpoint();
      out.push_back(std::move(p));
    }

    // Untimed words travel with their nearest timed neighbour in the same segment.
    for (size_t k = first; k < out.size(); ++k) {
      if (out[k].word.interval) continue;
      std::optional<double> t;
      for (size_t b = k; b-- > first && !t;) {
        if (out[b].word.interval) t = out[b].match_time;
      }
      for (size_t n = k + 1; n < out.size() && !t; ++n) {
        if (out[n].word.interval) t = out[n].match_time;
      }
      out[k].match_time = t ? *t : seg.interval.midpoint();
    }
  }
  return out;
}

// Base segment whose slack window [start - eps, end + eps] holds t; the
// closest one (earliest on ties) when windows of neighbours overlap.
std::optional<size_t> match_segment(const std::vector<WorkSegment>& segs, double t, double eps) {
  auto it = std::lower_bound(segs.begin(), segs.end(), t,
                             [eps](const WorkSegment& s, double v) { return s.seg.interval.end + eps < v; });
  std::optional<size_t> best;
  double best_d = 0.0;
  for (; it != segs.end() && it->seg.interval.start - eps <= t; ++it) {
    const double d = distance(it->seg.interval, TimeInterval{t, t});
    if (!best || d < best_d) {
      best = size_t(it - segs.begin());
      best_d = d;
    }
  }
  return best;
}

WorkSegment make_orphan(std::vector<Word> words, const TimeInterval& fallback, std::vector<bool> inverted) {
  WorkSegment ws;
  ws.orphan = true;
  ws.measured = true;
  std::optional<TimeInterval> span;
  for (const auto& w : words) {
    if (!w.interval) continue;
    if (!span) {
      span = *w.interval;
    } else {
      span->start = std::min(span->start, w.interval->start);
      span->end = std::max(span->end, w.interval->end);
    }
  }
  ws.seg.interval = span ? *span : fallback;
  ws.seg.words = std::move(words);
  ws.seg.text = join_word_texts(ws.seg.words);
  ws.seg.speaker = majority_speaker(ws.seg.words);
  ws.inverted = std::move(inverted);
  return ws;
}

// Fill runs of untimed words evenly between the known bounds around them.
size_t interpolate_missing(Segment& seg, size_t seg_index, SyncResult& r) {
  size_t filled = 0;
  auto& words = seg.words;
  size_t k = 0;
  while (k < words.size()) {
    if (words[k].interval) {
      ++k;
      continue;
    }
    size_t n = k;
    while (n < words.size() && !words[n].interval) ++n;
    const double lo = k > 0 ? words[k - 1].interval->end : seg.interval.start;
    double hi = n < words.size() ? words[n].interval->start : seg.interval.end;
    hi = std::max(hi, lo);
    const double step = (hi - lo) / double(n - k);
    for (size_t j = k; j < n; ++j) {
      const double a = lo + step * double(j - k);
      const double b = (j + 1 == n) ? hi : lo + step * double(j - k + 1);
      words[j].interval = TimeInterval{a, b};
      add_repair(r, RepairKind::InterpolatedInterval, seg_index, j,
                 "'" + words[j].text + "' placed at " + span_str(*words[j].interval));
      ++filled;
    }
    k = n;
  }
  return filled;
}

size_t clamp_into_segment(Segment& seg, size_t seg_index, SyncResult& r) {
  size_t clamped = 0;
  for (size_t j = 0; j < seg.words.size(); ++j) {
    auto& w = seg.words[j];
    if (!w.interval) continue;
    const TimeInterval before = *w.interval;
    if (before.start >= seg.interval.start && before.end <= seg.interval.end) continue;
    w.interval->start = std::clamp(before.start, seg.interval.start, seg.interval.end);
    w.interval->end = std::clamp(before.end, w.interval->start, seg.interval.end);
    add_repair(r, RepairKind::ClampedToSegment, seg_index, j,
               "'" + w.text + "' " + span_str(before) + " -> " + span_str(*w.interval));
    ++clamped;
  }
  return clamped;
}

}  // namespace

const char* repair_kind_name(RepairKind k) {
  switch (k) {
    case RepairKind::ApproximatedWords:
      return "approximated_words";
    case RepairKind::TextReplaced:
      return "text_replaced";
    case RepairKind::OrphanSegment:
      return "orphan_segment";
    case RepairKind::InterpolatedInterval:
      return "interpolated_interval";
    case RepairKind::InvertedInterval:
      return "inverted_interval";
    case RepairKind::ClampedToSegment:
      return "clamped_to_segment";
    case RepairKind::MonotonicClip:
      return "monotonic_clip";
    case RepairKind::SpeakerInherited:
      return "speaker_inherited";
  }
  return "unknown";
}

size_t SyncResult::count(RepairKind k) const {
  return size_t(std::count_if(repairs.begin(), repairs.end(), [k](const RepairAction& a) { return a.kind == k; }));
}

std::vector<Word> approximate_words(const Segment& seg) {
  const auto pieces = utf8::split_words(seg.text);
  std::vector<Word> words;
  if (pieces.empty()) return words;

  std::vector<double> lengths;
  double total = 0.0;
  for (const auto& p : pieces) {
    lengths.push_back(double(std::max<size_t>(1, utf8::codepoint_count(p))));
    total += lengths.back();
  }

  const double start = seg.interval.start;
  const double dur = std::max(0.0, seg.interval.duration());
  double cum = 0.0;
  for (size_t i = 0; i < pieces.size(); ++i) {
    Word w;
    w.text = pieces[i];
    const double a = start + dur * cum / total;
    cum += lengths[i];
    const double b = (i + 1 == pieces.size()) ? seg.interval.end : start + dur * cum / total;
    w.interval = TimeInterval{a, b};
    w.speaker = seg.speaker;
    words.push_back(std::move(w));
  }
  return words;
}

SyncResult synchronize(const Transcript& base, const Transcript* aligned, const std::vector<DiarizationTurn>& turns,
                       const SyncOptions& options, Logger& log) {
  SyncResult r;
  Transcript& out = r.transcript;
  out.language = base.language;
  if (out.language.empty() && aligned) out.language = aligned->language;
  out.source_engine = aligned ? SourceEngine::Aligned : SourceEngine::Base;
  out.diarized = aligned && aligned->diarized;

  std::vector<WorkSegment> work;
  work.reserve(base.segments.size());
  for (const auto& s : base.segments) {
    WorkSegment ws;
    ws.seg.interval = s.interval;
    ws.seg.text = s.text;
    ws.seg.speaker = s.speaker;
    ws.base_text = s.text;
    work.push_back(std::move(ws));
  }

  size_t orphan_count = 0;
  if (aligned) {
    std::vector<PendingWord> pending = flatten_aligned(*aligned);
    std::vector<std::vector<size_t>> assigned(work.size());
    std::vector<std::optional<size_t>> target(pending.size());
    for (size_t k = 0; k < pending.size(); ++k) {
      target[k] = match_segment(work, pending[k].match_time, options.alignment_slack_sec);
      if (target[k]) assigned[*target[k]].push_back(k);
    }

    for (size_t i = 0; i < work.size(); ++i) {
      if (assigned[i].empty()) continue;
      auto& ws = work[i];
      ws.measured = true;
      for (size_t k : assigned[i]) {
        ws.seg.words.push_back(pending[k].word);
        ws.inverted.push_back(pending[k].inverted);
      }
      ws.seg.text = join_word_texts(ws.seg.words);
    }

    // Consecutive unmatched words of one aligned segment form one new segment.
    std::vector<WorkSegment> orphans;
    size_t k = 0;
    while (k < pending.size()) {
      if (target[k]) {
        ++k;
        continue;
      }
      const size_t src = pending[k].src_segment;
      std::vector<Word> words;
      std::vector<bool> inverted;
      while (k < pending.size() && !target[k] && pending[k].src_segment == src) {
        words.push_back(pending[k].word);
        inverted.push_back(pending[k].inverted);
        ++k;
      }
      orphans.push_back(make_orphan(std::move(words), aligned->segments[src].interval, std::move(inverted)));
    }
    orphan_count = orphans.size();
    for (auto& o : orphans) work.push_back(std::move(o));
    std::stable_sort(work.begin(), work.end(), [](const WorkSegment& a, const WorkSegment& b) {
      return a.seg.interval.start < b.seg.interval.start;
    });
  }

  // Segment-level monotonicity: never move a start backwards.
  double prev_end = 0.0;
  for (size_t i = 0; i < work.size(); ++i) {
    auto& iv = work[i].seg.interval;
    if (i > 0 && iv.start < prev_end) {
      const TimeInterval before = iv;
      iv.start = prev_end;
      if (iv.end < iv.start) iv.end = iv.start;
      r.clipped_count++;
      add_repair(r, RepairKind::MonotonicClip, i, std::nullopt, "segment " + span_str(before) + " -> " + span_str(iv));
    }
    prev_end = i > 0 ? std::max(prev_end, iv.end) : iv.end;
  }

  size_t approximated = 0;
  size_t measured = 0;
  size_t interpolated = 0;
  size_t clamped = 0;
  for (size_t i = 0; i < work.size(); ++i) {
    auto& ws = work[i];
    auto& seg = ws.seg;

    if (!ws.measured) {
      if (options.approximation_enabled) {
        seg.words = approximate_words(seg);
        if (!seg.words.empty()) {
          ++approximated;
          add_repair(r, RepairKind::ApproximatedWords, i, std::nullopt,
                     aligned ? "no aligned words matched; word timing interpolated"
                             : "no aligned data; word timing interpolated");
        }
      }
      continue;
    }

    ++measured;
    if (ws.orphan) {
      add_repair(r, RepairKind::OrphanSegment, i, std::nullopt,
                 "aligned words missed by the base engine at " + span_str(seg.interval) + ": '" + seg.text + "'");
    } else if (utf8::collapse_whitespace(ws.base_text) != seg.text) {
      add_repair(r, RepairKind::TextReplaced, i, std::nullopt, "'" + ws.base_text + "' -> '" + seg.text + "'");
    }
    for (size_t j = 0; j < ws.inverted.size(); ++j) {
      if (!ws.inverted[j]) continue;
      r.clipped_count++;
      add_repair(r, RepairKind::InvertedInterval, i, j,
                 "'" + seg.words[j].text + "' end before start, collapsed to " + span_str(*seg.words[j].interval));
    }
    clamped += clamp_into_segment(seg, i, r);
    interpolated += interpolate_missing(seg, i, r);

    if (out.diarized && !ws.orphan) {
      if (auto t = best_overlap_turn(seg.interval, turns)) {
        seg.speaker = turns[*t].speaker;
      } else if (auto m = majority_speaker(seg.words)) {
        seg.speaker = m;
      }
    }
  }

  // Word-level monotonicity inside each segment.
  // A word already counted as inverted is not counted again.
  for (size_t i = 0; i < work.size(); ++i) {
    auto& seg = work[i].seg;
    const auto& inverted = work[i].inverted;
    double prev = seg.interval.start;
    for (size_t j = 0; j < seg.words.size(); ++j) {
      auto& iv = *seg.words[j].interval;
      if (iv.start < prev) {
        const TimeInterval before = iv;
        iv.start = std::min(prev, seg.interval.end);
        if (j >= inverted.size() || !inverted[j]) r.clipped_count++;
        add_repair(r, RepairKind::MonotonicClip, i, j,
                   "'" + seg.words[j].text + "' " + span_str(before) + " -> start " + span_str(iv));
      }
      iv.start = std::min(iv.start, seg.interval.end);
      iv.end = std::clamp(iv.end, iv.start, seg.interval.end);
      prev = iv.end;
    }
  }

  for (auto& ws : work) out.segments.push_back(std::move(ws.seg));

  if (measured && approximated) {
    out.word_timing = WordTiming::Mixed;
  } else if (measured) {
    out.word_timing = WordTiming::Measured;
  } else if (approximated) {
    out.word_timing = WordTiming::Approximated;
  }

  if (out.diarized) {
    for (const auto& pos : fill_missing_speakers(out, turns)) {
      add_repair(r, RepairKind::SpeakerInherited, pos.first, pos.second,
                 "speaker " + *out.segments[pos.first].words[pos.second].speaker);
    }
    const auto missing = check_speaker_completeness(out);
    if (!missing.empty()) {
      log.warn(std::to_string(missing.size()) + " words have no speaker and no turn to inherit from; "
               "continuing without diarization");
      out.diarized = false;
    }
  }

  r.element_count = out.element_count();

  if (approximated) {
    log.warn("word timing approximated (linear, proportional to word length) for " + std::to_string(approximated) +
             " of " + std::to_string(out.segments.size()) + " segments");
  }
  if (orphan_count) {
    log.warn(std::to_string(orphan_count) + " segments synthesized from aligned words the base engine missed");
  }
  if (interpolated) log.warn(std::to_string(interpolated) + " words without alignment timing were interpolated");
  if (clamped) log.info(std::to_string(clamped) + " word intervals clamped into their segment");
  for (const auto& a : r.repairs) {
    log.debug(std::string(repair_kind_name(a.kind)) + " @ segment " + std::to_string(a.segment) +
              (a.word ? " word " + std::to_string(*a.word) : std::string()) + ": " + a.detail);
  }

  std::ostringstream ratio;
  ratio.precision(1);
  ratio << std::fixed << (100.0 * r.clip_ratio()) << "%";
  if (r.clipped_count > 0 && r.clip_ratio() > options.clip_fatal_ratio) {
    const std::string msg = "timing desynchronized: clipped " + std::to_string(r.clipped_count) + " of " +
                            std::to_string(r.element_count) + " elements (" + ratio.str() + ")";
    log.error(msg);
    throw DesyncError(msg, r.clip_ratio());
  }
  if (r.clipped_count > 0 && r.clipped_count >= options.clip_warn_count) {
    log.warn("clipped " + std::to_string(r.clipped_count) + " of " + std::to_string(r.element_count) +
             " elements to keep timing monotonic (" + ratio.str() + ")");
  }

  log.info(std::string("synchronized ") + std::to_string(out.segments.size()) + " segments, " +
           std::to_string(out.word_count()) + " words (source " + source_engine_name(out.source_engine) +
           ", word timing " + word_timing_name(out.word_timing) + ")");
  return r;
}
