#include "diarization.h"

#include <limits>
#include <string>

namespace {

constexpr double kTieEps = 1e-9;

TimeInterval word_span(const Word& w, const Segment& seg) { return w.interval ? *w.interval : seg.interval; }

std::optional<size_t> pick_turn(const TimeInterval& iv, const std::vector<DiarizationTurn>& turns) {
  if (auto best = best_overlap_turn(iv, turns)) return best;
  return nearest_turn(iv, turns);
}

}  // namespace

std::optional<size_t> best_overlap_turn(const TimeInterval& iv, const std::vector<DiarizationTurn>& turns) {
  std::optional<size_t> best;
  double best_ov = 0.0;
  for (size_t i = 0; i < turns.size(); ++i) {
    const double ov = overlap(iv, turns[i].interval);
    if (ov <= 0.0) continue;
    if (!best || ov > best_ov + kTieEps ||
        (ov > best_ov - kTieEps && turns[i].interval.start < turns[*best].interval.start)) {
      best = i;
      best_ov = ov;
    }
  }
  return best;
}

std::optional<size_t> nearest_turn(const TimeInterval& iv, const std::vector<DiarizationTurn>& turns) {
  std::optional<size_t> best;
  double best_d = std::numeric_limits<double>::infinity();
  bool best_precedes = false;
  for (size_t i = 0; i < turns.size(); ++i) {
    const double d = distance(iv, turns[i].interval);
    const bool precedes = turns[i].interval.start < iv.start;
    if (!best || d < best_d - kTieEps || (d < best_d + kTieEps && precedes && !best_precedes)) {
      best = i;
      best_d = d;
      best_precedes = precedes;
    }
  }
  return best;
}

void assign_speakers(Transcript& t, const std::vector<DiarizationTurn>& turns) {
  if (turns.empty()) return;
  t.diarized = true;
  for (auto& seg : t.segments) {
    if (auto i = best_overlap_turn(seg.interval, turns)) seg.speaker = turns[*i].speaker;
    for (auto& w : seg.words) {
      if (!w.interval || w.interval->is_inverted()) continue;
      TimeInterval iv = *w.interval;
      auto i = best_overlap_turn(iv, turns);
      // Zero-length words still sit inside a turn.
      if (!i && iv.is_zero_length()) {
        for (size_t k = 0; k < turns.size(); ++k) {
          if (turns[k].interval.contains(iv.start)) {
            i = k;
            break;
          }
        }
      }
      if (i) w.speaker = turns[*i].speaker;
    }
  }
}

std::vector<std::pair<size_t, size_t>> fill_missing_speakers(Transcript& t,
                                                              const std::vector<DiarizationTurn>& turns) {
  std::vector<std::pair<size_t, size_t>> filled;

  if (!turns.empty()) {
    for (size_t s = 0; s < t.segments.size(); ++s) {
      auto& seg = t.segments[s];
      for (size_t j = 0; j < seg.words.size(); ++j) {
        auto& w = seg.words[j];
        if (w.speaker) continue;
        if (auto i = pick_turn(word_span(w, seg), turns)) {
          w.speaker = turns[*i].speaker;
          filled.emplace_back(s, j);
        }
      }
      if (!seg.speaker) {
        if (auto i = pick_turn(seg.interval, turns)) seg.speaker = turns[*i].speaker;
      }
    }
    return filled;
  }

  // No turns: labels came with the words themselves.
  std::vector<std::pair<size_t, size_t>> order;
  for (size_t s = 0; s < t.segments.size(); ++s) {
    for (size_t j = 0; j < t.segments[s].words.size(); ++j) order.emplace_back(s, j);
  }
  auto at = [&t](const std::pair<size_t, size_t>& p) -> Word& { return t.segments[p.first].words[p.second]; };

  std::vector<std::optional<SpeakerId>> snapshot;
  snapshot.reserve(order.size());
  for (const auto& p : order) snapshot.push_back(at(p).speaker);

  for (size_t k = 0; k < order.size(); ++k) {
    if (snapshot[k]) continue;
    std::optional<SpeakerId> pick;
    for (size_t d = 1; d < order.size() && !pick; ++d) {
      if (k >= d && snapshot[k - d]) pick = snapshot[k - d];
      else if (k + d < order.size() && snapshot[k + d]) pick = snapshot[k + d];
    }
    if (!pick) break;  // nothing labelled anywhere
    at(order[k]).speaker = pick;
    filled.push_back(order[k]);
  }
  for (auto& seg : t.segments) {
    if (!seg.speaker) seg.speaker = majority_speaker(seg.words);
  }
  return filled;
}

std::vector<std::pair<size_t, size_t>> check_speaker_completeness(const Transcript& t) {
  std::vector<std::pair<size_t, size_t>> missing;
  for (size_t s = 0; s < t.segments.size(); ++s) {
    const auto& words = t.segments[s].words;
    for (size_t j = 0; j < words.size(); ++j) {
      if (!words[j].speaker) missing.emplace_back(s, j);
    }
  }
  return missing;
}

std::optional<SpeakerId> majority_speaker(const std::vector<Word>& words) {
  struct Tally {
    SpeakerId speaker;
    double seconds = 0.0;
    size_t count = 0;
  };
  std::vector<Tally> tallies;
  for (const auto& w : words) {
    if (!w.speaker) continue;
    auto it = tallies.begin();
    while (it != tallies.end() && it->speaker != *w.speaker) ++it;
    if (it == tallies.end()) {
      tallies.push_back({*w.speaker, 0.0, 0});
      it = tallies.end() - 1;
    }
    if (w.interval && !w.interval->is_inverted()) it->seconds += w.interval->duration();
    it->count++;
  }
  if (tallies.empty()) return std::nullopt;
  const Tally* best = &tallies.front();
  for (const auto& tl : tallies) {
    if (tl.seconds > best->seconds + kTieEps ||
        (tl.seconds > best->seconds - kTieEps && tl.count > best->count)) {
      best = &tl;
    }
  }
  return best->speaker;
}
