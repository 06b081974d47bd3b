#include "aligned_adapter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "diarization.h"
#include "errors.h"
#include "utf8_utils.h"

using json = nlohmann::json;

namespace {

std::string read_all_text(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

// Numbers, or numeric strings; anything else counts as missing.
std::optional<double> number_field(const json& obj, const char* key) {
  if (!obj.contains(key)) return std::nullopt;
  const auto& v = obj[key];
  if (v.is_number()) return v.get<double>();
  if (v.is_string()) {
    double out = 0.0;
    if (try_parse_timestamp(v.get<std::string>(), out)) return out;
  }
  return std::nullopt;
}

std::optional<std::string> string_field(const json& obj, const char* key) {
  if (!obj.contains(key) || !obj[key].is_string()) return std::nullopt;
  return obj[key].get<std::string>();
}

const json* find_segments(const json& j) {
  if (j.is_array()) return &j;
  if (!j.is_object()) return nullptr;
  if (j.contains("segments") && j["segments"].is_array()) return &j["segments"];
  if (j.contains("result") && j["result"].is_object()) {
    const auto& r = j["result"];
    if (r.contains("segments") && r["segments"].is_array()) return &r["segments"];
  }
  return nullptr;
}

std::vector<DiarizationTurn> parse_turns(const json& j, std::vector<std::string>& warnings) {
  std::vector<DiarizationTurn> turns;
  if (!j.is_object()) return turns;
  const json* arr = nullptr;
  for (const char* key : {"diarization", "speaker_turns"}) {
    if (j.contains(key) && j[key].is_array()) {
      arr = &j[key];
      break;
    }
  }
  if (!arr) return turns;

  for (size_t i = 0; i < arr->size(); ++i) {
    const auto& t = (*arr)[i];
    if (!t.is_object()) continue;
    const auto st = number_field(t, "start");
    const auto en = number_field(t, "end");
    const auto spk = string_field(t, "speaker");
    if (!st || !en || !spk || spk->empty() || *en < *st) {
      warnings.push_back("diarization turn " + std::to_string(i) + " unusable, skipped");
      continue;
    }
    turns.push_back({{*st, *en}, *spk});
  }
  std::stable_sort(turns.begin(), turns.end(), [](const DiarizationTurn& a, const DiarizationTurn& b) {
    return a.interval.start < b.interval.start;
  });
  return turns;
}

Word parse_word(const json& w) {
  Word word;
  auto text = string_field(w, "word");
  if (!text) text = string_field(w, "text");
  word.text = text ? utf8::trim(*text) : std::string();

  const auto st = number_field(w, "start");
  const auto en = number_field(w, "end");
  if (st && en) word.interval = TimeInterval{*st, *en};

  if (const auto score = number_field(w, "score")) word.confidence = make_confidence(*score);
  if (const auto spk = string_field(w, "speaker"); spk && !spk->empty()) word.speaker = *spk;
  return word;
}

}  // namespace

AlignedParseResult parse_aligned_output(const std::string& content, const std::string& language) {
  json j;
  try {
    j = json::parse(utf8::strip_bom(content));
  } catch (const json::parse_error& e) {
    throw ParseError(std::string("aligned output is not valid JSON: ") + e.what());
  }

  const json* segs = find_segments(j);
  if (!segs) throw ParseError("aligned output has no 'segments' array");

  AlignedParseResult result;
  auto& t = result.transcript;
  t.language = language;
  if (j.is_object()) {
    if (const auto lang = string_field(j, "language"); lang && !lang->empty()) t.language = *lang;
  }
  t.source_engine = SourceEngine::Aligned;
  t.word_timing = WordTiming::Measured;
  result.turns = parse_turns(j, result.warnings);

  bool labelled = false;
  for (size_t si = 0; si < segs->size(); ++si) {
    const auto& s = (*segs)[si];
    if (!s.is_object()) {
      result.warnings.push_back("segment " + std::to_string(si) + " is not an object, skipped");
      continue;
    }

    Segment seg;
    if (s.contains("words") && s["words"].is_array()) {
      for (const auto& w : s["words"]) {
        if (!w.is_object()) continue;
        Word word = parse_word(w);
        if (word.text.empty()) continue;
        if (word.speaker) labelled = true;
        seg.words.push_back(std::move(word));
      }
    }
    if (seg.words.empty()) {
      result.warnings.push_back("segment " + std::to_string(si) + " has no words, skipped");
      continue;
    }

    // Segment span covers its own bounds and every timed word.
    std::optional<double> lo = number_field(s, "start");
    std::optional<double> hi = number_field(s, "end");
    for (const auto& w : seg.words) {
      if (!w.interval) continue;
      const double ws = std::min(w.interval->start, w.interval->end);
      const double we = std::max(w.interval->start, w.interval->end);
      lo = lo ? std::min(*lo, ws) : ws;
      hi = hi ? std::max(*hi, we) : we;
    }
    if (!lo || !hi) {
      result.warnings.push_back("segment " + std::to_string(si) + " has no timing at all, skipped");
      continue;
    }
    seg.interval = {*lo, std::max(*lo, *hi)};
    seg.text = join_word_texts(seg.words);
    if (const auto spk = string_field(s, "speaker"); spk && !spk->empty()) {
      seg.speaker = *spk;
      labelled = true;
    }
    t.segments.push_back(std::move(seg));
  }

  std::stable_sort(t.segments.begin(), t.segments.end(), [](const Segment& a, const Segment& b) {
    return a.interval.start < b.interval.start;
  });

  if (!result.turns.empty()) {
    assign_speakers(t, result.turns);
  } else if (labelled) {
    t.diarized = true;
  }
  return result;
}

AlignedParseResult read_aligned_output(const std::filesystem::path& path, const std::string& language) {
  return parse_aligned_output(read_all_text(path), language);
}
