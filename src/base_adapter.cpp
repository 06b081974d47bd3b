#include "base_adapter.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "utf8_utils.h"

namespace {

struct RawSegment {
  double start = 0.0;
  double end = 0.0;
  std::string text;
  int line = 0;
};

std::string strip_cr(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

// "00:00:01,000 --> 00:00:02,500 X1:40 X2:600" -> both times; trailing cue settings are ignored.
bool parse_arrow_times(const std::string& line, double& start, double& end) {
  const auto arrow = line.find("-->");
  if (arrow == std::string::npos) return false;
  const std::string a = utf8::trim(line.substr(0, arrow));
  const auto rest = utf8::split_words(line.substr(arrow + 3));
  if (rest.empty()) return false;
  return try_parse_timestamp(a, start) && try_parse_timestamp(rest.front(), end);
}

std::string fmt_span(double a, double b) {
  return "[" + format_srt_time(a) + " --> " + format_srt_time(b) + "]";
}

}  // namespace

BaseParseResult parse_base_output(const std::string& raw, const std::string& language) {
  BaseParseResult result;
  result.transcript.language = language;
  result.transcript.source_engine = SourceEngine::Base;

  const std::string content = utf8::strip_bom(raw);
  const std::regex console_re(R"(^\s*\[([^\]]*-->[^\]]*)\]\s*(.*)$)");
  const std::regex score_re(R"(^\{score:\s*-?[\d.]+\}$)");

  std::vector<RawSegment> raw_segments;
  std::stringstream ss(content);
  std::string line;
  int line_no = 0;
  while (std::getline(ss, line)) {
    ++line_no;
    line = strip_cr(line);
    std::smatch m;
    if (std::regex_match(line, m, console_re)) {
      RawSegment seg;
      seg.line = line_no;
      if (!parse_arrow_times(m[1].str(), seg.start, seg.end)) {
        result.warnings.push_back("line " + std::to_string(line_no) + ": unreadable timestamps, segment skipped");
        continue;
      }
      seg.text = utf8::collapse_whitespace(m[2].str());
      raw_segments.push_back(std::move(seg));
      continue;
    }

    if (line.find("-->") == std::string::npos) continue;  // SRT index lines, engine chatter

    RawSegment seg;
    seg.line = line_no;
    const bool times_ok = parse_arrow_times(line, seg.start, seg.end);

    // Text runs until the next blank line (or EOF without trailing newline).
    std::string text;
    while (std::getline(ss, line)) {
      ++line_no;
      line = strip_cr(line);
      if (utf8::trim(line).empty()) break;
      if (std::regex_match(line, score_re)) continue;
      if (!text.empty()) text.push_back(' ');
      text += line;
    }
    if (!times_ok) {
      result.warnings.push_back("line " + std::to_string(seg.line) + ": unreadable timestamps, segment skipped");
      continue;
    }
    seg.text = utf8::collapse_whitespace(text);
    raw_segments.push_back(std::move(seg));
  }

  std::stable_sort(raw_segments.begin(), raw_segments.end(), [](const RawSegment& a, const RawSegment& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
  });

  auto& segs = result.transcript.segments;
  for (const auto& r : raw_segments) {
    const std::string at = "line " + std::to_string(r.line) + " " + fmt_span(r.start, r.end);
    if (r.end < r.start) {
      result.warnings.push_back(at + ": end before start, segment dropped");
      continue;
    }
    if (r.end == r.start) {
      result.warnings.push_back(at + ": zero-duration segment dropped");
      continue;
    }
    if (r.text.empty()) {
      result.warnings.push_back(at + ": empty text, segment dropped");
      continue;
    }
    if (!segs.empty()) {
      const auto& prev = segs.back();
      if (prev.interval.start == r.start && prev.interval.end == r.end && prev.text == r.text) {
        result.warnings.push_back(at + ": duplicate segment dropped");
        continue;
      }
    }

    Segment seg;
    seg.interval = {r.start, r.end};
    seg.text = r.text;

    if (!segs.empty() && seg.interval.start < segs.back().interval.end) {
      auto& prev = segs.back();
      if (seg.interval.end <= prev.interval.end) {
        // Nested cue: the enclosing span already covers it, so only the text moves.
        result.warnings.push_back(at + ": nested inside previous segment, text merged into it");
        prev.text += " " + seg.text;
        continue;
      }
      const double overlap_end = std::min(prev.interval.end, seg.interval.end);
      const double mid = 0.5 * (seg.interval.start + overlap_end);
      result.warnings.push_back(at + ": overlaps previous segment, both clipped at " + format_srt_time(mid));
      prev.interval.end = mid;
      seg.interval.start = mid;
    }
    segs.push_back(std::move(seg));
  }

  return result;
}

BaseParseResult read_base_output(const std::filesystem::path& path, const std::string& language) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open " + path.string());
  std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return parse_base_output(content, language);
}

void offset_transcript(Transcript& t, double seconds) {
  for (auto& seg : t.segments) {
    seg.interval.start += seconds;
    seg.interval.end += seconds;
    for (auto& w : seg.words) {
      if (!w.interval) continue;
      w.interval->start += seconds;
      w.interval->end += seconds;
    }
  }
}

Transcript concat_chunks(const std::vector<Transcript>& chunks, double chunk_seconds) {
  Transcript out;
  if (!chunks.empty()) out.language = chunks.front().language;
  for (size_t i = 0; i < chunks.size(); ++i) {
    Transcript shifted = chunks[i];
    offset_transcript(shifted, double(i) * chunk_seconds);
    for (auto& seg : shifted.segments) out.segments.push_back(std::move(seg));
  }
  return out;
}
