#include "karaoke_ass.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

#include "utf8_utils.h"

namespace {

std::string strip_braces(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c != '{' && c != '}') out.push_back(c);
  }
  return out;
}

std::string to_upper_ascii(std::string s) {
  for (auto& c : s) c = char(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

size_t visible_width(const std::string& tok) {
  std::string visible;
  bool in_tag = false;
  for (char c : tok) {
    if (c == '{') {
      in_tag = true;
    } else if (c == '}' && in_tag) {
      in_tag = false;
    } else if (!in_tag) {
      visible.push_back(c);
    }
  }
  return utf8::codepoint_count(visible);
}

int centiseconds(double seconds) { return int(std::lround(std::max(0.0, seconds) * 100.0)); }

}  // namespace

std::string ass_color_bgr(const std::string& rgb_hex) {
  std::string hex = utf8::trim(rgb_hex);
  if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);
  bool ok = hex.size() == 6;
  for (char c : hex) ok = ok && std::isxdigit(static_cast<unsigned char>(c));
  if (!ok) hex = "FFFFFF";
  return "&H00" + hex.substr(4, 2) + hex.substr(2, 2) + hex.substr(0, 2);
}

std::string build_karaoke_line(const Segment& seg, const SegmentReveal& reveal, const AssStyle& style) {
  std::string out;
  double prev_start = seg.interval.start;
  for (size_t k = 0; k < reveal.reveals.size(); ++k) {
    const auto& e = reveal.reveals[k];
    if (e.word_index >= seg.words.size()) continue;
    int cs = centiseconds(e.reveal_time - prev_start);
    if (k > 0) cs = std::max(cs, 1);
    prev_start = e.reveal_time;

    std::string text = strip_braces(seg.words[e.word_index].text);
    if (style.all_caps) text = to_upper_ascii(text);
    if (!out.empty()) out.push_back(' ');
    out += "{\\k" + std::to_string(cs) + "}" + text;
  }
  return out;
}

std::string wrap_ass_line(const std::string& text, int max_chars, int max_lines) {
  if (max_chars <= 0) return text;
  const size_t mc = size_t(max_chars);

  std::vector<std::string> lines(1);
  std::vector<size_t> widths(1, 0);
  auto append = [&](size_t idx, const std::string& tok, size_t w) {
    if (!lines[idx].empty()) lines[idx].push_back(' ');
    lines[idx] += tok;
    widths[idx] += w + (widths[idx] > 0 ? 1 : 0);
  };

  std::istringstream in(text);
  std::string tok;
  while (std::getline(in, tok, ' ')) {
    if (tok.empty()) continue;
    const size_t w = visible_width(tok);
    const size_t cur = lines.size() - 1;
    const size_t projected = widths[cur] + (widths[cur] > 0 ? 1 : 0) + w;
    if (widths[cur] > 0 && projected > mc) {
      if (max_lines > 0 && lines.size() >= size_t(max_lines)) {
        append(cur, tok, w);
      } else {
        lines.push_back(tok);
        widths.push_back(w);
      }
    } else {
      append(cur, tok, w);
    }
  }

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += "\\N";
    out += lines[i];
  }
  return out;
}

std::string render_ass_karaoke(const Transcript& t, const KaraokeSchedule& schedule, const AssStyle& style) {
  std::ostringstream out;
  out << "[Script Info]\n"
      << "ScriptType: v4.00+\n"
      << "PlayResX: " << style.play_res_x << "\n"
      << "PlayResY: " << style.play_res_y << "\n"
      << "ScaledBorderAndShadow: yes\n"
      << "WrapStyle: 2\n"
      << "\n"
      << "[V4+ Styles]\n"
      << "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, Bold, "
         "Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, "
         "MarginL, MarginR, MarginV, Encoding\n"
      << "Style: Default," << style.font_name << "," << style.font_size << "," << ass_color_bgr(style.highlight_rgb)
      << "," << ass_color_bgr(style.base_rgb) << "," << ass_color_bgr(style.outline_rgb)
      << ",&H00000000,0,0,0,0,100,100,0,0,1," << style.outline << "," << style.shadow << ",2,60,60,"
      << style.margin_v << ",1\n"
      << "\n"
      << "[Events]\n"
      << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n";

  for (const auto& sr : schedule.segments) {
    if (sr.segment_index >= t.segments.size()) continue;
    const auto& seg = t.segments[sr.segment_index];

    std::string text;
    if (!sr.reveals.empty()) {
      text = build_karaoke_line(seg, sr, style);
    } else {
      text = strip_braces(utf8::collapse_whitespace(seg.text));
      if (style.all_caps) text = to_upper_ascii(text);
    }
    if (text.empty()) continue;
    if (style.speaker_prefix && seg.speaker) text = "[" + *seg.speaker + "] " + text;
    if (style.max_chars_per_line > 0) text = wrap_ass_line(text, style.max_chars_per_line, style.max_lines);

    out << "Dialogue: 0," << format_ass_time(sr.interval.start) << "," << format_ass_time(sr.interval.end)
        << ",Default,,0,0,0,," << text << "\n";
  }
  return out.str();
}
