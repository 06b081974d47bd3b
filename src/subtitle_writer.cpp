#include "subtitle_writer.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "utf8_utils.h"

namespace {

size_t width(const std::string& s) { return utf8::codepoint_count(s); }

std::vector<std::string> greedy_lines(const std::vector<std::string>& words, size_t max_chars) {
  std::vector<std::string> lines;
  std::string cur;
  for (const auto& w : words) {
    if (cur.empty()) {
      cur = w;
    } else if (width(cur) + 1 + width(w) <= max_chars) {
      cur += " " + w;
    } else {
      lines.push_back(cur);
      cur = w;
    }
  }
  if (!cur.empty()) lines.push_back(cur);
  return lines;
}

// Lines past max_lines fold into the last one so no words are lost.
std::string join_lines(const std::vector<std::string>& lines, size_t max_lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out.push_back(i < max_lines ? '\n' : ' ');
    out += lines[i];
  }
  return out;
}

std::string caption_text(const Segment& seg, const CaptionOptions& opts) {
  std::string text = utf8::collapse_whitespace(seg.text);
  if (opts.speaker_prefix && seg.speaker) text = "[" + *seg.speaker + "] " + text;
  if (opts.wrap && opts.max_chars_per_line > 0 && opts.max_lines > 0) {
    text = wrap_text(text, opts.max_chars_per_line, opts.max_lines);
  }
  return text;
}

}  // namespace

std::string wrap_text(const std::string& text, int max_chars, int max_lines) {
  const auto words = utf8::split_words(text);
  if (words.empty()) return "";
  if (max_chars <= 0 || max_lines <= 0) return utf8::collapse_whitespace(text);
  const size_t mc = size_t(max_chars);
  const size_t ml = size_t(max_lines);

  std::vector<std::string> lines = greedy_lines(words, mc);
  if (lines.size() > ml) {
    const size_t chunk = std::max<size_t>(1, words.size() / ml);
    lines.clear();
    size_t i = 0;
    for (size_t l = 0; l + 1 < ml && i < words.size(); ++l) {
      std::string part;
      for (size_t k = 0; k < chunk && i < words.size(); ++k, ++i) {
        if (!part.empty()) part.push_back(' ');
        part += words[i];
      }
      lines.push_back(part);
    }
    std::string rest;
    for (; i < words.size(); ++i) {
      if (!rest.empty()) rest.push_back(' ');
      rest += words[i];
    }
    if (!rest.empty()) lines.push_back(rest);
  }

  std::vector<std::string> final_lines;
  for (const auto& ln : lines) {
    if (width(ln) <= mc) {
      final_lines.push_back(ln);
      continue;
    }
    for (auto& piece : greedy_lines(utf8::split_words(ln), mc)) final_lines.push_back(std::move(piece));
  }
  return join_lines(final_lines, ml);
}

std::string render_srt(const Transcript& t, const CaptionOptions& opts) {
  std::ostringstream out;
  int index = 0;
  for (const auto& seg : t.segments) {
    const std::string text = caption_text(seg, opts);
    if (text.empty()) continue;
    if (index) out << "\n";
    out << ++index << "\n";
    out << format_srt_time(seg.interval.start) << " --> " << format_srt_time(seg.interval.end) << "\n";
    out << text << "\n";
  }
  return out.str();
}

std::string render_vtt(const Transcript& t, const CaptionOptions& opts) {
  std::ostringstream out;
  out << "WEBVTT\n";
  for (const auto& seg : t.segments) {
    const std::string text = caption_text(seg, opts);
    if (text.empty()) continue;
    out << "\n";
    out << format_vtt_time(seg.interval.start) << " --> " << format_vtt_time(seg.interval.end) << "\n";
    out << text << "\n";
  }
  return out.str();
}

std::string render_timestamped_text(const Transcript& t) {
  std::ostringstream out;
  for (const auto& seg : t.segments) {
    const std::string text = utf8::collapse_whitespace(seg.text);
    if (text.empty()) continue;
    out << format_srt_time(seg.interval.start) << " --> " << format_srt_time(seg.interval.end) << " | " << text
        << "\n";
  }
  return out.str();
}

std::string render_plain_text(const Transcript& t) {
  std::ostringstream out;
  for (const auto& seg : t.segments) {
    const std::string text = utf8::collapse_whitespace(seg.text);
    if (!text.empty()) out << text << "\n";
  }
  return out.str();
}

void write_text_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) throw std::runtime_error("Failed to write " + path.string());
  f << content;
  if (!f) throw std::runtime_error("Failed to write " + path.string());
}
