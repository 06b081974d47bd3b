#include "timing.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "errors.h"
#include "utf8_utils.h"

namespace {

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// "05", "05.440", "05,440"
bool parse_seconds_field(std::string s, double& out) {
  std::replace(s.begin(), s.end(), ',', '.');
  const auto dot = s.find('.');
  const std::string whole = s.substr(0, dot);
  if (!all_digits(whole)) return false;
  if (dot != std::string::npos && !all_digits(s.substr(dot + 1))) return false;
  out = std::strtod(s.c_str(), nullptr);
  return true;
}

bool parse_plain_seconds(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

void split_clock(double sec, int64_t& hh, int64_t& mm, int64_t& ss, int64_t& ms) {
  const int64_t total_ms = to_millis(sec);
  hh = total_ms / 3600000;
  mm = (total_ms / 60000) % 60;
  ss = (total_ms / 1000) % 60;
  ms = total_ms % 1000;
}

}  // namespace

Confidence make_confidence(double raw) {
  if (!std::isfinite(raw)) return std::nullopt;
  return static_cast<float>(std::clamp(raw, 0.0, 1.0));
}

double overlap(const TimeInterval& a, const TimeInterval& b) {
  const double lo = std::max(a.start, b.start);
  const double hi = std::min(a.end, b.end);
  return std::max(0.0, hi - lo);
}

double distance(const TimeInterval& a, const TimeInterval& b) {
  if (a.end < b.start) return b.start - a.end;
  if (b.end < a.start) return a.start - b.end;
  return 0.0;
}

bool try_parse_timestamp(const std::string& text, double& out) {
  const std::string s = utf8::trim(text);
  if (s.find(':') == std::string::npos) return parse_plain_seconds(s, out);

  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    const auto next = s.find(':', pos);
    parts.push_back(s.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  if (parts.size() != 2 && parts.size() != 3) return false;

  double seconds = 0.0;
  if (!parse_seconds_field(parts.back(), seconds)) return false;
  double total = seconds;
  double scale = 60.0;
  for (size_t i = parts.size() - 1; i-- > 0;) {
    if (!all_digits(parts[i])) return false;
    total += std::strtod(parts[i].c_str(), nullptr) * scale;
    scale *= 60.0;
  }
  out = total;
  return true;
}

double parse_timestamp(const std::string& text) {
  double v = 0.0;
  if (!try_parse_timestamp(text, v)) throw ParseError("Invalid timestamp: '" + text + "'");
  return v;
}

int64_t to_millis(double sec) {
  if (!(sec > 0.0)) return 0;
  return static_cast<int64_t>(std::llround(sec * 1000.0));
}

std::string format_srt_time(double sec) {
  int64_t hh, mm, ss, ms;
  split_clock(sec, hh, mm, ss, ms);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", (long long)hh, (long long)mm, (long long)ss,
                (long long)ms);
  return std::string(buf);
}

std::string format_vtt_time(double sec) {
  std::string s = format_srt_time(sec);
  s[s.size() - 4] = '.';
  return s;
}

std::string format_ass_time(double sec) {
  int64_t hh, mm, ss, ms;
  split_clock(sec, hh, mm, ss, ms);
  int64_t cs = (ms + 5) / 10;
  if (cs >= 100) cs = 99;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld.%02lld", (long long)hh, (long long)mm, (long long)ss,
                (long long)cs);
  return std::string(buf);
}
