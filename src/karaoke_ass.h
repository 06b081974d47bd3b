#pragma once

#include <string>

#include "karaoke.h"
#include "transcript.h"

struct AssStyle {
  std::string font_name = "Arial";
  int font_size = 48;
  std::string highlight_rgb = "FFFF00";  // sung part (PrimaryColour)
  std::string base_rgb = "FFFFFF";       // not yet sung (SecondaryColour)
  std::string outline_rgb = "000000";
  int outline = 3;
  int shadow = 2;
  int margin_v = 50;
  int play_res_x = 1920;
  int play_res_y = 1080;
  int max_chars_per_line = 0;  // 0 = no wrapping
  int max_lines = 0;           // 0 = unlimited
  bool all_caps = false;
  bool speaker_prefix = false;
};

// "RRGGBB" -> "&H00BBGGRR"; malformed input becomes white.
std::string ass_color_bgr(const std::string& rgb_hex);

// Dialogue text for one segment: "{\kN}word" per reveal, where N is the
// centisecond delay since the previous reveal (first word: since the segment
// start; later words at least 1cs so highlights stay strictly ordered).
std::string build_karaoke_line(const Segment& seg, const SegmentReveal& reveal, const AssStyle& style);

// Insert \N breaks so that no line exceeds max_chars visible characters
// (override blocks do not count). Extra lines fold into the last one when
// max_lines is reached.
std::string wrap_ass_line(const std::string& text, int max_chars, int max_lines);

std::string render_ass_karaoke(const Transcript& t, const KaraokeSchedule& schedule, const AssStyle& style);
