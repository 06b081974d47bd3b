#pragma once

#include <filesystem>
#include <string>

#include "transcript.h"

struct CaptionOptions {
  bool wrap = true;
  int max_chars_per_line = 42;
  int max_lines = 2;
  bool speaker_prefix = false;  // "[SPEAKER_00] text"
};

// Greedy word wrap on codepoint counts. When more than max_lines result, the
// words are redistributed evenly over max_lines; overlong lines are re-wrapped
// and anything past max_lines is appended to the last line.
std::string wrap_text(const std::string& text, int max_chars, int max_lines);

std::string render_srt(const Transcript& t, const CaptionOptions& opts = CaptionOptions());
std::string render_vtt(const Transcript& t, const CaptionOptions& opts = CaptionOptions());

// "HH:MM:SS,mmm --> HH:MM:SS,mmm | text" per segment.
std::string render_timestamped_text(const Transcript& t);

// One line of text per segment.
std::string render_plain_text(const Transcript& t);

void write_text_file(const std::filesystem::path& path, const std::string& content);
