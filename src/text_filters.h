#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "transcript.h"

// Ordered source -> replacement pairs, applied in file order.
using Glossary = std::vector<std::pair<std::string, std::string>>;

// "key=value" lines ('#' comments and blank lines ignored) or, for *.json, a
// flat object of strings. Throws std::runtime_error if the file cannot be
// read and ParseError on malformed JSON.
Glossary load_glossary(const std::filesystem::path& path);
Glossary parse_glossary_text(const std::string& content);
Glossary parse_glossary_json(const std::string& content);

// Replaces whole-word occurrences only: a match must not be glued to a
// letter, digit or underscore on either side.
std::string apply_glossary(const std::string& text, const Glossary& glossary);

// E-mail -> [EMAIL], phone -> [TEL], CPF -> [CPF], CNPJ -> [CNPJ].
std::string redact_pii(const std::string& text);

// Byte range [begin, end) of a filter hit and the text that replaces it.
struct TextMatch {
  size_t begin = 0;
  size_t end = 0;
  std::string replacement;
};

// Glossary entries in order, then the PII patterns when redact is set.
struct TextFilters {
  Glossary glossary;
  bool redact = false;

  bool empty() const { return glossary.empty() && !redact; }
  size_t step_count() const;
  // Non-overlapping hits of one step, in text order.
  std::vector<TextMatch> find_matches(const std::string& text, size_t step) const;
  std::string apply(const std::string& text) const;
};

// Matches run over the space-joined words of each segment, so a phrase or a
// number split across several words is still found. The words a hit touches
// are merged into one word carrying the replacement, spanning their
// intervals, with the lowest confidence and the first word's speaker. A word
// left empty is dropped. Segment text is rebuilt from the words; segments
// without words are filtered as plain text.
void apply_text_filters(Transcript& t, const TextFilters& filters);
