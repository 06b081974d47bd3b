#include "text_filters.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "utf8_utils.h"

namespace {

std::string read_all_text(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open glossary: " + path.string());
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

// Non-ASCII bytes count as word characters so accented letters are not
// treated as boundaries.
bool is_word_byte(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u >= 0x80 || std::isalnum(u) || c == '_';
}

std::vector<TextMatch> whole_word_matches(const std::string& text, const std::string& from, const std::string& to) {
  std::vector<TextMatch> out;
  if (from.empty()) return out;
  size_t pos = 0;
  while (true) {
    const size_t hit = text.find(from, pos);
    if (hit == std::string::npos) break;
    const size_t after = hit + from.size();
    const bool left_ok = hit == 0 || !is_word_byte(text[hit - 1]) || !is_word_byte(from.front());
    const bool right_ok = after >= text.size() || !is_word_byte(text[after]) || !is_word_byte(from.back());
    if (left_ok && right_ok) {
      out.push_back({hit, after, to});
      pos = after;
    } else {
      pos = hit + 1;
    }
  }
  return out;
}

std::vector<TextMatch> regex_matches(const std::string& text, const std::regex& re, const std::string& label) {
  std::vector<TextMatch> out;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
    const auto& m = *it;
    if (m.length(0) == 0) continue;
    out.push_back({size_t(m.position(0)), size_t(m.position(0) + m.length(0)), label});
  }
  return out;
}

const std::regex& email_re() {
  static const std::regex re(R"(\b[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}\b)", std::regex::icase);
  return re;
}
const std::regex& phone_re() {
  static const std::regex re(R"((?:(?:\+?55)\s*)?(?:\(?\d{2}\)?\s*)?\d{4,5}[-\s]?\d{4}\b)");
  return re;
}
const std::regex& cpf_re() {
  static const std::regex re(R"(\b\d{3}\.?\d{3}\.?\d{3}-?\d{2}\b)");
  return re;
}
const std::regex& cnpj_re() {
  static const std::regex re(R"(\b\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}\b)");
  return re;
}

// Applied in order; each step sees the output of the previous one.
const std::vector<std::pair<std::regex, std::string>>& pii_steps() {
  static const std::vector<std::pair<std::regex, std::string>> steps = {
      {email_re(), "[EMAIL]"}, {phone_re(), "[TEL]"}, {cpf_re(), "[CPF]"}, {cnpj_re(), "[CNPJ]"}};
  return steps;
}

std::string replace_matches(const std::string& text, const std::vector<TextMatch>& matches) {
  std::string out;
  size_t pos = 0;
  for (const auto& m : matches) {
    out.append(text, pos, m.begin - pos);
    out += m.replacement;
    pos = m.end;
  }
  out.append(text, pos, std::string::npos);
  return out;
}

void replace_word_matches(std::vector<Word>& words, const std::vector<TextMatch>& matches) {
  if (matches.empty()) return;
  // Byte span of each word inside the space-joined text.
  std::vector<size_t> begins, ends;
  size_t pos = 0;
  for (const auto& w : words) {
    begins.push_back(pos);
    ends.push_back(pos + w.text.size());
    pos += w.text.size() + 1;
  }

  // Back to front: earlier offsets stay valid while later words are merged.
  for (auto m = matches.rbegin(); m != matches.rend(); ++m) {
    size_t first = 0;
    while (first < words.size() && ends[first] <= m->begin) ++first;
    if (first == words.size()) continue;
    size_t last = first;
    while (last + 1 < words.size() && begins[last + 1] < m->end) ++last;

    const size_t head = m->begin > begins[first] ? m->begin - begins[first] : 0;
    const size_t tail = m->end > begins[last] ? m->end - begins[last] : 0;
    Word merged = words[first];
    merged.text = words[first].text.substr(0, head) + m->replacement +
                  (tail < words[last].text.size() ? words[last].text.substr(tail) : std::string());
    for (size_t k = first + 1; k <= last; ++k) {
      const auto& w = words[k];
      if (w.interval) {
        merged.interval = merged.interval ? TimeInterval{std::min(merged.interval->start, w.interval->start),
                                                         std::max(merged.interval->end, w.interval->end)}
                                          : *w.interval;
      }
      if (w.confidence && (!merged.confidence || *w.confidence < *merged.confidence)) merged.confidence = w.confidence;
    }
    merged.text = utf8::trim(merged.text);

    words.erase(words.begin() + std::ptrdiff_t(first + 1), words.begin() + std::ptrdiff_t(last + 1));
    if (merged.text.empty()) {
      words.erase(words.begin() + std::ptrdiff_t(first));
    } else {
      words[first] = std::move(merged);
    }
  }
}

}  // namespace

Glossary parse_glossary_text(const std::string& content) {
  Glossary g;
  std::istringstream in(utf8::strip_bom(content));
  std::string line;
  while (std::getline(in, line)) {
    line = utf8::trim(line);
    if (line.empty() || line[0] == '#') continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = utf8::trim(line.substr(0, eq));
    std::string value = utf8::trim(line.substr(eq + 1));
    if (!key.empty()) g.emplace_back(std::move(key), std::move(value));
  }
  return g;
}

Glossary parse_glossary_json(const std::string& content) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(utf8::strip_bom(content));
  } catch (const nlohmann::json::parse_error& e) {
    throw ParseError(std::string("Invalid glossary JSON: ") + e.what());
  }
  if (!j.is_object()) throw ParseError("Glossary JSON must be an object of strings");
  Glossary g;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_string()) throw ParseError("Glossary value for '" + it.key() + "' is not a string");
    if (!it.key().empty()) g.emplace_back(it.key(), it.value().get<std::string>());
  }
  return g;
}

Glossary load_glossary(const std::filesystem::path& path) {
  const std::string content = read_all_text(path);
  std::string ext = path.extension().string();
  for (auto& c : ext) c = char(std::tolower(static_cast<unsigned char>(c)));
  return ext == ".json" ? parse_glossary_json(content) : parse_glossary_text(content);
}

std::string apply_glossary(const std::string& text, const Glossary& glossary) {
  std::string out = text;
  for (const auto& [from, to] : glossary) out = replace_matches(out, whole_word_matches(out, from, to));
  return out;
}

std::string redact_pii(const std::string& text) {
  std::string out = text;
  for (const auto& step : pii_steps()) out = replace_matches(out, regex_matches(out, step.first, step.second));
  return out;
}

std::vector<TextMatch> TextFilters::find_matches(const std::string& text, size_t step) const {
  if (step < glossary.size()) return whole_word_matches(text, glossary[step].first, glossary[step].second);
  const auto& pii = pii_steps();
  const size_t k = step - glossary.size();
  if (redact && k < pii.size()) return regex_matches(text, pii[k].first, pii[k].second);
  return {};
}

size_t TextFilters::step_count() const { return glossary.size() + (redact ? pii_steps().size() : 0); }

std::string TextFilters::apply(const std::string& text) const {
  std::string out = text;
  for (size_t step = 0; step < step_count(); ++step) out = replace_matches(out, find_matches(out, step));
  return out;
}

void apply_text_filters(Transcript& t, const TextFilters& filters) {
  if (filters.empty()) return;
  for (auto& seg : t.segments) {
    if (seg.words.empty()) {
      seg.text = filters.apply(seg.text);
      continue;
    }
    for (auto& w : seg.words) w.text = utf8::trim(w.text);
    seg.words.erase(std::remove_if(seg.words.begin(), seg.words.end(), [](const Word& w) { return w.text.empty(); }),
                    seg.words.end());
    for (size_t step = 0; step < filters.step_count(); ++step) {
      replace_word_matches(seg.words, filters.find_matches(join_word_texts(seg.words), step));
    }
    seg.text = join_word_texts(seg.words);
  }
}
