#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "errors.h"
#include "test_support.h"
#include "text_filters.h"

namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& content) {
  const fs::path p = fs::temp_directory_path() / ("capsync_test_" + name);
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << content;
  return p;
}

}  // namespace

TEST_CASE("parse_glossary_text: key=value lines, comments ignored", "[filters]") {
  const auto g = parse_glossary_text("\xEF\xBB\xBF# terms\n\ngpt = GPT\nno separator\nopen ai=OpenAI\r\n=orphan\n");
  REQUIRE(g.size() == 2);
  CHECK(g[0] == std::make_pair(std::string("gpt"), std::string("GPT")));
  CHECK(g[1] == std::make_pair(std::string("open ai"), std::string("OpenAI")));
}

TEST_CASE("parse_glossary_json: flat object of strings", "[filters]") {
  const auto g = parse_glossary_json(R"({"whisper": "Whisper", "ffmpeg": "FFmpeg"})");
  CHECK(g.size() == 2);
  CHECK_THROWS_AS(parse_glossary_json("[1, 2]"), ParseError);
  CHECK_THROWS_AS(parse_glossary_json(R"({"a": 1})"), ParseError);
  CHECK_THROWS_AS(parse_glossary_json("{"), ParseError);
}

TEST_CASE("load_glossary: format chosen by extension", "[filters]") {
  const auto txt = write_temp("glossary.txt", "kube=Kubernetes\n");
  const auto json = write_temp("glossary.JSON", R"({"kube": "K8s"})");

  CHECK(load_glossary(txt).at(0).second == "Kubernetes");
  CHECK(load_glossary(json).at(0).second == "K8s");
  CHECK_THROWS_AS(load_glossary(fs::temp_directory_path() / "capsync_test_missing.txt"), std::runtime_error);

  fs::remove(txt);
  fs::remove(json);
}

TEST_CASE("apply_glossary: whole words only", "[filters]") {
  const Glossary g = {{"gpt", "GPT"}, {"open ai", "OpenAI"}, {"cafe", "Café"}};
  CHECK(apply_glossary("gpt and chatgpt use gpt_x, gpt.", g) == "GPT and chatgpt use gpt_x, GPT.");
  CHECK(apply_glossary("we love open ai.", g) == "we love OpenAI.");
  CHECK(apply_glossary("café cafe", g) == "café Café");
}

TEST_CASE("redact_pii: e-mail, phone, CPF and CNPJ", "[filters]") {
  CHECK(redact_pii("write to joao.silva@example.com.br today") == "write to [EMAIL] today");
  CHECK(redact_pii("call (11) 98765-4321 now") == "call [TEL] now");
  CHECK(redact_pii("cpf 123.456.789-09 ok") == "cpf [CPF] ok");
  CHECK(redact_pii("cnpj 12.345.678/0001-95 ok") == "cnpj [CNPJ] ok");
  CHECK(redact_pii("nothing to hide") == "nothing to hide");
}

TEST_CASE("apply_text_filters: segment text and word text", "[filters]") {
  Transcript t = make_transcript({aligned_segment({timed_word("ask", 0.0, 0.5), timed_word("gpt", 0.5, 1.0)})},
                                 SourceEngine::Aligned);
  TextFilters filters;
  CHECK(filters.empty());
  filters.glossary = {{"gpt", "GPT"}};
  apply_text_filters(t, filters);
  CHECK(t.segments[0].text == "ask GPT");
  CHECK(t.segments[0].words[1].text == "GPT");
}

TEST_CASE("TextFilters::apply: glossary runs before redaction", "[filters]") {
  TextFilters filters;
  filters.glossary = {{"mail", "contact@example.org"}};
  filters.redact = true;
  CHECK(filters.apply("send mail") == "send [EMAIL]");
}

TEST_CASE("apply_text_filters: a phone number split across words is redacted", "[filters]") {
  Transcript t = make_transcript({aligned_segment({timed_word("ligue", 0.0, 0.5), timed_word("(11)", 0.6, 1.0),
                                                   timed_word("98765", 1.0, 1.6), timed_word("4321", 1.7, 2.2),
                                                   timed_word("agora", 2.4, 3.0)})},
                                 SourceEngine::Aligned);
  t.segments[0].words[3].confidence = 0.4f;
  TextFilters filters;
  filters.redact = true;
  apply_text_filters(t, filters);

  const auto& seg = t.segments[0];
  CHECK(seg.text == "ligue [TEL] agora");
  REQUIRE(seg.words.size() == 3);
  CHECK(seg.words[1].text == "[TEL]");
  CHECK(seg.words[1].interval == TimeInterval{0.6, 2.2});
  REQUIRE(seg.words[1].confidence);
  CHECK(*seg.words[1].confidence == Approx(0.4f));
  for (const auto& w : seg.words) CHECK(w.text.find("98765") == std::string::npos);
  CHECK(validate_transcript(t).empty());
}

TEST_CASE("apply_text_filters: multi-word glossary entries merge the words they cover", "[filters]") {
  Transcript t = make_transcript({aligned_segment({timed_word("we", 0.0, 0.3), timed_word("love", 0.3, 0.7),
                                                   timed_word("open", 0.8, 1.1), timed_word("ai.", 1.1, 1.5)})},
                                 SourceEngine::Aligned);
  TextFilters filters;
  filters.glossary = {{"open ai", "OpenAI"}};
  apply_text_filters(t, filters);

  const auto& seg = t.segments[0];
  CHECK(seg.text == "we love OpenAI.");
  REQUIRE(seg.words.size() == 3);
  CHECK(seg.words[2].text == "OpenAI.");
  CHECK(seg.words[2].interval == TimeInterval{0.8, 1.5});
}

TEST_CASE("apply_text_filters: an empty replacement drops the word", "[filters]") {
  Transcript t = make_transcript({aligned_segment({timed_word("um", 0.0, 0.3), timed_word("hello", 0.4, 0.9)})},
                                 SourceEngine::Aligned);
  TextFilters filters;
  filters.glossary = {{"um", ""}};
  apply_text_filters(t, filters);
  REQUIRE(t.segments[0].words.size() == 1);
  CHECK(t.segments[0].text == "hello");
}

TEST_CASE("apply_text_filters: segments without words filter their text", "[filters]") {
  Transcript t = make_transcript({base_segment(0.0, 2.0, "mail joao@example.com")});
  TextFilters filters;
  filters.redact = true;
  apply_text_filters(t, filters);
  CHECK(t.segments[0].text == "mail [EMAIL]");
}
