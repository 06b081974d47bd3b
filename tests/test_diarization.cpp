#include <catch2/catch.hpp>

#include "diarization.h"
#include "test_support.h"

namespace {

std::vector<DiarizationTurn> two_turns() { return {{{0.0, 2.0}, "SPEAKER_A"}, {{2.0, 5.0}, "SPEAKER_B"}}; }

}  // namespace

TEST_CASE("best_overlap_turn: largest overlap wins, ties go to the earlier turn", "[diarize]") {
  const auto turns = two_turns();
  CHECK(*best_overlap_turn({1.0, 2.5}, turns) == 0);
  CHECK(*best_overlap_turn({1.5, 3.0}, turns) == 1);
  CHECK(*best_overlap_turn({1.9, 2.1}, turns) == 0);
  CHECK_FALSE(best_overlap_turn({6.0, 7.0}, turns));
}

TEST_CASE("nearest_turn: closest gap, ties go to the preceding turn", "[diarize]") {
  const std::vector<DiarizationTurn> turns = {{{0.0, 1.0}, "SPEAKER_A"}, {{3.0, 4.0}, "SPEAKER_B"}};
  CHECK(*nearest_turn({1.2, 1.4}, turns) == 0);
  CHECK(*nearest_turn({2.7, 2.8}, turns) == 1);
  CHECK(*nearest_turn({1.5, 2.5}, turns) == 0);
  CHECK_FALSE(nearest_turn({1.0, 2.0}, {}));
}

TEST_CASE("assign_speakers: words and segments take the best-overlapping turn", "[diarize]") {
  Transcript t = make_transcript(
      {aligned_segment({timed_word("hi", 0.2, 0.8), timed_word("there", 2.5, 3.5), untimed_word("x")})},
      SourceEngine::Aligned);
  assign_speakers(t, two_turns());

  CHECK(t.diarized);
  const auto& words = t.segments[0].words;
  CHECK(*words[0].speaker == "SPEAKER_A");
  CHECK(*words[1].speaker == "SPEAKER_B");
  CHECK_FALSE(words[2].speaker);
  CHECK(*t.segments[0].speaker == "SPEAKER_B");
}

TEST_CASE("assign_speakers: zero-length words inside a turn are labelled", "[diarize]") {
  Transcript t = make_transcript({aligned_segment({timed_word("um", 3.0, 3.0)})}, SourceEngine::Aligned);
  assign_speakers(t, two_turns());
  CHECK(*t.segments[0].words[0].speaker == "SPEAKER_B");
}

TEST_CASE("assign_speakers: no turns leaves the transcript undiarized", "[diarize]") {
  Transcript t = make_transcript({aligned_segment({timed_word("hi", 0.0, 1.0)})}, SourceEngine::Aligned);
  assign_speakers(t, {});
  CHECK_FALSE(t.diarized);
  CHECK_FALSE(t.segments[0].words[0].speaker);
}

TEST_CASE("fill_missing_speakers: untimed words use the segment span against turns", "[diarize]") {
  Transcript t = make_transcript({base_segment(2.5, 4.0, "")});
  t.segments[0].words = {untimed_word("later")};
  const auto filled = fill_missing_speakers(t, two_turns());
  REQUIRE(filled.size() == 1);
  CHECK(*t.segments[0].words[0].speaker == "SPEAKER_B");
  CHECK(*t.segments[0].speaker == "SPEAKER_B");
}

TEST_CASE("fill_missing_speakers: without turns the preceding labelled word wins", "[diarize]") {
  Transcript t = make_transcript(
      {aligned_segment({timed_word("a", 0.0, 1.0, "SPEAKER_A"), timed_word("b", 1.0, 2.0),
                        timed_word("c", 2.0, 3.0, "SPEAKER_B")}),
       aligned_segment({timed_word("d", 4.0, 5.0)})},
      SourceEngine::Aligned);

  const auto filled = fill_missing_speakers(t, {});
  CHECK(filled.size() == 2);
  CHECK(*t.segments[0].words[1].speaker == "SPEAKER_A");
  CHECK(*t.segments[1].words[0].speaker == "SPEAKER_B");
  CHECK(check_speaker_completeness(t).empty());
}

TEST_CASE("fill_missing_speakers: nothing labelled anywhere fills nothing", "[diarize]") {
  Transcript t = make_transcript({aligned_segment({timed_word("a", 0.0, 1.0), timed_word("b", 1.0, 2.0)})},
                                 SourceEngine::Aligned);
  CHECK(fill_missing_speakers(t, {}).empty());
  CHECK(check_speaker_completeness(t).size() == 2);
}

TEST_CASE("majority_speaker: by total duration, then by word count", "[diarize]") {
  const std::vector<Word> by_time = {timed_word("a", 0.0, 0.5, "SPEAKER_A"), timed_word("b", 0.5, 1.0, "SPEAKER_A"),
                                     timed_word("c", 1.0, 3.0, "SPEAKER_B")};
  CHECK(*majority_speaker(by_time) == "SPEAKER_B");

  const std::vector<Word> by_count = {untimed_word("x"), timed_word("a", 0.0, 1.0, "SPEAKER_A"),
                                      timed_word("b", 1.0, 1.5, "SPEAKER_B"), timed_word("c", 1.5, 2.0, "SPEAKER_B")};
  CHECK(*majority_speaker(by_count) == "SPEAKER_B");

  CHECK_FALSE(majority_speaker({untimed_word("x")}));
}
