#include <catch2/catch.hpp>

#include <stdexcept>

#include "engine_policy.h"

namespace {

EngineDecision decide(EngineRequest req, Availability avail, DiarizeRequest diar, bool token) {
  EngineInputs in;
  in.requested_engine = req;
  in.aligned_runtime = avail;
  in.diarize_requested = diar;
  in.hf_token_present = token;
  return select_engines(in);
}

}  // namespace

TEST_CASE("select_engines: base_only never aligns or diarizes", "[policy]") {
  const auto d = decide(EngineRequest::BaseOnly, Availability::Available, DiarizeRequest::On, true);
  CHECK_FALSE(d.use_aligned);
  CHECK_FALSE(d.use_diarization);
  CHECK_FALSE(d.aligned_failure_fatal);
}

TEST_CASE("select_engines: explicit aligned is attempted regardless of availability", "[policy]") {
  for (auto avail : {Availability::Available, Availability::Unavailable, Availability::Unknown}) {
    const auto d = decide(EngineRequest::Aligned, avail, DiarizeRequest::Off, false);
    CHECK(d.use_aligned);
    CHECK(d.aligned_failure_fatal);
    CHECK_FALSE(d.use_diarization);
  }
}

TEST_CASE("select_engines: auto follows the tri-state runtime probe", "[policy]") {
  CHECK(decide(EngineRequest::Auto, Availability::Available, DiarizeRequest::Off, false).use_aligned);
  CHECK(decide(EngineRequest::Auto, Availability::Unknown, DiarizeRequest::Off, false).use_aligned);
  CHECK_FALSE(decide(EngineRequest::Auto, Availability::Unavailable, DiarizeRequest::Off, false).use_aligned);
  CHECK_FALSE(decide(EngineRequest::Auto, Availability::Available, DiarizeRequest::Off, false).aligned_failure_fatal);
}

TEST_CASE("select_engines: diarization needs alignment and on, or auto with a token", "[policy]") {
  CHECK(decide(EngineRequest::Auto, Availability::Available, DiarizeRequest::On, false).use_diarization);
  CHECK(decide(EngineRequest::Auto, Availability::Available, DiarizeRequest::Auto, true).use_diarization);
  CHECK_FALSE(decide(EngineRequest::Auto, Availability::Available, DiarizeRequest::Auto, false).use_diarization);
  CHECK_FALSE(decide(EngineRequest::Auto, Availability::Available, DiarizeRequest::Off, true).use_diarization);
  CHECK_FALSE(decide(EngineRequest::Auto, Availability::Unavailable, DiarizeRequest::On, true).use_diarization);
}

TEST_CASE("parse_engine_request and parse_diarize_request accept CLI spellings", "[policy]") {
  CHECK(parse_engine_request("AUTO") == EngineRequest::Auto);
  CHECK(parse_engine_request("base") == EngineRequest::BaseOnly);
  CHECK(parse_engine_request("approx") == EngineRequest::BaseOnly);
  CHECK(parse_engine_request("whisperx") == EngineRequest::Aligned);
  CHECK(parse_diarize_request("on") == DiarizeRequest::On);
  CHECK(parse_diarize_request("false") == DiarizeRequest::Off);
  CHECK_THROWS_AS(parse_engine_request("fast"), std::runtime_error);
  CHECK_THROWS_AS(parse_diarize_request("maybe"), std::runtime_error);
}
