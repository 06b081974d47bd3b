#include "engine_policy.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::tolower(c)); });
  return s;
}

}  // namespace

EngineDecision select_engines(const EngineInputs& in) {
  EngineDecision d;
  switch (in.requested_engine) {
    case EngineRequest::BaseOnly:
      d.use_aligned = false;
      d.reason = "base engine only (requested)";
      break;
    case EngineRequest::Aligned:
      d.use_aligned = true;
      d.aligned_failure_fatal = true;
      d.reason = std::string("aligned engine requested explicitly (runtime ") +
                 availability_name(in.aligned_runtime) + ")";
      break;
    case EngineRequest::Auto:
      d.use_aligned = in.aligned_runtime != Availability::Unavailable;
      d.reason = d.use_aligned ? std::string("auto: aligned runtime ") + availability_name(in.aligned_runtime) +
                                     ", approximation on failure"
                               : std::string("auto: aligned runtime unavailable, approximating word timing");
      break;
  }

  const bool want = in.diarize_requested == DiarizeRequest::On ||
                    (in.diarize_requested == DiarizeRequest::Auto && in.hf_token_present);
  d.use_diarization = d.use_aligned && want;
  if (want && !d.use_aligned) d.reason += "; diarization skipped (needs the aligned engine)";
  if (d.use_diarization) d.reason += "; diarization on";
  return d;
}

EngineRequest parse_engine_request(const std::string& s) {
  const std::string v = lower(s);
  if (v == "auto") return EngineRequest::Auto;
  if (v == "base" || v == "base_only" || v == "approx") return EngineRequest::BaseOnly;
  if (v == "aligned" || v == "whisperx") return EngineRequest::Aligned;
  throw std::runtime_error("Invalid engine selection '" + s + "' (expected auto, base or aligned)");
}

DiarizeRequest parse_diarize_request(const std::string& s) {
  const std::string v = lower(s);
  if (v == "auto") return DiarizeRequest::Auto;
  if (v == "on" || v == "true" || v == "1") return DiarizeRequest::On;
  if (v == "off" || v == "false" || v == "0") return DiarizeRequest::Off;
  throw std::runtime_error("Invalid diarization setting '" + s + "' (expected on, off or auto)");
}

Availability availability_from_bool(bool available) {
  return available ? Availability::Available : Availability::Unavailable;
}

const char* engine_request_name(EngineRequest r) {
  switch (r) {
    case EngineRequest::Auto:
      return "auto";
    case EngineRequest::BaseOnly:
      return "base";
    case EngineRequest::Aligned:
      return "aligned";
  }
  return "auto";
}

const char* diarize_request_name(DiarizeRequest r) {
  switch (r) {
    case DiarizeRequest::Auto:
      return "auto";
    case DiarizeRequest::On:
      return "on";
    case DiarizeRequest::Off:
      return "off";
  }
  return "auto";
}

const char* availability_name(Availability a) {
  switch (a) {
    case Availability::Available:
      return "available";
    case Availability::Unavailable:
      return "unavailable";
    case Availability::Unknown:
      return "unknown";
  }
  return "unknown";
}
