#pragma once

#include <string>

enum class EngineRequest { Auto, BaseOnly, Aligned };
enum class DiarizeRequest { Auto, On, Off };

// Result of probing the aligned engine. Unknown means the probe itself was
// inconclusive (timeout, odd exit code); it is never coerced to a guess.
enum class Availability { Available, Unavailable, Unknown };

struct EngineInputs {
  EngineRequest requested_engine = EngineRequest::Auto;
  Availability aligned_runtime = Availability::Unknown;
  DiarizeRequest diarize_requested = DiarizeRequest::Auto;
  bool hf_token_present = false;
};

struct EngineDecision {
  bool use_aligned = false;
  bool use_diarization = false;
  // Only an explicit aligned request turns an aligned failure into a fatal
  // error; in auto mode the run degrades to approximation.
  bool aligned_failure_fatal = false;
  std::string reason;
};

// Pure, stateless engine selection:
//   base_only -> no alignment
//   aligned   -> alignment regardless of availability (failure is fatal)
//   auto      -> alignment unless the runtime is known to be unavailable
//   diarization = alignment && (on || (auto && hf token present))
EngineDecision select_engines(const EngineInputs& in);

EngineRequest parse_engine_request(const std::string& s);    // auto | base | aligned
DiarizeRequest parse_diarize_request(const std::string& s);  // auto | on | off
Availability availability_from_bool(bool available);

const char* engine_request_name(EngineRequest r);
const char* diarize_request_name(DiarizeRequest r);
const char* availability_name(Availability a);
