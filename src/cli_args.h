#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "engines.h"
#include "pipeline.h"

struct CliArgs {
  std::filesystem::path input;  // media file or directory
  bool recursive = false;
  int jobs = 1;
  std::filesystem::path config;  // optional JSON defaults
  std::filesystem::path log_file;
  std::filesystem::path glossary;
  bool redact_pii = false;
  bool debug = false;
  std::filesystem::path state_file;  // defaults to <output>/_state.json
  bool force = false;                // ignore the state file's verdict

  EngineSettings engine;
  PipelineConfig pipeline;
  OutputOptions output;
};

// Flags override values from --config, wherever --config appears.
// Returns true on success; on failure writes usage to stderr and returns false (and sets exit_code).
bool parse_cli_args(int argc, char** argv, CliArgs& out, int& exit_code);

// Applies a config object onto `out`. Keys are the long flag names with '_'
// instead of '-' (e.g. "clip_fatal_ratio", "whisper_cli"); ASS styling sits
// under "ass". Throws std::runtime_error on a value of the wrong type or an
// unknown key.
void apply_config_json(const nlohmann::json& j, CliArgs& out);
void load_config_file(const std::filesystem::path& path, CliArgs& out);

void print_usage();

// Every option that changes the produced files, as a JSON object for
// options_fingerprint(). Call after the glossary is loaded into
// args.pipeline.filters.
nlohmann::json fingerprint_options(const CliArgs& args);
