#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ProcessOptions {
  double timeout_sec = 0.0;                  // 0 = no timeout
  const std::atomic<bool>* cancel = nullptr;  // checked while the child runs
  std::filesystem::path cwd;                 // empty = inherit
  std::vector<std::pair<std::string, std::string>> env;  // added to the inherited environment
};

struct ProcessResult {
  int exit_code = -1;  // 127 when the program could not be started
  std::string output;  // stdout and stderr interleaved
  bool timed_out = false;
  bool cancelled = false;

  bool ok() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// Runs argv[0] (PATH lookup, honouring a PATH given in opts.env) with the
// remaining arguments and captures its output. A program that cannot be found
// yields exit code 127 without forking. On timeout or cancellation the child
// gets SIGTERM, then SIGKILL after a grace period. Throws ProcessError only if
// the child cannot be forked at all.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts = ProcessOptions());

// Resolves a program name through PATH (names containing '/' are checked as
// given). nullopt when not found or not executable.
std::optional<std::filesystem::path> find_executable(const std::string& name);

// Quoted command line for log messages.
std::string describe_command(const std::vector<std::string>& argv);
