#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Engine output that cannot be normalized into a transcript.
class ParseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A required collaborator (engine binary, model, explicitly requested aligned
// engine) is missing or failed. Fatal for the file, or for the run when raised
// before the batch starts.
class EngineUnavailableError : public std::runtime_error {
 public:
  EngineUnavailableError(const std::string& collaborator, const std::string& msg)
      : std::runtime_error(collaborator + ": " + msg), collaborator_(collaborator) {}

  const std::string& collaborator() const { return collaborator_; }

 private:
  std::string collaborator_;
};

// Too many timing repairs: the two sources are not describing the same audio.
class DesyncError : public std::runtime_error {
 public:
  DesyncError(const std::string& msg, double clip_ratio)
      : std::runtime_error(msg), clip_ratio_(clip_ratio) {}

  double clip_ratio() const { return clip_ratio_; }

 private:
  double clip_ratio_;
};

// External process failed, timed out, or was cancelled.
class ProcessError : public std::runtime_error {
 public:
  ProcessError(const std::string& msg, int exit_code, std::string output)
      : std::runtime_error(msg), exit_code_(exit_code), output_(std::move(output)) {}

  int exit_code() const { return exit_code_; }
  const std::string& output() const { return output_; }

 private:
  int exit_code_;
  std::string output_;
};
