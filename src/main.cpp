#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
#include "batch.h"
#include "cli_args.h"
#include "engines.h"
#include "errors.h"
#include "logger.h"
#include "pipeline.h"
#include "state.h"
#include "text_filters.h"

static std::atomic<bool> g_cancel{false};

extern "C" void handle_interrupt(int) { g_cancel.store(true); }

// Forward declaration
static int run_capsync(int argc, char** argv);

int main(int argc, char** argv) {
  try {
    return run_capsync(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "\n[ERROR] " << e.what() << "\n";
    return 1;
  }
}

static int run_capsync(int argc, char** argv) {
  CliArgs args;
  int exit_code = 0;
  if (!parse_cli_args(argc, argv, args, exit_code)) {
    return exit_code;
  }

  Logger log;
  log.set_debug(args.debug);
  if (!args.log_file.empty()) {
    std::error_code ec;
    if (args.log_file.has_parent_path()) fs::create_directories(args.log_file.parent_path(), ec);
    log.enable_file(args.log_file);
  }

  std::signal(SIGINT, handle_interrupt);
  std::signal(SIGTERM, handle_interrupt);

  if (!args.glossary.empty()) {
    args.pipeline.filters.glossary = load_glossary(args.glossary);
    log.info("Loaded glossary: " + std::to_string(args.pipeline.filters.glossary.size()) + " entries");
  }
  args.pipeline.filters.redact = args.redact_pii;

  try {
    check_base_engine(args.engine);
  } catch (const EngineUnavailableError& e) {
    log.error(std::string("Base engine unavailable, nothing processed: ") + e.what());
    return 1;
  }

  const auto files = collect_media_files(args.input, args.recursive);
  if (files.empty()) {
    log.error("No supported media found in " + args.input.string());
    return 1;
  }
  {
    std::ostringstream ss;
    ss << "Found " << files.size() << " file(s); engine=" << engine_request_name(args.pipeline.engine_request)
       << " diarize=" << diarize_request_name(args.pipeline.diarize_request) << " jobs=" << args.jobs;
    log.info(ss.str());
  }

  ProcessEngineBackend backend(args.engine, &g_cancel, log.scoped("engine"));
  if (args.pipeline.engine_request != EngineRequest::BaseOnly) backend.aligned_availability();

  StateStore state(args.state_file);
  state.load(log);
  log.debug("State: " + state.path().string() + " (" + std::to_string(state.size()) + " entries)");

  const FileJob process = [&](const fs::path& media) {
    Logger file_log = log.scoped(media.stem().string());
    return process_file(media, args.pipeline, args.output, backend, file_log, &g_cancel);
  };
  const FileJob job = resumable_job(process, state, options_fingerprint(fingerprint_options(args)), args.output,
                                    args.force, log.scoped("state"));
  const BatchSummary summary = run_batch(files, size_t(args.jobs), job, &g_cancel);

  for (const auto& r : summary.results) {
    if (!r.ok) log.error(r.media.string() + ": " + r.error);
  }
  {
    std::ostringstream ss;
    ss << "Summary: " << summary.ok << " ok, " << summary.failed << " failed";
    if (summary.unchanged) ss << ", " << summary.unchanged << " unchanged";
    if (summary.skipped) ss << ", " << summary.skipped << " skipped";
    log.info(ss.str());
  }

  if (g_cancel.load()) return 130;
  return summary.failed ? 1 : 0;
}
