#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

class Logger {
 public:
  enum class Level { Debug, Info, Warn, Error };

  Logger() : sink_(std::make_shared<Sink>()) {}

  void enable_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(sink_->mu);
    sink_->file.open(path, std::ios::binary | std::ios::app);
  }

  void set_debug(bool enabled) {
    std::lock_guard<std::mutex> lock(sink_->mu);
    sink_->debug_enabled = enabled;
  }

  // Redirects console output (tests capture into a stringstream).
  void set_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(sink_->mu);
    sink_->console = out;
  }

  // Child logger sharing this sink; every line is tagged "<context> | ".
  Logger scoped(const std::string& context) const {
    Logger child(*this);
    child.context_ = context;
    return child;
  }

  const std::string& context() const { return context_; }

  void log(Level level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(sink_->mu);
    if (level == Level::Debug && !sink_->debug_enabled) return;
    const std::string line = format(level, context_, msg);
    if (sink_->console) *sink_->console << line;
    if (sink_->file.is_open()) sink_->file << line << std::flush;
  }

  void info(const std::string& msg) { log(Level::Info, msg); }
  void warn(const std::string& msg) { log(Level::Warn, msg); }
  void error(const std::string& msg) { log(Level::Error, msg); }
  void debug(const std::string& msg) { log(Level::Debug, msg); }

 private:
  struct Sink {
    std::mutex mu;
    bool debug_enabled = false;
    std::ostream* console = &std::cerr;
    std::ofstream file;
  };

  static const char* level_tag(Level l) {
    switch (l) {
      case Level::Debug:
        return "DEBUG";
      case Level::Info:
        return "INFO";
      case Level::Warn:
        return "WARN";
      case Level::Error:
        return "ERROR";
    }
    return "INFO";
  }

  static std::string format(Level l, const std::string& context, const std::string& msg) {
    std::string out;
    out.reserve(msg.size() + context.size() + 16);
    out += "[";
    out += level_tag(l);
    out += "] ";
    if (!context.empty()) {
      out += context;
      out += " | ";
    }
    out += msg;
    if (out.empty() || out.back() != '\n') out.push_back('\n');
    return out;
  }

  std::shared_ptr<Sink> sink_;
  std::string context_;
};
