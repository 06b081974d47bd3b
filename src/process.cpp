#include "process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "errors.h"

extern char** environ;

namespace fs = std::filesystem;

namespace {

constexpr int kGracePollCount = 50;  // x 100ms after SIGTERM

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return status;
}

void drain(int fd, std::string& out) {
  char buffer[4096];
  while (true) {
    const ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, size_t(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;  // EOF or EAGAIN
  }
}

int terminate_child(pid_t pid, int read_fd, std::string& out) {
  kill(pid, SIGTERM);
  for (int i = 0; i < kGracePollCount; ++i) {
    drain(read_fd, out);
    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) return decode_status(status);
    if (waited < 0 && errno == ECHILD) return -1;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  kill(pid, SIGKILL);
  int status = 0;
  if (waitpid(pid, &status, 0) == pid) return decode_status(status);
  return -1;
}

bool is_executable_file(const fs::path& p) {
  std::error_code ec;
  return access(p.c_str(), X_OK) == 0 && !fs::is_directory(p, ec);
}

std::optional<fs::path> search_path(const std::string& name, const char* path_list) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) return fs::path(name);
    return std::nullopt;
  }
  if (!path_list) return std::nullopt;
  std::istringstream in(path_list);
  std::string dir;
  while (std::getline(in, dir, ':')) {
    if (dir.empty()) dir = ".";
    const fs::path candidate = fs::path(dir) / name;
    if (is_executable_file(candidate)) return candidate;
  }
  return std::nullopt;
}

// Inherited environment with the overrides replacing same-named entries.
std::vector<std::string> merged_environment(const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    const std::string entry(*e);
    const std::string key = entry.substr(0, entry.find('='));
    bool replaced = false;
    for (const auto& kv : overrides) replaced = replaced || kv.first == key;
    if (!replaced) out.push_back(entry);
  }
  for (const auto& [key, value] : overrides) out.push_back(key + "=" + value);
  return out;
}

std::vector<char*> c_array(std::vector<std::string>& strings) {
  std::vector<char*> out;
  out.reserve(strings.size() + 1);
  for (auto& s : strings) out.push_back(s.data());
  out.push_back(nullptr);
  return out;
}

}  // namespace

std::optional<fs::path> find_executable(const std::string& name) { return search_path(name, std::getenv("PATH")); }

std::string describe_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out.push_back(' ');
    if (a.find_first_of(" \t\"'") == std::string::npos && !a.empty()) {
      out += a;
    } else {
      out += "\"" + a + "\"";
    }
  }
  return out;
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& opts) {
  ProcessResult result;
  if (argv.empty()) {
    result.exit_code = 127;
    result.output = "empty command";
    return result;
  }

  // Everything the child needs is prepared here: after fork() only
  // async-signal-safe calls are allowed.
  const char* path_list = std::getenv("PATH");
  for (const auto& kv : opts.env) {
    if (kv.first == "PATH") path_list = kv.second.c_str();
  }
  const auto program = search_path(argv[0], path_list);
  if (!program) {
    result.exit_code = 127;
    result.output = "program not found: " + argv[0];
    return result;
  }
  // Absolute, since the child may chdir before exec.
  std::error_code ec;
  const fs::path absolute = fs::absolute(*program, ec);
  const std::string program_path = (ec ? *program : absolute).string();
  std::vector<std::string> arg_strings = argv;
  std::vector<std::string> env_strings = merged_environment(opts.env);
  const std::vector<char*> args = c_array(arg_strings);
  const std::vector<char*> envp = c_array(env_strings);
  const std::string cwd = opts.cwd.string();
  const std::string chdir_failed = "chdir failed: " + cwd + "\n";
  const std::string exec_failed = "exec failed: " + program_path + "\n";

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) throw ProcessError(std::string("pipe failed: ") + std::strerror(errno), -1, "");

  const pid_t pid = fork();
  if (pid < 0) {
    close(fds[0]);
    close(fds[1]);
    throw ProcessError(std::string("fork failed: ") + std::strerror(errno), -1, "");
  }

  if (pid == 0) {
    // dup2 clears close-on-exec on the copies; the pipe ends close on exec.
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      const ssize_t ignored = write(STDERR_FILENO, chdir_failed.data(), chdir_failed.size());
      (void)ignored;
      _exit(127);
    }
    execve(program_path.c_str(), args.data(), envp.data());
    const ssize_t ignored = write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
    (void)ignored;
    _exit(127);
  }

  close(fds[1]);
  fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK);

  const auto started = std::chrono::steady_clock::now();
  while (true) {
    pollfd pfd{fds[0], POLLIN, 0};
    const int rc = poll(&pfd, 1, 100);
    if (rc > 0) drain(fds[0], result.output);

    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      result.exit_code = decode_status(status);
      break;
    }
    if (waited < 0 && errno != EINTR) {
      result.exit_code = -1;
      break;
    }

    if (opts.cancel && opts.cancel->load()) {
      result.cancelled = true;
      result.exit_code = terminate_child(pid, fds[0], result.output);
      break;
    }
    if (opts.timeout_sec > 0.0) {
      const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
      if (elapsed.count() > opts.timeout_sec) {
        result.timed_out = true;
        result.exit_code = terminate_child(pid, fds[0], result.output);
        break;
      }
    }
  }

  drain(fds[0], result.output);
  close(fds[0]);
  return result;
}
