#ifndef _WIN32

#include "blobcast/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

extern char** environ;

namespace blobcast {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

// Read everything currently available from a non-blocking fd. Stops at EOF,
// EAGAIN, or a read error.
void drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
  char buf[4096];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    return;
  }
}

void close_pair(int p[2]) {
  if (p[0] >= 0)
    close(p[0]);
  if (p[1] >= 0)
    close(p[1]);
}

std::vector<std::string> build_environment(const ProcessSpec& spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env && environ) {
    for (char** e = environ; *e; ++e) {
      const std::string kv(*e);
      const auto eq = kv.find('=');
      if (eq == std::string::npos)
        continue;
      merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
  }
  for (const auto& [k, v] : spec.env)
    merged[k] = v;

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged)
    out.push_back(k + "=" + v);
  return out;
}

bool is_executable_file(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> resolve_executable(const std::string& name) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name))
      return name;
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  const std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto end = path.find(':', start);
    std::string dir = path.substr(start, end == std::string::npos ? std::string::npos
                                                                  : end - start);
    if (dir.empty())
      dir = ".";
    const std::string candidate = dir + "/" + name;
    if (is_executable_file(candidate))
      return candidate;
    if (end == std::string::npos)
      break;
    start = end + 1;
  }
  return std::nullopt;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    result.exit_code = -1;
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  if (pipe(err_pipe) != 0) {
    result.exit_code = -1;
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    close_pair(out_pipe);
    return result;
  }

  // Build argv/envp before fork: only async-signal-safe calls in the child.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_environment(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    result.exit_code = -1;
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    close_pair(out_pipe);
    close_pair(err_pipe);
    return result;
  }

  if (pid == 0) {
    setsid();
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0)
        _exit(127);
    }

    execve(spec.command.c_str(), argv.data(), envp.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  while (true) {
    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
          result.stdout_truncated);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
          result.stderr_truncated);

    const pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  // The child may have exited with output still buffered in the pipes.
  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
        result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
        result.stderr_truncated);
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace blobcast

#endif
