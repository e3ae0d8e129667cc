#pragma once

// blobcast/process.hpp: Synchronous child process execution with captured output.
//
// The external broadcaster is a blocking CLI. run_process() forks, execs, and
// collects stdout/stderr through non-blocking pipes until the child exits or
// the timeout fires. stdin is connected to /dev/null so an interactive prompt
// in the child fails fast instead of hanging the session.
//
// EXIT CODES:
//   - normal exit: the child's exit status
//   - killed by signal N: 128 + N
//   - timeout: 124 (timed_out = true, process group killed)
//   - exec failure in the child: 127
//   - fork/pipe failure in the parent: error_message set, exit_code = -1

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blobcast {

struct ProcessSpec {
  std::string command;  // absolute path, see resolve_executable()
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  // When true, the child starts from this process's environment and `env`
  // entries override it. When false, `env` is the whole environment.
  bool inherit_env{true};
  std::string cwd;
  std::uint64_t timeout_ms{120000};
  // Bytes kept per stream. The text is never edited; anything beyond the
  // limit is dropped and reported through the *_truncated flags.
  std::size_t max_output_bytes{1u << 20};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolve `name` against PATH (or return it unchanged if it contains a '/').
// Returns nullopt when no executable file is found.
std::optional<std::string> resolve_executable(const std::string& name);

}  // namespace blobcast
