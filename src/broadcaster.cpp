#include "blobcast/broadcaster.hpp"

#include "blobcast/process.hpp"

namespace blobcast {

NearCliBroadcaster::NearCliBroadcaster(std::string executable, std::uint64_t timeout_ms)
    : executable_(std::move(executable)), timeout_ms_(timeout_ms) {}

std::vector<std::string> NearCliBroadcaster::build_argv(const BroadcastRequest& request) {
  return {
      "contract",        "call-function",
      "as-transaction",  request.receiver,
      request.method,    "file-args",
      request.payload_path,
      "prepaid-gas",     request.gas,
      "attached-deposit", request.deposit,
      "sign-as",         request.signer_account,
      "network-config",  request.network,
      "sign-with-plaintext-private-key", request.signer_credential,
      "send",
  };
}

BroadcastResult NearCliBroadcaster::broadcast(const BroadcastRequest& request) {
  BroadcastResult out;
  const auto resolved = resolve_executable(executable_);
  if (!resolved) {
    out.exit_code = 127;
    out.spawn_error = "broadcaster executable not found: " + executable_;
    return out;
  }

  ProcessSpec spec;
  spec.command = *resolved;
  spec.argv = build_argv(request);
  spec.inherit_env = true;  // the CLI reads its own config from HOME
  spec.timeout_ms = timeout_ms_;
  spec.max_output_bytes = kBroadcastOutputLimit;

  ProcessResult pr = run_process(spec);
  out.exit_code = pr.exit_code;
  out.timed_out = pr.timed_out;
  out.stdout_truncated = pr.stdout_truncated;
  out.stderr_truncated = pr.stderr_truncated;
  out.stdout_text = std::move(pr.stdout_text);
  out.stderr_text = std::move(pr.stderr_text);
  out.spawn_error = std::move(pr.error_message);
  return out;
}

}  // namespace blobcast
