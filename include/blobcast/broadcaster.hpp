#pragma once

// blobcast/broadcaster.hpp: External transaction broadcaster contract.
//
// The core treats signing and broadcasting as an opaque synchronous call:
// BroadcastRequest in, BroadcastResult out. Credentials pass straight through
// to the collaborator; nothing here validates or logs them.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "blobcast/types.hpp"

namespace blobcast {

// Privileged method understood only by the indexer. No deployed contract
// implements it.
constexpr std::string_view kIngestMethod = "__ingest_chunk";

// Per-stream capture limit for a broadcaster run. Far above what the CLI
// prints, so markers late in the output are still seen.
constexpr std::size_t kBroadcastOutputLimit = 64u << 20;

struct BroadcastRequest {
  std::string network;
  std::string receiver;
  std::string method{kIngestMethod};
  std::string payload_path;
  std::string gas;      // e.g. "300 Tgas"
  std::string deposit;  // e.g. "0 NEAR"
  std::string signer_account;
  std::string signer_credential;
};

class Broadcaster {
public:
  virtual ~Broadcaster() = default;
  virtual BroadcastResult broadcast(const BroadcastRequest& request) = 0;
  virtual std::string name() const = 0;
};

// Runs the `near` CLI once per request:
//   near contract call-function as-transaction <receiver> <method>
//     file-args <payload> prepaid-gas '<gas>' attached-deposit '<deposit>'
//     sign-as <signer> network-config <network>
//     sign-with-plaintext-private-key <credential> send
class NearCliBroadcaster : public Broadcaster {
public:
  NearCliBroadcaster(std::string executable, std::uint64_t timeout_ms);

  BroadcastResult broadcast(const BroadcastRequest& request) override;
  std::string name() const override { return "near-cli"; }

  // Argument vector after the executable name.
  static std::vector<std::string> build_argv(const BroadcastRequest& request);

private:
  std::string executable_;
  std::uint64_t timeout_ms_;
};

}  // namespace blobcast
