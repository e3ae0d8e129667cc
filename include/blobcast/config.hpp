#pragma once

// blobcast/config.hpp: Uploader configuration.
//
// Sources, lowest precedence first:
//   1. built-in defaults
//   2. env file (KEY=VALUE lines; '#' comments and blank lines ignored)
//   3. process environment
// Keys are BLOBCAST_*. The receiver/sender keys also accept the older
// FASTFS_* names when the BLOBCAST_* name is absent.
//
// The signer credential is carried opaquely. It is never logged and
// to_json() redacts it.

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "blobcast/chunk_planner.hpp"
#include "blobcast/types.hpp"

namespace blobcast {

using EnvValues = std::map<std::string, std::string>;

// Parse a dotenv-style file. Fails with missing_input if it cannot be read.
std::optional<EnvValues> load_env_file(const std::string& path, UploadError* err);

// Parse dotenv-style text. Lines without '=' are ignored; key and value are
// trimmed of surrounding whitespace.
EnvValues parse_env_text(const std::string& text);

// "*.near" -> "mainnet", "*.testnet" -> "testnet", otherwise nullopt.
std::optional<std::string> infer_network(const std::string& account);

struct UploaderConfig {
  std::string receiver;
  std::string sender_account_id;
  std::string sender_private_key;
  std::string network;  // empty until inferred or set
  std::string storage_domain{"fastfs.io"};
  std::string broadcaster{"near"};
  std::string gas{"300 Tgas"};
  std::string deposit{"0 NEAR"};
  std::uint32_t max_chunk_size{kDefaultMaxChunkSize};
  std::uint64_t timeout_ms{120000};
  NonceMode nonce_mode{NonceMode::random};
  std::string spool_dir;  // empty = system temp dir
  std::string receipt_dir{".blobcast/receipts"};
  std::string event_log;  // empty = disabled

  // Apply `values` over the defaults. Malformed numbers or enum values fail
  // with config_invalid. Does not check required keys; see validate().
  static std::optional<UploaderConfig> from_values(const EnvValues& values, UploadError* err);

  // Defaults <- env file (if `env_file` non-empty) <- process environment.
  static std::optional<UploaderConfig> from_env(const std::string& env_file, UploadError* err);

  // Required keys present, network known or inferable from the receiver,
  // limits non-zero. Fills `network` when inferred.
  bool validate(UploadError* err);

  // Redacted view for `--json` output and diagnostics.
  std::string to_json() const;
};

// Process-environment values for every recognized key that is set.
EnvValues process_env_values();

// Rename legacy FASTFS_* keys to their BLOBCAST_* names within one source.
// The BLOBCAST_* value wins when a source sets both.
EnvValues resolve_aliases(EnvValues values);

// `overlay` over `base`, each source alias-resolved first, so a legacy key in
// a later source still overrides the current key from an earlier one.
EnvValues layer_env(EnvValues base, EnvValues overlay);

}  // namespace blobcast
