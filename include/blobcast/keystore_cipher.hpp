#pragma once

// blobcast/keystore_cipher.hpp: Secret encryption for the keystore.
//
//   derived = SHA-256(key_material || "keystore-encryption-v1")
//   out[i]  = in[i] ^ derived[i % 32]
//
// Decryption is the same XOR. The scheme has no authentication and no
// per-message randomness: it is a placeholder the keystore understands, not a
// general-purpose cipher. Identical plaintexts under one key produce identical
// ciphertexts.

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "blobcast/types.hpp"

namespace blobcast {

constexpr std::string_view kKeyDerivationContext = "keystore-encryption-v1";
constexpr std::size_t kKeyMaterialBytes = 32;
constexpr std::size_t kMaxCipherInput = 10u << 20;

// Keys the executing worker sets itself; user secrets may not shadow them.
constexpr std::array<std::string_view, 11> kReservedSecretKeys = {
    "NEAR_SENDER_ID",        "NEAR_CONTRACT_ID",      "NEAR_USER_ACCOUNT_ID",
    "NEAR_PAYMENT_YOCTO",    "NEAR_TRANSACTION_HASH", "NEAR_BLOCK_HEIGHT",
    "NEAR_BLOCK_TIMESTAMP",  "NEAR_MAX_INSTRUCTIONS", "NEAR_MAX_MEMORY_MB",
    "NEAR_MAX_EXECUTION_SECONDS", "NEAR_REQUEST_ID",
};

bool is_reserved_secret_key(std::string_view key);

// 64 hex chars -> 32 raw bytes, else invalid_key_material.
std::optional<std::string> parse_key_material(std::string_view hex, UploadError* err);

// 32-byte derived key.
std::string derive_key(std::string_view key_material);

// XOR with the repeating derived key. Input over kMaxCipherInput fails with
// payload_too_large.
std::optional<std::string> xor_cipher(std::string_view input, std::string_view key_material,
                                      UploadError* err);

std::string base64_encode(std::string_view bytes);
std::optional<std::string> base64_decode(std::string_view text, UploadError* err);

// Plaintext must be a JSON object (values of any type, repeated keys resolve
// last-wins) with no reserved keys.
bool validate_secrets_json(const std::string& json, UploadError* err);

// validate -> xor -> base64.
std::optional<std::string> encrypt_secrets(const std::string& json, std::string_view pubkey_hex,
                                           UploadError* err);

// base64 -> xor.
std::optional<std::string> decrypt_secrets(std::string_view base64, std::string_view pubkey_hex,
                                           UploadError* err);

// ---------------------------------------------------------------------------
// Keystore addressing
// ---------------------------------------------------------------------------

constexpr std::string_view kDefaultSecretsContract = "outlayer.testnet";

// "github.com/<owner>/<name>" from "owner/name", "github.com/owner/name",
// "https://github.com/owner/name" or "git@github.com:owner/name.git".
std::string normalize_repo(std::string_view repo);

// Keystore key-derivation seed: "<normalized repo>:<owner>[:<branch>]".
std::string keystore_seed(std::string_view repo, std::string_view owner, std::string_view branch);

struct SecretsStoreTarget {
  std::string contract{kDefaultSecretsContract};
  std::string repo;
  std::string owner;   // NEAR account that owns the secrets
  std::string branch;  // empty = all branches
  std::string profile;
};

// `near call <contract> store_secrets '<args>' --accountId <owner> --deposit 0.01`
std::string store_secrets_command(const SecretsStoreTarget& target,
                                  std::string_view encrypted_base64);

}  // namespace blobcast
