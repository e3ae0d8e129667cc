#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace blobcast {

struct HashRuntimeInfo {
  std::string content_primitive;    // "sha256"
  std::string content_backend;      // OpenSSL version string
  std::string integrity_primitive;  // "blake3"
  std::string integrity_version;
};

HashRuntimeInfo hash_runtime_info();

// Content addressing: SHA-256, lowercase hex (64 chars).
std::string sha256_hex(std::string_view payload);

// Binary digest (32 bytes)
std::string sha256_bytes(std::string_view payload);

// Stream-hash a file with a 64 KB read buffer. Returns nullopt if the file
// cannot be opened or a read fails part way.
std::optional<std::string> hash_file_sha256_hex(const std::string& path);

// Integrity digests for locally stored objects (receipt store).
std::string blake3_hex(std::string_view payload);

// Hex helpers. from_hex accepts upper or lower case and rejects odd lengths.
std::string to_hex(std::string_view bytes);
std::optional<std::string> from_hex(std::string_view hex);

// True for a 64-char lowercase hex string.
bool valid_digest(std::string_view digest);

}  // namespace blobcast
