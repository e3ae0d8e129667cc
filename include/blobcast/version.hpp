#pragma once

// blobcast/version.hpp: Version manifest for every persisted or wire format.
//
// INVARIANT:
//   Any change to a byte layout below bumps its constant. Indexers and older
//   receipt readers key off these numbers, never off the tool's semver.

#include <cstdint>
#include <string>

namespace blobcast {
namespace version {

// ---------------------------------------------------------------------------
// FRAME_FORMAT_VERSION
// Layout of single-shot and chunk frames (discriminator, u32 LE length
// prefixes, offset/full_size/nonce fields). Version 1 = current.
// ---------------------------------------------------------------------------
constexpr uint32_t FRAME_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// RECEIPT_FORMAT_VERSION
// On-disk receipt store: objects/AB/CD/<sha256> + JSON .meta sidecar with a
// BLAKE3 stored_blob_hash.
// ---------------------------------------------------------------------------
constexpr uint32_t RECEIPT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// JSONL ChunkEvent records written to BLOBCAST_EVENT_LOG.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t frame_format{FRAME_FORMAT_VERSION};
  uint32_t receipt_format{RECEIPT_FORMAT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string semver;
  std::string content_hash;     // "sha256"
  std::string content_backend;  // OpenSSL version
  std::string integrity_hash;   // "blake3"
  std::string integrity_version;
  bool zstd{false};
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace blobcast
