#pragma once

// blobcast/types.hpp: Core data model for chunked content-addressed uploads.
//
// DATA FLOW:
//   content -> sha256 (content address) -> plan_chunks() -> encode (per chunk)
//   -> SubmissionDriver -> Reporter
//
// MEMORY OWNERSHIP:
//   - Content and chunk bytes are held in std::string used as a byte buffer.
//   - Chunk owns a copy of its slice. For the default 1 MiB chunk size this is
//     one extra copy per chunk, which is released as soon as the frame is built.
//   - All types are value types. No borrowed references escape a call.
//
// INVARIANTS:
//   - Chunk::offset + Chunk::bytes.size() <= Chunk::full_size.
//   - Chunks concatenated in ascending offset order reconstruct the content.
//   - SubmissionOutcome records are appended in submission order and never
//     mutated afterwards.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blobcast {

enum class ErrorCode {
  none,
  encoding_overflow,
  frame_malformed,
  resource_error,
  transport_failure,
  spawn_failed,
  timeout,
  missing_input,
  config_invalid,
  invalid_key_material,
  payload_too_large,
  receipt_integrity_failed,
};

std::string to_string(ErrorCode code);

// UploadError: the single error value passed across module boundaries.
// stdout_text/stderr_text carry the broadcaster's captured streams verbatim
// when the failure came from a broadcaster invocation.
struct UploadError {
  ErrorCode code{ErrorCode::none};
  std::string message;
  std::string stdout_text;
  std::string stderr_text;

  bool ok() const { return code == ErrorCode::none; }
};

// Set *err (if non-null) and return false. Keeps failure sites to one line.
bool fail(UploadError* err, ErrorCode code, std::string message);

// ---------------------------------------------------------------------------
// Upload data model
// ---------------------------------------------------------------------------

enum class NonceMode {
  random,      // random 32-bit value per session (default)
  wall_clock,  // unix seconds - kNonceEpochOffset, for older indexers
};

enum class FramingMode {
  single_shot,
  chunked,
};

struct UploadSession {
  std::string content;
  std::string content_hash;   // 64-char lowercase hex SHA-256
  std::string relative_path;  // "<content_hash>.<ext>" or "<content_hash>"
  std::string mime_type;
  std::uint32_t max_chunk_size{1u << 20};
  std::uint32_t nonce{0};
  FramingMode framing{FramingMode::chunked};
};

struct Chunk {
  std::uint32_t offset{0};
  std::uint32_t full_size{0};
  std::string bytes;
};

// Structured result of one external broadcaster invocation.
struct BroadcastResult {
  int exit_code{0};
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out{false};
  // Set when the stream was longer than the capture limit and was cut short.
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  // Non-empty when the broadcaster could not be started at all.
  std::string spawn_error;
};

enum class Verdict {
  success,
  retryable,
  fatal,
};

std::string to_string(Verdict verdict);

struct SubmissionOutcome {
  std::size_t chunk_index{0};
  std::uint32_t offset{0};
  std::size_t bytes{0};
  std::optional<std::string> transaction_id;
  bool success{false};
  Verdict verdict{Verdict::fatal};
  int exit_code{0};
  std::string raw_output;  // stdout followed by stderr
  std::uint64_t duration_ns{0};
};

}  // namespace blobcast
