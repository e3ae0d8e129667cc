#pragma once

// blobcast/chunk_planner.hpp: Deterministic partition of content into chunks.
//
// INVARIANTS:
//   1. Chunk count = ceil(size / max_chunk_size), or exactly one zero-length
//      chunk for empty content (the indexer must still observe a record).
//   2. Offsets start at 0, strictly increase, and leave no gaps or overlaps.
//   3. Every chunk carries the same full_size.
//   4. Only the final chunk may be shorter than max_chunk_size.
//
// The plan is a pure function of (content, max_chunk_size). The session nonce
// is chosen separately and shared by every chunk through the UploadSession.

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "blobcast/types.hpp"

namespace blobcast {

// 1 MiB keeps every frame under the network's per-transaction payload ceiling
// with room for the frame header.
constexpr std::uint32_t kDefaultMaxChunkSize = 1u << 20;

// Largest content accepted for single-shot framing.
constexpr std::uint32_t kSingleFrameCeiling = kDefaultMaxChunkSize;

// Offset of the legacy wall-clock nonce: unix seconds minus this value.
constexpr std::int64_t kNonceEpochOffset = 1769376240;

// Fails with config_invalid for max_chunk_size == 0 and encoding_overflow for
// content that cannot be described by a u32 full_size.
std::optional<std::vector<Chunk>> plan_chunks(std::string_view content,
                                              std::uint32_t max_chunk_size,
                                              UploadError* err);

// Chunked framing unless the caller asked for single-shot and the content fits
// in one frame of at most `single_frame_ceiling` bytes.
FramingMode choose_framing(std::size_t full_size, bool prefer_single_shot,
                           std::uint32_t single_frame_ceiling = kSingleFrameCeiling);

// Session nonce. random: fresh 32-bit value from std::random_device.
// wall_clock: (unix_seconds - kNonceEpochOffset) truncated to u32.
std::uint32_t make_session_nonce(NonceMode mode);

// Exposed for tests: the wall-clock formula for a given unix time.
std::uint32_t wall_clock_nonce(std::int64_t unix_seconds);

}  // namespace blobcast
