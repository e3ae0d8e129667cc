#include "blobcast/chunk_planner.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <random>

namespace blobcast {

std::optional<std::vector<Chunk>> plan_chunks(std::string_view content,
                                              std::uint32_t max_chunk_size,
                                              UploadError* err) {
  if (max_chunk_size == 0) {
    fail(err, ErrorCode::config_invalid, "max_chunk_size must be at least 1");
    return std::nullopt;
  }
  if (content.size() > std::numeric_limits<std::uint32_t>::max()) {
    fail(err, ErrorCode::encoding_overflow,
         "content size " + std::to_string(content.size()) + " exceeds u32 range");
    return std::nullopt;
  }

  const auto full_size = static_cast<std::uint32_t>(content.size());
  std::vector<Chunk> chunks;

  if (full_size == 0) {
    chunks.push_back(Chunk{0, 0, {}});
    return chunks;
  }

  chunks.reserve((static_cast<std::size_t>(full_size) + max_chunk_size - 1) / max_chunk_size);
  std::uint32_t offset = 0;
  while (offset < full_size) {
    const std::uint32_t len = std::min(max_chunk_size, full_size - offset);
    Chunk c;
    c.offset = offset;
    c.full_size = full_size;
    c.bytes.assign(content.data() + offset, len);
    chunks.push_back(std::move(c));
    offset += len;
  }
  return chunks;
}

FramingMode choose_framing(std::size_t full_size, bool prefer_single_shot,
                           std::uint32_t single_frame_ceiling) {
  if (prefer_single_shot && full_size <= single_frame_ceiling) {
    return FramingMode::single_shot;
  }
  return FramingMode::chunked;
}

std::uint32_t wall_clock_nonce(std::int64_t unix_seconds) {
  return static_cast<std::uint32_t>(unix_seconds - kNonceEpochOffset);
}

std::uint32_t make_session_nonce(NonceMode mode) {
  if (mode == NonceMode::wall_clock) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return wall_clock_nonce(std::chrono::duration_cast<std::chrono::seconds>(now).count());
  }
  std::random_device rd;
  std::uniform_int_distribution<std::uint32_t> dist;
  return dist(rd);
}

}  // namespace blobcast
