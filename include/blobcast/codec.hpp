#pragma once

// blobcast/codec.hpp: Wire framing for ingestion payloads.
//
// FRAME LAYOUT (all integers little-endian, strings/bytes = u32 len + bytes):
//
//   single-shot:  u8 0 | string relative_path | u8 1 (content present)
//                 | string mime_type | bytes content
//
//   chunk:        u8 1 | string relative_path | u32 offset | u32 full_size
//                 | string mime_type | bytes content_chunk | u32 nonce
//
// The first byte selects the decoder. A single-shot frame with presence byte 0
// carries no mime type and no content; it is accepted by decode_frame() but
// never produced by this encoder.
//
// INVARIANT: encoding is a pure function of its inputs. Any length that does
// not fit in u32 fails with ErrorCode::encoding_overflow and produces no bytes.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "blobcast/types.hpp"

namespace blobcast {

constexpr std::uint8_t kSingleShotDiscriminator = 0;
constexpr std::uint8_t kChunkDiscriminator = 1;
constexpr std::uint8_t kContentPresent = 1;
constexpr std::uint8_t kContentAbsent = 0;

void append_u32_le(std::uint32_t value, std::string& out);

// Appends the u32 length prefix for a field of `len` bytes.
bool encode_length(std::size_t len, std::string& out, UploadError* err);

bool encode_string(std::string_view s, std::string& out, UploadError* err);
bool encode_bytes(std::string_view b, std::string& out, UploadError* err);

std::optional<std::string> encode_single_shot_frame(std::string_view relative_path,
                                                    std::string_view mime_type,
                                                    std::string_view content,
                                                    UploadError* err);

std::optional<std::string> encode_chunk_frame(std::string_view relative_path,
                                              std::string_view mime_type,
                                              const Chunk& chunk,
                                              std::uint32_t nonce,
                                              UploadError* err);

// Frame for one chunk of a session, using the session's framing mode.
// Single-shot framing is only valid when the session has exactly one chunk.
std::optional<std::string> encode_session_frame(const UploadSession& session,
                                                const Chunk& chunk,
                                                UploadError* err);

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

struct SingleShotFrame {
  std::string relative_path;
  bool has_content{false};
  std::string mime_type;
  std::string content;
};

struct ChunkFrame {
  std::string relative_path;
  std::uint32_t offset{0};
  std::uint32_t full_size{0};
  std::string mime_type;
  std::string content_chunk;
  std::uint32_t nonce{0};
};

using DecodedFrame = std::variant<SingleShotFrame, ChunkFrame>;

// Rejects truncated input, unknown discriminators and trailing bytes
// (ErrorCode::frame_malformed).
std::optional<DecodedFrame> decode_frame(std::string_view bytes, UploadError* err);

// Rebuild content from chunk frames. Frames may arrive in any order; they are
// sorted by offset and must be contiguous, agree on path, full_size and nonce,
// and cover exactly full_size bytes.
std::optional<std::string> reassemble(std::vector<ChunkFrame> frames, UploadError* err);

}  // namespace blobcast
