#include "blobcast/codec.hpp"

#include <algorithm>
#include <limits>

namespace blobcast {

namespace {

constexpr std::size_t kU32Max = std::numeric_limits<std::uint32_t>::max();

// Bounds-checked little-endian reader over a frame.
struct Reader {
  std::string_view s;
  std::size_t i{0};

  bool u8(std::uint8_t& out) {
    if (s.size() - i < 1) return false;
    out = static_cast<std::uint8_t>(s[i++]);
    return true;
  }

  bool u32(std::uint32_t& out) {
    if (s.size() - i < 4) return false;
    const auto* p = reinterpret_cast<const unsigned char*>(s.data() + i);
    out = static_cast<std::uint32_t>(p[0]) |
          (static_cast<std::uint32_t>(p[1]) << 8) |
          (static_cast<std::uint32_t>(p[2]) << 16) |
          (static_cast<std::uint32_t>(p[3]) << 24);
    i += 4;
    return true;
  }

  bool blob(std::string& out) {
    std::uint32_t len = 0;
    if (!u32(len)) return false;
    if (s.size() - i < len) return false;
    out.assign(s.data() + i, len);
    i += len;
    return true;
  }

  bool done() const { return i == s.size(); }
};

bool malformed(UploadError* err, const std::string& what) {
  return fail(err, ErrorCode::frame_malformed, what);
}

}  // namespace

void append_u32_le(std::uint32_t value, std::string& out) {
  out.push_back(static_cast<char>(value & 0xFF));
  out.push_back(static_cast<char>((value >> 8) & 0xFF));
  out.push_back(static_cast<char>((value >> 16) & 0xFF));
  out.push_back(static_cast<char>((value >> 24) & 0xFF));
}

bool encode_length(std::size_t len, std::string& out, UploadError* err) {
  if (len > kU32Max) {
    return fail(err, ErrorCode::encoding_overflow,
                "field length " + std::to_string(len) + " exceeds u32 range");
  }
  append_u32_le(static_cast<std::uint32_t>(len), out);
  return true;
}

bool encode_string(std::string_view s, std::string& out, UploadError* err) {
  if (!encode_length(s.size(), out, err)) return false;
  out.append(s.data(), s.size());
  return true;
}

bool encode_bytes(std::string_view b, std::string& out, UploadError* err) {
  if (!encode_length(b.size(), out, err)) return false;
  out.append(b.data(), b.size());
  return true;
}

std::optional<std::string> encode_single_shot_frame(std::string_view relative_path,
                                                    std::string_view mime_type,
                                                    std::string_view content,
                                                    UploadError* err) {
  std::string out;
  out.reserve(1 + 4 + relative_path.size() + 1 + 4 + mime_type.size() + 4 + content.size());
  out.push_back(static_cast<char>(kSingleShotDiscriminator));
  if (!encode_string(relative_path, out, err)) return std::nullopt;
  out.push_back(static_cast<char>(kContentPresent));
  if (!encode_string(mime_type, out, err)) return std::nullopt;
  if (!encode_bytes(content, out, err)) return std::nullopt;
  return out;
}

std::optional<std::string> encode_chunk_frame(std::string_view relative_path,
                                              std::string_view mime_type,
                                              const Chunk& chunk,
                                              std::uint32_t nonce,
                                              UploadError* err) {
  std::string out;
  out.reserve(1 + 4 + relative_path.size() + 8 + 4 + mime_type.size() + 4 +
              chunk.bytes.size() + 4);
  out.push_back(static_cast<char>(kChunkDiscriminator));
  if (!encode_string(relative_path, out, err)) return std::nullopt;
  append_u32_le(chunk.offset, out);
  append_u32_le(chunk.full_size, out);
  if (!encode_string(mime_type, out, err)) return std::nullopt;
  if (!encode_bytes(chunk.bytes, out, err)) return std::nullopt;
  append_u32_le(nonce, out);
  return out;
}

std::optional<std::string> encode_session_frame(const UploadSession& session,
                                                const Chunk& chunk,
                                                UploadError* err) {
  if (session.framing == FramingMode::single_shot) {
    return encode_single_shot_frame(session.relative_path, session.mime_type,
                                    chunk.bytes, err);
  }
  return encode_chunk_frame(session.relative_path, session.mime_type, chunk,
                            session.nonce, err);
}

std::optional<DecodedFrame> decode_frame(std::string_view bytes, UploadError* err) {
  Reader r{bytes};
  std::uint8_t discriminator = 0;
  if (!r.u8(discriminator)) {
    malformed(err, "empty frame");
    return std::nullopt;
  }

  if (discriminator == kSingleShotDiscriminator) {
    SingleShotFrame f;
    std::uint8_t presence = 0;
    if (!r.blob(f.relative_path) || !r.u8(presence)) {
      malformed(err, "truncated single-shot frame header");
      return std::nullopt;
    }
    if (presence == kContentPresent) {
      f.has_content = true;
      if (!r.blob(f.mime_type) || !r.blob(f.content)) {
        malformed(err, "truncated single-shot frame content");
        return std::nullopt;
      }
    } else if (presence != kContentAbsent) {
      malformed(err, "invalid content presence byte " + std::to_string(presence));
      return std::nullopt;
    }
    if (!r.done()) {
      malformed(err, "trailing bytes after single-shot frame");
      return std::nullopt;
    }
    return DecodedFrame{std::move(f)};
  }

  if (discriminator == kChunkDiscriminator) {
    ChunkFrame f;
    if (!r.blob(f.relative_path) || !r.u32(f.offset) || !r.u32(f.full_size) ||
        !r.blob(f.mime_type) || !r.blob(f.content_chunk) || !r.u32(f.nonce)) {
      malformed(err, "truncated chunk frame");
      return std::nullopt;
    }
    if (!r.done()) {
      malformed(err, "trailing bytes after chunk frame");
      return std::nullopt;
    }
    if (static_cast<std::uint64_t>(f.offset) + f.content_chunk.size() > f.full_size) {
      malformed(err, "chunk extends past full_size");
      return std::nullopt;
    }
    return DecodedFrame{std::move(f)};
  }

  malformed(err, "unknown frame discriminator " + std::to_string(discriminator));
  return std::nullopt;
}

std::optional<std::string> reassemble(std::vector<ChunkFrame> frames, UploadError* err) {
  if (frames.empty()) {
    malformed(err, "no chunk frames");
    return std::nullopt;
  }
  std::sort(frames.begin(), frames.end(),
            [](const ChunkFrame& a, const ChunkFrame& b) { return a.offset < b.offset; });

  const ChunkFrame& first = frames.front();
  std::string out;
  out.reserve(first.full_size);
  for (const auto& f : frames) {
    if (f.relative_path != first.relative_path || f.full_size != first.full_size ||
        f.nonce != first.nonce) {
      malformed(err, "chunk frames belong to different sessions");
      return std::nullopt;
    }
    if (f.offset != out.size()) {
      malformed(err, "gap or overlap at offset " + std::to_string(f.offset));
      return std::nullopt;
    }
    out += f.content_chunk;
  }
  if (out.size() != first.full_size) {
    malformed(err, "reassembled " + std::to_string(out.size()) + " of " +
                       std::to_string(first.full_size) + " bytes");
    return std::nullopt;
  }
  return out;
}

}  // namespace blobcast
