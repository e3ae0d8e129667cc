#include "blobcast/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. SHA-256 is the content-address primitive. The indexer, the access URL
//      and the {"content_hash": ...} descriptor all depend on it. Never swap it.
//   2. BLAKE3 is used only for local integrity digests (receipt store blobs).
//      Those digests never leave this machine.
//   3. Digests are rendered as lowercase hex everywhere.

#include <array>
#include <cstdint>
#include <fstream>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/opensslv.h>

extern "C" {
#include <blake3.h>
}

namespace blobcast {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string hex_of(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

using Sha256Out = std::array<unsigned char, 32>;

bool sha256_raw(std::string_view payload, Sha256Out& out) {
  unsigned int len = 0;
  return EVP_Digest(payload.data(), payload.size(), out.data(), &len,
                    EVP_sha256(), nullptr) == 1 &&
         len == out.size();
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.content_primitive = "sha256";
  info.content_backend = OpenSSL_version(OPENSSL_VERSION);
  info.integrity_primitive = "blake3";
  info.integrity_version = blake3_version();
  return info;
}

std::string sha256_hex(std::string_view payload) {
  Sha256Out out{};
  if (!sha256_raw(payload, out)) return {};
  return hex_of(out.data(), out.size());
}

std::string sha256_bytes(std::string_view payload) {
  Sha256Out out{};
  if (!sha256_raw(payload, out)) return {};
  return std::string(reinterpret_cast<const char*>(out.data()), out.size());
}

std::optional<std::string> hash_file_sha256_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return std::nullopt;

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return std::nullopt;
  }

  constexpr std::size_t buffer_size = 65536;
  std::unique_ptr<char[]> buffer(new char[buffer_size]);
  while (file) {
    file.read(buffer.get(), buffer_size);
    const std::streamsize count = file.gcount();
    if (count > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.get(), static_cast<std::size_t>(count)) != 1) {
      return std::nullopt;
    }
  }
  if (file.bad()) return std::nullopt;

  Sha256Out out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
    return std::nullopt;
  }
  return hex_of(out.data(), out.size());
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return hex_of(out.data(), out.size());
}

std::string to_hex(std::string_view bytes) {
  return hex_of(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::optional<std::string> from_hex(std::string_view hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  std::string out;
  out.resize(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return std::nullopt;
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

bool valid_digest(std::string_view digest) {
  if (digest.size() != 64) return false;
  for (char c : digest) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace blobcast
