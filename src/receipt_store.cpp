#include "blobcast/receipt_store.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#if defined(BLOBCAST_WITH_ZSTD)
#include <zstd.h>
#endif

#include "blobcast/hash.hpp"
#include "blobcast/jsonlite.hpp"

namespace fs = std::filesystem;

namespace blobcast {

namespace {

#if defined(BLOBCAST_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file in the target directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data, UploadError* err) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    return fail(err, ErrorCode::resource_error,
                "cannot create " + target.parent_path().string() + ": " + ec.message());
  }
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return fail(err, ErrorCode::resource_error, "cannot open " + tmp);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      fs::remove(tmp, ec);
      return fail(err, ErrorCode::resource_error, "cannot write " + tmp);
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    const std::string msg = "cannot rename into " + target.string() + ": " + ec.message();
    fs::remove(tmp, ec);
    return fail(err, ErrorCode::resource_error, msg);
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

std::string meta_to_json(const ReceiptObjectInfo& info) {
  return "{\"digest\":\"" + info.digest + "\",\"encoding\":\"" + info.encoding +
         "\",\"original_size\":" + std::to_string(info.original_size) +
         ",\"stored_size\":" + std::to_string(info.stored_size) +
         ",\"stored_blob_hash\":\"" + info.stored_blob_hash +
         "\",\"created_at\":" + std::to_string(info.created_at) + "}";
}

}  // namespace

// ---------------------------------------------------------------------------
// Receipt JSON
// ---------------------------------------------------------------------------

std::string receipt_to_json(const Receipt& r) {
  std::string o = "{\"content_hash\":\"" + r.content_hash + "\"";
  o += ",\"relative_path\":\"" + jsonlite::escape(r.relative_path) + "\"";
  o += ",\"url\":\"" + jsonlite::escape(r.url) + "\"";
  o += ",\"mime_type\":\"" + jsonlite::escape(r.mime_type) + "\"";
  o += ",\"network\":\"" + jsonlite::escape(r.network) + "\"";
  o += ",\"receiver\":\"" + jsonlite::escape(r.receiver) + "\"";
  o += ",\"sender\":\"" + jsonlite::escape(r.sender) + "\"";
  o += ",\"nonce\":" + std::to_string(r.nonce);
  o += ",\"chunk_count\":" + std::to_string(r.chunk_count);
  o += ",\"total_bytes\":" + std::to_string(r.total_bytes);
  o += ",\"transaction_ids\":[";
  for (std::size_t i = 0; i < r.transaction_ids.size(); ++i) {
    if (i) o += ",";
    o += "\"" + jsonlite::escape(r.transaction_ids[i]) + "\"";
  }
  o += "],\"created_at\":" + std::to_string(r.created_at) + "}";
  return o;
}

std::optional<Receipt> receipt_from_json(const std::string& json, UploadError* err) {
  std::optional<jsonlite::JsonError> jerr;
  const jsonlite::Object obj = jsonlite::parse(json, &jerr);
  if (jerr) {
    fail(err, ErrorCode::receipt_integrity_failed, "receipt is not valid JSON: " + jerr->message);
    return std::nullopt;
  }
  Receipt r;
  r.content_hash = jsonlite::get_string(obj, "content_hash");
  if (!valid_digest(r.content_hash)) {
    fail(err, ErrorCode::receipt_integrity_failed, "receipt has no valid content_hash");
    return std::nullopt;
  }
  r.relative_path = jsonlite::get_string(obj, "relative_path");
  r.url = jsonlite::get_string(obj, "url");
  r.mime_type = jsonlite::get_string(obj, "mime_type");
  r.network = jsonlite::get_string(obj, "network");
  r.receiver = jsonlite::get_string(obj, "receiver");
  r.sender = jsonlite::get_string(obj, "sender");
  r.nonce = static_cast<std::uint32_t>(jsonlite::get_u64(obj, "nonce"));
  r.chunk_count = static_cast<std::size_t>(jsonlite::get_u64(obj, "chunk_count"));
  r.total_bytes = jsonlite::get_u64(obj, "total_bytes");
  r.transaction_ids = jsonlite::get_string_array(obj, "transaction_ids");
  r.created_at = jsonlite::get_u64(obj, "created_at");
  return r;
}

// ---------------------------------------------------------------------------
// ReceiptStore
// ---------------------------------------------------------------------------

ReceiptStore::ReceiptStore(std::string root) : root_(std::move(root)) {}

std::string ReceiptStore::object_path(const std::string& content_hash) const {
  return (fs::path(root_) / "objects" / content_hash.substr(0, 2) / content_hash.substr(2, 2) /
          content_hash)
      .string();
}

std::string ReceiptStore::meta_path(const std::string& content_hash) const {
  return object_path(content_hash) + ".meta";
}

bool ReceiptStore::put(const Receipt& receipt, UploadError* err, bool compress) {
  if (!valid_digest(receipt.content_hash)) {
    return fail(err, ErrorCode::config_invalid,
                "receipt key is not a sha256 hex digest: " + receipt.content_hash);
  }

  const std::string data = receipt_to_json(receipt);
  std::string stored = data;
  std::string encoding = "identity";
#if defined(BLOBCAST_WITH_ZSTD)
  if (compress) {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compress;
#endif

  const fs::path target = object_path(receipt.content_hash);
  if (!atomic_write(target, stored, err)) return false;

  ReceiptObjectInfo info;
  info.digest = receipt.content_hash;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at = static_cast<std::uint64_t>(std::time(nullptr));

  if (!atomic_write(meta_path(receipt.content_hash), meta_to_json(info), err)) {
    std::error_code ec;
    fs::remove(target, ec);
    return false;
  }
  return true;
}

std::optional<ReceiptObjectInfo> ReceiptStore::info(const std::string& content_hash) const {
  if (!valid_digest(content_hash)) return std::nullopt;
  auto raw = read_all(meta_path(content_hash));
  if (!raw) return std::nullopt;

  std::optional<jsonlite::JsonError> jerr;
  const jsonlite::Object obj = jsonlite::parse(*raw, &jerr);
  if (jerr) return std::nullopt;

  ReceiptObjectInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at = jsonlite::get_u64(obj, "created_at");
  if (inf.digest != content_hash) return std::nullopt;
  return inf;
}

std::optional<Receipt> ReceiptStore::get(const std::string& content_hash, UploadError* err) const {
  if (!valid_digest(content_hash)) return std::nullopt;
  const fs::path p = object_path(content_hash);
  std::error_code ec;
  if (!fs::exists(p, ec)) return std::nullopt;

  auto data = read_all(p);
  if (!data) {
    fail(err, ErrorCode::resource_error, "cannot read receipt " + p.string());
    return std::nullopt;
  }
  auto meta = info(content_hash);
  if (!meta) {
    fail(err, ErrorCode::receipt_integrity_failed, "receipt metadata missing or unreadable");
    return std::nullopt;
  }
  if (blake3_hex(*data) != meta->stored_blob_hash) {
    fail(err, ErrorCode::receipt_integrity_failed, "receipt blob hash mismatch for " + content_hash);
    return std::nullopt;
  }

  if (meta->encoding == "zstd") {
#if defined(BLOBCAST_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) {
      fail(err, ErrorCode::receipt_integrity_failed, "receipt zstd frame is corrupt");
      return std::nullopt;
    }
    data = std::move(plain);
#else
    fail(err, ErrorCode::receipt_integrity_failed,
         "receipt is zstd-compressed but this build has no zstd");
    return std::nullopt;
#endif
  } else if (meta->encoding != "identity") {
    fail(err, ErrorCode::receipt_integrity_failed, "unknown receipt encoding: " + meta->encoding);
    return std::nullopt;
  }

  auto receipt = receipt_from_json(*data, err);
  if (!receipt) return std::nullopt;
  if (receipt->content_hash != content_hash) {
    fail(err, ErrorCode::receipt_integrity_failed, "receipt key does not match its content_hash");
    return std::nullopt;
  }
  return receipt;
}

}  // namespace blobcast
