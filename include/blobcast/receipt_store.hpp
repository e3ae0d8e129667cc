#pragma once

// blobcast/receipt_store.hpp: Local record of completed uploads.
//
// LAYOUT (RECEIPT_FORMAT_VERSION 1):
//   <root>/objects/AB/CD/<content_hash>        receipt JSON (identity or zstd)
//   <root>/objects/AB/CD/<content_hash>.meta   {"digest","encoding",
//                                               "original_size","stored_size",
//                                               "stored_blob_hash","created_at"}
//
// INVARIANTS:
//   - Key = SHA-256 hex of the uploaded content (the content address).
//   - Both files are written tmp + rename. The blob is written first and
//     removed again if the meta write fails.
//   - stored_blob_hash = BLAKE3 of the stored bytes; get() re-hashes and
//     rejects any mismatch with receipt_integrity_failed.
//   - A newer receipt for the same content replaces the older one.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "blobcast/types.hpp"

namespace blobcast {

struct Receipt {
  std::string content_hash;
  std::string relative_path;
  std::string url;
  std::string mime_type;
  std::string network;
  std::string receiver;
  std::string sender;
  std::uint32_t nonce{0};
  std::size_t chunk_count{0};
  std::uint64_t total_bytes{0};
  std::vector<std::string> transaction_ids;  // "" where none was reported
  std::uint64_t created_at{0};               // unix seconds
};

std::string receipt_to_json(const Receipt& r);
std::optional<Receipt> receipt_from_json(const std::string& json, UploadError* err);

struct ReceiptObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  std::uint64_t created_at{0};
};

class ReceiptStore {
public:
  explicit ReceiptStore(std::string root = ".blobcast/receipts");

  // `compress` requests zstd; ignored (identity) when built without zstd.
  bool put(const Receipt& receipt, UploadError* err, bool compress = false);

  // nullopt with err->ok() when absent; nullopt with
  // receipt_integrity_failed when present but damaged.
  std::optional<Receipt> get(const std::string& content_hash, UploadError* err) const;

  std::optional<ReceiptObjectInfo> info(const std::string& content_hash) const;

  const std::string& root() const { return root_; }

  std::string object_path(const std::string& content_hash) const;
  std::string meta_path(const std::string& content_hash) const;

private:
  std::string root_;
};

}  // namespace blobcast
