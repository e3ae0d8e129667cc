#pragma once

// blobcast/session.hpp: Upload session construction and orchestration.
//
// run_upload() is the whole pipeline:
//   read file -> sha256 -> UploadSession -> plan -> SubmissionDriver
//   -> summarize -> receipt
// Nothing touches the broadcaster before the config, the file and the chunk
// plan have all been validated.

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "blobcast/broadcaster.hpp"
#include "blobcast/chunk_planner.hpp"
#include "blobcast/config.hpp"
#include "blobcast/receipt_store.hpp"
#include "blobcast/reporter.hpp"
#include "blobcast/submission.hpp"
#include "blobcast/types.hpp"

namespace blobcast {

struct SessionOptions {
  std::string mime_override;  // empty = by extension
  std::uint32_t max_chunk_size{kDefaultMaxChunkSize};
  bool prefer_single_shot{false};
  NonceMode nonce_mode{NonceMode::random};
  bool skip_existing{false};
};

// Whole file, or missing_input.
std::optional<std::string> read_content(const std::string& path, UploadError* err);

// Lower-cased extension without the dot; "" when the file name has none.
std::string file_extension(const std::string& path);

// "<hash>.<ext>", or "<hash>" when ext is empty.
std::string relative_path_for(const std::string& content_hash, const std::string& ext);

// application/wasm for "wasm", application/octet-stream when unknown.
std::string mime_type_for(const std::string& ext);

std::optional<UploadSession> make_session(std::string content, const std::string& source_path,
                                          const SessionOptions& opts, UploadError* err);

// Single-shot sessions plan exactly one chunk covering the whole content.
std::optional<std::vector<Chunk>> plan_session(const UploadSession& session, UploadError* err);

struct UploadRun {
  bool ok{false};
  bool skipped{false};  // satisfied from an existing receipt
  UploadSession session;
  SessionResult result;
  std::optional<UploadSummary> summary;
  UploadError error;
  UploadError receipt_error;  // set when the receipt could not be written
};

Receipt receipt_from_summary(const UploadSummary& s);
UploadSummary summary_from_receipt(const Receipt& r);

// `receipts` may be null (no receipt lookup or recording). `cfg` must have
// passed validate().
UploadRun run_upload(const UploaderConfig& cfg, const std::string& file,
                     const SessionOptions& opts, Broadcaster& broadcaster,
                     ReceiptStore* receipts, std::ostream* progress);

}  // namespace blobcast
