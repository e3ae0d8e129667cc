#pragma once

// blobcast/reporter.hpp: Caller-facing results of an upload session.
//
// A summary exists only for a session whose every chunk succeeded. On abort
// the caller prints failure_text() instead, which carries the broadcaster's
// streams verbatim.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "blobcast/submission.hpp"
#include "blobcast/types.hpp"

namespace blobcast {

// https://<sender>.<storage_domain>/<receiver>/<relative_path>
std::string access_url(const std::string& sender, const std::string& storage_domain,
                       const std::string& receiver, const std::string& relative_path);

// {"content_hash":"<64-hex>"}
std::string content_hash_descriptor(const std::string& content_hash);

struct UploadSummary {
  std::string url;
  std::string relative_path;
  std::string content_hash;
  std::string mime_type;
  std::string network;
  std::string receiver;
  std::string sender;
  std::uint32_t nonce{0};
  FramingMode framing{FramingMode::chunked};
  std::size_t chunk_count{0};
  std::uint64_t total_bytes{0};
  std::vector<std::optional<std::string>> transaction_ids;  // chunk order
  std::uint64_t duration_ns{0};
};

struct ReportContext {
  std::string network;
  std::string receiver;
  std::string sender;
  std::string storage_domain;
};

// nullopt unless `result.ok`.
std::optional<UploadSummary> summarize(const UploadSession& session,
                                       const SessionResult& result,
                                       const ReportContext& ctx);

std::string summary_text(const UploadSummary& s);
std::string summary_json(const UploadSummary& s);

// Error line followed by the captured broadcaster streams, unmodified.
std::string failure_text(const UploadError& err);
std::string failure_json(const UploadError& err, const SessionResult& partial);

}  // namespace blobcast
