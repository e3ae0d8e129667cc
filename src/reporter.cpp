#include "blobcast/reporter.hpp"

#include <sstream>

#include "blobcast/jsonlite.hpp"

namespace blobcast {

std::string access_url(const std::string& sender, const std::string& storage_domain,
                       const std::string& receiver, const std::string& relative_path) {
  return "https://" + sender + "." + storage_domain + "/" + receiver + "/" + relative_path;
}

std::string content_hash_descriptor(const std::string& content_hash) {
  return "{\"content_hash\":\"" + content_hash + "\"}";
}

std::optional<UploadSummary> summarize(const UploadSession& session,
                                       const SessionResult& result,
                                       const ReportContext& ctx) {
  if (!result.ok) return std::nullopt;
  UploadSummary s;
  s.url = access_url(ctx.sender, ctx.storage_domain, ctx.receiver, session.relative_path);
  s.relative_path = session.relative_path;
  s.content_hash = session.content_hash;
  s.mime_type = session.mime_type;
  s.network = ctx.network;
  s.receiver = ctx.receiver;
  s.sender = ctx.sender;
  s.nonce = session.nonce;
  s.framing = session.framing;
  s.chunk_count = result.outcomes.size();
  for (const auto& o : result.outcomes) {
    s.total_bytes += o.bytes;
    s.duration_ns += o.duration_ns;
    s.transaction_ids.push_back(o.transaction_id);
  }
  return s;
}

std::string summary_text(const UploadSummary& s) {
  std::ostringstream o;
  o << "Upload complete\n"
    << "  chunks: " << s.chunk_count << "\n"
    << "  bytes:  " << s.total_bytes << "\n"
    << "  nonce:  " << s.nonce << "\n";
  for (std::size_t i = 0; i < s.transaction_ids.size(); ++i) {
    o << "  tx[" << i << "]: " << s.transaction_ids[i].value_or("-") << "\n";
  }
  o << "\n"
    << "URL: " << s.url << "\n"
    << "\n"
    << content_hash_descriptor(s.content_hash) << "\n";
  return o.str();
}

std::string summary_json(const UploadSummary& s) {
  std::ostringstream o;
  o << "{\"ok\":true"
    << ",\"url\":\"" << jsonlite::escape(s.url) << "\""
    << ",\"relative_path\":\"" << jsonlite::escape(s.relative_path) << "\""
    << ",\"content_hash\":\"" << s.content_hash << "\""
    << ",\"descriptor\":" << content_hash_descriptor(s.content_hash)
    << ",\"mime_type\":\"" << jsonlite::escape(s.mime_type) << "\""
    << ",\"network\":\"" << jsonlite::escape(s.network) << "\""
    << ",\"receiver\":\"" << jsonlite::escape(s.receiver) << "\""
    << ",\"sender\":\"" << jsonlite::escape(s.sender) << "\""
    << ",\"nonce\":" << s.nonce
    << ",\"framing\":\"" << (s.framing == FramingMode::single_shot ? "single_shot" : "chunked") << "\""
    << ",\"chunk_count\":" << s.chunk_count
    << ",\"total_bytes\":" << s.total_bytes
    << ",\"duration_ms\":" << (s.duration_ns / 1000000u)
    << ",\"transaction_ids\":[";
  for (std::size_t i = 0; i < s.transaction_ids.size(); ++i) {
    if (i) o << ",";
    if (s.transaction_ids[i]) {
      o << "\"" << jsonlite::escape(*s.transaction_ids[i]) << "\"";
    } else {
      o << "null";
    }
  }
  o << "]}";
  return o.str();
}

std::string failure_text(const UploadError& err) {
  std::string out = "ERROR [" + to_string(err.code) + "]: " + err.message + "\n";
  if (!err.stdout_text.empty()) out += "STDOUT:\n" + err.stdout_text + "\n";
  if (!err.stderr_text.empty()) out += "STDERR:\n" + err.stderr_text + "\n";
  return out;
}

std::string failure_json(const UploadError& err, const SessionResult& partial) {
  std::ostringstream o;
  o << "{\"ok\":false"
    << ",\"error\":{\"code\":\"" << to_string(err.code) << "\""
    << ",\"message\":\"" << jsonlite::escape(err.message) << "\""
    << ",\"stdout\":\"" << jsonlite::escape(err.stdout_text) << "\""
    << ",\"stderr\":\"" << jsonlite::escape(err.stderr_text) << "\"}"
    << ",\"chunks_attempted\":" << partial.outcomes.size()
    << ",\"transaction_ids\":[";
  bool first = true;
  for (const auto& oc : partial.outcomes) {
    if (!first) o << ",";
    first = false;
    if (oc.transaction_id) {
      o << "\"" << jsonlite::escape(*oc.transaction_id) << "\"";
    } else {
      o << "null";
    }
  }
  o << "]}";
  return o.str();
}

}  // namespace blobcast
