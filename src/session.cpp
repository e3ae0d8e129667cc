#include "blobcast/session.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

#include "blobcast/classifier.hpp"
#include "blobcast/hash.hpp"

namespace fs = std::filesystem;

namespace blobcast {

namespace {

const std::map<std::string, std::string>& mime_table() {
  static const std::map<std::string, std::string> table = {
      {"wasm", "application/wasm"},
      {"json", "application/json"},
      {"js", "text/javascript"},
      {"mjs", "text/javascript"},
      {"html", "text/html"},
      {"htm", "text/html"},
      {"css", "text/css"},
      {"txt", "text/plain"},
      {"md", "text/markdown"},
      {"svg", "image/svg+xml"},
      {"png", "image/png"},
      {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},
      {"gif", "image/gif"},
      {"webp", "image/webp"},
      {"pdf", "application/pdf"},
      {"zip", "application/zip"},
      {"gz", "application/gzip"},
  };
  return table;
}

}  // namespace

std::optional<std::string> read_content(const std::string& path, UploadError* err) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    fail(err, ErrorCode::missing_input, "file not found: " + path);
    return std::nullopt;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    fail(err, ErrorCode::missing_input, "cannot open " + path);
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (ifs.bad()) {
    fail(err, ErrorCode::missing_input, "read error on " + path);
    return std::nullopt;
  }
  return ss.str();
}

std::string file_extension(const std::string& path) {
  std::string ext = fs::path(path).extension().string();
  if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::string relative_path_for(const std::string& content_hash, const std::string& ext) {
  return ext.empty() ? content_hash : content_hash + "." + ext;
}

std::string mime_type_for(const std::string& ext) {
  auto it = mime_table().find(ext);
  return it == mime_table().end() ? "application/octet-stream" : it->second;
}

std::optional<UploadSession> make_session(std::string content, const std::string& source_path,
                                          const SessionOptions& opts, UploadError* err) {
  if (content.size() > std::numeric_limits<std::uint32_t>::max()) {
    fail(err, ErrorCode::encoding_overflow,
         "content is " + std::to_string(content.size()) + " bytes; frames carry u32 sizes");
    return std::nullopt;
  }
  if (opts.max_chunk_size == 0) {
    fail(err, ErrorCode::config_invalid, "max chunk size must be > 0");
    return std::nullopt;
  }

  UploadSession s;
  s.content_hash = sha256_hex(content);
  const std::string ext = file_extension(source_path);
  s.relative_path = relative_path_for(s.content_hash, ext);
  s.mime_type = opts.mime_override.empty() ? mime_type_for(ext) : opts.mime_override;
  s.max_chunk_size = opts.max_chunk_size;
  s.nonce = make_session_nonce(opts.nonce_mode);
  s.framing = choose_framing(content.size(), opts.prefer_single_shot);
  s.content = std::move(content);
  return s;
}

std::optional<std::vector<Chunk>> plan_session(const UploadSession& session, UploadError* err) {
  if (session.framing == FramingMode::single_shot) {
    const auto whole = static_cast<std::uint32_t>(
        std::max<std::size_t>(session.content.size(), 1));
    return plan_chunks(session.content, whole, err);
  }
  return plan_chunks(session.content, session.max_chunk_size, err);
}

Receipt receipt_from_summary(const UploadSummary& s) {
  Receipt r;
  r.content_hash = s.content_hash;
  r.relative_path = s.relative_path;
  r.url = s.url;
  r.mime_type = s.mime_type;
  r.network = s.network;
  r.receiver = s.receiver;
  r.sender = s.sender;
  r.nonce = s.nonce;
  r.chunk_count = s.chunk_count;
  r.total_bytes = s.total_bytes;
  for (const auto& id : s.transaction_ids) r.transaction_ids.push_back(id.value_or(""));
  r.created_at = static_cast<std::uint64_t>(std::time(nullptr));
  return r;
}

UploadSummary summary_from_receipt(const Receipt& r) {
  UploadSummary s;
  s.url = r.url;
  s.relative_path = r.relative_path;
  s.content_hash = r.content_hash;
  s.mime_type = r.mime_type;
  s.network = r.network;
  s.receiver = r.receiver;
  s.sender = r.sender;
  s.nonce = r.nonce;
  s.chunk_count = r.chunk_count;
  s.total_bytes = r.total_bytes;
  for (const auto& id : r.transaction_ids) {
    if (id.empty()) {
      s.transaction_ids.emplace_back(std::nullopt);
    } else {
      s.transaction_ids.emplace_back(id);
    }
  }
  return s;
}

UploadRun run_upload(const UploaderConfig& cfg, const std::string& file,
                     const SessionOptions& opts, Broadcaster& broadcaster,
                     ReceiptStore* receipts, std::ostream* progress) {
  UploadRun run;

  auto content = read_content(file, &run.error);
  if (!content) return run;

  auto session = make_session(std::move(*content), file, opts, &run.error);
  if (!session) return run;
  run.session = std::move(*session);

  if (opts.skip_existing && receipts) {
    UploadError lookup_err;
    auto existing = receipts->get(run.session.content_hash, &lookup_err);
    if (existing && existing->receiver == cfg.receiver && existing->sender == cfg.sender_account_id &&
        existing->network == cfg.network && existing->relative_path == run.session.relative_path) {
      run.ok = true;
      run.skipped = true;
      run.summary = summary_from_receipt(*existing);
      if (progress) *progress << "already uploaded; using receipt from " << receipts->root() << "\n";
      return run;
    }
    if (!lookup_err.ok() && progress) {
      *progress << "warning: ignoring receipt: " << lookup_err.message << "\n";
    }
  }

  auto chunks = plan_session(run.session, &run.error);
  if (!chunks) return run;

  if (progress) {
    *progress << "Uploading " << file << "\n"
              << "  size:     " << run.session.content.size() << " bytes\n"
              << "  sha256:   " << run.session.content_hash << "\n"
              << "  sender:   " << cfg.sender_account_id << "\n"
              << "  receiver: " << cfg.receiver << "\n"
              << "  network:  " << cfg.network << "\n"
              << "  chunks:   " << chunks->size() << " ("
              << (run.session.framing == FramingMode::single_shot ? "single-shot" : "chunked")
              << ")\n";
  }

  BroadcastRequest tmpl;
  tmpl.network = cfg.network;
  tmpl.receiver = cfg.receiver;
  tmpl.gas = cfg.gas;
  tmpl.deposit = cfg.deposit;
  tmpl.signer_account = cfg.sender_account_id;
  tmpl.signer_credential = cfg.sender_private_key;

  DataSinkClassifier classifier;
  SubmissionDriver driver(broadcaster, classifier, std::move(tmpl), cfg.spool_dir, progress);
  run.result = driver.submit_all(run.session, *chunks);
  if (!run.result.ok) {
    run.error = run.result.error;
    return run;
  }

  ReportContext ctx{cfg.network, cfg.receiver, cfg.sender_account_id, cfg.storage_domain};
  run.summary = summarize(run.session, run.result, ctx);
  run.ok = run.summary.has_value();

  if (run.ok && receipts) {
    if (!receipts->put(receipt_from_summary(*run.summary), &run.receipt_error, true) && progress) {
      *progress << "warning: receipt not recorded: " << run.receipt_error.message << "\n";
    }
  }
  return run;
}

}  // namespace blobcast
