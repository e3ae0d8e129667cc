#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include "blobcast/broadcaster.hpp"
#include "blobcast/chunk_planner.hpp"
#include "blobcast/codec.hpp"
#include "blobcast/config.hpp"
#include "blobcast/hash.hpp"
#include "blobcast/jsonlite.hpp"
#include "blobcast/keystore_cipher.hpp"
#include "blobcast/observability.hpp"
#include "blobcast/receipt_store.hpp"
#include "blobcast/reporter.hpp"
#include "blobcast/session.hpp"
#include "blobcast/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.1.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
    "usage: blobcast <command> [options]\n"
    "\n"
    "commands:\n"
    "  upload <file> [--env FILE] [--mime TYPE] [--chunk-size N]\n"
    "                [--single-shot] [--json] [--skip-existing]\n"
    "  hash <file> [--json]\n"
    "  plan <file> [--chunk-size N] [--single-shot] [--json]\n"
    "  inspect <frame-file> [--json]\n"
    "  encrypt-secrets --pubkey HEX (<json> | --file PATH)\n"
    "                  [--repo REPO --owner ACCOUNT --profile NAME\n"
    "                   [--branch NAME] [--contract ACCOUNT]]\n"
    "  decrypt-secrets --pubkey HEX (<base64> | --file PATH)\n"
    "  status <file> [--env FILE] [--json]\n"
    "  health [--env FILE]\n"
    "\n"
    "plan and inspect always print their result as JSON; --json also puts\n"
    "errors on stdout as JSON.\n";

// Options that take a value. Everything else starting with "--" is a flag.
const std::set<std::string> kValueOptions = {"--env",   "--mime",  "--chunk-size", "--pubkey",
                                             "--file",  "--repo",  "--owner",      "--profile",
                                             "--branch", "--contract"};
const std::set<std::string> kFlags = {"--single-shot", "--json", "--skip-existing", "--help"};

struct Args {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  std::set<std::string> flags;
  std::string error;

  bool has(const std::string& flag) const { return flags.count(flag) != 0; }
  std::string get(const std::string& opt, const std::string& def = "") const {
    auto it = options.find(opt);
    return it == options.end() ? def : it->second;
  }
};

Args parse_args(int argc, char** argv, int first) {
  Args a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (kValueOptions.count(arg)) {
        if (i + 1 >= argc) {
          a.error = arg + " requires a value";
          return a;
        }
        a.options[arg] = argv[++i];
      } else if (kFlags.count(arg)) {
        a.flags.insert(arg);
      } else {
        a.error = "unknown option: " + arg;
        return a;
      }
    } else {
      a.positional.push_back(arg);
    }
  }
  return a;
}

int usage_error(const std::string& msg) {
  std::cerr << "error: " << msg << "\n\n" << kUsage;
  return kExitUsage;
}

int report_error(const blobcast::UploadError& err, bool json) {
  if (json) {
    std::cout << "{\"ok\":false,\"error\":{\"code\":\"" << blobcast::to_string(err.code)
              << "\",\"message\":\"" << blobcast::jsonlite::escape(err.message) << "\"}}\n";
  }
  std::cerr << blobcast::failure_text(err);
  return kExitFailure;
}

bool parse_chunk_size(const std::string& text, std::uint32_t& out) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return !text.empty() && ec == std::errc() && ptr == last && out > 0;
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Positional argument or --file contents.
std::optional<std::string> text_input(const Args& a, std::size_t index, std::string* error) {
  if (!a.get("--file").empty()) {
    auto data = read_file(a.get("--file"));
    if (!data) *error = "cannot read " + a.get("--file");
    return data;
  }
  if (a.positional.size() <= index) {
    *error = "missing input";
    return std::nullopt;
  }
  return a.positional[index];
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_upload(const Args& a) {
  if (a.positional.size() != 1) return usage_error("upload takes exactly one file");
  const bool json = a.has("--json");

  blobcast::UploadError err;
  auto cfg = blobcast::UploaderConfig::from_env(a.get("--env"), &err);
  if (!cfg) return report_error(err, json);

  blobcast::SessionOptions opts;
  opts.max_chunk_size = cfg->max_chunk_size;
  if (!a.get("--chunk-size").empty() && !parse_chunk_size(a.get("--chunk-size"), opts.max_chunk_size)) {
    return usage_error("--chunk-size must be a positive 32-bit integer");
  }
  cfg->max_chunk_size = opts.max_chunk_size;
  if (!cfg->validate(&err)) return report_error(err, json);

  opts.mime_override = a.get("--mime");
  opts.prefer_single_shot = a.has("--single-shot");
  opts.nonce_mode = cfg->nonce_mode;
  opts.skip_existing = a.has("--skip-existing");

  if (!cfg->event_log.empty()) blobcast::set_event_log_path(cfg->event_log);

  blobcast::NearCliBroadcaster broadcaster(cfg->broadcaster, cfg->timeout_ms);
  blobcast::ReceiptStore receipts(cfg->receipt_dir);
  std::ostream& progress = json ? std::cerr : std::cout;

  auto run = blobcast::run_upload(*cfg, a.positional[0], opts, broadcaster, &receipts, &progress);
  if (!run.ok) {
    if (json) std::cout << blobcast::failure_json(run.error, run.result) << "\n";
    std::cerr << blobcast::failure_text(run.error);
    return kExitFailure;
  }

  if (json) {
    std::cout << blobcast::summary_json(*run.summary) << "\n";
  } else {
    std::cout << "\n" << blobcast::summary_text(*run.summary);
  }
  return kExitOk;
}

int cmd_hash(const Args& a) {
  if (a.positional.size() != 1) return usage_error("hash takes exactly one file");
  const std::string& path = a.positional[0];
  blobcast::UploadError err;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    blobcast::fail(&err, blobcast::ErrorCode::missing_input, "file not found: " + path);
    return report_error(err, a.has("--json"));
  }
  // Streamed, so hashing does not hold the whole file in memory.
  const auto digest_opt = blobcast::hash_file_sha256_hex(path);
  const auto size = std::filesystem::file_size(path, ec);
  if (!digest_opt || ec) {
    blobcast::fail(&err, blobcast::ErrorCode::missing_input, "read error on " + path);
    return report_error(err, a.has("--json"));
  }
  const std::string& digest = *digest_opt;
  const std::string ext = blobcast::file_extension(a.positional[0]);
  const std::string rel = blobcast::relative_path_for(digest, ext);
  if (a.has("--json")) {
    std::cout << "{\"content_hash\":\"" << digest << "\",\"relative_path\":\""
              << blobcast::jsonlite::escape(rel) << "\",\"mime_type\":\""
              << blobcast::jsonlite::escape(blobcast::mime_type_for(ext))
              << "\",\"size\":" << size
              << ",\"descriptor\":" << blobcast::content_hash_descriptor(digest) << "}\n";
  } else {
    std::cout << rel << "\n" << blobcast::content_hash_descriptor(digest) << "\n";
  }
  return kExitOk;
}

int cmd_plan(const Args& a) {
  if (a.positional.size() != 1) return usage_error("plan takes exactly one file");
  const bool json = a.has("--json");
  blobcast::SessionOptions opts;
  if (!a.get("--chunk-size").empty() && !parse_chunk_size(a.get("--chunk-size"), opts.max_chunk_size)) {
    return usage_error("--chunk-size must be a positive 32-bit integer");
  }
  opts.prefer_single_shot = a.has("--single-shot");

  blobcast::UploadError err;
  auto content = blobcast::read_content(a.positional[0], &err);
  if (!content) return report_error(err, json);
  auto session = blobcast::make_session(std::move(*content), a.positional[0], opts, &err);
  if (!session) return report_error(err, json);
  auto chunks = blobcast::plan_session(*session, &err);
  if (!chunks) return report_error(err, json);

  std::ostringstream o;
  o << "{\"content_hash\":\"" << session->content_hash << "\""
    << ",\"relative_path\":\"" << blobcast::jsonlite::escape(session->relative_path) << "\""
    << ",\"mime_type\":\"" << blobcast::jsonlite::escape(session->mime_type) << "\""
    << ",\"full_size\":" << session->content.size()
    << ",\"framing\":\""
    << (session->framing == blobcast::FramingMode::single_shot ? "single_shot" : "chunked") << "\""
    << ",\"max_chunk_size\":" << session->max_chunk_size
    << ",\"chunk_count\":" << chunks->size() << ",\"chunks\":[";
  for (std::size_t i = 0; i < chunks->size(); ++i) {
    const auto& c = (*chunks)[i];
    if (i) o << ",";
    o << "{\"index\":" << i << ",\"offset\":" << c.offset << ",\"length\":" << c.bytes.size()
      << "}";
  }
  o << "]}";
  std::cout << o.str() << "\n";
  return kExitOk;
}

int cmd_inspect(const Args& a) {
  if (a.positional.size() != 1) return usage_error("inspect takes exactly one frame file");
  const bool json = a.has("--json");
  auto bytes = read_file(a.positional[0]);
  if (!bytes) {
    blobcast::UploadError err;
    blobcast::fail(&err, blobcast::ErrorCode::missing_input, "cannot read " + a.positional[0]);
    return report_error(err, json);
  }
  blobcast::UploadError err;
  auto frame = blobcast::decode_frame(*bytes, &err);
  if (!frame) return report_error(err, json);

  std::ostringstream o;
  if (const auto* s = std::get_if<blobcast::SingleShotFrame>(&*frame)) {
    o << "{\"variant\":\"single_shot\""
      << ",\"relative_path\":\"" << blobcast::jsonlite::escape(s->relative_path) << "\""
      << ",\"has_content\":" << (s->has_content ? "true" : "false");
    if (s->has_content) {
      o << ",\"mime_type\":\"" << blobcast::jsonlite::escape(s->mime_type) << "\""
        << ",\"content_length\":" << s->content.size()
        << ",\"content_sha256\":\"" << blobcast::sha256_hex(s->content) << "\"";
    }
    o << "}";
  } else {
    const auto& c = std::get<blobcast::ChunkFrame>(*frame);
    o << "{\"variant\":\"chunk\""
      << ",\"relative_path\":\"" << blobcast::jsonlite::escape(c.relative_path) << "\""
      << ",\"offset\":" << c.offset << ",\"full_size\":" << c.full_size
      << ",\"mime_type\":\"" << blobcast::jsonlite::escape(c.mime_type) << "\""
      << ",\"chunk_length\":" << c.content_chunk.size()
      << ",\"chunk_sha256\":\"" << blobcast::sha256_hex(c.content_chunk) << "\""
      << ",\"nonce\":" << c.nonce << "}";
  }
  o << "\n";
  std::cout << o.str();
  return kExitOk;
}

int cmd_encrypt_secrets(const Args& a) {
  const std::string pubkey = a.get("--pubkey");
  if (pubkey.empty()) return usage_error("--pubkey is required");
  std::string input_error;
  auto plaintext = text_input(a, 0, &input_error);
  if (!plaintext) return usage_error(input_error);

  blobcast::SecretsStoreTarget target;
  target.repo = a.get("--repo");
  target.owner = a.get("--owner");
  target.profile = a.get("--profile");
  target.branch = a.get("--branch");
  target.contract = a.get("--contract", std::string(blobcast::kDefaultSecretsContract));
  const bool with_target = !target.repo.empty() || !target.owner.empty() || !target.profile.empty();
  if (with_target && (target.repo.empty() || target.owner.empty() || target.profile.empty())) {
    return usage_error("--repo, --owner and --profile go together");
  }

  blobcast::UploadError err;
  auto out = blobcast::encrypt_secrets(*plaintext, pubkey, &err);
  if (!out) return report_error(err, false);
  std::cerr << "encrypted " << plaintext->size() << " bytes\n";
  std::cout << *out << "\n";
  if (with_target) {
    std::cerr << "keystore seed: "
              << blobcast::keystore_seed(target.repo, target.owner, target.branch) << "\n"
              << "store with:\n  " << blobcast::store_secrets_command(target, *out) << "\n";
  }
  return kExitOk;
}

int cmd_decrypt_secrets(const Args& a) {
  const std::string pubkey = a.get("--pubkey");
  if (pubkey.empty()) return usage_error("--pubkey is required");
  std::string input_error;
  auto ciphertext = text_input(a, 0, &input_error);
  if (!ciphertext) return usage_error(input_error);

  blobcast::UploadError err;
  auto out = blobcast::decrypt_secrets(*ciphertext, pubkey, &err);
  if (!out) return report_error(err, false);
  std::cout << *out << "\n";
  return kExitOk;
}

int cmd_status(const Args& a) {
  if (a.positional.size() != 1) return usage_error("status takes exactly one file");
  const bool json = a.has("--json");

  blobcast::UploadError err;
  auto cfg = blobcast::UploaderConfig::from_env(a.get("--env"), &err);
  if (!cfg) return report_error(err, json);
  auto content = blobcast::read_content(a.positional[0], &err);
  if (!content) return report_error(err, json);

  const std::string digest = blobcast::sha256_hex(*content);
  blobcast::ReceiptStore store(cfg->receipt_dir);
  auto receipt = store.get(digest, &err);
  if (!receipt) {
    if (!err.ok()) return report_error(err, json);
    if (json) {
      std::cout << "{\"found\":false,\"content_hash\":\"" << digest << "\"}\n";
    } else {
      std::cout << "no receipt for " << digest << " in " << store.root() << "\n";
    }
    return kExitFailure;
  }

  if (json) {
    std::cout << "{\"found\":true,\"receipt\":" << blobcast::receipt_to_json(*receipt) << "}\n";
  } else {
    std::cout << blobcast::summary_text(blobcast::summary_from_receipt(*receipt));
  }
  return kExitOk;
}

// Known SHA-256 vectors; a wrong libcrypto build must not produce addresses.
bool verify_hash_vectors() {
  return blobcast::sha256_hex("") ==
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" &&
         blobcast::sha256_hex("abc") ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" &&
         blobcast::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262";
}

int cmd_health(const Args& a) {
  const auto manifest = blobcast::version::current_manifest(PROJECT_VERSION);
  const bool vectors_ok = verify_hash_vectors();

  // A missing or invalid config is reported in the document, not as a failure.
  blobcast::UploadError err;
  std::string config_json = "null";
  auto cfg = blobcast::UploaderConfig::from_env(a.get("--env"), &err);
  if (cfg && cfg->validate(&err)) config_json = cfg->to_json();

  std::cout << "{\"ok\":" << (vectors_ok ? "true" : "false")
            << ",\"hash_vectors\":" << (vectors_ok ? "true" : "false")
            << ",\"version\":" << blobcast::version::manifest_to_json(manifest)
            << ",\"config\":" << config_json;
  if (!err.ok()) {
    std::cout << ",\"config_error\":{\"code\":\"" << blobcast::to_string(err.code)
              << "\",\"message\":\"" << blobcast::jsonlite::escape(err.message) << "\"}";
  }
  std::cout << ",\"stats\":" << blobcast::global_upload_stats().to_json() << "}\n";
  return vectors_ok ? kExitOk : kExitFailure;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << kUsage;
    return kExitUsage;
  }
  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "help") {
    std::cout << kUsage;
    return kExitOk;
  }

  const Args args = parse_args(argc, argv, 2);
  if (!args.error.empty()) return usage_error(args.error);
  if (args.has("--help")) {
    std::cout << kUsage;
    return kExitOk;
  }

  if (cmd == "upload") return cmd_upload(args);
  if (cmd == "hash") return cmd_hash(args);
  if (cmd == "plan") return cmd_plan(args);
  if (cmd == "inspect") return cmd_inspect(args);
  if (cmd == "encrypt-secrets") return cmd_encrypt_secrets(args);
  if (cmd == "decrypt-secrets") return cmd_decrypt_secrets(args);
  if (cmd == "status") return cmd_status(args);
  if (cmd == "health") return cmd_health(args);

  return usage_error("unknown command: " + cmd);
}
