#include "blobcast/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "blobcast/jsonlite.hpp"

namespace blobcast {

namespace {

// BLOBCAST_* key, optional legacy FASTFS_* alias.
struct KeySpec {
  const char* key;
  const char* legacy;
};

constexpr KeySpec kKeys[] = {
    {"BLOBCAST_RECEIVER", "FASTFS_RECEIVER"},
    {"BLOBCAST_SENDER_ACCOUNT_ID", "FASTFS_SENDER_ACCOUNT_ID"},
    {"BLOBCAST_SENDER_PRIVATE_KEY", "FASTFS_SENDER_PRIVATE_KEY"},
    {"BLOBCAST_NETWORK", nullptr},
    {"BLOBCAST_STORAGE_DOMAIN", nullptr},
    {"BLOBCAST_BROADCASTER", nullptr},
    {"BLOBCAST_GAS", nullptr},
    {"BLOBCAST_DEPOSIT", nullptr},
    {"BLOBCAST_MAX_CHUNK_SIZE", nullptr},
    {"BLOBCAST_TIMEOUT_MS", nullptr},
    {"BLOBCAST_NONCE_MODE", nullptr},
    {"BLOBCAST_SPOOL_DIR", nullptr},
    {"BLOBCAST_RECEIPT_DIR", nullptr},
    {"BLOBCAST_EVENT_LOG", nullptr},
};

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// Value for `spec` from `values`, preferring the BLOBCAST_* name.
const std::string* lookup(const EnvValues& values, const KeySpec& spec) {
  auto it = values.find(spec.key);
  if (it != values.end()) return &it->second;
  if (spec.legacy) {
    it = values.find(spec.legacy);
    if (it != values.end()) return &it->second;
  }
  return nullptr;
}

template <typename T>
bool parse_unsigned(const std::string& text, T& out) {
  if (text.empty()) return false;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

EnvValues parse_env_text(const std::string& text) {
  EnvValues out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    out[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
  }
  return out;
}

std::optional<EnvValues> load_env_file(const std::string& path, UploadError* err) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    fail(err, ErrorCode::missing_input, "env file not found: " + path);
    return std::nullopt;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return parse_env_text(ss.str());
}

std::optional<std::string> infer_network(const std::string& account) {
  auto ends_with = [&](const std::string& suffix) {
    return account.size() > suffix.size() &&
           account.compare(account.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with(".near")) return std::string("mainnet");
  if (ends_with(".testnet")) return std::string("testnet");
  return std::nullopt;
}

EnvValues process_env_values() {
  EnvValues out;
  for (const auto& spec : kKeys) {
    if (const char* v = std::getenv(spec.key); v && v[0]) out[spec.key] = v;
    if (spec.legacy) {
      if (const char* v = std::getenv(spec.legacy); v && v[0]) out[spec.legacy] = v;
    }
  }
  return out;
}

std::optional<UploaderConfig> UploaderConfig::from_values(const EnvValues& values,
                                                          UploadError* err) {
  UploaderConfig c;
  auto str = [&](const KeySpec& spec, std::string& field) {
    if (const std::string* v = lookup(values, spec)) field = *v;
  };
  str(kKeys[0], c.receiver);
  str(kKeys[1], c.sender_account_id);
  str(kKeys[2], c.sender_private_key);
  str(kKeys[3], c.network);
  str(kKeys[4], c.storage_domain);
  str(kKeys[5], c.broadcaster);
  str(kKeys[6], c.gas);
  str(kKeys[7], c.deposit);
  str(kKeys[11], c.spool_dir);
  str(kKeys[12], c.receipt_dir);
  str(kKeys[13], c.event_log);

  if (const std::string* v = lookup(values, kKeys[8])) {
    if (!parse_unsigned(*v, c.max_chunk_size)) {
      fail(err, ErrorCode::config_invalid, "BLOBCAST_MAX_CHUNK_SIZE is not a u32: " + *v);
      return std::nullopt;
    }
  }
  if (const std::string* v = lookup(values, kKeys[9])) {
    if (!parse_unsigned(*v, c.timeout_ms)) {
      fail(err, ErrorCode::config_invalid, "BLOBCAST_TIMEOUT_MS is not an integer: " + *v);
      return std::nullopt;
    }
  }
  if (const std::string* v = lookup(values, kKeys[10])) {
    if (*v == "random") {
      c.nonce_mode = NonceMode::random;
    } else if (*v == "wall_clock") {
      c.nonce_mode = NonceMode::wall_clock;
    } else {
      fail(err, ErrorCode::config_invalid,
           "BLOBCAST_NONCE_MODE must be random or wall_clock, got: " + *v);
      return std::nullopt;
    }
  }
  return c;
}

EnvValues resolve_aliases(EnvValues values) {
  for (const auto& spec : kKeys) {
    if (!spec.legacy) continue;
    auto legacy = values.find(spec.legacy);
    if (legacy == values.end()) continue;
    values.try_emplace(spec.key, legacy->second);
    values.erase(legacy);
  }
  return values;
}

EnvValues layer_env(EnvValues base, EnvValues overlay) {
  EnvValues merged = resolve_aliases(std::move(base));
  for (auto& [k, v] : resolve_aliases(std::move(overlay))) merged[k] = std::move(v);
  return merged;
}

std::optional<UploaderConfig> UploaderConfig::from_env(const std::string& env_file,
                                                       UploadError* err) {
  EnvValues file_values;
  if (!env_file.empty()) {
    auto loaded = load_env_file(env_file, err);
    if (!loaded) return std::nullopt;
    file_values = std::move(*loaded);
  }
  return from_values(layer_env(std::move(file_values), process_env_values()), err);
}

bool UploaderConfig::validate(UploadError* err) {
  if (receiver.empty()) return fail(err, ErrorCode::config_invalid, "BLOBCAST_RECEIVER is required");
  if (sender_account_id.empty()) {
    return fail(err, ErrorCode::config_invalid, "BLOBCAST_SENDER_ACCOUNT_ID is required");
  }
  if (sender_private_key.empty()) {
    return fail(err, ErrorCode::config_invalid, "BLOBCAST_SENDER_PRIVATE_KEY is required");
  }
  if (network.empty()) {
    auto inferred = infer_network(receiver);
    if (!inferred) {
      return fail(err, ErrorCode::config_invalid,
                  "cannot determine network from receiver '" + receiver +
                      "' (expected *.near or *.testnet); set BLOBCAST_NETWORK");
    }
    network = *inferred;
  }
  if (storage_domain.empty()) {
    return fail(err, ErrorCode::config_invalid, "BLOBCAST_STORAGE_DOMAIN is empty");
  }
  if (broadcaster.empty()) return fail(err, ErrorCode::config_invalid, "BLOBCAST_BROADCASTER is empty");
  if (max_chunk_size == 0) return fail(err, ErrorCode::config_invalid, "BLOBCAST_MAX_CHUNK_SIZE must be > 0");
  if (timeout_ms == 0) return fail(err, ErrorCode::config_invalid, "BLOBCAST_TIMEOUT_MS must be > 0");
  return true;
}

std::string UploaderConfig::to_json() const {
  std::string o = "{\"receiver\":\"" + jsonlite::escape(receiver) + "\"";
  o += ",\"sender_account_id\":\"" + jsonlite::escape(sender_account_id) + "\"";
  o += ",\"sender_private_key\":\"";
  o += sender_private_key.empty() ? "" : "<redacted>";
  o += "\",\"network\":\"" + jsonlite::escape(network) + "\"";
  o += ",\"storage_domain\":\"" + jsonlite::escape(storage_domain) + "\"";
  o += ",\"broadcaster\":\"" + jsonlite::escape(broadcaster) + "\"";
  o += ",\"gas\":\"" + jsonlite::escape(gas) + "\"";
  o += ",\"deposit\":\"" + jsonlite::escape(deposit) + "\"";
  o += ",\"max_chunk_size\":" + std::to_string(max_chunk_size);
  o += ",\"timeout_ms\":" + std::to_string(timeout_ms);
  o += ",\"nonce_mode\":\"";
  o += nonce_mode == NonceMode::random ? "random" : "wall_clock";
  o += "\",\"spool_dir\":\"" + jsonlite::escape(spool_dir) + "\"";
  o += ",\"receipt_dir\":\"" + jsonlite::escape(receipt_dir) + "\"";
  o += ",\"event_log\":\"" + jsonlite::escape(event_log) + "\"}";
  return o;
}

}  // namespace blobcast
