#include "blobcast/keystore_cipher.hpp"

#include <openssl/evp.h>

#include <vector>

#include "blobcast/hash.hpp"
#include "blobcast/jsonlite.hpp"

namespace blobcast {

bool is_reserved_secret_key(std::string_view key) {
  for (auto reserved : kReservedSecretKeys) {
    if (reserved == key) return true;
  }
  return false;
}

std::optional<std::string> parse_key_material(std::string_view hex, UploadError* err) {
  if (hex.size() != kKeyMaterialBytes * 2) {
    fail(err, ErrorCode::invalid_key_material,
         "public key must be " + std::to_string(kKeyMaterialBytes * 2) + " hex chars, got " +
             std::to_string(hex.size()));
    return std::nullopt;
  }
  auto raw = from_hex(hex);
  if (!raw) {
    fail(err, ErrorCode::invalid_key_material, "public key is not valid hex");
    return std::nullopt;
  }
  return raw;
}

std::string derive_key(std::string_view key_material) {
  std::string input(key_material);
  input.append(kKeyDerivationContext);
  return sha256_bytes(input);
}

std::optional<std::string> xor_cipher(std::string_view input, std::string_view key_material,
                                      UploadError* err) {
  if (input.size() > kMaxCipherInput) {
    fail(err, ErrorCode::payload_too_large,
         "input is " + std::to_string(input.size()) + " bytes, limit is " +
             std::to_string(kMaxCipherInput));
    return std::nullopt;
  }
  const std::string key = derive_key(key_material);
  std::string out(input);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<char>(static_cast<unsigned char>(out[i]) ^
                               static_cast<unsigned char>(key[i % key.size()]));
  }
  return out;
}

std::string base64_encode(std::string_view bytes) {
  if (bytes.empty()) return {};
  std::vector<unsigned char> buf(4 * ((bytes.size() + 2) / 3) + 1);
  const int n = EVP_EncodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                                static_cast<int>(bytes.size()));
  return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n));
}

std::optional<std::string> base64_decode(std::string_view text, UploadError* err) {
  std::string clean;
  clean.reserve(text.size());
  for (char c : text) {
    if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
    clean.push_back(c);
  }
  if (clean.empty()) return std::string();
  if (clean.size() % 4 != 0) {
    fail(err, ErrorCode::frame_malformed, "base64 length is not a multiple of 4");
    return std::nullopt;
  }
  if (clean.size() / 4 * 3 > kMaxCipherInput + 3) {
    fail(err, ErrorCode::payload_too_large, "base64 input exceeds the cipher input limit");
    return std::nullopt;
  }

  std::size_t padding = 0;
  if (clean.back() == '=') ++padding;
  if (clean.size() >= 2 && clean[clean.size() - 2] == '=') ++padding;

  std::vector<unsigned char> buf(clean.size() / 4 * 3 + 1);
  const int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                static_cast<int>(clean.size()));
  if (n < 0 || static_cast<std::size_t>(n) < padding) {
    fail(err, ErrorCode::frame_malformed, "invalid base64");
    return std::nullopt;
  }
  // EVP_DecodeBlock counts '=' padding as zero bytes.
  return std::string(reinterpret_cast<const char*>(buf.data()),
                     static_cast<std::size_t>(n) - padding);
}

bool validate_secrets_json(const std::string& json, UploadError* err) {
  std::optional<jsonlite::JsonError> jerr;
  // The keystore decodes secrets into a JSON map: any value type is allowed
  // and a repeated key keeps its last value.
  const jsonlite::Object obj = jsonlite::parse(json, &jerr, jsonlite::DuplicateKeys::last_wins);
  if (jerr) {
    return fail(err, ErrorCode::config_invalid,
                "secrets must be a JSON object, e.g. {\"KEY\":\"value\"}: " + jerr->message);
  }
  std::string reserved;
  for (const auto& [key, value] : obj) {
    if (is_reserved_secret_key(key)) {
      if (!reserved.empty()) reserved += ", ";
      reserved += key;
    }
  }
  if (!reserved.empty()) {
    return fail(err, ErrorCode::config_invalid,
                "cannot use reserved system keywords as secret keys: " + reserved);
  }
  return true;
}

std::optional<std::string> encrypt_secrets(const std::string& json, std::string_view pubkey_hex,
                                           UploadError* err) {
  auto key = parse_key_material(pubkey_hex, err);
  if (!key) return std::nullopt;
  if (json.size() > kMaxCipherInput) {
    fail(err, ErrorCode::payload_too_large, "secrets exceed " + std::to_string(kMaxCipherInput) + " bytes");
    return std::nullopt;
  }
  if (!validate_secrets_json(json, err)) return std::nullopt;
  auto ct = xor_cipher(json, *key, err);
  if (!ct) return std::nullopt;
  return base64_encode(*ct);
}

std::optional<std::string> decrypt_secrets(std::string_view base64, std::string_view pubkey_hex,
                                           UploadError* err) {
  auto key = parse_key_material(pubkey_hex, err);
  if (!key) return std::nullopt;
  auto ct = base64_decode(base64, err);
  if (!ct) return std::nullopt;
  return xor_cipher(*ct, *key, err);
}

std::string normalize_repo(std::string_view repo) {
  constexpr std::string_view kHost = "github.com/";
  constexpr std::string_view kHttps = "https://github.com/";
  constexpr std::string_view kSsh = "git@github.com:";
  std::string path;
  if (repo.starts_with(kHttps)) {
    path = repo.substr(kHttps.size());
  } else if (repo.starts_with(kSsh)) {
    path = repo.substr(kSsh.size());
    if (path.ends_with(".git")) path.resize(path.size() - 4);
  } else if (repo.starts_with(kHost)) {
    path = repo.substr(kHost.size());
  } else {
    path = repo;
  }
  return std::string(kHost) + path;
}

std::string keystore_seed(std::string_view repo, std::string_view owner, std::string_view branch) {
  std::string seed = normalize_repo(repo) + ":" + std::string(owner);
  if (!branch.empty()) seed += ":" + std::string(branch);
  return seed;
}

std::string store_secrets_command(const SecretsStoreTarget& target,
                                  std::string_view encrypted_base64) {
  // The contract stores the repository without the host prefix.
  const std::string repo = normalize_repo(target.repo).substr(std::string_view("github.com/").size());
  std::string args = "{\"repo\":\"" + jsonlite::escape(repo) + "\"";
  if (!target.branch.empty()) args += ",\"branch\":\"" + jsonlite::escape(target.branch) + "\"";
  args += ",\"profile\":\"" + jsonlite::escape(target.profile) + "\"";
  args += ",\"encrypted_secrets_base64\":\"" + std::string(encrypted_base64) + "\"";
  args += ",\"access\":{\"AllowAll\":{}}}";
  return "near call " + target.contract + " store_secrets '" + args + "' --accountId " +
         target.owner + " --deposit 0.01";
}

}  // namespace blobcast
