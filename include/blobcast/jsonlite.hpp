#pragma once

// blobcast/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// Scope: the CLI's JSON surfaces (receipts, secrets plaintext, summaries).
// Numbers are unsigned 64-bit integers or doubles; duplicate keys are an error.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace blobcast::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

// How parse() treats a key that appears twice in one object.
enum class DuplicateKeys {
  reject,     // json_duplicate_key
  last_wins,
};

// Parse a document whose top level must be an object. On error returns an
// empty object and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error,
             DuplicateKeys duplicates = DuplicateKeys::reject);

std::string escape(const std::string& s);

std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace blobcast::jsonlite
