#include "blobcast/output_scanner.hpp"

namespace blobcast {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

// First whitespace-delimited token starting at `pos`.
std::optional<std::string> token_after(std::string_view line, std::size_t pos) {
  while (pos < line.size() && is_space(line[pos])) ++pos;
  std::size_t end = pos;
  while (end < line.size() && !is_space(line[end])) ++end;
  if (end == pos) return std::nullopt;
  return std::string(line.substr(pos, end - pos));
}

std::optional<std::string> scan_line(std::string_view line) {
  for (std::string_view marker : {kTxIdMarker, kTxSentMarker}) {
    const auto p = line.find(marker);
    if (p != std::string_view::npos) {
      return token_after(line, p + marker.size());
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> extract_transaction_id(std::string_view text) {
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    if (auto id = scan_line(text.substr(start, end - start))) return id;
    start = end + 1;
  }
  return std::nullopt;
}

std::optional<std::string> extract_transaction_id(const BroadcastResult& result) {
  if (auto id = extract_transaction_id(result.stdout_text)) return id;
  return extract_transaction_id(result.stderr_text);
}

bool contains_no_code_marker(const BroadcastResult& result) {
  return result.stderr_text.find(kNoCodeMarker) != std::string::npos ||
         result.stdout_text.find(kNoCodeMarker) != std::string::npos;
}

std::string combined_output(const BroadcastResult& result) {
  return result.stdout_text + result.stderr_text;
}

}  // namespace blobcast
