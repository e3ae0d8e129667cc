#pragma once

// blobcast/output_scanner.hpp: The only place that pattern-matches broadcaster text.
//
// Transport changes that alter the CLI's wording are edited here and nowhere
// else. Everything downstream consumes BroadcastResult fields and the values
// these functions return.

#include <optional>
#include <string>
#include <string_view>

#include "blobcast/types.hpp"

namespace blobcast {

// Accepted transaction id markers, in priority order within a line.
constexpr std::string_view kTxIdMarker = "Transaction ID:";
constexpr std::string_view kTxSentMarker = "Transaction sent:";

// Error name reported by the network when the receiving account has no
// deployed code. For a data-sink receiver this means the payload was accepted.
constexpr std::string_view kNoCodeMarker = "CodeDoesNotExist";

// Scans stdout lines, then stderr lines; the first line carrying either marker
// wins. The id is the first whitespace-delimited token after the marker.
std::optional<std::string> extract_transaction_id(const BroadcastResult& result);

// Same scan over a single block of text.
std::optional<std::string> extract_transaction_id(std::string_view text);

bool contains_no_code_marker(const BroadcastResult& result);

// stdout followed by stderr, as stored in SubmissionOutcome::raw_output.
std::string combined_output(const BroadcastResult& result);

}  // namespace blobcast
