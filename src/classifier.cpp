#include "blobcast/classifier.hpp"

#include "blobcast/output_scanner.hpp"

namespace blobcast {

Verdict DataSinkClassifier::classify(const BroadcastResult& result) const {
  if (!result.spawn_error.empty()) return Verdict::fatal;
  if (result.timed_out) return Verdict::retryable;
  if (result.exit_code == 0) return Verdict::success;
  if (contains_no_code_marker(result)) return Verdict::success;
  return Verdict::fatal;
}

}  // namespace blobcast
