#pragma once

// blobcast/submission.hpp: Sequential per-chunk submission.
//
// For each chunk, in ascending offset order:
//   encode frame -> PayloadFile -> Broadcaster::broadcast -> scan output for a
//   transaction id -> OutcomeClassifier::classify -> delete payload file ->
//   record SubmissionOutcome -> emit ChunkEvent.
//
// INVARIANTS:
//   - At most one payload file exists at any time. Chunk n+1 is not encoded
//     until chunk n's outcome is recorded and its file deleted.
//   - There is no retry. The first non-success verdict ends the session;
//     outcomes recorded so far stay in the result (the network may already
//     hold those chunks).
//   - A missing transaction id is reported, never fatal.

#include <ostream>
#include <string>
#include <vector>

#include "blobcast/broadcaster.hpp"
#include "blobcast/classifier.hpp"
#include "blobcast/types.hpp"

namespace blobcast {

struct SessionResult {
  bool ok{false};
  std::vector<SubmissionOutcome> outcomes;
  UploadError error;
};

class SubmissionDriver {
public:
  // `request_template` supplies network, receiver, gas, deposit and signer;
  // payload_path is filled per chunk. `progress` (nullable) receives one
  // human-readable line per chunk.
  SubmissionDriver(Broadcaster& broadcaster,
                   const OutcomeClassifier& classifier,
                   BroadcastRequest request_template,
                   std::string spool_dir,
                   std::ostream* progress = nullptr);

  SessionResult submit_all(const UploadSession& session, const std::vector<Chunk>& chunks);

private:
  Broadcaster& broadcaster_;
  const OutcomeClassifier& classifier_;
  BroadcastRequest template_;
  std::string spool_dir_;
  std::ostream* progress_;
};

}  // namespace blobcast
