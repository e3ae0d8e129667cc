#pragma once

// blobcast/classifier.hpp: Broadcast outcome classification seam.
//
// The SubmissionDriver never inspects exit codes or output itself. It asks an
// OutcomeClassifier for a Verdict, so an alternate ingestion backend can bring
// its own rules without touching the driver's control flow.
//
// The driver has no retry layer: both retryable and fatal abort the session.
// The distinction is reported to the caller (timeout vs transport_failure).

#include "blobcast/types.hpp"

namespace blobcast {

class OutcomeClassifier {
public:
  virtual ~OutcomeClassifier() = default;
  virtual Verdict classify(const BroadcastResult& result) const = 0;
};

// Rules for a receiver account that has no deployed code:
//   exit 0                                   -> success
//   timed out                                -> retryable
//   spawn failure                            -> fatal
//   exit != 0 and output has CodeDoesNotExist -> success (indexer ingests the tx)
//   anything else                            -> fatal
class DataSinkClassifier : public OutcomeClassifier {
public:
  Verdict classify(const BroadcastResult& result) const override;
};

}  // namespace blobcast
