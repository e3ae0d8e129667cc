#include "blobcast/submission.hpp"

#include <utility>

#include "blobcast/codec.hpp"
#include "blobcast/observability.hpp"
#include "blobcast/output_scanner.hpp"
#include "blobcast/payload_file.hpp"

namespace blobcast {

namespace {

// Aborting error for a non-success verdict. Streams are carried verbatim.
UploadError abort_error(const BroadcastResult& br, Verdict verdict, std::size_t index) {
  UploadError e;
  const std::string where = "chunk " + std::to_string(index);
  if (!br.spawn_error.empty()) {
    e.code = ErrorCode::spawn_failed;
    e.message = where + ": broadcaster could not be started: " + br.spawn_error;
  } else if (verdict == Verdict::retryable) {
    e.code = ErrorCode::timeout;
    e.message = where + ": broadcaster timed out";
  } else {
    e.code = ErrorCode::transport_failure;
    e.message = where + ": broadcaster exited with code " + std::to_string(br.exit_code);
  }
  if (br.stdout_truncated || br.stderr_truncated) {
    e.message += " (captured output cut at the capture limit:";
    if (br.stdout_truncated) e.message += " stdout";
    if (br.stderr_truncated) e.message += " stderr";
    e.message += ")";
  }
  e.stdout_text = br.stdout_text;
  e.stderr_text = br.stderr_text;
  return e;
}

}  // namespace

SubmissionDriver::SubmissionDriver(Broadcaster& broadcaster,
                                   const OutcomeClassifier& classifier,
                                   BroadcastRequest request_template,
                                   std::string spool_dir,
                                   std::ostream* progress)
    : broadcaster_(broadcaster),
      classifier_(classifier),
      template_(std::move(request_template)),
      spool_dir_(std::move(spool_dir)),
      progress_(progress) {}

SessionResult SubmissionDriver::submit_all(const UploadSession& session,
                                           const std::vector<Chunk>& chunks) {
  SessionResult result;
  if (chunks.empty()) {
    fail(&result.error, ErrorCode::config_invalid, "no chunks to submit");
    return result;
  }
  if (session.framing == FramingMode::single_shot && chunks.size() != 1) {
    fail(&result.error, ErrorCode::config_invalid,
         "single-shot framing requires exactly one chunk, got " + std::to_string(chunks.size()));
    return result;
  }

  const std::string session_id = session.content_hash + ":" + std::to_string(session.nonce);
  result.outcomes.reserve(chunks.size());

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const Chunk& chunk = chunks[i];

    ChunkEvent ev;
    ev.session_id = session_id;
    ev.chunk_index = i;
    ev.chunk_count = chunks.size();
    ev.offset = chunk.offset;
    ev.bytes = chunk.bytes.size();

    auto frame = encode_session_frame(session, chunk, &result.error);
    if (!frame) {
      ev.error_code = to_string(result.error.code);
      emit_chunk_event(ev);
      return result;
    }
    ev.frame_bytes = frame->size();

    auto payload = PayloadFile::create(spool_dir_, *frame, &result.error);
    frame.reset();
    if (!payload) {
      ev.error_code = to_string(result.error.code);
      emit_chunk_event(ev);
      return result;
    }

    SubmissionOutcome outcome;
    outcome.chunk_index = i;
    outcome.offset = chunk.offset;
    outcome.bytes = chunk.bytes.size();

    BroadcastResult br;
    {
      ScopeTimer timer(outcome.duration_ns);
      BroadcastRequest req = template_;
      req.payload_path = payload->path();
      br = broadcaster_.broadcast(req);
    }

    outcome.transaction_id = extract_transaction_id(br);
    outcome.verdict = classifier_.classify(br);
    outcome.success = outcome.verdict == Verdict::success;
    outcome.exit_code = br.exit_code;
    outcome.raw_output = combined_output(br);

    UploadError release_err;
    const bool released = payload->release(&release_err);

    ev.exit_code = br.exit_code;
    ev.verdict = to_string(outcome.verdict);
    ev.no_code_response = outcome.success && br.exit_code != 0;
    ev.transaction_id = outcome.transaction_id.value_or("");
    ev.duration_ns = outcome.duration_ns;

    if (progress_) {
      *progress_ << "chunk " << (i + 1) << "/" << chunks.size() << " offset=" << chunk.offset
                 << " bytes=" << chunk.bytes.size() << " verdict=" << ev.verdict;
      if (outcome.transaction_id) *progress_ << " tx=" << *outcome.transaction_id;
      if (ev.no_code_response) *progress_ << " (accepted by indexer)";
      *progress_ << "\n";
      if (outcome.success && !outcome.transaction_id) {
        *progress_ << "warning: no transaction id in broadcaster output for chunk " << i << "\n";
      }
    }

    result.outcomes.push_back(std::move(outcome));
    const SubmissionOutcome& recorded = result.outcomes.back();

    if (!recorded.success) {
      result.error = abort_error(br, recorded.verdict, i);
      ev.error_code = to_string(result.error.code);
      emit_chunk_event(ev);
      return result;
    }
    if (!released) {
      result.error = std::move(release_err);
      ev.error_code = to_string(result.error.code);
      emit_chunk_event(ev);
      return result;
    }
    emit_chunk_event(ev);
  }

  result.ok = true;
  return result;
}

}  // namespace blobcast
