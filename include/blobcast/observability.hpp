#pragma once

// blobcast/observability.hpp: Per-chunk events, counters and latency.
//
// DESIGN:
//   ChunkEvent is the observable unit: one per broadcaster invocation. Every
//   event is
//     - recorded in the process-wide UploadStats (atomic counters + histogram),
//     - passed to an optional hook (tests, embedding callers), otherwise
//     - appended as one JSON line to the event log path when one is set.
//
// Invariant: events carry digests, sizes, ids and codes only. Never payload
// bytes, never signer credentials.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace blobcast {

struct ChunkEvent {
  std::string session_id;      // "<content_hash>:<nonce>"
  std::size_t chunk_index{0};
  std::size_t chunk_count{0};
  std::uint32_t offset{0};
  std::size_t bytes{0};        // chunk bytes (not frame bytes)
  std::size_t frame_bytes{0};
  int exit_code{0};
  std::string verdict;         // to_string(Verdict)
  bool no_code_response{false};
  std::string transaction_id;  // empty when not found in output
  std::uint64_t duration_ns{0};
  std::string error_code;      // to_string(ErrorCode), empty on success
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 40;  // up to ~6 days in doubling steps

  void record(std::uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Microseconds; 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

class UploadStats {
 public:
  void record_chunk(const ChunkEvent& ev);
  std::string to_json() const;

  std::atomic<std::uint64_t> chunks_submitted{0};
  std::atomic<std::uint64_t> chunks_accepted{0};
  std::atomic<std::uint64_t> chunks_failed{0};
  std::atomic<std::uint64_t> no_code_responses{0};  // accepted via CodeDoesNotExist
  std::atomic<std::uint64_t> missing_tx_ids{0};
  std::atomic<std::uint64_t> bytes_sent{0};

  LatencyHistogram broadcast_latency;
};

UploadStats& global_upload_stats();

using ChunkEventHook = void (*)(const ChunkEvent&);
void set_chunk_event_hook(ChunkEventHook hook);

// JSONL destination when no hook is set. Empty path falls back to
// $BLOBCAST_EVENT_LOG.
void set_event_log_path(const std::string& path);

void emit_chunk_event(const ChunkEvent& ev);

std::string chunk_event_to_json(const ChunkEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace blobcast
