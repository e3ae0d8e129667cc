#include "blobcast/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "blobcast/jsonlite.hpp"

namespace blobcast {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<ChunkEventHook> g_event_hook{nullptr};

std::mutex g_log_mu;
std::string g_log_path;  // guarded by g_log_mu

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "{\"count\":%llu,\"mean_ms\":%.3f,\"p50_ms\":%.3f,\"p95_ms\":%.3f,\"p99_ms\":%.3f}",
                static_cast<unsigned long long>(count()), mean_us() / 1000.0,
                percentile(0.50) / 1000.0, percentile(0.95) / 1000.0,
                percentile(0.99) / 1000.0);
  return buf;
}

// ---------------------------------------------------------------------------
// UploadStats
// ---------------------------------------------------------------------------

void UploadStats::record_chunk(const ChunkEvent& ev) {
  chunks_submitted.fetch_add(1, std::memory_order_relaxed);
  if (ev.error_code.empty()) {
    chunks_accepted.fetch_add(1, std::memory_order_relaxed);
    bytes_sent.fetch_add(ev.bytes, std::memory_order_relaxed);
  } else {
    chunks_failed.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.no_code_response) no_code_responses.fetch_add(1, std::memory_order_relaxed);
  if (ev.transaction_id.empty()) missing_tx_ids.fetch_add(1, std::memory_order_relaxed);
  broadcast_latency.record(ev.duration_ns);
}

std::string UploadStats::to_json() const {
  std::string out = "{\"chunks_submitted\":";
  out += std::to_string(chunks_submitted.load(std::memory_order_relaxed));
  out += ",\"chunks_accepted\":";
  out += std::to_string(chunks_accepted.load(std::memory_order_relaxed));
  out += ",\"chunks_failed\":";
  out += std::to_string(chunks_failed.load(std::memory_order_relaxed));
  out += ",\"no_code_responses\":";
  out += std::to_string(no_code_responses.load(std::memory_order_relaxed));
  out += ",\"missing_tx_ids\":";
  out += std::to_string(missing_tx_ids.load(std::memory_order_relaxed));
  out += ",\"bytes_sent\":";
  out += std::to_string(bytes_sent.load(std::memory_order_relaxed));
  out += ",\"broadcast_latency\":";
  out += broadcast_latency.to_json();
  out += "}";
  return out;
}

UploadStats& global_upload_stats() {
  static UploadStats inst;
  return inst;
}

void set_chunk_event_hook(ChunkEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string chunk_event_to_json(const ChunkEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"session_id\":\"";
  line += jsonlite::escape(ev.session_id);
  line += "\",\"chunk_index\":";
  line += std::to_string(ev.chunk_index);
  line += ",\"chunk_count\":";
  line += std::to_string(ev.chunk_count);
  line += ",\"offset\":";
  line += std::to_string(ev.offset);
  line += ",\"bytes\":";
  line += std::to_string(ev.bytes);
  line += ",\"frame_bytes\":";
  line += std::to_string(ev.frame_bytes);
  line += ",\"exit_code\":";
  line += std::to_string(ev.exit_code);
  line += ",\"verdict\":\"";
  line += ev.verdict;
  line += "\",\"no_code_response\":";
  line += ev.no_code_response ? "true" : "false";
  line += ",\"transaction_id\":\"";
  line += jsonlite::escape(ev.transaction_id);
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\"}";
  return line;
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path = path;
}

void emit_chunk_event(const ChunkEvent& ev) {
  global_upload_stats().record_chunk(ev);

  ChunkEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  std::lock_guard<std::mutex> lk(g_log_mu);
  std::string log_path = g_log_path;
  if (log_path.empty()) {
    const char* env = std::getenv("BLOBCAST_EVENT_LOG");
    if (!env || !env[0]) return;
    log_path = env;
  }

  const std::string line = chunk_event_to_json(ev) + "\n";
  // Event logging is best-effort; an unwritable log never fails an upload.
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace blobcast
