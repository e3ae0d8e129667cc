#include <sys/stat.h>

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "blobcast/broadcaster.hpp"
#include "blobcast/chunk_planner.hpp"
#include "blobcast/classifier.hpp"
#include "blobcast/codec.hpp"
#include "blobcast/config.hpp"
#include "blobcast/hash.hpp"
#include "blobcast/jsonlite.hpp"
#include "blobcast/keystore_cipher.hpp"
#include "blobcast/observability.hpp"
#include "blobcast/output_scanner.hpp"
#include "blobcast/payload_file.hpp"
#include "blobcast/process.hpp"
#include "blobcast/receipt_store.hpp"
#include "blobcast/reporter.hpp"
#include "blobcast/session.hpp"
#include "blobcast/submission.hpp"
#include "blobcast/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
std::string g_cli_path;  // blobcast executable, passed as argv[1]

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("blobcast_test_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

std::string bytes(std::initializer_list<int> v) {
  std::string out;
  for (int b : v) out.push_back(static_cast<char>(b));
  return out;
}

std::string pseudo_random_content(std::size_t n, unsigned seed) {
  std::mt19937 rng(seed);
  std::string out(n, '\0');
  for (auto& c : out) c = static_cast<char>(rng() & 0xFF);
  return out;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& p, const std::string& data) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

// Scripted broadcaster. Records each request, the payload bytes and whether
// the payload file existed while broadcast() ran.
class MockBroadcaster : public blobcast::Broadcaster {
public:
  struct Call {
    blobcast::BroadcastRequest request;
    bool file_existed{false};
    std::string payload;
  };

  std::deque<blobcast::BroadcastResult> script;
  blobcast::BroadcastResult fallback;
  std::vector<Call> calls;

  blobcast::BroadcastResult broadcast(const blobcast::BroadcastRequest& request) override {
    Call c;
    c.request = request;
    c.file_existed = fs::exists(request.payload_path);
    if (c.file_existed) c.payload = read_file(request.payload_path);
    calls.push_back(std::move(c));
    if (script.empty()) return fallback;
    auto r = script.front();
    script.pop_front();
    return r;
  }
  std::string name() const override { return "mock"; }
};

blobcast::BroadcastResult no_code_result(const std::string& tx) {
  blobcast::BroadcastResult r;
  r.exit_code = 1;
  r.stdout_text = "Transaction ID: " + tx + "\n";
  r.stderr_text =
      "Error: ActionError { kind: FunctionCallError(CompilationError(CodeDoesNotExist { "
      "account_id: \"sink.testnet\" })) }\n";
  return r;
}

blobcast::UploadSession make_test_session(const std::string& content, std::uint32_t max_chunk,
                                          std::uint32_t nonce) {
  blobcast::UploadSession s;
  s.content = content;
  s.content_hash = blobcast::sha256_hex(content);
  s.relative_path = s.content_hash + ".wasm";
  s.mime_type = "application/wasm";
  s.max_chunk_size = max_chunk;
  s.nonce = nonce;
  s.framing = blobcast::FramingMode::chunked;
  return s;
}

blobcast::BroadcastRequest test_request_template() {
  blobcast::BroadcastRequest r;
  r.network = "testnet";
  r.receiver = "sink.testnet";
  r.gas = "300 Tgas";
  r.deposit = "0 NEAR";
  r.signer_account = "alice.testnet";
  r.signer_credential = "ed25519:secret";
  return r;
}

// ============================================================================
// Hashing
// ============================================================================

void test_sha256_known_vectors() {
  expect(blobcast::sha256_hex("") ==
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 empty vector");
  expect(blobcast::sha256_hex("abc") ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
  expect(blobcast::sha256_bytes("abc").size() == 32, "raw digest is 32 bytes");
  expect(blobcast::to_hex(blobcast::sha256_bytes("abc")) == blobcast::sha256_hex("abc"),
         "hex of raw digest matches hex digest");
}

void test_blake3_known_vector() {
  expect(blobcast::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blobcast::blake3_hex("a") != blobcast::blake3_hex("b"), "BLAKE3 distinguishes input");
}

void test_hex_helpers() {
  expect(blobcast::from_hex("00ff10").value_or("") == bytes({0x00, 0xff, 0x10}), "from_hex decodes");
  expect(blobcast::from_hex("ABcd").has_value(), "from_hex accepts mixed case");
  expect(!blobcast::from_hex("abc").has_value(), "odd length rejected");
  expect(!blobcast::from_hex("zz").has_value(), "non-hex rejected");
  expect(blobcast::valid_digest(blobcast::sha256_hex("x")), "sha256 hex is a valid digest");
  expect(!blobcast::valid_digest(std::string(64, 'A')), "upper-case digest rejected");
}

void test_file_hashing() {
  const fs::path dir = scratch_dir("file_hash");
  write_file(dir / "a.bin", "abc");
  auto h = blobcast::hash_file_sha256_hex((dir / "a.bin").string());
  expect(h.has_value() && *h == blobcast::sha256_hex("abc"), "file hash equals buffer hash");
  expect(!blobcast::hash_file_sha256_hex((dir / "missing").string()).has_value(),
         "missing file yields nullopt");
  fs::remove_all(dir);
}

// ============================================================================
// Encoder / decoder
// ============================================================================

void test_single_shot_frame_bytes() {
  blobcast::UploadError err;
  auto f = blobcast::encode_single_shot_frame("ab", "t", "xyz", &err);
  expect(f.has_value(), "single-shot encodes");
  const std::string expected = bytes({0x00, 2, 0, 0, 0, 'a', 'b', 0x01, 1, 0, 0, 0, 't', 3, 0, 0,
                                      0, 'x', 'y', 'z'});
  expect(*f == expected, "single-shot frame is byte-exact");
}

void test_chunk_frame_bytes() {
  blobcast::UploadError err;
  blobcast::Chunk c{1, 3, "yz"};
  auto f = blobcast::encode_chunk_frame("p", "m", c, 0x01020304u, &err);
  expect(f.has_value(), "chunk encodes");
  const std::string expected =
      bytes({0x01, 1, 0, 0, 0, 'p', 1, 0, 0, 0, 3, 0, 0, 0, 1, 0, 0, 0, 'm', 2, 0, 0, 0, 'y', 'z',
             0x04, 0x03, 0x02, 0x01});
  expect(*f == expected, "chunk frame is byte-exact with little-endian fields");
}

void test_encode_length_overflow() {
  std::string out;
  blobcast::UploadError err;
  expect(blobcast::encode_length(0xFFFFFFFFu, out, &err), "u32 max length encodes");
  expect(out == bytes({0xff, 0xff, 0xff, 0xff}), "u32 max length bytes");
  if constexpr (sizeof(std::size_t) > 4) {
    out.clear();
    expect(!blobcast::encode_length(std::size_t{1} << 32, out, &err), "2^32 length rejected");
    expect(err.code == blobcast::ErrorCode::encoding_overflow, "overflow is encoding_overflow");
    expect(out.empty(), "nothing appended on overflow");
  }
}

void test_discriminator_selection() {
  auto whole = make_test_session("hello", blobcast::kDefaultMaxChunkSize, 7);
  blobcast::UploadError err;
  blobcast::Chunk c{0, 5, "hello"};

  auto chunked = blobcast::encode_session_frame(whole, c, &err);
  expect(chunked && static_cast<unsigned char>((*chunked)[0]) == blobcast::kChunkDiscriminator,
         "chunked session uses discriminator 1");

  whole.framing = blobcast::FramingMode::single_shot;
  auto single = blobcast::encode_session_frame(whole, c, &err);
  expect(single && static_cast<unsigned char>((*single)[0]) == blobcast::kSingleShotDiscriminator,
         "single-shot session uses discriminator 0");
}

void test_decode_roundtrip_and_reassemble() {
  const std::string content = pseudo_random_content(10000, 42);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(content, 3000, &err);
  expect(chunks && chunks->size() == 4, "10000 bytes at 3000 -> 4 chunks");

  std::vector<blobcast::ChunkFrame> frames;
  // Decode in reverse: reassembly must not depend on arrival order.
  for (auto it = chunks->rbegin(); it != chunks->rend(); ++it) {
    auto enc = blobcast::encode_chunk_frame("x.bin", "application/octet-stream", *it, 99, &err);
    expect(enc.has_value(), "chunk encodes");
    auto dec = blobcast::decode_frame(*enc, &err);
    expect(dec.has_value(), "chunk decodes");
    const auto* cf = std::get_if<blobcast::ChunkFrame>(&*dec);
    expect(cf != nullptr, "decoded variant is chunk");
    expect(cf->offset == it->offset && cf->full_size == 10000 && cf->nonce == 99,
           "decoded fields match");
    frames.push_back(*cf);
  }
  auto whole = blobcast::reassemble(frames, &err);
  expect(whole.has_value() && *whole == content, "reassembled content equals original");

  frames.pop_back();  // drop offset 0
  expect(!blobcast::reassemble(frames, &err).has_value(), "missing chunk detected");
  expect(err.code == blobcast::ErrorCode::frame_malformed, "gap is frame_malformed");
}

void test_reassemble_rejects_mixed_sessions() {
  blobcast::UploadError err;
  blobcast::ChunkFrame a{"p", 0, 4, "m", "ab", 1};
  blobcast::ChunkFrame b{"p", 2, 4, "m", "cd", 2};
  expect(!blobcast::reassemble({a, b}, &err).has_value(), "different nonces rejected");
  b.nonce = 1;
  auto ok = blobcast::reassemble({b, a}, &err);
  expect(ok.has_value() && *ok == "abcd", "same nonce reassembles");
}

void test_decode_single_shot() {
  blobcast::UploadError err;
  auto enc = blobcast::encode_single_shot_frame("h.wasm", "application/wasm",
                                                 bytes({0x00, 'a', 's', 'm'}), &err);
  auto dec = blobcast::decode_frame(*enc, &err);
  expect(dec.has_value(), "single-shot decodes");
  const auto* sf = std::get_if<blobcast::SingleShotFrame>(&*dec);
  expect(sf && sf->has_content && sf->relative_path == "h.wasm" && sf->content.size() == 4 &&
             sf->mime_type == "application/wasm",
         "single-shot fields");

  const std::string absent = bytes({0x00, 1, 0, 0, 0, 'p', 0x00});
  auto dec2 = blobcast::decode_frame(absent, &err);
  expect(dec2 && !std::get<blobcast::SingleShotFrame>(*dec2).has_content,
         "content-absent single-shot decodes");
}

void test_decode_malformed() {
  blobcast::UploadError err;
  expect(!blobcast::decode_frame("", &err).has_value(), "empty frame rejected");
  expect(err.code == blobcast::ErrorCode::frame_malformed, "empty is frame_malformed");

  expect(!blobcast::decode_frame(bytes({0x02}), &err).has_value(), "discriminator 2 rejected");

  blobcast::Chunk c{0, 2, "ab"};
  auto enc = blobcast::encode_chunk_frame("p", "m", c, 1, &err);
  expect(!blobcast::decode_frame(enc->substr(0, enc->size() - 1), &err).has_value(),
         "truncated nonce rejected");
  expect(!blobcast::decode_frame(*enc + "x", &err).has_value(), "trailing byte rejected");

  const std::string bad_presence = bytes({0x00, 1, 0, 0, 0, 'p', 0x07});
  expect(!blobcast::decode_frame(bad_presence, &err).has_value(), "presence byte 7 rejected");

  blobcast::Chunk past{3, 4, "ab"};
  auto enc2 = blobcast::encode_chunk_frame("p", "m", past, 1, &err);
  expect(!blobcast::decode_frame(*enc2, &err).has_value(), "chunk past full_size rejected");

  // Declared length far larger than the frame.
  const std::string huge_len = bytes({0x01, 0xff, 0xff, 0xff, 0x7f, 'p'});
  expect(!blobcast::decode_frame(huge_len, &err).has_value(), "oversized length rejected");
}

// ============================================================================
// Chunk planner
// ============================================================================

void test_plan_two_and_a_half_mib() {
  const std::string content = pseudo_random_content(2621440, 7);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(content, blobcast::kDefaultMaxChunkSize, &err);
  expect(chunks && chunks->size() == 3, "2.5 MiB -> 3 chunks");
  const std::uint32_t offsets[] = {0, 1048576, 2097152};
  const std::size_t lengths[] = {1048576, 1048576, 458752};
  for (std::size_t i = 0; i < 3; ++i) {
    expect((*chunks)[i].offset == offsets[i], "offset " + std::to_string(i));
    expect((*chunks)[i].bytes.size() == lengths[i], "length " + std::to_string(i));
    expect((*chunks)[i].full_size == 2621440, "full_size " + std::to_string(i));
  }
}

void test_plan_count_and_offset_laws() {
  blobcast::UploadError err;
  const std::uint32_t max = 1000;
  for (std::size_t n : {1u, 999u, 1000u, 1001u, 2000u, 4321u}) {
    const std::string content = pseudo_random_content(n, static_cast<unsigned>(n));
    auto chunks = blobcast::plan_chunks(content, max, &err);
    expect(chunks.has_value(), "plan succeeds");
    expect(chunks->size() == (n + max - 1) / max, "ceil(n / max) chunks for n=" + std::to_string(n));
    std::string joined;
    for (std::size_t i = 0; i < chunks->size(); ++i) {
      const auto& c = (*chunks)[i];
      expect(c.offset == i * max, "offset law");
      expect(c.bytes.size() <= max, "chunk within max");
      expect(c.offset + c.bytes.size() <= c.full_size, "chunk within full_size");
      joined += c.bytes;
    }
    expect(joined == content, "concatenation reconstructs content");
  }
}

void test_plan_empty_and_invalid() {
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks("", blobcast::kDefaultMaxChunkSize, &err);
  expect(chunks && chunks->size() == 1, "empty content -> one chunk");
  expect((*chunks)[0].bytes.empty() && (*chunks)[0].offset == 0 && (*chunks)[0].full_size == 0,
         "empty chunk fields");

  expect(!blobcast::plan_chunks("abc", 0, &err).has_value(), "max 0 rejected");
  expect(err.code == blobcast::ErrorCode::config_invalid, "max 0 is config_invalid");
}

void test_choose_framing() {
  using blobcast::FramingMode;
  expect(blobcast::choose_framing(10, false) == FramingMode::chunked, "chunked by default");
  expect(blobcast::choose_framing(10, true) == FramingMode::single_shot, "single-shot on request");
  expect(blobcast::choose_framing(blobcast::kSingleFrameCeiling + 1, true) == FramingMode::chunked,
         "oversized content stays chunked");
}

void test_nonce_modes() {
  expect(blobcast::wall_clock_nonce(blobcast::kNonceEpochOffset + 5) == 5u, "wall clock offset");
  expect(blobcast::wall_clock_nonce(blobcast::kNonceEpochOffset - 1) == 0xFFFFFFFFu,
         "wall clock wraps to u32");
  // Two random draws colliding has probability 2^-32.
  const auto a = blobcast::make_session_nonce(blobcast::NonceMode::random);
  const auto b = blobcast::make_session_nonce(blobcast::NonceMode::random);
  const auto c = blobcast::make_session_nonce(blobcast::NonceMode::random);
  expect(!(a == b && b == c), "random nonces vary");
}

// ============================================================================
// Output scanning and classification
// ============================================================================

void test_transaction_id_extraction() {
  blobcast::BroadcastResult r;
  r.stdout_text = "Signing...\nTransaction ID: 8Xy3abc  (see explorer)\n";
  expect(blobcast::extract_transaction_id(r).value_or("") == "8Xy3abc", "tx id from stdout");

  r.stdout_text = "nothing here\n";
  r.stderr_text = "INFO Transaction sent: Hq9zz\n";
  expect(blobcast::extract_transaction_id(r).value_or("") == "Hq9zz", "tx id from stderr");

  r.stdout_text = "Transaction sent: FIRST\n";
  r.stderr_text = "Transaction ID: SECOND\n";
  expect(blobcast::extract_transaction_id(r).value_or("") == "FIRST", "stdout wins over stderr");

  r.stdout_text = "Transaction ID:\n";
  r.stderr_text = "";
  expect(!blobcast::extract_transaction_id(r).has_value(), "marker without id");

  r.stdout_text = "";
  expect(!blobcast::extract_transaction_id(r).has_value(), "no output -> no id");
}

void test_classifier() {
  blobcast::DataSinkClassifier c;
  blobcast::BroadcastResult r;
  expect(c.classify(r) == blobcast::Verdict::success, "exit 0 -> success");

  r.exit_code = 1;
  r.stderr_text = "CodeDoesNotExist";
  expect(c.classify(r) == blobcast::Verdict::success, "no-code in stderr -> success");
  r.stderr_text.clear();
  r.stdout_text = "... CodeDoesNotExist ...";
  expect(c.classify(r) == blobcast::Verdict::success, "no-code in stdout -> success");

  r.stdout_text = "insufficient balance";
  expect(c.classify(r) == blobcast::Verdict::fatal, "other failure -> fatal");

  r.timed_out = true;
  r.exit_code = 124;
  expect(c.classify(r) == blobcast::Verdict::retryable, "timeout -> retryable");

  blobcast::BroadcastResult spawn;
  spawn.exit_code = 127;
  spawn.spawn_error = "not found";
  expect(c.classify(spawn) == blobcast::Verdict::fatal, "spawn failure -> fatal");
}

// ============================================================================
// Payload file
// ============================================================================

void test_payload_file_lifecycle() {
  const fs::path dir = scratch_dir("payload");
  blobcast::UploadError err;
  std::string path;
  {
    auto f = blobcast::PayloadFile::create(dir.string(), "frame-bytes", &err);
    expect(f.has_value(), "payload file created");
    path = f->path();
    expect(read_file(path) == "frame-bytes", "payload contents written");
    struct stat st;
    expect(stat(path.c_str(), &st) == 0 && (st.st_mode & 0777) == 0600, "payload file mode 0600");
    expect(f->release(&err), "release succeeds");
    expect(!fs::exists(path), "release deletes file");
    expect(f->release(&err), "release is idempotent");
  }
  {
    auto f = blobcast::PayloadFile::create(dir.string(), "x", &err);
    path = f->path();
  }
  expect(!fs::exists(path), "destructor deletes file");

  write_file(dir / "not_a_dir", "x");
  auto bad = blobcast::PayloadFile::create((dir / "not_a_dir" / "sub").string(), "x", &err);
  expect(!bad.has_value(), "uncreatable spool dir fails");
  expect(err.code == blobcast::ErrorCode::resource_error, "spool failure is resource_error");
  fs::remove_all(dir);
}

// ============================================================================
// Submission driver
// ============================================================================

int g_hook_events = 0;
void counting_hook(const blobcast::ChunkEvent&) { ++g_hook_events; }

void test_submission_two_and_a_half_mib_scenario() {
  const fs::path dir = scratch_dir("submit_ok");
  const std::string content = pseudo_random_content(2621440, 11);
  auto session = make_test_session(content, blobcast::kDefaultMaxChunkSize, 0xCAFEu);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(session.content, session.max_chunk_size, &err);

  MockBroadcaster mock;
  mock.script = {no_code_result("tx0"), no_code_result("tx1"), no_code_result("tx2")};
  blobcast::DataSinkClassifier classifier;
  blobcast::SubmissionDriver driver(mock, classifier, test_request_template(), dir.string());

  g_hook_events = 0;
  blobcast::set_chunk_event_hook(counting_hook);
  auto result = driver.submit_all(session, *chunks);
  blobcast::set_chunk_event_hook(nullptr);

  expect(result.ok, "all chunks accepted via CodeDoesNotExist");
  expect(mock.calls.size() == 3, "three broadcaster calls");
  expect(g_hook_events == 3, "one event per chunk");

  std::vector<blobcast::ChunkFrame> frames;
  const std::uint32_t offsets[] = {0, 1048576, 2097152};
  const std::size_t lengths[] = {1048576, 1048576, 458752};
  for (std::size_t i = 0; i < 3; ++i) {
    const auto& call = mock.calls[i];
    expect(call.file_existed, "payload file existed during call");
    expect(!fs::exists(call.request.payload_path), "payload file deleted after call");
    expect(call.request.method == "__ingest_chunk", "method name");
    expect(call.request.receiver == "sink.testnet", "receiver passed through");
    auto dec = blobcast::decode_frame(call.payload, &err);
    expect(dec.has_value(), "payload decodes");
    const auto& cf = std::get<blobcast::ChunkFrame>(*dec);
    expect(cf.offset == offsets[i] && cf.content_chunk.size() == lengths[i], "frame offset/len");
    expect(cf.nonce == 0xCAFEu, "all chunks share the session nonce");
    expect(cf.relative_path == session.relative_path, "relative path in every frame");
    frames.push_back(cf);
    expect(result.outcomes[i].transaction_id.value_or("") == "tx" + std::to_string(i),
           "tx ids recorded in order");
    expect(result.outcomes[i].success && result.outcomes[i].exit_code == 1, "no-code outcome");
  }
  auto whole = blobcast::reassemble(frames, &err);
  expect(whole && *whole == content, "frames reconstruct the content");
  expect(fs::is_empty(dir), "no payload files left in spool dir");

  blobcast::ReportContext ctx{"testnet", "sink.testnet", "alice.testnet", "fastfs.io"};
  auto summary = blobcast::summarize(session, result, ctx);
  expect(summary.has_value(), "summary produced");
  expect(summary->url == "https://alice.testnet.fastfs.io/sink.testnet/" + session.content_hash +
                             ".wasm",
         "access URL format");
  expect(summary->url.find(blobcast::sha256_hex(content)) != std::string::npos,
         "URL contains sha256 hex of content");
  expect(summary->total_bytes == 2621440 && summary->chunk_count == 3, "summary totals");
  expect(summary_json(*summary).find("\"transaction_ids\":[\"tx0\",\"tx1\",\"tx2\"]") !=
             std::string::npos,
         "summary JSON lists tx ids in order");
  fs::remove_all(dir);
}

void test_submission_fail_fast() {
  const fs::path dir = scratch_dir("submit_fail");
  const std::string content = pseudo_random_content(3000, 3);
  auto session = make_test_session(content, 1000, 5);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(session.content, session.max_chunk_size, &err);

  blobcast::BroadcastResult boom;
  boom.exit_code = 1;
  boom.stdout_text = "partial out\n";
  boom.stderr_text = "Error: account alice.testnet does not exist\n  at line 2\n";

  MockBroadcaster mock;
  mock.script = {no_code_result("tx0"), boom};
  blobcast::DataSinkClassifier classifier;
  blobcast::SubmissionDriver driver(mock, classifier, test_request_template(), dir.string());
  auto result = driver.submit_all(session, *chunks);

  expect(!result.ok, "session aborts");
  expect(mock.calls.size() == 2, "no chunk after the failing one is submitted");
  expect(result.outcomes.size() == 2, "failing chunk outcome is recorded");
  expect(result.error.code == blobcast::ErrorCode::transport_failure, "transport_failure");
  expect(result.error.stderr_text == boom.stderr_text, "stderr surfaced verbatim");
  expect(result.error.stdout_text == boom.stdout_text, "stdout surfaced verbatim");
  expect(result.outcomes[1].raw_output == boom.stdout_text + boom.stderr_text, "raw output kept");
  expect(!fs::exists(mock.calls[1].request.payload_path), "failing chunk's file deleted");

  blobcast::ReportContext ctx{"testnet", "sink.testnet", "alice.testnet", "fastfs.io"};
  expect(!blobcast::summarize(session, result, ctx).has_value(), "no summary after abort");
  const std::string text = blobcast::failure_text(result.error);
  expect(text.find(boom.stderr_text) != std::string::npos, "failure text carries stderr");
  fs::remove_all(dir);
}

void test_submission_timeout_and_spawn() {
  const fs::path dir = scratch_dir("submit_timeout");
  auto session = make_test_session("abc", 1000, 5);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(session.content, session.max_chunk_size, &err);
  blobcast::DataSinkClassifier classifier;

  MockBroadcaster timeout_mock;
  blobcast::BroadcastResult t;
  t.exit_code = 124;
  t.timed_out = true;
  timeout_mock.script = {t};
  blobcast::SubmissionDriver d1(timeout_mock, classifier, test_request_template(), dir.string());
  auto r1 = d1.submit_all(session, *chunks);
  expect(!r1.ok && r1.error.code == blobcast::ErrorCode::timeout, "timeout aborts with timeout");
  expect(r1.outcomes[0].verdict == blobcast::Verdict::retryable, "timeout verdict is retryable");

  MockBroadcaster spawn_mock;
  blobcast::BroadcastResult s;
  s.exit_code = 127;
  s.spawn_error = "broadcaster executable not found: near";
  spawn_mock.script = {s};
  blobcast::SubmissionDriver d2(spawn_mock, classifier, test_request_template(), dir.string());
  auto r2 = d2.submit_all(session, *chunks);
  expect(!r2.ok && r2.error.code == blobcast::ErrorCode::spawn_failed, "spawn failure code");
  fs::remove_all(dir);
}

void test_submission_missing_tx_id_not_fatal() {
  const fs::path dir = scratch_dir("submit_notx");
  auto session = make_test_session("abcdef", 3, 5);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(session.content, session.max_chunk_size, &err);

  MockBroadcaster mock;  // fallback: exit 0, no output
  blobcast::DataSinkClassifier classifier;
  std::ostringstream progress;
  blobcast::SubmissionDriver driver(mock, classifier, test_request_template(), dir.string(),
                                    &progress);
  auto result = driver.submit_all(session, *chunks);
  expect(result.ok, "missing tx id does not abort");
  expect(result.outcomes.size() == 2 && !result.outcomes[0].transaction_id, "no tx id recorded");
  expect(progress.str().find("warning: no transaction id") != std::string::npos,
         "missing tx id is reported");
  fs::remove_all(dir);
}

void test_submission_reports_cut_output() {
  const fs::path dir = scratch_dir("submit_cut");
  auto session = make_test_session("abc", 1000, 5);
  blobcast::UploadError err;
  auto chunks = blobcast::plan_chunks(session.content, session.max_chunk_size, &err);

  blobcast::BroadcastResult big;
  big.exit_code = 2;
  big.stderr_text = std::string(64, 'e');
  big.stderr_truncated = true;
  MockBroadcaster mock;
  mock.script = {big};
  blobcast::DataSinkClassifier classifier;
  blobcast::SubmissionDriver driver(mock, classifier, test_request_template(), dir.string());
  auto result = driver.submit_all(session, *chunks);
  expect(!result.ok && result.error.code == blobcast::ErrorCode::transport_failure, "aborts");
  expect(result.error.stderr_text == big.stderr_text, "captured stderr passed through unedited");
  expect(result.error.message.find("capture limit: stderr") != std::string::npos,
         "message says stderr was cut");
  expect(result.error.message.find("stdout") == std::string::npos, "stdout not flagged");
  fs::remove_all(dir);
}

void test_single_shot_session_end_to_end() {
  const fs::path dir = scratch_dir("single_shot");
  write_file(dir / "mod.wasm", bytes({0x00, 'a', 's', 'm', 0x01, 0x00, 0x00, 0x00}));
  blobcast::UploaderConfig cfg;
  cfg.receiver = "sink.near";
  cfg.sender_account_id = "bob.near";
  cfg.sender_private_key = "ed25519:k";
  blobcast::UploadError err;
  expect(cfg.validate(&err) && cfg.network == "mainnet", "mainnet inferred");
  cfg.spool_dir = (dir / "spool").string();

  blobcast::SessionOptions opts;
  opts.prefer_single_shot = true;
  MockBroadcaster mock;
  mock.script = {no_code_result("only")};
  auto run = blobcast::run_upload(cfg, (dir / "mod.wasm").string(), opts, mock, nullptr, nullptr);
  expect(run.ok, "single-shot upload succeeds");
  expect(mock.calls.size() == 1, "single broadcaster call");
  auto dec = blobcast::decode_frame(mock.calls[0].payload, &err);
  const auto* sf = dec ? std::get_if<blobcast::SingleShotFrame>(&*dec) : nullptr;
  expect(sf && sf->has_content && sf->content == read_file(dir / "mod.wasm"),
         "single-shot frame carries whole content");
  expect(sf->mime_type == "application/wasm", "mime type by extension");
  expect(run.summary->relative_path == run.session.content_hash + ".wasm", "relative path");
  fs::remove_all(dir);
}

// ============================================================================
// Session preparation
// ============================================================================

void test_relative_path_and_mime() {
  const std::string h = blobcast::sha256_hex("abc");
  expect(blobcast::relative_path_for(h, "wasm") == h + ".wasm", "path with extension");
  expect(blobcast::relative_path_for(h, "") == h, "bare hex without extension");
  expect(blobcast::file_extension("/a/b/Module.WASM") == "wasm", "extension lower-cased");
  expect(blobcast::file_extension("/a/b/noext") == "", "no extension");
  expect(blobcast::mime_type_for("wasm") == "application/wasm", "wasm mime");
  expect(blobcast::mime_type_for("xyz") == "application/octet-stream", "default mime");

  blobcast::SessionOptions opts;
  blobcast::UploadError err;
  auto s1 = blobcast::make_session("same bytes", "x/one.wasm", opts, &err);
  auto s2 = blobcast::make_session("same bytes", "y/two.wasm", opts, &err);
  expect(s1 && s2 && s1->relative_path == s2->relative_path, "identical content -> identical path");
}

void test_missing_input() {
  blobcast::UploadError err;
  expect(!blobcast::read_content("/nonexistent/blobcast/file.wasm", &err).has_value(),
         "missing file rejected");
  expect(err.code == blobcast::ErrorCode::missing_input, "missing_input");
}

// ============================================================================
// Configuration
// ============================================================================

void test_env_file_parsing() {
  auto v = blobcast::parse_env_text(
      "# comment\n\nBLOBCAST_RECEIVER = sink.testnet\nBLOBCAST_GAS=100 Tgas\nnot a pair\n"
      "FASTFS_SENDER_ACCOUNT_ID=alice.testnet\nBLOBCAST_SENDER_PRIVATE_KEY=ed25519:abc=\n");
  expect(v["BLOBCAST_RECEIVER"] == "sink.testnet", "trimmed key/value");
  expect(v["BLOBCAST_GAS"] == "100 Tgas", "value with space");
  expect(v["BLOBCAST_SENDER_PRIVATE_KEY"] == "ed25519:abc=", "value keeps later '='");
  expect(v.count("not a pair") == 0, "line without '=' ignored");

  blobcast::UploadError err;
  auto cfg = blobcast::UploaderConfig::from_values(v, &err);
  expect(cfg.has_value(), "config parses");
  expect(cfg->sender_account_id == "alice.testnet", "legacy FASTFS_ key accepted");
  expect(cfg->gas == "100 Tgas" && cfg->deposit == "0 NEAR", "override and default");
  expect(cfg->storage_domain == "fastfs.io", "default storage domain");
  expect(cfg->validate(&err) && cfg->network == "testnet", "testnet inferred");
  expect(cfg->to_json().find("ed25519:abc=") == std::string::npos, "credential redacted");
}

void test_config_legacy_alias_layering() {
  // Later source's legacy key beats an earlier source's current key.
  auto merged = blobcast::layer_env({{"BLOBCAST_RECEIVER", "file.testnet"}},
                                    {{"FASTFS_RECEIVER", "env.testnet"}});
  expect(merged["BLOBCAST_RECEIVER"] == "env.testnet", "process legacy key overrides file");
  expect(merged.count("FASTFS_RECEIVER") == 0, "legacy key folded into current key");

  // Within one source the current name wins.
  auto same = blobcast::resolve_aliases(
      {{"BLOBCAST_SENDER_ACCOUNT_ID", "new.testnet"}, {"FASTFS_SENDER_ACCOUNT_ID", "old.testnet"}});
  expect(same["BLOBCAST_SENDER_ACCOUNT_ID"] == "new.testnet", "current key wins in one source");

  auto kept = blobcast::layer_env({{"FASTFS_RECEIVER", "file.testnet"}}, {});
  blobcast::UploadError err;
  auto cfg = blobcast::UploaderConfig::from_values(kept, &err);
  expect(cfg && cfg->receiver == "file.testnet", "legacy key from file alone still applies");
}

void test_config_validation() {
  blobcast::UploadError err;
  blobcast::UploaderConfig c;
  expect(!c.validate(&err) && err.code == blobcast::ErrorCode::config_invalid, "receiver required");

  c.receiver = "sink.example";
  c.sender_account_id = "a";
  c.sender_private_key = "k";
  expect(!c.validate(&err), "unknown network suffix rejected");
  expect(err.message.find("sink.example") != std::string::npos, "message names the receiver");
  c.network = "localnet";
  expect(c.validate(&err), "explicit network accepted");

  expect(!blobcast::UploaderConfig::from_values({{"BLOBCAST_MAX_CHUNK_SIZE", "12x"}}, &err),
         "bad chunk size rejected");
  expect(!blobcast::UploaderConfig::from_values({{"BLOBCAST_NONCE_MODE", "sequential"}}, &err),
         "bad nonce mode rejected");
  auto wc = blobcast::UploaderConfig::from_values({{"BLOBCAST_NONCE_MODE", "wall_clock"}}, &err);
  expect(wc && wc->nonce_mode == blobcast::NonceMode::wall_clock, "wall_clock nonce mode");

  expect(!blobcast::load_env_file("/nonexistent/.env", &err).has_value(), "missing env file");
  expect(err.code == blobcast::ErrorCode::missing_input, "missing env file is missing_input");
}

// ============================================================================
// Keystore cipher
// ============================================================================

const std::string kPubkey = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";

void test_cipher_roundtrip() {
  blobcast::UploadError err;
  const std::string secrets = "{\"OPENAI_KEY\":\"sk-123\",\"N\":5}";
  auto ct = blobcast::encrypt_secrets(secrets, kPubkey, &err);
  expect(ct.has_value(), "encrypt succeeds");
  expect(*ct != secrets, "ciphertext differs from plaintext");
  auto pt = blobcast::decrypt_secrets(*ct, kPubkey, &err);
  expect(pt.has_value() && *pt == secrets, "decrypt restores plaintext");

  auto key = blobcast::parse_key_material(kPubkey, &err);
  const std::string derived = blobcast::derive_key(*key);
  expect(derived == blobcast::sha256_bytes(*key + "keystore-encryption-v1"), "key derivation");
  auto raw = blobcast::xor_cipher("A", *key, &err);
  expect(raw && (*raw)[0] == static_cast<char>('A' ^ derived[0]), "first byte XOR");
}

void test_cipher_rejections() {
  blobcast::UploadError err;
  expect(!blobcast::encrypt_secrets("{}", "abcd", &err), "short key rejected");
  expect(err.code == blobcast::ErrorCode::invalid_key_material, "invalid_key_material");
  expect(!blobcast::encrypt_secrets("{\"NEAR_SENDER_ID\":\"x\"}", kPubkey, &err),
         "reserved key rejected");
  expect(err.message.find("NEAR_SENDER_ID") != std::string::npos, "reserved key named");
  expect(!blobcast::encrypt_secrets("[1,2]", kPubkey, &err), "non-object rejected");

  auto key = blobcast::parse_key_material(kPubkey, &err);
  const std::string big(blobcast::kMaxCipherInput + 1, 'x');
  expect(!blobcast::xor_cipher(big, *key, &err), "oversized input rejected");
  expect(err.code == blobcast::ErrorCode::payload_too_large, "payload_too_large");
}

void test_cipher_accepts_any_object() {
  blobcast::UploadError err;
  for (const std::string secrets :
       {"{\"CFG\":{\"model\":\"gpt\"}}", "{\"LIST\":[1,2]}", "{\"A\":\"1\",\"A\":\"2\"}"}) {
    auto ct = blobcast::encrypt_secrets(secrets, kPubkey, &err);
    expect(ct.has_value(), "accepted: " + secrets);
    auto pt = blobcast::decrypt_secrets(*ct, kPubkey, &err);
    expect(pt && *pt == secrets, "plaintext restored byte for byte: " + secrets);
  }
  expect(!blobcast::encrypt_secrets("{\"X\":{\"a\":1},\"NEAR_REQUEST_ID\":\"x\"}", kPubkey, &err),
         "reserved key still rejected next to nested values");
  expect(!blobcast::encrypt_secrets("{\"A\":1,\"NEAR_BLOCK_HEIGHT\":1,\"NEAR_BLOCK_HEIGHT\":2}",
                                    kPubkey, &err),
         "repeated reserved key rejected");
}

void test_keystore_addressing() {
  expect(blobcast::normalize_repo("alice/project") == "github.com/alice/project", "bare repo");
  expect(blobcast::normalize_repo("https://github.com/alice/project") == "github.com/alice/project",
         "https repo");
  expect(blobcast::normalize_repo("git@github.com:alice/project.git") == "github.com/alice/project",
         "ssh repo");
  expect(blobcast::normalize_repo("github.com/alice/project") == "github.com/alice/project",
         "already normalized");
  expect(blobcast::keystore_seed("alice/project", "alice.testnet", "") ==
             "github.com/alice/project:alice.testnet",
         "seed without branch");
  expect(blobcast::keystore_seed("alice/project", "alice.testnet", "main") ==
             "github.com/alice/project:alice.testnet:main",
         "seed with branch");

  blobcast::SecretsStoreTarget t;
  t.repo = "https://github.com/alice/project";
  t.owner = "alice.testnet";
  t.profile = "prod";
  t.branch = "main";
  const std::string cmd = blobcast::store_secrets_command(t, "QUJD");
  expect(cmd ==
             "near call outlayer.testnet store_secrets '{\"repo\":\"alice/project\","
             "\"branch\":\"main\",\"profile\":\"prod\",\"encrypted_secrets_base64\":\"QUJD\","
             "\"access\":{\"AllowAll\":{}}}' --accountId alice.testnet --deposit 0.01",
         "store_secrets command");
  t.branch.clear();
  expect(blobcast::store_secrets_command(t, "QUJD").find("branch") == std::string::npos,
         "branch omitted when empty");
}

void test_base64() {
  blobcast::UploadError err;
  expect(blobcast::base64_encode("foobar") == "Zm9vYmFy", "base64 no padding");
  expect(blobcast::base64_encode("fo") == "Zm8=", "base64 one pad");
  expect(blobcast::base64_decode("Zm8=", &err).value_or("?") == "fo", "decode one pad");
  expect(blobcast::base64_decode("Zg==", &err).value_or("?") == "f", "decode two pads");
  expect(!blobcast::base64_decode("Zm8", &err).has_value(), "bad length rejected");
}

// ============================================================================
// Receipt store
// ============================================================================

blobcast::Receipt sample_receipt() {
  blobcast::Receipt r;
  r.content_hash = blobcast::sha256_hex("content");
  r.relative_path = r.content_hash + ".wasm";
  r.url = "https://alice.testnet.fastfs.io/sink.testnet/" + r.relative_path;
  r.mime_type = "application/wasm";
  r.network = "testnet";
  r.receiver = "sink.testnet";
  r.sender = "alice.testnet";
  r.nonce = 77;
  r.chunk_count = 2;
  r.total_bytes = 7;
  r.transaction_ids = {"tx0", ""};
  r.created_at = 1700000000;
  return r;
}

void test_receipt_put_get() {
  const fs::path dir = scratch_dir("receipts");
  blobcast::ReceiptStore store(dir.string());
  blobcast::UploadError err;
  const auto r = sample_receipt();
  expect(!store.get(r.content_hash, &err).has_value() && err.ok(), "absent receipt, no error");
  expect(store.put(r, &err, true), "put succeeds");
  expect(store.info(r.content_hash).has_value(), "object metadata present after put");
  auto back = store.get(r.content_hash, &err);
  expect(back.has_value(), "get succeeds");
  expect(back->url == r.url && back->nonce == 77 && back->transaction_ids.size() == 2 &&
             back->transaction_ids[1].empty(),
         "receipt fields preserved");
  const std::string obj = store.object_path(r.content_hash);
  expect(obj.find("/objects/" + r.content_hash.substr(0, 2) + "/" + r.content_hash.substr(2, 2) +
                  "/") != std::string::npos,
         "sharded layout");
  fs::remove_all(dir);
}

void test_receipt_corruption_detection() {
  const fs::path dir = scratch_dir("receipts_corrupt");
  blobcast::ReceiptStore store(dir.string());
  blobcast::UploadError err;
  const auto r = sample_receipt();
  expect(store.put(r, &err, false), "put identity");
  {
    std::ofstream ofs(store.object_path(r.content_hash), std::ios::binary | std::ios::app);
    ofs << "tamper";
  }
  expect(!store.get(r.content_hash, &err).has_value(), "tampered receipt rejected");
  expect(err.code == blobcast::ErrorCode::receipt_integrity_failed, "receipt_integrity_failed");
  fs::remove_all(dir);
}

void test_skip_existing_uses_receipt() {
  const fs::path dir = scratch_dir("skip_existing");
  write_file(dir / "m.wasm", "module bytes");
  blobcast::UploaderConfig cfg;
  cfg.receiver = "sink.testnet";
  cfg.sender_account_id = "alice.testnet";
  cfg.sender_private_key = "k";
  blobcast::UploadError err;
  expect(cfg.validate(&err), "config valid");
  cfg.spool_dir = (dir / "spool").string();
  blobcast::ReceiptStore store((dir / "receipts").string());

  blobcast::SessionOptions opts;
  MockBroadcaster mock;
  mock.script = {no_code_result("first")};
  auto first = blobcast::run_upload(cfg, (dir / "m.wasm").string(), opts, mock, &store, nullptr);
  expect(first.ok && !first.skipped && first.receipt_error.ok(), "first upload records receipt");

  opts.skip_existing = true;
  auto second = blobcast::run_upload(cfg, (dir / "m.wasm").string(), opts, mock, &store, nullptr);
  expect(second.ok && second.skipped, "second upload satisfied from receipt");
  expect(mock.calls.size() == 1, "broadcaster not called again");
  expect(second.summary->url == first.summary->url, "same URL reported");
  expect(second.summary->transaction_ids[0].value_or("") == "first", "recorded tx id reported");
  fs::remove_all(dir);
}

// ============================================================================
// Process runner and near CLI adapter
// ============================================================================

void test_run_process_capture() {
  blobcast::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo out; echo err 1>&2; exit 3"};
  spec.timeout_ms = 10000;
  auto r = blobcast::run_process(spec);
  expect(r.exit_code == 3 && !r.timed_out, "exit code captured");
  expect(r.stdout_text == "out\n" && r.stderr_text == "err\n", "streams captured separately");
}

void test_run_process_output_limit() {
  blobcast::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "printf 0123456789abcdef; printf XYZ 1>&2"};
  spec.timeout_ms = 10000;
  spec.max_output_bytes = 10;
  auto r = blobcast::run_process(spec);
  expect(r.exit_code == 0, "exit code");
  expect(r.stdout_text == "0123456789", "stdout holds exactly the first bytes, no suffix");
  expect(r.stdout_truncated, "stdout flagged as cut");
  expect(r.stderr_text == "XYZ" && !r.stderr_truncated, "short stderr untouched");
}

void test_near_cli_sees_late_marker() {
  const fs::path dir = scratch_dir("near_cli_late");
  const fs::path script = dir / "chatty-near";
  // 2 MiB of noise before the marker.
  write_file(script,
             "#!/bin/sh\n"
             "head -c 2097152 /dev/zero | tr '\\0' 'x' 1>&2\n"
             "echo 1>&2\n"
             "echo 'CodeDoesNotExist' 1>&2\n"
             "exit 1\n");
  fs::permissions(script, fs::perms::owner_all);
  blobcast::NearCliBroadcaster b(script.string(), 20000);
  auto req = test_request_template();
  req.payload_path = "/tmp/payload.bin";
  auto r = b.broadcast(req);
  expect(!r.stderr_truncated, "broadcaster output kept whole");
  expect(blobcast::DataSinkClassifier().classify(r) == blobcast::Verdict::success,
         "marker after 2 MiB still classified");
  fs::remove_all(dir);
}

void test_run_process_timeout() {
  blobcast::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 10"};
  spec.timeout_ms = 200;
  auto r = blobcast::run_process(spec);
  expect(r.timed_out && r.exit_code == 124, "timeout enforced");
}

void test_near_cli_broadcaster() {
  const fs::path dir = scratch_dir("near_cli");
  const fs::path script = dir / "fake-near";
  write_file(script,
             "#!/bin/sh\n"
             "for a in \"$@\"; do echo \"arg: $a\"; done\n"
             "echo 'Transaction ID: FAKE123'\n"
             "echo 'CodeDoesNotExist' 1>&2\n"
             "exit 1\n");
  fs::permissions(script, fs::perms::owner_all);

  blobcast::NearCliBroadcaster b(script.string(), 10000);
  auto req = test_request_template();
  req.payload_path = "/tmp/payload.bin";
  auto r = b.broadcast(req);
  expect(r.spawn_error.empty(), "fake CLI started");
  expect(r.exit_code == 1, "exit code passed through");
  expect(r.stdout_text.find("arg: 300 Tgas\n") != std::string::npos, "gas as one argument");
  expect(r.stdout_text.find("arg: __ingest_chunk\n") != std::string::npos, "method argument");
  expect(r.stdout_text.find("arg: /tmp/payload.bin\n") != std::string::npos, "payload argument");
  expect(blobcast::extract_transaction_id(r).value_or("") == "FAKE123", "tx id parsed");
  expect(blobcast::DataSinkClassifier().classify(r) == blobcast::Verdict::success,
         "no-code classified as success");

  auto argv = blobcast::NearCliBroadcaster::build_argv(req);
  expect(argv.size() == 18 && argv.front() == "contract" && argv.back() == "send", "argv shape");

  blobcast::NearCliBroadcaster missing((dir / "absent").string(), 1000);
  auto m = missing.broadcast(req);
  expect(!m.spawn_error.empty() && m.exit_code == 127, "missing executable reported");
  fs::remove_all(dir);
}

// ============================================================================
// Observability, JSON, version
// ============================================================================

void test_event_json_and_stats() {
  blobcast::ChunkEvent ev;
  ev.session_id = "abc:1";
  ev.chunk_index = 2;
  ev.verdict = "success";
  ev.transaction_id = "tx\"q";
  const std::string j = blobcast::chunk_event_to_json(ev);
  std::optional<blobcast::jsonlite::JsonError> jerr;
  auto obj = blobcast::jsonlite::parse(j, &jerr);
  expect(!jerr, "event line is valid JSON");
  expect(blobcast::jsonlite::get_string(obj, "transaction_id") == "tx\"q", "escaped tx id");
  expect(blobcast::jsonlite::get_u64(obj, "chunk_index") == 2, "chunk index");

  blobcast::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  h.record(1000000);
  expect(h.count() == 1 && h.mean_us() == 1000.0, "one sample recorded");
}

void test_jsonlite_strict() {
  std::optional<blobcast::jsonlite::JsonError> err;
  auto o = blobcast::jsonlite::parse("{\"a\":\"x\",\"b\":[\"y\"],\"c\":3}", &err);
  expect(!err && blobcast::jsonlite::get_string(o, "a") == "x", "object parsed");
  expect(blobcast::jsonlite::get_string_array(o, "b").size() == 1, "array parsed");
  blobcast::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  auto lw = blobcast::jsonlite::parse("{\"a\":\"1\",\"a\":\"2\"}", &err,
                                      blobcast::jsonlite::DuplicateKeys::last_wins);
  expect(!err && blobcast::jsonlite::get_string(lw, "a") == "2", "last value wins when allowed");
  blobcast::jsonlite::parse("{\"a\":1} x", &err);
  expect(err.has_value(), "trailing data rejected");
}

void test_version_manifest() {
  auto m = blobcast::version::current_manifest("9.9.9");
  expect(m.frame_format == blobcast::version::FRAME_FORMAT_VERSION, "frame format version");
  expect(m.content_hash == "sha256" && m.integrity_hash == "blake3", "hash primitives");
  const std::string j = blobcast::version::manifest_to_json(m);
  std::optional<blobcast::jsonlite::JsonError> err;
  auto obj = blobcast::jsonlite::parse(j, &err);
  expect(!err && blobcast::jsonlite::get_string(obj, "semver") == "9.9.9", "manifest JSON");
}

// ============================================================================
// Command line
// ============================================================================

blobcast::ProcessResult run_cli(const std::vector<std::string>& args) {
  blobcast::ProcessSpec spec;
  spec.command = g_cli_path;
  spec.argv = args;
  spec.timeout_ms = 20000;
  return blobcast::run_process(spec);
}

void test_cli_error_stream_follows_json_flag() {
  auto plain = run_cli({"plan", "/nonexistent/blobcast/input.wasm"});
  expect(plain.exit_code == 1, "plan on missing file fails");
  expect(plain.stdout_text.empty(), "no JSON on stdout without --json");
  expect(plain.stderr_text.find("ERROR [missing_input]") != std::string::npos, "error on stderr");

  auto json = run_cli({"plan", "/nonexistent/blobcast/input.wasm", "--json"});
  expect(json.exit_code == 1, "plan --json on missing file fails");
  expect(json.stdout_text.find("\"ok\":false") != std::string::npos, "JSON error with --json");

  const fs::path dir = scratch_dir("cli_inspect");
  write_file(dir / "bad.frame", bytes({0x07}));
  auto bad = run_cli({"inspect", (dir / "bad.frame").string()});
  expect(bad.exit_code == 1 && bad.stdout_text.empty(), "inspect error stays off stdout");
  expect(bad.stderr_text.find("frame_malformed") != std::string::npos, "inspect error code");
  fs::remove_all(dir);
}

void test_cli_hash_streams_file() {
  const fs::path dir = scratch_dir("cli_hash");
  write_file(dir / "m.wasm", "abc");
  auto r = run_cli({"hash", (dir / "m.wasm").string(), "--json"});
  expect(r.exit_code == 0, "hash succeeds");
  std::optional<blobcast::jsonlite::JsonError> err;
  auto obj = blobcast::jsonlite::parse(r.stdout_text, &err);
  expect(!err, "hash prints JSON");
  expect(blobcast::jsonlite::get_string(obj, "content_hash") == blobcast::sha256_hex("abc"),
         "hash digest");
  expect(blobcast::jsonlite::get_u64(obj, "size") == 3, "hash size");
  fs::remove_all(dir);
}

void test_cli_health_reports_redacted_config() {
  const fs::path dir = scratch_dir("cli_health");
  write_file(dir / "uploader.env",
             "BLOBCAST_RECEIVER=sink.testnet\n"
             "BLOBCAST_SENDER_ACCOUNT_ID=alice.testnet\n"
             "BLOBCAST_SENDER_PRIVATE_KEY=ed25519:topsecret\n");
  auto r = run_cli({"health", "--env", (dir / "uploader.env").string()});
  expect(r.exit_code == 0, "health succeeds");
  expect(r.stdout_text.find("\"config\":{") != std::string::npos, "config included");
  expect(r.stdout_text.find("\"network\":\"testnet\"") != std::string::npos, "network inferred");
  expect(r.stdout_text.find("topsecret") == std::string::npos, "credential not printed");
  expect(r.stdout_text.find("<redacted>") != std::string::npos, "credential redacted");

  auto missing = run_cli({"health", "--env", (dir / "absent.env").string()});
  expect(missing.exit_code == 0, "health answers without config");
  expect(missing.stdout_text.find("\"config\":null") != std::string::npos, "config null");
  expect(missing.stdout_text.find("missing_input") != std::string::npos, "config error reported");
  fs::remove_all(dir);
}

void test_cli_encrypt_prints_store_command() {
  auto r = run_cli({"encrypt-secrets", "--pubkey", kPubkey, "--repo", "alice/project", "--owner",
                    "alice.testnet", "--profile", "prod", "{\"K\":{\"nested\":true}}"});
  expect(r.exit_code == 0, "encrypt succeeds");
  expect(r.stderr_text.find("keystore seed: github.com/alice/project:alice.testnet\n") !=
             std::string::npos,
         "seed printed");
  expect(r.stderr_text.find("store_secrets") != std::string::npos, "store command printed");
  auto partial = run_cli({"encrypt-secrets", "--pubkey", kPubkey, "--repo", "alice/project", "{}"});
  expect(partial.exit_code == 2, "incomplete target is a usage error");
}

}  // namespace

int main(int argc, char** argv) {
  if (argc > 1) g_cli_path = argv[1];

  std::cout << "=== blobcast test suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("SHA-256 known vectors", test_sha256_known_vectors);
  run_test("BLAKE3 known vector", test_blake3_known_vector);
  run_test("hex helpers", test_hex_helpers);
  run_test("file hashing", test_file_hashing);

  std::cout << "\n[Encoder]\n";
  run_test("single-shot frame bytes", test_single_shot_frame_bytes);
  run_test("chunk frame bytes", test_chunk_frame_bytes);
  run_test("length overflow", test_encode_length_overflow);
  run_test("discriminator selection", test_discriminator_selection);
  run_test("decode + reassemble", test_decode_roundtrip_and_reassemble);
  run_test("reassemble rejects mixed sessions", test_reassemble_rejects_mixed_sessions);
  run_test("decode single-shot", test_decode_single_shot);
  run_test("decode malformed", test_decode_malformed);

  std::cout << "\n[Chunk planner]\n";
  run_test("2.5 MiB plan", test_plan_two_and_a_half_mib);
  run_test("count and offset laws", test_plan_count_and_offset_laws);
  run_test("empty and invalid", test_plan_empty_and_invalid);
  run_test("framing choice", test_choose_framing);
  run_test("nonce modes", test_nonce_modes);

  std::cout << "\n[Classification]\n";
  run_test("transaction id extraction", test_transaction_id_extraction);
  run_test("data sink classifier", test_classifier);

  std::cout << "\n[Submission]\n";
  run_test("payload file lifecycle", test_payload_file_lifecycle);
  run_test("2.5 MiB scenario", test_submission_two_and_a_half_mib_scenario);
  run_test("fail fast", test_submission_fail_fast);
  run_test("timeout and spawn failure", test_submission_timeout_and_spawn);
  run_test("missing tx id not fatal", test_submission_missing_tx_id_not_fatal);
  run_test("cut output reported", test_submission_reports_cut_output);
  run_test("single-shot end to end", test_single_shot_session_end_to_end);

  std::cout << "\n[Session]\n";
  run_test("relative path and mime", test_relative_path_and_mime);
  run_test("missing input", test_missing_input);

  std::cout << "\n[Config]\n";
  run_test("env file parsing", test_env_file_parsing);
  run_test("legacy alias layering", test_config_legacy_alias_layering);
  run_test("validation", test_config_validation);

  std::cout << "\n[Keystore cipher]\n";
  run_test("round trip", test_cipher_roundtrip);
  run_test("rejections", test_cipher_rejections);
  run_test("any JSON object accepted", test_cipher_accepts_any_object);
  run_test("keystore addressing", test_keystore_addressing);
  run_test("base64", test_base64);

  std::cout << "\n[Receipt store]\n";
  run_test("put/get", test_receipt_put_get);
  run_test("corruption detection", test_receipt_corruption_detection);
  run_test("skip existing", test_skip_existing_uses_receipt);

  std::cout << "\n[Process]\n";
  run_test("capture", test_run_process_capture);
  run_test("output limit", test_run_process_output_limit);
  run_test("timeout", test_run_process_timeout);
  run_test("near CLI adapter", test_near_cli_broadcaster);
  run_test("late no-code marker", test_near_cli_sees_late_marker);

  std::cout << "\n[Observability]\n";
  run_test("event JSON and stats", test_event_json_and_stats);
  run_test("jsonlite strict parsing", test_jsonlite_strict);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Command line]\n";
  if (g_cli_path.empty()) {
    std::cout << "  skipped (pass the blobcast executable as the first argument)\n";
  } else {
    run_test("error stream follows --json", test_cli_error_stream_follows_json_flag);
    run_test("hash streams the file", test_cli_hash_streams_file);
    run_test("health reports redacted config", test_cli_health_reports_redacted_config);
    run_test("encrypt prints store command", test_cli_encrypt_prints_store_command);
  }

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
