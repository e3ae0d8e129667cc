#include "blobcast/types.hpp"

#include <utility>

namespace blobcast {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::encoding_overflow: return "encoding_overflow";
    case ErrorCode::frame_malformed: return "frame_malformed";
    case ErrorCode::resource_error: return "resource_error";
    case ErrorCode::transport_failure: return "transport_failure";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::missing_input: return "missing_input";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::invalid_key_material: return "invalid_key_material";
    case ErrorCode::payload_too_large: return "payload_too_large";
    case ErrorCode::receipt_integrity_failed: return "receipt_integrity_failed";
  }
  return "";
}

std::string to_string(Verdict verdict) {
  switch (verdict) {
    case Verdict::success: return "success";
    case Verdict::retryable: return "retryable";
    case Verdict::fatal: return "fatal";
  }
  return "";
}

bool fail(UploadError* err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

}  // namespace blobcast
