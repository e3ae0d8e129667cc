#pragma once

// blobcast/payload_file.hpp: Scoped on-disk payload for one chunk submission.
//
// The broadcaster consumes a file path, not a buffer. A PayloadFile owns that
// file for exactly one submission: create() writes it, release() deletes it and
// reports a deletion failure, and the destructor deletes it on any path that
// skipped release(). At most one PayloadFile is alive per session.

#include <optional>
#include <string>
#include <string_view>

#include "blobcast/types.hpp"

namespace blobcast {

class PayloadFile {
public:
  // Writes `bytes` to a fresh file "<dir>/blobcast-XXXXXX.bin" (mode 0600).
  // Empty `dir` means the system temp directory. Fails with resource_error.
  static std::optional<PayloadFile> create(const std::string& dir,
                                           std::string_view bytes,
                                           UploadError* err);

  PayloadFile(PayloadFile&& other) noexcept;
  PayloadFile& operator=(PayloadFile&& other) noexcept;
  PayloadFile(const PayloadFile&) = delete;
  PayloadFile& operator=(const PayloadFile&) = delete;
  ~PayloadFile();

  const std::string& path() const { return path_; }

  // Delete the file now. Idempotent. Fails with resource_error if the file
  // exists but cannot be removed.
  bool release(UploadError* err);

private:
  explicit PayloadFile(std::string path) : path_(std::move(path)) {}
  std::string path_;
};

}  // namespace blobcast
