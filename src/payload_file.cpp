#include "blobcast/payload_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace blobcast {

namespace {

bool write_all(int fd, std::string_view bytes) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

std::optional<PayloadFile> PayloadFile::create(const std::string& dir,
                                               std::string_view bytes,
                                               UploadError* err) {
  std::error_code ec;
  const fs::path base = dir.empty() ? fs::temp_directory_path(ec) : fs::path(dir);
  if (ec) {
    fail(err, ErrorCode::resource_error, "no temp directory: " + ec.message());
    return std::nullopt;
  }
  fs::create_directories(base, ec);
  if (ec) {
    fail(err, ErrorCode::resource_error,
         "cannot create spool dir " + base.string() + ": " + ec.message());
    return std::nullopt;
  }

  const std::string tmpl = (base / "blobcast-XXXXXX.bin").string();
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');
  const int fd = ::mkstemps(name.data(), 4);
  if (fd < 0) {
    fail(err, ErrorCode::resource_error,
         "cannot create payload file in " + base.string() + ": " + std::strerror(errno));
    return std::nullopt;
  }

  PayloadFile file(std::string(name.data()));
  const bool wrote = write_all(fd, bytes);
  const int write_errno = errno;
  const bool closed = ::close(fd) == 0;
  if (!wrote || !closed) {
    fail(err, ErrorCode::resource_error,
         "cannot write payload file " + file.path_ + ": " +
             std::strerror(wrote ? errno : write_errno));
    return std::nullopt;  // ~PayloadFile removes the partial file
  }
  return file;
}

PayloadFile::PayloadFile(PayloadFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

PayloadFile& PayloadFile::operator=(PayloadFile&& other) noexcept {
  if (this != &other) {
    if (!path_.empty()) {
      std::error_code ec;
      fs::remove(path_, ec);
    }
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

PayloadFile::~PayloadFile() {
  if (!path_.empty()) {
    std::error_code ec;
    fs::remove(path_, ec);
  }
}

bool PayloadFile::release(UploadError* err) {
  if (path_.empty()) return true;
  std::error_code ec;
  fs::remove(path_, ec);
  const std::string path = std::move(path_);
  path_.clear();
  if (ec) {
    return fail(err, ErrorCode::resource_error,
                "cannot delete payload file " + path + ": " + ec.message());
  }
  return true;
}

}  // namespace blobcast
