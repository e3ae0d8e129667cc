#include "blobcast/version.hpp"

#include <sstream>

#include "blobcast/hash.hpp"
#include "blobcast/jsonlite.hpp"

#ifndef BLOBCAST_VERSION
#define BLOBCAST_VERSION "0.1.0"
#endif

namespace blobcast {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? BLOBCAST_VERSION : semver;
  const HashRuntimeInfo h = hash_runtime_info();
  m.content_hash = h.content_primitive;
  m.content_backend = h.content_backend;
  m.integrity_hash = h.integrity_primitive;
  m.integrity_version = h.integrity_version;
#if defined(BLOBCAST_WITH_ZSTD)
  m.zstd = true;
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"frame_format\":" << m.frame_format
    << ",\"receipt_format\":" << m.receipt_format
    << ",\"event_log\":" << m.event_log
    << ",\"semver\":\"" << jsonlite::escape(m.semver) << "\""
    << ",\"content_hash\":\"" << m.content_hash << "\""
    << ",\"content_backend\":\"" << jsonlite::escape(m.content_backend) << "\""
    << ",\"integrity_hash\":\"" << m.integrity_hash << "\""
    << ",\"integrity_version\":\"" << jsonlite::escape(m.integrity_version) << "\""
    << ",\"zstd\":" << (m.zstd ? "true" : "false")
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace blobcast
