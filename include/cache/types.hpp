#ifndef RCACHE_CACHE_TYPES_HPP
#define RCACHE_CACHE_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace rcache {

// Identifies a blob by the SHA-256 of its bytes and its length
struct ContentDigest {
  std::string hash;
  uint64_t size_bytes{0};

  bool operator==(const ContentDigest& other) const {
    return hash == other.hash && size_bytes == other.size_bytes;
  }
  bool operator!=(const ContentDigest& other) const { return !(*this == other); }
};

struct OutputFile {
  std::string path;
  ContentDigest digest;
};

// Remote record bound to a key fingerprint
struct ActionResult {
  std::vector<OutputFile> output_files;
};

// One write request of an upload stream
struct TransferFrame {
  std::string resource_name;
  std::vector<uint8_t> data;
  uint64_t write_offset{0};
  bool finish_write{false};
};

struct RestoreOutcome {
  bool hit{false};
  ContentDigest digest;
  std::string matched_key;

  static RestoreOutcome miss() { return RestoreOutcome{}; }

  static RestoreOutcome make_hit(const ContentDigest& digest, const std::string& matched_key) {
    RestoreOutcome outcome;
    outcome.hit = true;
    outcome.digest = digest;
    outcome.matched_key = matched_key;
    return outcome;
  }
};

} // namespace rcache

#endif // RCACHE_CACHE_TYPES_HPP
