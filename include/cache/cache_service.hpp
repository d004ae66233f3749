#ifndef RCACHE_CACHE_CACHE_SERVICE_HPP
#define RCACHE_CACHE_CACHE_SERVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "archive/archiver.hpp"
#include "cache/download_pipeline.hpp"
#include "cache/key_resolver.hpp"
#include "cache/key_version.hpp"
#include "cache/upload_pipeline.hpp"
#include "network/remote_store.hpp"

namespace rcache {

// Top-level save and restore. Validation errors always reach the caller; every other
// failure is logged as a warning and the call degrades to a no-op.
class CacheService {
public:
  static constexpr std::size_t MAX_KEY_LENGTH = 512;
  static constexpr std::size_t MAX_KEYS = 10;
  // Archives above this size are never uploaded
  static constexpr uint64_t ARCHIVE_SIZE_LIMIT = 20ULL * 1024 * 1024 * 1024;

  static constexpr int SAVE_SUCCEEDED = 1;
  static constexpr int SAVE_SKIPPED = -1;

  // ---- CONSTRUCTOR ----
  CacheService(network::RemoteStore& remote,
               archive::Archiver& archiver,
               KeyVersioning versioning,
               uint64_t archive_size_limit = ARCHIVE_SIZE_LIMIT);


  // ---- CACHE OPERATIONS ----
  // Returns SAVE_SUCCEEDED or SAVE_SKIPPED
  int save(const std::vector<std::string>& paths,
           const std::string& key,
           bool cross_platform = false,
           std::optional<std::size_t> max_frame_bytes = std::nullopt);

  // Returns the key that produced the hit, or nullopt on a miss or a degraded restore
  std::optional<std::string> restore(const std::vector<std::string>& paths,
                                     const std::string& primary_key,
                                     const std::vector<std::string>& fallback_keys = {},
                                     bool cross_platform = false,
                                     bool lookup_only = false);


  // ---- VALIDATION ----
  static void check_paths(const std::vector<std::string>& paths);
  static void check_key(const std::string& key);

private:
  // ---- PARAMETERS ----
  network::RemoteStore& remote_;
  archive::Archiver& archiver_;
  KeyVersioning versioning_;
  uint64_t archive_size_limit_;


  // ---- HELPERS ----
  // Drops paths that do not exist, throws ValidationError when none remain
  static std::vector<std::string> resolve_paths(const std::vector<std::string>& paths);
  static std::filesystem::path create_temp_directory();
};

} // namespace rcache

#endif // RCACHE_CACHE_CACHE_SERVICE_HPP
