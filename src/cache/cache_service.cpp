#include "cache/cache_service.hpp"
#include "cache/errors.hpp"
#include "crypto/digest.hpp"
#include <cmath>
#include <filesystem>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace rcache {

namespace {

// Removes a temporary directory tree when it goes out of scope. Failures are only logged.
class ScopedTempDirectory {
public:
  ScopedTempDirectory() = default;
  ScopedTempDirectory(const ScopedTempDirectory&) = delete;
  ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

  ~ScopedTempDirectory() {
    if (path_.empty()) {
      return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Cache service: Failed to delete archive: " << ec.message();
    }
  }

  void reset(const std::filesystem::path& path) { path_ = path; }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

uint64_t to_megabytes(uint64_t bytes) {
  return static_cast<uint64_t>(std::llround(static_cast<double>(bytes) / (1024.0 * 1024.0)));
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

CacheService::CacheService(network::RemoteStore& remote,
                           archive::Archiver& archiver,
                           KeyVersioning versioning,
                           uint64_t archive_size_limit)
  : remote_(remote)
  , archiver_(archiver)
  , versioning_(std::move(versioning))
  , archive_size_limit_(archive_size_limit) {}

//==============================================
// CACHE OPERATIONS
//==============================================

int CacheService::save(const std::vector<std::string>& paths,
                       const std::string& key,
                       bool cross_platform,
                       std::optional<std::size_t> max_frame_bytes) {
  const std::size_t frame_bytes = max_frame_bytes.value_or(UploadPipeline::DEFAULT_FRAME_BYTES);
  UploadPipeline::check_frame_size(frame_bytes);
  check_paths(paths);
  check_key(key);

  const archive::CompressionMethod method = archiver_.compression_method();
  const std::vector<std::string> cache_paths = resolve_paths(paths);

  ScopedTempDirectory archive_folder;
  try {
    archive_folder.reset(create_temp_directory());
    const std::filesystem::path archive_path = archiver_.pack(archive_folder.path(), cache_paths, method);
    BOOST_LOG_TRIVIAL(debug) << "Cache service: Archive Path: " << archive_path.string();

    const uint64_t archive_size = std::filesystem::file_size(archive_path);
    BOOST_LOG_TRIVIAL(debug) << "Cache service: File Size: " << archive_size;
    if (archive_size > archive_size_limit_) {
      throw CacheError("Cache size of ~" + std::to_string(to_megabytes(archive_size)) + " MB (" +
                       std::to_string(archive_size) + " B) is over the 20GB limit, not saving cache.");
    }

    const ContentDigest digest = crypto::digest_file(archive_path);

    UploadPipeline uploader(remote_);
    uploader.upload(archive_path, digest.size_bytes, digest.hash, frame_bytes);

    // The association is keyed on the paths as given, so save and restore agree
    const std::string fingerprint =
      versioning_.fingerprint(paths, std::string(archive::to_string(method)), cross_platform, key);
    uploader.register_association(fingerprint, digest, archive_path.filename().string());

    BOOST_LOG_TRIVIAL(info) << "Cache service: Cache saved with key: " << key;
    return SAVE_SUCCEEDED;
  }
  catch (const ValidationError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Cache service: Failed to save: " << e.what();
  }

  return SAVE_SKIPPED;
}

std::optional<std::string> CacheService::restore(const std::vector<std::string>& paths,
                                                 const std::string& primary_key,
                                                 const std::vector<std::string>& fallback_keys,
                                                 bool cross_platform,
                                                 bool lookup_only) {
  check_paths(paths);
  if (1 + fallback_keys.size() > MAX_KEYS) {
    throw ValidationError("Keys are limited to a maximum of " + std::to_string(MAX_KEYS) + ".");
  }
  check_key(primary_key);
  for (const auto& key : fallback_keys) {
    check_key(key);
  }

  const archive::CompressionMethod method = archiver_.compression_method();

  ScopedTempDirectory archive_folder;
  try {
    KeyResolver resolver(remote_, versioning_);
    const RestoreOutcome outcome = resolver.resolve(
      paths, primary_key, fallback_keys, std::string(archive::to_string(method)), cross_platform);
    if (!outcome.hit) {
      BOOST_LOG_TRIVIAL(info) << "Cache service: Cache not found for keys: " << primary_key;
      return std::nullopt;
    }

    if (lookup_only) {
      BOOST_LOG_TRIVIAL(info) << "Cache service: Lookup only - skipping download";
      return outcome.matched_key;
    }

    archive_folder.reset(create_temp_directory());
    const std::filesystem::path archive_path = archive_folder.path() / archive::cache_file_name(method);
    BOOST_LOG_TRIVIAL(debug) << "Cache service: Archive Path: " << archive_path.string();

    DownloadPipeline downloader(remote_);
    const uint64_t archive_size = downloader.download(outcome.digest, archive_path);
    BOOST_LOG_TRIVIAL(info) << "Cache service: Cache Size: ~" << to_megabytes(archive_size)
                            << " MB (" << archive_size << " B)";

    archiver_.unpack(archive_path, method);
    BOOST_LOG_TRIVIAL(info) << "Cache service: Cache restored successfully";
    return outcome.matched_key;
  }
  catch (const ValidationError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Cache service: Failed to restore: " << e.what();
  }

  return std::nullopt;
}

//==============================================
// VALIDATION
//==============================================

void CacheService::check_paths(const std::vector<std::string>& paths) {
  if (paths.empty()) {
    throw ValidationError("At least one directory or file path is required");
  }
  for (const auto& path : paths) {
    if (path.find(KeyVersioning::DELIMITER) != std::string::npos) {
      throw ValidationError("Path " + path + " cannot contain '" + KeyVersioning::DELIMITER + "'.");
    }
  }
}

void CacheService::check_key(const std::string& key) {
  if (key.size() > MAX_KEY_LENGTH) {
    throw ValidationError("Key " + key + " cannot be larger than " + std::to_string(MAX_KEY_LENGTH) +
                          " characters.");
  }
  if (key.find(',') != std::string::npos) {
    throw ValidationError("Key " + key + " cannot contain commas.");
  }
  if (key.find(KeyVersioning::DELIMITER) != std::string::npos) {
    throw ValidationError("Key " + key + " cannot contain '" + KeyVersioning::DELIMITER + "'.");
  }
}

//==============================================
// HELPERS
//==============================================

std::vector<std::string> CacheService::resolve_paths(const std::vector<std::string>& paths) {
  std::vector<std::string> resolved;
  for (const auto& path : paths) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      resolved.push_back(path);
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Cache service: Skipping missing path " << path;
    }
  }

  if (resolved.empty()) {
    throw ValidationError("Path(s) specified for caching do(es) not exist, hence no cache is being saved.");
  }
  return resolved;
}

std::filesystem::path CacheService::create_temp_directory() {
  boost::uuids::random_generator generator;
  const std::filesystem::path dir =
    std::filesystem::temp_directory_path() / ("rcache-" + boost::uuids::to_string(generator()));
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace rcache
