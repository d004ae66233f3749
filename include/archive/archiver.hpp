#ifndef RCACHE_ARCHIVE_ARCHIVER_HPP
#define RCACHE_ARCHIVE_ARCHIVER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace rcache {
namespace archive {

enum class CompressionMethod {
  GZIP,
  ZSTD
};

// Tag that takes part in the key fingerprint ("gzip" / "zstd")
const char* to_string(CompressionMethod method);
// cache.tgz / cache.tzst
std::string cache_file_name(CompressionMethod method);

// Packs cache paths into a single archive and back
class Archiver {
public:
  virtual ~Archiver() = default;

  // Creates an archive of paths inside dest_dir and returns its location
  virtual std::filesystem::path pack(const std::filesystem::path& dest_dir,
                                     const std::vector<std::string>& paths,
                                     CompressionMethod method) = 0;
  // Extracts archive_path relative to the working directory
  virtual void unpack(const std::filesystem::path& archive_path, CompressionMethod method) = 0;
  virtual CompressionMethod compression_method() const = 0;

protected:
  Archiver() = default;
};

// Archiver backed by the system tar. Uses zstd when a zstd binary is on PATH.
class TarArchiver : public Archiver {
public:
  TarArchiver();

  std::filesystem::path pack(const std::filesystem::path& dest_dir,
                             const std::vector<std::string>& paths,
                             CompressionMethod method) override;
  void unpack(const std::filesystem::path& archive_path, CompressionMethod method) override;
  CompressionMethod compression_method() const override { return method_; }

  static bool zstd_available();

private:
  CompressionMethod method_;

  static std::string quote(const std::string& argument);
  static void run(const std::string& command);
};

} // namespace archive
} // namespace rcache

#endif // RCACHE_ARCHIVE_ARCHIVER_HPP
