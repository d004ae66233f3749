#include "archive/archiver.hpp"
#include "cache/errors.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace rcache {
namespace archive {

const char* to_string(CompressionMethod method) {
  switch (method) {
    case CompressionMethod::GZIP: return "gzip";
    case CompressionMethod::ZSTD: return "zstd";
    default: return "unknown";
  }
}

std::string cache_file_name(CompressionMethod method) {
  return method == CompressionMethod::ZSTD ? "cache.tzst" : "cache.tgz";
}

//==============================================
// CONSTRUCTOR
//==============================================

TarArchiver::TarArchiver()
  : method_(zstd_available() ? CompressionMethod::ZSTD : CompressionMethod::GZIP) {
  BOOST_LOG_TRIVIAL(debug) << "Archiver: Compression method: " << to_string(method_);
}

//==============================================
// ARCHIVE OPERATIONS
//==============================================

std::filesystem::path TarArchiver::pack(const std::filesystem::path& dest_dir,
                                        const std::vector<std::string>& paths,
                                        CompressionMethod method) {
  const std::filesystem::path archive_path = dest_dir / cache_file_name(method);
  const std::filesystem::path manifest_path = dest_dir / "manifest.txt";

  {
    std::ofstream manifest(manifest_path, std::ios::trunc);
    if (!manifest) {
      throw CacheError("Archiver: Failed to create manifest " + manifest_path.string());
    }
    for (const auto& path : paths) {
      manifest << path << '\n';
    }
    if (!manifest) {
      throw CacheError("Archiver: Failed to write manifest " + manifest_path.string());
    }
  }

  std::ostringstream command;
  command << "tar --posix -cf " << quote(archive_path.string())
          << (method == CompressionMethod::ZSTD ? " --zstd" : " -z")
          << " -P --files-from " << quote(manifest_path.string());

  BOOST_LOG_TRIVIAL(debug) << "Archiver: Packing " << paths.size() << " paths into " << archive_path;
  run(command.str());
  return archive_path;
}

void TarArchiver::unpack(const std::filesystem::path& archive_path, CompressionMethod method) {
  std::ostringstream command;
  command << "tar -xf " << quote(archive_path.string())
          << (method == CompressionMethod::ZSTD ? " --zstd" : " -z")
          << " -P";

  BOOST_LOG_TRIVIAL(debug) << "Archiver: Unpacking " << archive_path;
  run(command.str());
}

//==============================================
// UTILITY METHODS
//==============================================

bool TarArchiver::zstd_available() {
  return std::system("zstd --version > /dev/null 2>&1") == 0;
}

// Single-quotes an argument for /bin/sh
std::string TarArchiver::quote(const std::string& argument) {
  std::string quoted = "'";
  for (char c : argument) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

void TarArchiver::run(const std::string& command) {
  int status = std::system(command.c_str());
  if (status != 0) {
    BOOST_LOG_TRIVIAL(error) << "Archiver: Command failed with status " << status << ": " << command;
    throw CacheError("Archiver: tar exited with status " + std::to_string(status));
  }
}

} // namespace archive
} // namespace rcache
