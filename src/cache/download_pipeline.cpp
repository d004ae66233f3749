#include "cache/download_pipeline.hpp"
#include "cache/errors.hpp"
#include <fstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace rcache {

DownloadPipeline::DownloadPipeline(network::RemoteStore& remote)
  : remote_(remote) {}

uint64_t DownloadPipeline::download(const ContentDigest& digest, const std::filesystem::path& destination_path) {
  const std::string resource_name = make_read_resource_name(digest);
  BOOST_LOG_TRIVIAL(info) << "Download pipeline: Downloading " << resource_name
                          << " to " << destination_path.string();

  uint64_t total_bytes = 0;
  try {
    auto stream = remote_.open_download_stream(resource_name);

    // Create destination fresh so stale content is never appended to
    std::ofstream file(destination_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw TransferFailed("cannot create " + destination_path.string());
    }

    std::vector<uint8_t> chunk;
    while (stream->next(chunk)) {
      if (chunk.empty()) {
        continue;
      }
      file.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
      if (!file.good()) {
        throw TransferFailed("failed to write " + destination_path.string());
      }
      total_bytes += chunk.size();
      BOOST_LOG_TRIVIAL(trace) << "Download pipeline: Received " << chunk.size()
                               << " bytes, total: " << total_bytes << " / " << digest.size_bytes;
    }

    file.close();
    if (file.fail()) {
      throw TransferFailed("failed to close " + destination_path.string());
    }
  }
  catch (const network::RemoteError& e) {
    BOOST_LOG_TRIVIAL(error) << "Download pipeline: Failed to download blob " << e.what();
    throw TransferFailed(e.what(), e.code());
  }
  catch (const CacheError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Download pipeline: Protocol error during download: " << e.what();
    throw TransferFailed(e.what());
  }

  if (total_bytes != digest.size_bytes) {
    BOOST_LOG_TRIVIAL(error) << "Download pipeline: Received " << total_bytes
                             << " bytes, expected " << digest.size_bytes;
    throw TransferFailed("received " + std::to_string(total_bytes) + " of " +
                         std::to_string(digest.size_bytes) + " bytes for " + resource_name);
  }

  BOOST_LOG_TRIVIAL(info) << "Download pipeline: Successfully downloaded " << total_bytes << " bytes";
  return total_bytes;
}

std::string DownloadPipeline::make_read_resource_name(const ContentDigest& digest) {
  return "blobs/" + digest.hash + "/" + std::to_string(digest.size_bytes);
}

} // namespace rcache
