#ifndef RCACHE_CACHE_DOWNLOAD_PIPELINE_HPP
#define RCACHE_CACHE_DOWNLOAD_PIPELINE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "cache/types.hpp"
#include "network/remote_store.hpp"

namespace rcache {

class DownloadPipeline {
public:
  explicit DownloadPipeline(network::RemoteStore& remote);

  // Streams the blob into a freshly created destination file in arrival order.
  // Throws TransferFailed on any transport error or size mismatch; a partial file
  // may be left behind and must be discarded by the caller.
  uint64_t download(const ContentDigest& digest, const std::filesystem::path& destination_path);

  // blobs/{hash}/{size}
  static std::string make_read_resource_name(const ContentDigest& digest);

private:
  network::RemoteStore& remote_;
};

} // namespace rcache

#endif // RCACHE_CACHE_DOWNLOAD_PIPELINE_HPP
