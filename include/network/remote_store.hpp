#ifndef RCACHE_NETWORK_REMOTE_STORE_HPP
#define RCACHE_NETWORK_REMOTE_STORE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "cache/types.hpp"
#include "network/status.hpp"

namespace rcache {
namespace network {

// Client side of a single ByteStream write
class UploadStream {
public:
  virtual ~UploadStream() = default;

  // Sends one frame. Frames must arrive in offset order.
  virtual void write(const TransferFrame& frame) = 0;
  // Waits for the remote side to close the write and returns the committed size
  virtual uint64_t finish() = 0;

protected:
  UploadStream() = default;
};

// Client side of a single ByteStream read
class DownloadStream {
public:
  virtual ~DownloadStream() = default;

  // Fills chunk with the next piece of the blob. Returns false once the stream is drained.
  virtual bool next(std::vector<uint8_t>& chunk) = 0;

protected:
  DownloadStream() = default;
};

// Capabilities of the remote action cache and blob store.
// Every operation throws RemoteError on failure; NOT_FOUND marks an absent entry.
class RemoteStore {
public:
  virtual ~RemoteStore() = default;

  // ---- ACTION CACHE ----
  virtual void register_association(const std::string& fingerprint, const ActionResult& result) = 0;
  virtual ActionResult lookup_association(const std::string& fingerprint) = 0;


  // ---- BYTE STREAM ----
  virtual std::unique_ptr<UploadStream> open_upload_stream() = 0;
  virtual std::unique_ptr<DownloadStream> open_download_stream(const std::string& resource_name) = 0;

protected:
  RemoteStore() = default;
};

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_REMOTE_STORE_HPP
