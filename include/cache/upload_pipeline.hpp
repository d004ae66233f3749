#ifndef RCACHE_CACHE_UPLOAD_PIPELINE_HPP
#define RCACHE_CACHE_UPLOAD_PIPELINE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "cache/types.hpp"
#include "network/remote_store.hpp"

namespace rcache {

class UploadPipeline {
public:
  // Recommended message size for streaming writes
  static constexpr std::size_t DEFAULT_FRAME_BYTES = 64 * 1024;
  // Maximum size of a single transport message, minus a small delta for the envelope
  static constexpr std::size_t MAX_FRAME_BYTES = 4 * 1024 * 1024 - 1024;

  // ---- CONSTRUCTOR ----
  explicit UploadPipeline(network::RemoteStore& remote);


  // ---- UPLOAD OPERATIONS ----
  // Streams declared_size bytes of file_path to the blob store in frames of at most
  // max_frame_bytes. Returns the committed size; throws TransferIncomplete on a short
  // commit and TransferFailed on transport errors.
  uint64_t upload(const std::filesystem::path& file_path,
                  uint64_t declared_size,
                  const std::string& content_hash,
                  std::size_t max_frame_bytes = DEFAULT_FRAME_BYTES);

  // Binds fingerprint to digest in the action cache, throws AssociationRegistrationFailed
  void register_association(const std::string& fingerprint,
                            const ContentDigest& digest,
                            const std::string& output_path);


  // ---- UTILITY METHODS ----
  // Throws ValidationError when max_frame_bytes is zero or above MAX_FRAME_BYTES
  static void check_frame_size(std::size_t max_frame_bytes);
  // uploads/{uuid}/blobs/{hash}/{size}
  static std::string make_upload_resource_name(const std::string& content_hash, uint64_t size_bytes);

private:
  network::RemoteStore& remote_;
};

} // namespace rcache

#endif // RCACHE_CACHE_UPLOAD_PIPELINE_HPP
