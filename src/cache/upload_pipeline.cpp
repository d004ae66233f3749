#include "cache/upload_pipeline.hpp"
#include "cache/errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <vector>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace rcache {

namespace {

uint64_t to_megabytes(uint64_t bytes) {
  return static_cast<uint64_t>(std::llround(static_cast<double>(bytes) / (1024.0 * 1024.0)));
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

UploadPipeline::UploadPipeline(network::RemoteStore& remote)
  : remote_(remote) {}

//==============================================
// UPLOAD OPERATIONS
//==============================================

uint64_t UploadPipeline::upload(const std::filesystem::path& file_path,
                                uint64_t declared_size,
                                const std::string& content_hash,
                                std::size_t max_frame_bytes) {
  check_frame_size(max_frame_bytes);

  const std::string resource_name = make_upload_resource_name(content_hash, declared_size);
  BOOST_LOG_TRIVIAL(debug) << "Upload pipeline: Resource name to upload file: " << resource_name;

  // Open source file in binary mode, closed on every exit path
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Upload pipeline: Failed to open file: " << file_path.string();
    throw TransferFailed("cannot open " + file_path.string());
  }

  uint64_t committed_size = 0;
  try {
    auto stream = remote_.open_upload_stream();

    std::vector<uint8_t> buffer(max_frame_bytes);
    uint64_t offset = 0;
    uint64_t remaining = declared_size;
    bool finished = false;

    while (!finished) {
      const std::size_t to_read = static_cast<std::size_t>(
        std::min<uint64_t>(remaining, static_cast<uint64_t>(max_frame_bytes)));

      std::size_t bytes_read = 0;
      if (to_read > 0) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
        bytes_read = static_cast<std::size_t>(file.gcount());
        if (file.bad()) {
          throw TransferFailed("error reading " + file_path.string());
        }
      }

      remaining -= bytes_read;
      // A short read means the file ended early; finish anyway and let the commit check report it
      finished = remaining == 0 || bytes_read < to_read;
      if (bytes_read < to_read) {
        BOOST_LOG_TRIVIAL(warning) << "Upload pipeline: File " << file_path.string()
                                   << " ended " << remaining << " bytes before its declared size";
      }

      TransferFrame frame;
      frame.resource_name = resource_name;
      frame.data.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(bytes_read));
      frame.write_offset = offset;
      frame.finish_write = finished;
      stream->write(frame);

      offset += bytes_read;
      BOOST_LOG_TRIVIAL(info) << "Upload pipeline: Remaining ~" << to_megabytes(remaining)
                              << " MB to upload of the total size of: " << to_megabytes(declared_size) << " MB";
    }

    committed_size = stream->finish();
  }
  catch (const network::RemoteError& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload pipeline: Failed to upload file " << e.what();
    throw TransferFailed(e.what(), e.code());
  }
  catch (const CacheError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload pipeline: Protocol error during upload: " << e.what();
    throw TransferFailed(e.what());
  }

  if (committed_size < declared_size) {
    BOOST_LOG_TRIVIAL(error) << "Upload pipeline: The upload process failed to send the entire file content, committed "
                             << committed_size << " of " << declared_size << " bytes";
    throw TransferIncomplete(committed_size, declared_size);
  }

  BOOST_LOG_TRIVIAL(debug) << "Upload pipeline: File saved with hash: " << content_hash
                           << ", fileByteLength: " << declared_size;
  return committed_size;
}

void UploadPipeline::register_association(const std::string& fingerprint,
                                          const ContentDigest& digest,
                                          const std::string& output_path) {
  ActionResult result;
  result.output_files.push_back(OutputFile{output_path, digest});

  try {
    remote_.register_association(fingerprint, result);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload pipeline: Failed to upload action result " << e.what();
    throw AssociationRegistrationFailed(e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Upload pipeline: Saved action with hash: " << fingerprint;
}

//==============================================
// UTILITY METHODS
//==============================================

void UploadPipeline::check_frame_size(std::size_t max_frame_bytes) {
  if (max_frame_bytes == 0 || max_frame_bytes > MAX_FRAME_BYTES) {
    throw ValidationError("upload chunk size must be between 1 and " +
                          std::to_string(MAX_FRAME_BYTES) + " bytes, got " +
                          std::to_string(max_frame_bytes));
  }
}

std::string UploadPipeline::make_upload_resource_name(const std::string& content_hash, uint64_t size_bytes) {
  // random_generator is not thread safe; one per call
  boost::uuids::random_generator generator;
  const boost::uuids::uuid session = generator();
  return "uploads/" + boost::uuids::to_string(session) + "/blobs/" + content_hash + "/" +
         std::to_string(size_bytes);
}

} // namespace rcache
