#ifndef RCACHE_TESTS_FAKE_REMOTE_STORE_HPP
#define RCACHE_TESTS_FAKE_REMOTE_STORE_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "network/remote_store.hpp"

namespace rcache {
namespace test {

// In-memory action cache and blob store. Failure knobs are set by the test before use.
class FakeRemoteStore : public network::RemoteStore {
public:
  // ---- STATE ----
  std::map<std::string, ActionResult> associations;
  // Keyed by read resource name, blobs/{hash}/{size}
  std::map<std::string, std::vector<uint8_t>> blobs;
  std::vector<TransferFrame> written_frames;
  std::vector<std::string> lookups;
  int register_calls = 0;
  int upload_streams_opened = 0;
  int download_streams_opened = 0;
  // Highest number of lookups that were inside lookup_association at once
  std::size_t peak_in_flight = 0;


  // ---- FAILURE INJECTION ----
  std::map<std::string, network::StatusCode> lookup_errors;
  std::map<std::string, std::chrono::milliseconds> lookup_delays;
  // Lookups of these fingerprints block until all of them are in flight, or the gate timeout passes
  std::set<std::string> gated_lookups;
  std::chrono::milliseconds gate_timeout{5000};
  std::optional<network::StatusCode> register_error;
  std::optional<network::StatusCode> open_upload_error;
  // Fails the write of the frame with this index
  std::optional<std::size_t> fail_write_at_frame;
  // Committed size reported by finish instead of the bytes received
  std::optional<uint64_t> commit_override;
  std::optional<network::StatusCode> open_download_error;
  // Fails the read after this many chunks were delivered
  std::optional<std::size_t> fail_read_after_chunks;
  // Stops the read stream early after this many bytes
  std::optional<std::size_t> truncate_read_at;
  std::size_t read_chunk_size = 1024;


  // ---- ACTION CACHE ----
  void register_association(const std::string& fingerprint, const ActionResult& result) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++register_calls;
    if (register_error) {
      throw network::RemoteError(*register_error, "injected register failure");
    }
    associations[fingerprint] = result;
  }

  ActionResult lookup_association(const std::string& fingerprint) override {
    std::chrono::milliseconds delay{0};
    {
      std::unique_lock<std::mutex> lock(mutex_);
      lookups.push_back(fingerprint);
      peak_in_flight = std::max(peak_in_flight, ++in_flight_);
      if (auto it = lookup_delays.find(fingerprint); it != lookup_delays.end()) {
        delay = it->second;
      }
      if (gated_lookups.count(fingerprint) > 0) {
        ++gate_arrivals_;
        gate_.notify_all();
        gate_.wait_for(lock, gate_timeout, [this] { return gate_arrivals_ >= gated_lookups.size(); });
      }
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    if (auto it = lookup_errors.find(fingerprint); it != lookup_errors.end()) {
      throw network::RemoteError(it->second, "injected lookup failure for " + fingerprint);
    }
    auto it = associations.find(fingerprint);
    if (it == associations.end()) {
      throw network::RemoteError(network::StatusCode::NOT_FOUND, "no action result for " + fingerprint);
    }
    return it->second;
  }


  // ---- BYTE STREAM ----
  std::unique_ptr<network::UploadStream> open_upload_stream() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++upload_streams_opened;
    if (open_upload_error) {
      throw network::RemoteError(*open_upload_error, "injected upload open failure");
    }
    return std::make_unique<FakeUploadStream>(*this);
  }

  std::unique_ptr<network::DownloadStream> open_download_stream(const std::string& resource_name) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++download_streams_opened;
    if (open_download_error) {
      throw network::RemoteError(*open_download_error, "injected download open failure");
    }
    auto it = blobs.find(resource_name);
    if (it == blobs.end()) {
      throw network::RemoteError(network::StatusCode::NOT_FOUND, "no blob " + resource_name);
    }
    std::vector<uint8_t> data = it->second;
    if (truncate_read_at && *truncate_read_at < data.size()) {
      data.resize(*truncate_read_at);
    }
    return std::make_unique<FakeDownloadStream>(std::move(data), read_chunk_size, fail_read_after_chunks);
  }


  // ---- HELPERS ----
  void put_blob(const ContentDigest& digest, const std::vector<uint8_t>& data) {
    blobs["blobs/" + digest.hash + "/" + std::to_string(digest.size_bytes)] = data;
  }

  std::size_t lookup_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookups.size();
  }

private:
  std::mutex mutex_;
  std::condition_variable gate_;
  std::size_t gate_arrivals_ = 0;
  std::size_t in_flight_ = 0;

  class FakeUploadStream : public network::UploadStream {
  public:
    explicit FakeUploadStream(FakeRemoteStore& store)
      : store_(store) {}

    void write(const TransferFrame& frame) override {
      if (store_.fail_write_at_frame && frames_ == *store_.fail_write_at_frame) {
        throw network::RemoteError(network::StatusCode::UNAVAILABLE, "injected write failure");
      }
      ++frames_;
      store_.written_frames.push_back(frame);
      resource_name_ = frame.resource_name;
      data_.insert(data_.end(), frame.data.begin(), frame.data.end());
    }

    uint64_t finish() override {
      // uploads/{uuid}/blobs/{hash}/{size} is readable as blobs/{hash}/{size}
      const auto pos = resource_name_.find("blobs/");
      if (pos != std::string::npos) {
        store_.blobs[resource_name_.substr(pos)] = data_;
      }
      return store_.commit_override.value_or(data_.size());
    }

  private:
    FakeRemoteStore& store_;
    std::size_t frames_ = 0;
    std::string resource_name_;
    std::vector<uint8_t> data_;
  };

  class FakeDownloadStream : public network::DownloadStream {
  public:
    FakeDownloadStream(std::vector<uint8_t> data, std::size_t chunk_size, std::optional<std::size_t> fail_after)
      : data_(std::move(data))
      , chunk_size_(chunk_size)
      , fail_after_(fail_after) {}

    bool next(std::vector<uint8_t>& chunk) override {
      if (fail_after_ && chunks_ == *fail_after_) {
        throw network::RemoteError(network::StatusCode::UNAVAILABLE, "injected read failure");
      }
      if (offset_ >= data_.size()) {
        return false;
      }
      const std::size_t length = std::min(chunk_size_, data_.size() - offset_);
      chunk.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                   data_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
      offset_ += length;
      ++chunks_;
      return true;
    }

  private:
    std::vector<uint8_t> data_;
    std::size_t chunk_size_;
    std::optional<std::size_t> fail_after_;
    std::size_t offset_ = 0;
    std::size_t chunks_ = 0;
  };
};

} // namespace test
} // namespace rcache

#endif // RCACHE_TESTS_FAKE_REMOTE_STORE_HPP
