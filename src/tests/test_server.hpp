#ifndef RCACHE_TESTS_TEST_SERVER_HPP
#define RCACHE_TESTS_TEST_SERVER_HPP

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "network/codec.hpp"
#include "network/connection.hpp"
#include "network/messages.hpp"

namespace rcache {
namespace test {

// Minimal remote cache speaking the framed protocol on 127.0.0.1. Connections are
// served one at a time on a background thread; concurrent clients queue in the backlog.
class TestCacheServer {
public:
  explicit TestCacheServer(std::string credential = "test-api-key")
    : credential_(std::move(credential))
    , acceptor_(io_context_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this]() { serve(); });
  }

  ~TestCacheServer() {
    stopping_ = true;
    // Wake the blocking accept
    boost::asio::ip::tcp::iostream wake("127.0.0.1", std::to_string(port_));
    wake.close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  TestCacheServer(const TestCacheServer&) = delete;
  TestCacheServer& operator=(const TestCacheServer&) = delete;

  network::Endpoint endpoint() const { return network::Endpoint{"127.0.0.1", port_}; }

  void put_action_result(const std::string& fingerprint, const ActionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    action_results_[fingerprint] = result;
  }

  std::optional<ActionResult> action_result(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = action_results_.find(fingerprint);
    if (it == action_results_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void put_blob(const std::string& resource_name, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[resource_name] = data;
  }

  std::optional<std::vector<uint8_t>> blob(const std::string& resource_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(resource_name);
    if (it == blobs_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::size_t frames_received() const { return frames_received_; }
  void set_read_chunk_size(std::size_t size) { read_chunk_size_ = size; }
  // Reported committed size is reduced by this many bytes
  void set_commit_shortfall(uint64_t bytes) { commit_shortfall_ = bytes; }

private:
  std::string credential_;
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t port_{0};
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<std::size_t> frames_received_{0};
  std::atomic<std::size_t> read_chunk_size_{1000};
  std::atomic<uint64_t> commit_shortfall_{0};
  network::Codec codec_;

  std::mutex mutex_;
  std::map<std::string, ActionResult> action_results_;
  std::map<std::string, std::vector<uint8_t>> blobs_;

  void serve() {
    while (!stopping_) {
      boost::asio::ip::tcp::iostream stream;
      boost::system::error_code ec;
      acceptor_.accept(stream.socket(), ec);
      if (ec || stopping_) {
        break;
      }
      try {
        handle(stream);
      }
      catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(debug) << "Test server: Connection ended: " << e.what();
      }
    }
  }

  void reply(std::iostream& stream, const network::MessageFrame& frame) {
    codec_.serialize(frame, stream);
  }

  void reply_status(std::iostream& stream, network::StatusCode code, const std::string& message) {
    network::Status status;
    status.code = code;
    status.message = message;
    reply(stream, network::encode(status));
  }

  void handle(std::iostream& stream) {
    network::MessageFrame request = codec_.deserialize(stream);
    if (request.credential != credential_) {
      reply_status(stream, network::StatusCode::UNAUTHENTICATED, "invalid API key");
      return;
    }

    switch (request.message_type) {
      case network::MessageType::GET_ACTION_RESULT: {
        auto fingerprint = network::decode_get_action_result(request).action_hash;
        auto result = action_result(fingerprint);
        if (!result) {
          reply_status(stream, network::StatusCode::NOT_FOUND, "action result not found");
        } else {
          reply(stream, network::encode(*result));
        }
        break;
      }

      case network::MessageType::UPDATE_ACTION_RESULT: {
        auto update = network::decode_update_action_result(request);
        put_action_result(update.action_hash, update.action_result);
        reply_status(stream, network::StatusCode::OK, "");
        break;
      }

      case network::MessageType::WRITE:
        handle_write(stream, request);
        break;

      case network::MessageType::READ:
        handle_read(stream, network::decode_read(request));
        break;

      default:
        reply_status(stream, network::StatusCode::INVALID_ARGUMENT, "unsupported request");
        break;
    }
  }

  void handle_write(std::iostream& stream, network::MessageFrame request) {
    std::vector<uint8_t> data;
    std::string resource_name;
    while (true) {
      TransferFrame frame = network::decode_write(request);
      ++frames_received_;
      if (frame.write_offset != data.size()) {
        reply_status(stream, network::StatusCode::INVALID_ARGUMENT, "unexpected write offset");
        return;
      }
      resource_name = frame.resource_name;
      data.insert(data.end(), frame.data.begin(), frame.data.end());
      if (frame.finish_write) {
        break;
      }
      request = codec_.deserialize(stream);
    }

    const auto pos = resource_name.find("blobs/");
    if (pos != std::string::npos) {
      put_blob(resource_name.substr(pos), data);
    }

    network::WriteResponse response;
    const uint64_t shortfall = commit_shortfall_;
    response.committed_size = data.size() > shortfall ? data.size() - shortfall : 0;
    reply(stream, network::encode(response));
  }

  void handle_read(std::iostream& stream, const network::ReadRequest& request) {
    auto data = blob(request.resource_name);
    if (!data) {
      reply_status(stream, network::StatusCode::NOT_FOUND, "blob not found");
      return;
    }

    const std::size_t chunk_size = read_chunk_size_;
    for (std::size_t offset = 0; offset < data->size(); offset += chunk_size) {
      const std::size_t length = std::min(chunk_size, data->size() - offset);
      network::ReadResponse response;
      response.data.assign(data->begin() + static_cast<std::ptrdiff_t>(offset),
                           data->begin() + static_cast<std::ptrdiff_t>(offset + length));
      reply(stream, network::encode(response));
    }
    reply_status(stream, network::StatusCode::OK, "");
  }
};

} // namespace test
} // namespace rcache

#endif // RCACHE_TESTS_TEST_SERVER_HPP
