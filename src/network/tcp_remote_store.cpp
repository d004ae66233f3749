#include "network/tcp_remote_store.hpp"
#include "network/messages.hpp"
#include <boost/log/trivial.hpp>

namespace rcache {
namespace network {

namespace {

// Turns error replies and protocol mismatches into RemoteError
void expect_reply(const MessageFrame& reply, MessageType expected) {
  throw_if_error_status(reply);
  if (reply.message_type != expected) {
    throw RemoteError(StatusCode::INTERNAL,
                      "unexpected reply type " + std::to_string(static_cast<int>(reply.message_type)));
  }
}

class TcpUploadStream : public UploadStream {
public:
  explicit TcpUploadStream(std::unique_ptr<Connection> connection)
    : connection_(std::move(connection)) {}

  void write(const TransferFrame& frame) override {
    if (finished_) {
      throw RemoteError(StatusCode::FAILED_PRECONDITION, "write after finish on " + frame.resource_name);
    }

    // The server rejects a stream by replying early and closing the connection
    if (connection_->has_pending_input()) {
      throw_rejection(connection_->receive());
    }

    try {
      connection_->send(encode(frame));
    }
    catch (const RemoteError&) {
      if (auto reply = connection_->receive_pending()) {
        throw_rejection(*reply);
      }
      throw;
    }
    BOOST_LOG_TRIVIAL(trace) << "TCP remote store: Sent frame at offset " << frame.write_offset
                             << " (" << frame.data.size() << " bytes, finish=" << frame.finish_write << ")";
  }

  uint64_t finish() override {
    finished_ = true;
    MessageFrame reply = connection_->receive();
    expect_reply(reply, MessageType::WRITE_RESULT);
    uint64_t committed = decode_write_response(reply).committed_size;
    connection_->close();
    return committed;
  }

private:
  std::unique_ptr<Connection> connection_;
  bool finished_ = false;

  [[noreturn]] static void throw_rejection(const MessageFrame& reply) {
    throw_if_error_status(reply);
    throw RemoteError(StatusCode::INTERNAL,
                      "unexpected reply type " + std::to_string(static_cast<int>(reply.message_type)) +
                      " during upload");
  }
};

class TcpDownloadStream : public DownloadStream {
public:
  explicit TcpDownloadStream(std::unique_ptr<Connection> connection)
    : connection_(std::move(connection)) {}

  bool next(std::vector<uint8_t>& chunk) override {
    if (drained_) {
      return false;
    }

    MessageFrame reply = connection_->receive();
    if (reply.message_type == MessageType::STATUS) {
      // An OK status terminates the read stream
      throw_if_error_status(reply);
      drained_ = true;
      connection_->close();
      return false;
    }

    expect_reply(reply, MessageType::READ_CHUNK);
    chunk = decode_read_response(reply).data;
    return true;
  }

private:
  std::unique_ptr<Connection> connection_;
  bool drained_ = false;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

TcpRemoteStore::TcpRemoteStore(Endpoint endpoint, std::string credential)
  : endpoint_(std::move(endpoint))
  , credential_(std::move(credential)) {
  BOOST_LOG_TRIVIAL(debug) << "TCP remote store: Using endpoint " << endpoint_.to_string();
}

std::unique_ptr<Connection> TcpRemoteStore::connect() const {
  auto connection = std::make_unique<Connection>(endpoint_, credential_);
  connection->open();
  return connection;
}

//==============================================
// ACTION CACHE
//==============================================

void TcpRemoteStore::register_association(const std::string& fingerprint, const ActionResult& result) {
  BOOST_LOG_TRIVIAL(debug) << "TCP remote store: Updating action result for " << fingerprint;

  auto connection = connect();
  UpdateActionResultRequest request;
  request.action_hash = fingerprint;
  request.action_result = result;
  connection->send(encode(request));

  MessageFrame reply = connection->receive();
  expect_reply(reply, MessageType::STATUS);
}

ActionResult TcpRemoteStore::lookup_association(const std::string& fingerprint) {
  BOOST_LOG_TRIVIAL(debug) << "TCP remote store: Getting action result for " << fingerprint;

  auto connection = connect();
  GetActionResultRequest request;
  request.action_hash = fingerprint;
  connection->send(encode(request));

  MessageFrame reply = connection->receive();
  expect_reply(reply, MessageType::ACTION_RESULT);
  return decode_action_result(reply);
}

//==============================================
// BYTE STREAM
//==============================================

std::unique_ptr<UploadStream> TcpRemoteStore::open_upload_stream() {
  return std::make_unique<TcpUploadStream>(connect());
}

std::unique_ptr<DownloadStream> TcpRemoteStore::open_download_stream(const std::string& resource_name) {
  BOOST_LOG_TRIVIAL(debug) << "TCP remote store: Reading resource " << resource_name;

  auto connection = connect();
  ReadRequest request;
  request.resource_name = resource_name;
  connection->send(encode(request));
  return std::make_unique<TcpDownloadStream>(std::move(connection));
}

} // namespace network
} // namespace rcache
