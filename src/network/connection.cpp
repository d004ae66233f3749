#include "network/connection.hpp"
#include "network/status.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace rcache {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Connection::Connection(Endpoint endpoint, std::string credential)
  : endpoint_(std::move(endpoint))
  , credential_(std::move(credential)) {}

// Cleanup connection on destruction
Connection::~Connection() {
  close();
}

//==============================================
// CONNECTION CONTROL
//==============================================

void Connection::open() {
  if (is_open()) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Connection: Connecting to " << endpoint_.to_string();

  stream_ = std::make_unique<boost::asio::ip::tcp::iostream>();
  stream_->connect(endpoint_.host, std::to_string(endpoint_.port));
  if (!*stream_) {
    std::string reason = stream_error();
    stream_.reset();
    BOOST_LOG_TRIVIAL(error) << "Connection: Failed to connect to " << endpoint_.to_string() << ": " << reason;
    throw RemoteError(StatusCode::UNAVAILABLE, "failed to connect to " + endpoint_.to_string() + ": " + reason);
  }

  BOOST_LOG_TRIVIAL(debug) << "Connection: Connected to " << endpoint_.to_string();
}

void Connection::close() {
  if (!stream_) {
    return;
  }

  boost::system::error_code ec;
  auto& socket = stream_->socket();
  if (socket.is_open()) {
    // Shutdown both send and receive operations
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "Connection: Socket shutdown error: " << ec.message();
    }
    socket.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Connection: Socket close error: " << ec.message();
    }
  }
  stream_.reset();
}

bool Connection::is_open() const {
  return stream_ && stream_->socket().is_open();
}

//==============================================
// MESSAGE OPERATIONS
//==============================================

void Connection::send(MessageFrame frame) {
  if (!is_open()) {
    throw RemoteError(StatusCode::UNAVAILABLE, "connection to " + endpoint_.to_string() + " is not open");
  }

  frame.credential = credential_;
  try {
    codec_.serialize(frame, *stream_);
  }
  catch (const std::runtime_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection: Send error: " << e.what();
    throw RemoteError(StatusCode::UNAVAILABLE, std::string(e.what()) + " (" + stream_error() + ")");
  }
}

MessageFrame Connection::receive() {
  if (!is_open()) {
    throw RemoteError(StatusCode::UNAVAILABLE, "connection to " + endpoint_.to_string() + " is not open");
  }

  try {
    return codec_.deserialize(*stream_);
  }
  catch (const std::runtime_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Connection: Receive error: " << e.what();
    throw RemoteError(StatusCode::UNAVAILABLE, std::string(e.what()) + " (" + stream_error() + ")");
  }
}

bool Connection::has_pending_input() const {
  if (!is_open()) {
    return false;
  }
  if (stream_->rdbuf()->in_avail() > 0) {
    return true;
  }
  boost::system::error_code ec;
  std::size_t available = stream_->socket().available(ec);
  return !ec && available > 0;
}

std::optional<MessageFrame> Connection::receive_pending() {
  if (!stream_) {
    return std::nullopt;
  }

  // A failed write leaves the stream in a fail state, data already received is still readable
  stream_->clear();
  try {
    return codec_.deserialize(*stream_);
  }
  catch (const std::runtime_error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: No pending reply from " << endpoint_.to_string() << ": " << e.what();
    return std::nullopt;
  }
}

std::string Connection::stream_error() const {
  if (!stream_) {
    return "no stream";
  }
  const boost::system::error_code& ec = stream_->error();
  return ec ? ec.message() : "stream closed";
}

} // namespace network
} // namespace rcache
