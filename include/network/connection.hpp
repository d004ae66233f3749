#ifndef RCACHE_NETWORK_CONNECTION_HPP
#define RCACHE_NETWORK_CONNECTION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "network/codec.hpp"
#include "network/message_frame.hpp"

namespace rcache {
namespace network {

struct Endpoint {
  std::string host;
  uint16_t port{0};

  std::string to_string() const { return host + ":" + std::to_string(port); }
};

// One blocking TCP connection to the remote cache. Attaches the credential to every outgoing frame.
class Connection {
public:
  // Delete copy operations to prevent socket duplication
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Connection(Endpoint endpoint, std::string credential);
  ~Connection();


  // ---- CONNECTION CONTROL ----
  // Resolves and connects, throws RemoteError(UNAVAILABLE) on failure
  void open();
  void close();
  bool is_open() const;


  // ---- MESSAGE OPERATIONS ----
  void send(MessageFrame frame);
  // Blocks until one full frame has arrived
  MessageFrame receive();
  // True when the peer has sent bytes that were not read yet
  bool has_pending_input() const;
  // Reads a reply the peer sent before the stream failed. Returns nullopt when none arrived.
  std::optional<MessageFrame> receive_pending();

private:
  // ---- PARAMETERS ----
  Endpoint endpoint_;
  std::string credential_;
  Codec codec_;
  std::unique_ptr<boost::asio::ip::tcp::iostream> stream_;

  std::string stream_error() const;
};

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_CONNECTION_HPP
