#ifndef RCACHE_NETWORK_CODEC_HPP
#define RCACHE_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include "network/message_frame.hpp"

namespace rcache {
namespace network {

// Wire layout, integers in network byte order:
//   u8 message type | u32 credential length | credential | u64 payload size | payload
class Codec {
public:
  // 4 MiB transport limit plus room for the request envelope
  static constexpr uint64_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024 + 64 * 1024;
  static constexpr uint32_t MAX_CREDENTIAL_SIZE = 4096;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a message frame to an output stream, returns bytes written
  std::size_t serialize(const MessageFrame& frame, std::ostream& output) const;
  // Reads one message frame from the input stream
  MessageFrame deserialize(std::istream& input) const;

private:
  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  static void read_bytes(std::istream& input, void* data, std::size_t size);
};

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_CODEC_HPP
