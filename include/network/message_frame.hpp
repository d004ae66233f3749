#ifndef RCACHE_NETWORK_MESSAGE_FRAME_HPP
#define RCACHE_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <boost/endian/conversion.hpp>

namespace rcache {
namespace network {

// Message type used to differentiate between requests and replies
enum class MessageType : uint8_t {
  // Requests
  GET_ACTION_RESULT = 0x01,
  UPDATE_ACTION_RESULT = 0x02,
  WRITE = 0x03,
  READ = 0x04,

  // Replies
  ACTION_RESULT = 0x10,
  WRITE_RESULT = 0x11,
  READ_CHUNK = 0x12,
  STATUS = 0x1F
};

// Data structure used to represent one message locally
struct MessageFrame {
  MessageType message_type{MessageType::STATUS};
  // API key attached to every request, empty on replies
  std::string credential;
  uint64_t payload_size{0};
  std::shared_ptr<std::stringstream> payload_stream;
};

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_MESSAGE_FRAME_HPP
