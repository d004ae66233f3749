#ifndef RCACHE_NETWORK_MESSAGES_HPP
#define RCACHE_NETWORK_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "cache/types.hpp"
#include "network/message_frame.hpp"
#include "network/status.hpp"

namespace rcache {
namespace network {

// ---- REQUESTS ----
struct GetActionResultRequest {
  std::string action_hash;
};

struct UpdateActionResultRequest {
  std::string action_hash;
  ActionResult action_result;
};

struct ReadRequest {
  std::string resource_name;
  uint64_t read_offset{0};
  // Zero reads to the end of the blob
  uint64_t read_limit{0};
};


// ---- REPLIES ----
struct WriteResponse {
  uint64_t committed_size{0};
};

struct ReadResponse {
  std::vector<uint8_t> data;
};

struct Status {
  StatusCode code{StatusCode::OK};
  std::string message;
};


// ---- ENCODING ----
// Each encoder builds a frame with its payload filled in and no credential
MessageFrame encode(const GetActionResultRequest& request);
MessageFrame encode(const UpdateActionResultRequest& request);
MessageFrame encode(const TransferFrame& request);
MessageFrame encode(const ReadRequest& request);
MessageFrame encode(const ActionResult& reply);
MessageFrame encode(const WriteResponse& reply);
MessageFrame encode(const ReadResponse& reply);
MessageFrame encode(const Status& reply);


// ---- DECODING ----
// Decoders check the message type and throw std::runtime_error on mismatch or truncation
GetActionResultRequest decode_get_action_result(const MessageFrame& frame);
UpdateActionResultRequest decode_update_action_result(const MessageFrame& frame);
TransferFrame decode_write(const MessageFrame& frame);
ReadRequest decode_read(const MessageFrame& frame);
ActionResult decode_action_result(const MessageFrame& frame);
WriteResponse decode_write_response(const MessageFrame& frame);
ReadResponse decode_read_response(const MessageFrame& frame);
Status decode_status(const MessageFrame& frame);

// Throws RemoteError when the frame is a non-OK STATUS reply
void throw_if_error_status(const MessageFrame& frame);

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_MESSAGES_HPP
