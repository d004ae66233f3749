#include "network/messages.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace rcache {
namespace network {

namespace {

// Strings and byte blobs are length-prefixed with a big-endian u32
constexpr uint32_t MAX_FIELD_SIZE = 8 * 1024 * 1024;

class PayloadWriter {
public:
  explicit PayloadWriter(MessageType type) {
    frame_.message_type = type;
    frame_.payload_stream = std::make_shared<std::stringstream>();
  }

  void put_u8(uint8_t value) {
    write(&value, sizeof(value));
  }

  void put_u32(uint32_t value) {
    uint32_t network_value = boost::endian::native_to_big(value);
    write(&network_value, sizeof(network_value));
  }

  void put_u64(uint64_t value) {
    uint64_t network_value = boost::endian::native_to_big(value);
    write(&network_value, sizeof(network_value));
  }

  void put_string(const std::string& value) {
    put_u32(static_cast<uint32_t>(value.size()));
    write(value.data(), value.size());
  }

  void put_bytes(const std::vector<uint8_t>& value) {
    put_u32(static_cast<uint32_t>(value.size()));
    write(value.data(), value.size());
  }

  MessageFrame finish() {
    frame_.payload_size = size_;
    frame_.payload_stream->seekg(0);
    return frame_;
  }

private:
  MessageFrame frame_;
  uint64_t size_ = 0;

  void write(const void* data, std::size_t size) {
    if (size == 0) {
      return;
    }
    frame_.payload_stream->write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!frame_.payload_stream->good()) {
      throw std::runtime_error("Messages: Failed to write payload field");
    }
    size_ += size;
  }
};

class PayloadReader {
public:
  PayloadReader(const MessageFrame& frame, MessageType expected)
    : frame_(frame) {
    if (frame.message_type != expected) {
      throw std::runtime_error("Messages: Unexpected message type " +
                               std::to_string(static_cast<int>(frame.message_type)) +
                               ", expected " + std::to_string(static_cast<int>(expected)));
    }
    if (frame.payload_size > 0 && !frame.payload_stream) {
      throw std::runtime_error("Messages: Missing payload stream");
    }
    if (frame_.payload_stream) {
      frame_.payload_stream->clear();
      frame_.payload_stream->seekg(0);
    }
  }

  uint8_t get_u8() {
    uint8_t value;
    read(&value, sizeof(value));
    return value;
  }

  uint32_t get_u32() {
    uint32_t network_value;
    read(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  uint64_t get_u64() {
    uint64_t network_value;
    read(&network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  std::string get_string() {
    uint32_t length = get_field_length();
    std::string value(length, '\0');
    if (length > 0) {
      read(&value[0], length);
    }
    return value;
  }

  std::vector<uint8_t> get_bytes() {
    uint32_t length = get_field_length();
    std::vector<uint8_t> value(length);
    if (length > 0) {
      read(value.data(), length);
    }
    return value;
  }

private:
  const MessageFrame& frame_;
  uint64_t consumed_ = 0;

  uint32_t get_field_length() {
    uint32_t length = get_u32();
    if (length > MAX_FIELD_SIZE || consumed_ + length > frame_.payload_size) {
      throw std::runtime_error("Messages: Field length " + std::to_string(length) + " out of range");
    }
    return length;
  }

  void read(void* data, std::size_t size) {
    if (consumed_ + size > frame_.payload_size ||
        !frame_.payload_stream->read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
      BOOST_LOG_TRIVIAL(error) << "Messages: Truncated payload, needed " << size << " bytes at offset " << consumed_;
      throw std::runtime_error("Messages: Truncated payload");
    }
    consumed_ += size;
  }
};

void put_digest(PayloadWriter& writer, const ContentDigest& digest) {
  writer.put_string(digest.hash);
  writer.put_u64(digest.size_bytes);
}

ContentDigest get_digest(PayloadReader& reader) {
  ContentDigest digest;
  digest.hash = reader.get_string();
  digest.size_bytes = reader.get_u64();
  return digest;
}

void put_action_result(PayloadWriter& writer, const ActionResult& result) {
  writer.put_u32(static_cast<uint32_t>(result.output_files.size()));
  for (const auto& output : result.output_files) {
    writer.put_string(output.path);
    put_digest(writer, output.digest);
  }
}

ActionResult get_action_result(PayloadReader& reader) {
  ActionResult result;
  uint32_t count = reader.get_u32();
  for (uint32_t i = 0; i < count; ++i) {
    OutputFile output;
    output.path = reader.get_string();
    output.digest = get_digest(reader);
    result.output_files.push_back(std::move(output));
  }
  return result;
}

} // namespace

//==============================================
// ENCODING
//==============================================

MessageFrame encode(const GetActionResultRequest& request) {
  PayloadWriter writer(MessageType::GET_ACTION_RESULT);
  writer.put_string(request.action_hash);
  return writer.finish();
}

MessageFrame encode(const UpdateActionResultRequest& request) {
  PayloadWriter writer(MessageType::UPDATE_ACTION_RESULT);
  writer.put_string(request.action_hash);
  put_action_result(writer, request.action_result);
  return writer.finish();
}

MessageFrame encode(const TransferFrame& request) {
  PayloadWriter writer(MessageType::WRITE);
  writer.put_string(request.resource_name);
  writer.put_u64(request.write_offset);
  writer.put_u8(request.finish_write ? 1 : 0);
  writer.put_bytes(request.data);
  return writer.finish();
}

MessageFrame encode(const ReadRequest& request) {
  PayloadWriter writer(MessageType::READ);
  writer.put_string(request.resource_name);
  writer.put_u64(request.read_offset);
  writer.put_u64(request.read_limit);
  return writer.finish();
}

MessageFrame encode(const ActionResult& reply) {
  PayloadWriter writer(MessageType::ACTION_RESULT);
  put_action_result(writer, reply);
  return writer.finish();
}

MessageFrame encode(const WriteResponse& reply) {
  PayloadWriter writer(MessageType::WRITE_RESULT);
  writer.put_u64(reply.committed_size);
  return writer.finish();
}

MessageFrame encode(const ReadResponse& reply) {
  PayloadWriter writer(MessageType::READ_CHUNK);
  writer.put_bytes(reply.data);
  return writer.finish();
}

MessageFrame encode(const Status& reply) {
  PayloadWriter writer(MessageType::STATUS);
  writer.put_u8(static_cast<uint8_t>(reply.code));
  writer.put_string(reply.message);
  return writer.finish();
}

//==============================================
// DECODING
//==============================================

GetActionResultRequest decode_get_action_result(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::GET_ACTION_RESULT);
  GetActionResultRequest request;
  request.action_hash = reader.get_string();
  return request;
}

UpdateActionResultRequest decode_update_action_result(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::UPDATE_ACTION_RESULT);
  UpdateActionResultRequest request;
  request.action_hash = reader.get_string();
  request.action_result = get_action_result(reader);
  return request;
}

TransferFrame decode_write(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::WRITE);
  TransferFrame request;
  request.resource_name = reader.get_string();
  request.write_offset = reader.get_u64();
  request.finish_write = reader.get_u8() != 0;
  request.data = reader.get_bytes();
  return request;
}

ReadRequest decode_read(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::READ);
  ReadRequest request;
  request.resource_name = reader.get_string();
  request.read_offset = reader.get_u64();
  request.read_limit = reader.get_u64();
  return request;
}

ActionResult decode_action_result(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::ACTION_RESULT);
  return get_action_result(reader);
}

WriteResponse decode_write_response(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::WRITE_RESULT);
  WriteResponse reply;
  reply.committed_size = reader.get_u64();
  return reply;
}

ReadResponse decode_read_response(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::READ_CHUNK);
  ReadResponse reply;
  reply.data = reader.get_bytes();
  return reply;
}

Status decode_status(const MessageFrame& frame) {
  PayloadReader reader(frame, MessageType::STATUS);
  Status reply;
  reply.code = static_cast<StatusCode>(reader.get_u8());
  reply.message = reader.get_string();
  return reply;
}

void throw_if_error_status(const MessageFrame& frame) {
  if (frame.message_type != MessageType::STATUS) {
    return;
  }
  Status status = decode_status(frame);
  if (status.code != StatusCode::OK) {
    throw RemoteError(status.code, status.message);
  }
}

} // namespace network
} // namespace rcache
