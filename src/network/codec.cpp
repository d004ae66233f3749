#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <vector>

namespace rcache {
namespace network {

std::size_t Codec::serialize(const MessageFrame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  if (frame.credential.size() > MAX_CREDENTIAL_SIZE) {
    throw std::runtime_error("Codec: Credential exceeds " + std::to_string(MAX_CREDENTIAL_SIZE) + " bytes");
  }
  if (frame.payload_size > MAX_PAYLOAD_SIZE) {
    throw std::runtime_error("Codec: Payload of " + std::to_string(frame.payload_size) +
                             " bytes exceeds transport limit");
  }

  std::size_t total_bytes = 0;

  // Write message type
  uint8_t msg_type = static_cast<uint8_t>(frame.message_type);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing message type: " << static_cast<int>(msg_type);
  write_bytes(output, &msg_type, sizeof(msg_type));
  total_bytes += sizeof(msg_type);

  // Write credential length and credential
  uint32_t network_credential_length =
    boost::endian::native_to_big(static_cast<uint32_t>(frame.credential.size()));
  write_bytes(output, &network_credential_length, sizeof(network_credential_length));
  write_bytes(output, frame.credential.data(), frame.credential.size());
  total_bytes += sizeof(network_credential_length) + frame.credential.size();

  // Write payload size in network byte order
  uint64_t network_payload_size = boost::endian::native_to_big(frame.payload_size);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing payload size: " << frame.payload_size;
  write_bytes(output, &network_payload_size, sizeof(network_payload_size));
  total_bytes += sizeof(network_payload_size);

  // Copy exactly payload_size bytes of payload
  if (frame.payload_size > 0) {
    if (!frame.payload_stream) {
      throw std::runtime_error("Codec: Missing payload stream");
    }
    frame.payload_stream->seekg(0);
    std::vector<char> buffer(static_cast<std::size_t>(frame.payload_size));
    read_bytes(*frame.payload_stream, buffer.data(), buffer.size());
    write_bytes(output, buffer.data(), buffer.size());
    total_bytes += buffer.size();
  }

  output.flush();
  if (!output.good()) {
    throw std::runtime_error("Codec: Failed to flush output stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Message frame serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

MessageFrame Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw std::runtime_error("Codec: Invalid input stream");
  }

  MessageFrame frame;

  // Read message type
  uint8_t msg_type;
  read_bytes(input, &msg_type, sizeof(msg_type));
  frame.message_type = static_cast<MessageType>(msg_type);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Read message type: " << static_cast<int>(msg_type);

  // Read credential
  uint32_t network_credential_length;
  read_bytes(input, &network_credential_length, sizeof(network_credential_length));
  uint32_t credential_length = boost::endian::big_to_native(network_credential_length);
  if (credential_length > MAX_CREDENTIAL_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Credential length out of range: " << credential_length;
    throw std::runtime_error("Codec: Credential length out of range");
  }
  frame.credential.resize(credential_length);
  if (credential_length > 0) {
    read_bytes(input, &frame.credential[0], credential_length);
  }

  // Read payload size
  uint64_t network_payload_size;
  read_bytes(input, &network_payload_size, sizeof(network_payload_size));
  frame.payload_size = boost::endian::big_to_native(network_payload_size);
  if (frame.payload_size > MAX_PAYLOAD_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload size out of range: " << frame.payload_size;
    throw std::runtime_error("Codec: Payload size out of range");
  }
  BOOST_LOG_TRIVIAL(trace) << "Codec: Read payload size: " << frame.payload_size;

  // Read payload
  frame.payload_stream = std::make_shared<std::stringstream>();
  if (frame.payload_size > 0) {
    std::vector<char> buffer(static_cast<std::size_t>(frame.payload_size));
    read_bytes(input, buffer.data(), buffer.size());
    frame.payload_stream->write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    frame.payload_stream->seekg(0);
  }

  return frame;
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw std::runtime_error("Codec: Failed to read from input stream");
  }
}

} // namespace network
} // namespace rcache
