#ifndef RCACHE_NETWORK_STATUS_HPP
#define RCACHE_NETWORK_STATUS_HPP

#include <cstdint>
#include <string>
#include "cache/errors.hpp"

namespace rcache {
namespace network {

// Status codes carried by STATUS replies. Values follow the gRPC code table
// so that remote-execution servers map onto them one to one.
enum class StatusCode : uint8_t {
  OK = 0,
  CANCELLED = 1,
  UNKNOWN = 2,
  INVALID_ARGUMENT = 3,
  NOT_FOUND = 5,
  PERMISSION_DENIED = 7,
  RESOURCE_EXHAUSTED = 8,
  FAILED_PRECONDITION = 9,
  INTERNAL = 13,
  UNAVAILABLE = 14,
  DATA_LOSS = 15,
  UNAUTHENTICATED = 16
};

inline const char* status_code_to_string(StatusCode code) {
  switch (code) {
    case StatusCode::OK: return "OK";
    case StatusCode::CANCELLED: return "CANCELLED";
    case StatusCode::UNKNOWN: return "UNKNOWN";
    case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
    case StatusCode::NOT_FOUND: return "NOT_FOUND";
    case StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
    case StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
    case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
    case StatusCode::INTERNAL: return "INTERNAL";
    case StatusCode::UNAVAILABLE: return "UNAVAILABLE";
    case StatusCode::DATA_LOSS: return "DATA_LOSS";
    case StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
    default: return "UNDEFINED";
  }
}

// Transport-level failure reported by the remote store or the connection
class RemoteError : public CacheError {
public:
  RemoteError(StatusCode code, const std::string& message)
    : CacheError(std::string("code error: ") + status_code_to_string(code) + ", reason: " + message)
    , code_(code)
    , reason_(message) {}

  StatusCode code() const { return code_; }
  const std::string& reason() const { return reason_; }
  bool is_not_found() const { return code_ == StatusCode::NOT_FOUND; }

private:
  StatusCode code_;
  std::string reason_;
};

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_STATUS_HPP
