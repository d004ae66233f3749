#ifndef RCACHE_CACHE_ERRORS_HPP
#define RCACHE_CACHE_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace rcache {

namespace network {
enum class StatusCode : uint8_t;
} // namespace network

class CacheError : public std::runtime_error {
public:
  explicit CacheError(const std::string& message)
    : std::runtime_error(message) {}
};

// Malformed caller input. Never masked by save/restore.
class ValidationError : public CacheError {
public:
  explicit ValidationError(const std::string& message)
    : CacheError("Validation error: " + message) {}
};

class ConfigError : public CacheError {
public:
  explicit ConfigError(const std::string& message)
    : CacheError("Configuration error: " + message) {}
};

class TransferIncomplete : public CacheError {
public:
  TransferIncomplete(std::uint64_t committed_size, std::uint64_t declared_size)
    : CacheError("Transfer incomplete: committed " + std::to_string(committed_size) +
                 " of " + std::to_string(declared_size) + " bytes")
    , committed_size_(committed_size)
    , declared_size_(declared_size) {}

  std::uint64_t committed_size() const { return committed_size_; }
  std::uint64_t declared_size() const { return declared_size_; }

private:
  std::uint64_t committed_size_;
  std::uint64_t declared_size_;
};

// Keeps the remote status when the failure came from the store
class TransferFailed : public CacheError {
public:
  explicit TransferFailed(const std::string& message,
                          std::optional<network::StatusCode> status = std::nullopt)
    : CacheError("Transfer failed: " + message)
    , status_(status) {}

  std::optional<network::StatusCode> status() const { return status_; }

private:
  std::optional<network::StatusCode> status_;
};

// The blob was stored but the key binding could not be written
class AssociationRegistrationFailed : public CacheError {
public:
  explicit AssociationRegistrationFailed(const std::string& message)
    : CacheError("Association registration failed: " + message) {}
};

class ResolutionFailed : public CacheError {
public:
  explicit ResolutionFailed(const std::string& message)
    : CacheError("Resolution failed: " + message) {}
};

} // namespace rcache

#endif // RCACHE_CACHE_ERRORS_HPP
