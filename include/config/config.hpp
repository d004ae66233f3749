#ifndef RCACHE_CONFIG_CONFIG_HPP
#define RCACHE_CONFIG_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "network/connection.hpp"

namespace rcache {
namespace config {

// Names of the environment variables read by Config::from_environment
constexpr const char* ENV_REMOTE_CACHE_URL = "RCACHE_REMOTE_CACHE_URL";
constexpr const char* ENV_API_KEY = "RCACHE_API_KEY";
constexpr const char* ENV_VERSION_SALT = "RCACHE_VERSION_SALT";
constexpr const char* ENV_UPLOAD_CHUNK_SIZE = "RCACHE_UPLOAD_CHUNK_SIZE";

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

struct Config {
  std::string remote_cache_url;
  std::string credential;
  std::string salt = "1.0";
  std::optional<std::size_t> max_frame_bytes;
  std::string log_file = "rcache.log";
  bool verbose = false;

  // Reads the RCACHE_* variables. Missing required values stay empty.
  static Config from_environment(const EnvLookup& lookup = process_environment);
  static std::optional<std::string> process_environment(const std::string& name);

  // True when both the endpoint URL and the credential are set
  bool is_enabled() const;
  // Throws ConfigError naming the first missing or malformed value
  void validate() const;
  network::Endpoint endpoint() const;
};

// Accepts host:port, tcp://host:port and grpc://host[:port].
// Throws ConfigError on anything else, including grpcs:// since connections are plaintext.
network::Endpoint parse_endpoint(const std::string& url);

} // namespace config
} // namespace rcache

#endif // RCACHE_CONFIG_CONFIG_HPP
