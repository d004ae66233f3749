#include "config/config.hpp"
#include "cache/errors.hpp"
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace rcache {
namespace config {

namespace {

constexpr uint16_t DEFAULT_PLAIN_PORT = 80;

uint16_t parse_port(const std::string& text, const std::string& url) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 5) {
    throw ConfigError("invalid port in remote cache URL: " + url);
  }
  unsigned long port = std::stoul(text);
  if (port == 0 || port > 65535) {
    throw ConfigError("port out of range in remote cache URL: " + url);
  }
  return static_cast<uint16_t>(port);
}

} // namespace

//==============================================
// LOADING
//==============================================

std::optional<std::string> Config::process_environment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

Config Config::from_environment(const EnvLookup& lookup) {
  Config config;
  if (auto url = lookup(ENV_REMOTE_CACHE_URL)) {
    config.remote_cache_url = *url;
  }
  if (auto key = lookup(ENV_API_KEY)) {
    config.credential = *key;
  }
  if (auto salt = lookup(ENV_VERSION_SALT); salt && !salt->empty()) {
    config.salt = *salt;
  }
  if (auto chunk = lookup(ENV_UPLOAD_CHUNK_SIZE); chunk && !chunk->empty()) {
    if (chunk->find_first_not_of("0123456789") != std::string::npos || chunk->size() > 12) {
      throw ConfigError(std::string(ENV_UPLOAD_CHUNK_SIZE) + " must be a byte count, got '" + *chunk + "'");
    }
    config.max_frame_bytes = static_cast<std::size_t>(std::stoull(*chunk));
  }
  return config;
}

//==============================================
// VALIDATION
//==============================================

bool Config::is_enabled() const {
  return !remote_cache_url.empty() && !credential.empty();
}

void Config::validate() const {
  if (remote_cache_url.empty()) {
    throw ConfigError(std::string("remote cache URL is not set (") + ENV_REMOTE_CACHE_URL + ")");
  }
  if (credential.empty()) {
    throw ConfigError(std::string("API key is not set (") + ENV_API_KEY + ")");
  }
  parse_endpoint(remote_cache_url);
}

network::Endpoint Config::endpoint() const {
  return parse_endpoint(remote_cache_url);
}

network::Endpoint parse_endpoint(const std::string& url) {
  std::string rest = url;
  std::optional<uint16_t> default_port;

  const auto scheme_end = rest.find("://");
  if (scheme_end != std::string::npos) {
    const std::string scheme = rest.substr(0, scheme_end);
    // Connections are plaintext, a TLS endpoint would fail at the handshake
    if (scheme == "grpcs") {
      throw ConfigError("TLS is not supported, use a plaintext endpoint: " + url);
    }
    if (scheme == "grpc") {
      default_port = DEFAULT_PLAIN_PORT;
    } else if (scheme != "tcp") {
      throw ConfigError("unsupported scheme '" + scheme + "' in remote cache URL: " + url);
    }
    rest = rest.substr(scheme_end + 3);
  }

  // Drop a trailing path
  if (auto slash = rest.find('/'); slash != std::string::npos) {
    rest = rest.substr(0, slash);
  }

  network::Endpoint endpoint;
  const auto colon = rest.rfind(':');
  if (colon == std::string::npos) {
    if (!default_port) {
      throw ConfigError("remote cache URL has no port: " + url);
    }
    endpoint.host = rest;
    endpoint.port = *default_port;
  } else {
    endpoint.host = rest.substr(0, colon);
    endpoint.port = parse_port(rest.substr(colon + 1), url);
  }

  if (endpoint.host.empty()) {
    throw ConfigError("remote cache URL has no host: " + url);
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Remote cache endpoint " << endpoint.to_string();
  return endpoint;
}

} // namespace config
} // namespace rcache
