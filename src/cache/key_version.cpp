#include "cache/key_version.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>

namespace rcache {

KeyVersioning::KeyVersioning(std::string salt, bool platform_is_windows_like)
  : salt_(std::move(salt))
  , platform_is_windows_like_(platform_is_windows_like) {}

std::string KeyVersioning::fingerprint(const std::vector<std::string>& paths,
                                       const std::optional<std::string>& compression_tag,
                                       bool cross_platform,
                                       const std::optional<std::string>& symbolic_key) const {
  return compute_fingerprint(paths, compression_tag, cross_platform,
                             platform_is_windows_like_, symbolic_key, salt_);
}

std::string KeyVersioning::compute_fingerprint(const std::vector<std::string>& paths,
                                               const std::optional<std::string>& compression_tag,
                                               bool cross_platform,
                                               bool platform_is_windows_like,
                                               const std::optional<std::string>& symbolic_key,
                                               const std::string& salt) {
  // Path order is significant
  std::vector<std::string> components(paths.begin(), paths.end());

  if (compression_tag) {
    components.push_back(*compression_tag);
  }

  if (platform_is_windows_like && !cross_platform) {
    components.push_back(WINDOWS_ONLY_TAG);
  }

  if (symbolic_key) {
    components.push_back(*symbolic_key);
  }

  // Salt versions the whole scheme across breaking changes of the cache entry format
  components.push_back(salt);

  std::string joined;
  for (size_t i = 0; i < components.size(); ++i) {
    if (i > 0) {
      joined += DELIMITER;
    }
    joined += components[i];
  }

  std::string result = crypto::sha256_hex(joined);
  BOOST_LOG_TRIVIAL(trace) << "Key versioning: " << components.size()
                           << " components hashed to: " << result;
  return result;
}

bool KeyVersioning::current_platform_is_windows() {
#ifdef _WIN32
  return true;
#else
  return false;
#endif
}

} // namespace rcache
