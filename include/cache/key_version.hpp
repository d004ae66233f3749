#ifndef RCACHE_CACHE_KEY_VERSION_HPP
#define RCACHE_CACHE_KEY_VERSION_HPP

#include <optional>
#include <string>
#include <vector>

namespace rcache {

// Derives the fingerprint used as the lookup key in the remote action cache.
// Components are joined with DELIMITER, so callers must keep it out of paths and keys.
class KeyVersioning {
public:
  static constexpr char DELIMITER = '|';
  static constexpr const char* WINDOWS_ONLY_TAG = "windows-only";
  static constexpr const char* DEFAULT_SALT = "1.0";

  // ---- CONSTRUCTOR ----
  explicit KeyVersioning(std::string salt = DEFAULT_SALT,
                         bool platform_is_windows_like = current_platform_is_windows());


  // ---- FINGERPRINT COMPUTATION ----
  std::string fingerprint(const std::vector<std::string>& paths,
                          const std::optional<std::string>& compression_tag,
                          bool cross_platform,
                          const std::optional<std::string>& symbolic_key = std::nullopt) const;

  static std::string compute_fingerprint(const std::vector<std::string>& paths,
                                         const std::optional<std::string>& compression_tag,
                                         bool cross_platform,
                                         bool platform_is_windows_like,
                                         const std::optional<std::string>& symbolic_key,
                                         const std::string& salt);


  // ---- GETTERS ----
  const std::string& salt() const { return salt_; }
  bool platform_is_windows_like() const { return platform_is_windows_like_; }

  static bool current_platform_is_windows();

private:
  std::string salt_;
  bool platform_is_windows_like_;
};

} // namespace rcache

#endif // RCACHE_CACHE_KEY_VERSION_HPP
