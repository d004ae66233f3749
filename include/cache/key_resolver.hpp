#ifndef RCACHE_CACHE_KEY_RESOLVER_HPP
#define RCACHE_CACHE_KEY_RESOLVER_HPP

#include <optional>
#include <string>
#include <vector>
#include "cache/key_version.hpp"
#include "cache/types.hpp"
#include "network/remote_store.hpp"

namespace rcache {

// Finds the first key with a stored association: the primary key first, then the
// fallback keys in declared order. Fallback lookups run concurrently, one thread each.
class KeyResolver {
public:
  // ---- CONSTRUCTOR ----
  KeyResolver(network::RemoteStore& remote, const KeyVersioning& versioning);


  // ---- RESOLUTION ----
  // Returns a Hit or a Miss. Throws ResolutionFailed when the primary lookup fails with
  // anything but NOT_FOUND, or when no fallback hits and at least one fallback failed.
  RestoreOutcome resolve(const std::vector<std::string>& paths,
                         const std::string& primary_key,
                         const std::vector<std::string>& fallback_keys,
                         const std::optional<std::string>& compression_tag,
                         bool cross_platform) const;

private:
  // Outcome of one fallback lookup, written only by its own worker thread
  struct LookupSlot {
    enum class State { PENDING, FOUND, NOT_FOUND, FAILED };

    State state = State::PENDING;
    ActionResult result;
    std::string error;
  };

  // ---- PARAMETERS ----
  network::RemoteStore& remote_;
  const KeyVersioning& versioning_;


  // ---- RESOLUTION STEPS ----
  std::optional<RestoreOutcome> resolve_primary(const std::string& fingerprint,
                                                const std::string& primary_key) const;
  void lookup_into(const std::string& fingerprint, LookupSlot& slot) const;
};

} // namespace rcache

#endif // RCACHE_CACHE_KEY_RESOLVER_HPP
