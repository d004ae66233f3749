#include "cache/key_resolver.hpp"
#include "cache/errors.hpp"
#include "utils/join_guard.hpp"
#include <functional>
#include <thread>
#include <boost/log/trivial.hpp>

namespace rcache {

//==============================================
// CONSTRUCTOR
//==============================================

KeyResolver::KeyResolver(network::RemoteStore& remote, const KeyVersioning& versioning)
  : remote_(remote)
  , versioning_(versioning) {}

//==============================================
// RESOLUTION
//==============================================

RestoreOutcome KeyResolver::resolve(const std::vector<std::string>& paths,
                                    const std::string& primary_key,
                                    const std::vector<std::string>& fallback_keys,
                                    const std::optional<std::string>& compression_tag,
                                    bool cross_platform) const {
  const std::string primary_hash =
    versioning_.fingerprint(paths, compression_tag, cross_platform, primary_key);
  BOOST_LOG_TRIVIAL(debug) << "Key resolver: Looking for primary cache key: " << primary_key
                           << " and hash: " << primary_hash;

  if (auto hit = resolve_primary(primary_hash, primary_key)) {
    return *hit;
  }

  if (fallback_keys.empty()) {
    return RestoreOutcome::miss();
  }

  BOOST_LOG_TRIVIAL(debug) << "Key resolver: Primary key not found, looking for "
                           << fallback_keys.size() << " restore keys";

  // Fingerprints are computed up front so workers only touch their own slot
  std::vector<std::string> fingerprints;
  fingerprints.reserve(fallback_keys.size());
  for (const auto& key : fallback_keys) {
    fingerprints.push_back(versioning_.fingerprint(paths, compression_tag, cross_platform, key));
  }

  std::vector<LookupSlot> slots(fallback_keys.size());
  std::vector<std::thread> workers;
  workers.reserve(fallback_keys.size());
  {
    // Started lookups are joined even if spawning a later one throws
    utils::JoinGuard guard(workers);
    for (std::size_t i = 0; i < fallback_keys.size(); ++i) {
      workers.emplace_back(&KeyResolver::lookup_into, this, std::cref(fingerprints[i]), std::ref(slots[i]));
    }

    // Every lookup settles before the scan, nothing is cancelled early
    guard.join_all();
  }

  // Precedence follows the declared order of the fallback keys, not completion order
  bool has_error = false;
  std::string error_message;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    const LookupSlot& slot = slots[i];
    switch (slot.state) {
      case LookupSlot::State::FOUND:
        if (!slot.result.output_files.empty()) {
          BOOST_LOG_TRIVIAL(info) << "Key resolver: Cache restored from key: " << fallback_keys[i];
          return RestoreOutcome::make_hit(slot.result.output_files.front().digest, fallback_keys[i]);
        }
        BOOST_LOG_TRIVIAL(debug) << "Key resolver: Restore key " << fallback_keys[i]
                                 << " has an action result without files";
        break;

      case LookupSlot::State::NOT_FOUND:
        BOOST_LOG_TRIVIAL(debug) << "Key resolver: Restore key not found: " << fallback_keys[i];
        break;

      case LookupSlot::State::FAILED:
      case LookupSlot::State::PENDING:
        has_error = true;
        if (!error_message.empty()) {
          error_message += "; ";
        }
        error_message += "restore key '" + fallback_keys[i] + "': " + slot.error;
        break;
    }
  }

  if (has_error) {
    BOOST_LOG_TRIVIAL(error) << "Key resolver: " << error_message;
    throw ResolutionFailed(error_message);
  }

  return RestoreOutcome::miss();
}

//==============================================
// RESOLUTION STEPS
//==============================================

std::optional<RestoreOutcome> KeyResolver::resolve_primary(const std::string& fingerprint,
                                                           const std::string& primary_key) const {
  ActionResult result;
  try {
    result = remote_.lookup_association(fingerprint);
  }
  catch (const network::RemoteError& e) {
    if (e.is_not_found()) {
      BOOST_LOG_TRIVIAL(debug) << "Key resolver: Primary key not found: " << primary_key;
      return std::nullopt;
    }
    BOOST_LOG_TRIVIAL(error) << "Key resolver: Failed to retrieve action result for primaryKeyHash: "
                             << fingerprint << " " << e.what();
    throw ResolutionFailed("primary key '" + primary_key + "': " + e.what());
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Key resolver: Failed to retrieve action result for primaryKeyHash: "
                             << fingerprint << " " << e.what();
    throw ResolutionFailed("primary key '" + primary_key + "': " + e.what());
  }

  if (result.output_files.empty()) {
    throw ResolutionFailed("action result with primaryKeyHash: " + fingerprint + " doesn't contain any file");
  }

  BOOST_LOG_TRIVIAL(info) << "Key resolver: Cache hit for primary key: " << primary_key;
  return RestoreOutcome::make_hit(result.output_files.front().digest, primary_key);
}

void KeyResolver::lookup_into(const std::string& fingerprint, LookupSlot& slot) const {
  try {
    slot.result = remote_.lookup_association(fingerprint);
    slot.state = LookupSlot::State::FOUND;
  }
  catch (const network::RemoteError& e) {
    if (e.is_not_found()) {
      slot.state = LookupSlot::State::NOT_FOUND;
    } else {
      slot.state = LookupSlot::State::FAILED;
      slot.error = e.what();
    }
  }
  catch (const std::exception& e) {
    slot.state = LookupSlot::State::FAILED;
    slot.error = e.what();
  }
}

} // namespace rcache
