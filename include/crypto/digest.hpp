#ifndef RCACHE_CRYPTO_DIGEST_HPP
#define RCACHE_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "cache/types.hpp"

namespace rcache::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over arbitrary byte ranges
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  static constexpr size_t HEX_SIZE = DIGEST_SIZE * 2;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING OPERATIONS ----
  void update(const void* data, size_t length);
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Finalizes the digest and returns it as lowercase hex. The object cannot be updated afterwards.
  std::string final_hex();

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

// SHA-256 of a string as lowercase hex
std::string sha256_hex(const std::string& data);

// Streams a file through SHA-256 and returns its digest and byte length
ContentDigest digest_file(const std::filesystem::path& file_path);

} // namespace rcache::crypto

#endif // RCACHE_CRYPTO_DIGEST_HPP
